#pragma once

#include "chat_types.hpp"
#include "upstream/transport.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace linebridge {

struct BackendRequestOptions {
  std::string base_url;
  std::string path = "/api/search";
  std::string time_zone = "Asia/Shanghai";
};

nlohmann::json BuildBackendBody(const ChatRequest& req,
                                const std::string& backend_model,
                                const Identity& identity,
                                const std::string& time_zone);

UpstreamRequest BuildBackendRequest(const ChatRequest& req,
                                    const std::string& backend_model,
                                    const Identity& identity,
                                    const BackendRequestOptions& opts);

}  // namespace linebridge
