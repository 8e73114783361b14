#include "backend_request.hpp"

namespace linebridge {

static const char* kUserAgent =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/124.0 Safari/537.36";

nlohmann::json BuildBackendBody(const ChatRequest& req,
                                const std::string& backend_model,
                                const Identity& identity,
                                const std::string& time_zone) {
  nlohmann::json j;
  j["id"] = identity.conversation_id;
  j["group"] = "chat";
  j["messages"] = nlohmann::json::array();
  for (const auto& m : req.messages) {
    nlohmann::json part;
    part["type"] = "text";
    part["text"] = m.content;
    j["messages"].push_back({{"role", m.role}, {"content", m.content}, {"parts", nlohmann::json::array({part})}});
  }
  j["model"] = backend_model;
  j["timezone"] = time_zone;
  j["user_id"] = identity.caller_id;
  return j;
}

UpstreamRequest BuildBackendRequest(const ChatRequest& req,
                                    const std::string& backend_model,
                                    const Identity& identity,
                                    const BackendRequestOptions& opts) {
  UpstreamRequest out;
  out.path = opts.path;
  out.body = BuildBackendBody(req, backend_model, identity, opts.time_zone).dump();
  out.content_type = "application/json";
  out.headers.emplace_back("Accept", "*/*");
  out.headers.emplace_back("User-Agent", kUserAgent);
  if (!opts.base_url.empty()) {
    std::string origin = opts.base_url;
    if (origin.back() == '/') origin.pop_back();
    out.headers.emplace_back("Origin", origin);
    out.headers.emplace_back("Referer", opts.base_url);
  }
  return out;
}

}  // namespace linebridge
