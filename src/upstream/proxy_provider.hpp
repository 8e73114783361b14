#pragma once

#include "upstream/transport.hpp"

#include <optional>
#include <string>

namespace linebridge {

// Serves a single proxy taken from configuration (HTTP_PROXY).
class StaticProxyProvider : public IProxyProvider {
 public:
  explicit StaticProxyProvider(const std::string& proxy_url);

  std::optional<ProxyAddress> GetProxy(std::string* err) override;

 private:
  std::optional<ProxyAddress> proxy_;
};

}  // namespace linebridge
