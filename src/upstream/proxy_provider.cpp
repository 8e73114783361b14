#include "upstream/proxy_provider.hpp"

#include "config.hpp"

#include <iostream>

namespace linebridge {

StaticProxyProvider::StaticProxyProvider(const std::string& proxy_url) {
  if (proxy_url.empty()) return;
  auto ep = ParseHttpEndpoint(proxy_url, 8080);
  proxy_ = ProxyAddress{ep.host, ep.port};
  std::cout << "[upstream] proxy host=" << ep.host << " port=" << ep.port << "\n";
}

std::optional<ProxyAddress> StaticProxyProvider::GetProxy(std::string* err) {
  if (!proxy_) {
    if (err) *err = "no proxy configured";
    return std::nullopt;
  }
  return proxy_;
}

}  // namespace linebridge
