#pragma once

#include "config.hpp"
#include "upstream/transport.hpp"

#include <optional>
#include <string>

namespace linebridge {

// cpp-httplib backed transport. Each call opens its own client; the transfer
// runs on a worker thread that feeds a bounded chunk queue so readers can
// observe cancellation while they wait.
class HttpUpstreamTransport : public IUpstreamTransport {
 public:
  HttpUpstreamTransport(HttpEndpoint endpoint, int read_timeout_sec, IProxyProvider* proxies);

  std::optional<UpstreamResponse> Send(const UpstreamRequest& req, CancelToken* cancel, std::string* err) override;

 private:
  HttpEndpoint endpoint_;
  int read_timeout_sec_;
  IProxyProvider* proxies_;
};

}  // namespace linebridge
