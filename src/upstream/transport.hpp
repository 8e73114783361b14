#pragma once

#include "cancel_token.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace linebridge {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct UpstreamRequest {
  std::string path;
  std::string body;
  std::string content_type = "application/json";
  HeaderList headers;
};

// Incremental view of a response body.
class BodyReader {
 public:
  enum class Result {
    kChunk,
    kEof,
    kError,
  };

  virtual ~BodyReader() = default;

  // Blocks until a chunk arrives, the body ends, the transfer fails, or the
  // token is cancelled (reported as kError with the token's reason).
  virtual Result Read(CancelToken* cancel, std::string* chunk, std::string* err) = 0;
};

struct UpstreamResponse {
  int status = 0;
  std::unique_ptr<BodyReader> body;
};

class IUpstreamTransport {
 public:
  virtual ~IUpstreamTransport() = default;

  // Returns once the status line is known; the body is streamed afterwards.
  virtual std::optional<UpstreamResponse> Send(const UpstreamRequest& req, CancelToken* cancel, std::string* err) = 0;
};

struct ProxyAddress {
  std::string host;
  int port = 0;
};

class IProxyProvider {
 public:
  virtual ~IProxyProvider() = default;
  virtual std::optional<ProxyAddress> GetProxy(std::string* err) = 0;
};

// Reads the whole body, honouring cancellation. max_bytes of 0 means no limit.
bool ReadAll(BodyReader* reader, CancelToken* cancel, size_t max_bytes, std::string* out, std::string* err);

}  // namespace linebridge
