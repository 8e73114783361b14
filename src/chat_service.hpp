#pragma once

#include "api_error.hpp"
#include "cancel_token.hpp"
#include "chat_types.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "id_generator.hpp"
#include "identity_rotator.hpp"
#include "model_mapper.hpp"
#include "rate_limiter.hpp"
#include "response_cache.hpp"
#include "sse_sink.hpp"
#include "stream_session.hpp"
#include "token_counter.hpp"
#include "upstream/transport.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace linebridge {

// Collaborators left null are built from the configuration; a disabled cache
// or limiter becomes a stand-in that always misses or never blocks.
struct ChatServiceDeps {
  IUpstreamTransport* transport = nullptr;
  IResponseCache* cache = nullptr;
  IRateLimiter* limiter = nullptr;
  IdGenerator* ids = nullptr;
};

struct SyncResult {
  int status = 200;
  std::string body;
  bool cache_hit = false;
};

// A dispatched streaming request whose SSE response has not started yet.
struct PreparedStream {
  std::optional<ApiError> error;
  DispatchOutcome outcome;
  StreamOptions options;
  std::unique_ptr<TokenCounter> counter;
};

class ChatService {
 public:
  ChatService(GatewayConfig cfg, ChatServiceDeps deps);
  ~ChatService();

  ChatService(const ChatService&) = delete;
  ChatService& operator=(const ChatService&) = delete;

  std::optional<ApiError> Admit(CancelToken* cancel);
  std::optional<ApiError> Validate(const ChatRequest& req) const;

  SyncResult CompleteSync(const ChatRequest& req, CancelToken* cancel);

  PreparedStream OpenStream(const ChatRequest& req, CancelToken* cancel);
  StreamResult RunStream(PreparedStream* prepared, SseSink* sink, CancelToken* cancel);

  std::string ModelsBody();
  nlohmann::json Metrics() const;

  const GatewayConfig& config() const { return cfg_; }

 private:
  GatewayConfig cfg_;

  std::unique_ptr<IdGenerator> owned_ids_;
  std::unique_ptr<IProxyProvider> owned_proxies_;
  std::unique_ptr<IUpstreamTransport> owned_transport_;
  std::unique_ptr<IResponseCache> owned_cache_;
  std::unique_ptr<IRateLimiter> owned_limiter_;

  IdGenerator* ids_;
  IUpstreamTransport* transport_;
  IResponseCache* cache_;
  IRateLimiter* limiter_;

  ModelMapper models_;
  IdentityRotator identities_;
  Dispatcher dispatcher_;

  std::atomic<uint64_t> requests_{0};
  std::atomic<uint64_t> successes_{0};
  std::atomic<uint64_t> errors_{0};
  std::atomic<uint64_t> rejected_{0};
  std::atomic<uint64_t> streams_{0};
};

}  // namespace linebridge
