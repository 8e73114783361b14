#pragma once

#include "backend_request.hpp"
#include "cancel_token.hpp"
#include "chat_types.hpp"
#include "identity_rotator.hpp"
#include "model_mapper.hpp"
#include "upstream/transport.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace linebridge {

// One policy for both the streaming and the buffered path: the wait after
// attempt i is base_delay * (i + 1), capped at max_delay.
struct RetryPolicy {
  int attempts = 1;
  std::chrono::milliseconds base_delay{500};
  std::chrono::milliseconds max_delay{5000};

  std::chrono::milliseconds DelayAfter(int attempt_index) const;
};

struct DispatchOutcome {
  // Set only for a 2xx response whose body has not been consumed yet.
  std::optional<UpstreamResponse> response;
  std::string error;
  bool cancelled = false;
  Identity identity;
  int attempt_index = -1;

  bool ok() const { return response.has_value(); }
};

class Dispatcher {
 public:
  Dispatcher(IUpstreamTransport* transport,
             IdentityRotator* identities,
             const ModelMapper* models,
             BackendRequestOptions backend,
             RetryPolicy policy);

  DispatchOutcome Dispatch(const ChatRequest& req, CancelToken* cancel);

  const RetryPolicy& policy() const { return policy_; }
  nlohmann::json Metrics() const;

 private:
  bool TryOnce(const ChatRequest& req, const Identity& identity, CancelToken* cancel, DispatchOutcome* out);

  IUpstreamTransport* transport_;
  IdentityRotator* identities_;
  const ModelMapper* models_;
  BackendRequestOptions backend_;
  RetryPolicy policy_;

  std::atomic<uint64_t> attempts_{0};
  std::atomic<uint64_t> failures_{0};
  std::atomic<uint64_t> exhausted_{0};
};

}  // namespace linebridge
