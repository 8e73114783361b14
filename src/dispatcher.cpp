#include "dispatcher.hpp"

#include <algorithm>
#include <iostream>
#include <thread>
#include <utility>

namespace linebridge {
namespace {

constexpr size_t kMaxErrorBodyChars = 1024;

static std::string TruncateForLog(std::string s, size_t max_chars) {
  if (s.size() <= max_chars) return s;
  s.resize(max_chars);
  s += "...(truncated)";
  return s;
}

}  // namespace

std::chrono::milliseconds RetryPolicy::DelayAfter(int attempt_index) const {
  const auto scaled = base_delay * (attempt_index + 1);
  return std::min(scaled, max_delay);
}

Dispatcher::Dispatcher(IUpstreamTransport* transport,
                       IdentityRotator* identities,
                       const ModelMapper* models,
                       BackendRequestOptions backend,
                       RetryPolicy policy)
    : transport_(transport),
      identities_(identities),
      models_(models),
      backend_(std::move(backend)),
      policy_(policy) {
  if (policy_.attempts <= 0) policy_.attempts = 1;
}

bool Dispatcher::TryOnce(const ChatRequest& req, const Identity& identity, CancelToken* cancel, DispatchOutcome* out) {
  const std::string backend_model = models_ ? models_->ToBackendName(req.model) : req.model;
  auto upstream_req = BuildBackendRequest(req, backend_model, identity, backend_);

  std::string err;
  auto resp = transport_->Send(upstream_req, cancel, &err);
  if (!resp) {
    out->error = err.empty() ? "HTTP request failed" : err;
    return false;
  }
  if (resp->status < 200 || resp->status >= 300) {
    std::string body;
    std::string read_err;
    if (!resp->body || !ReadAll(resp->body.get(), cancel, kMaxErrorBodyChars + 1, &body, &read_err)) {
      body = "<unreadable body>";
    }
    out->error = "HTTP error: status=" + std::to_string(resp->status) +
                 ", body=" + TruncateForLog(body, kMaxErrorBodyChars) + ", path=" + upstream_req.path;
    return false;
  }
  out->response = std::move(resp);
  return true;
}

DispatchOutcome Dispatcher::Dispatch(const ChatRequest& req, CancelToken* cancel) {
  DispatchOutcome out;
  const int attempts = policy_.attempts;
  std::string last_err;

  for (int i = 0; i < attempts; i++) {
    if (cancel && cancel->IsCancelled()) {
      out.cancelled = true;
      out.error = cancel->Reason();
      return out;
    }

    out.identity = identities_->Next();
    out.attempt_index = i;
    attempts_++;
    std::cout << "[dispatch] attempt=" << (i + 1) << "/" << attempts << " caller=" << out.identity.caller_id
              << " chat_id=" << out.identity.conversation_id << "\n";

    if (TryOnce(req, out.identity, cancel, &out)) {
      std::cout << "[dispatch] attempt=" << (i + 1) << "/" << attempts << " ok status=" << out.response->status
                << "\n";
      out.error.clear();
      return out;
    }

    failures_++;
    last_err = out.error;
    std::cout << "[dispatch] attempt=" << (i + 1) << "/" << attempts << " failed err=" << last_err << "\n";

    if (cancel && cancel->IsCancelled()) {
      out.cancelled = true;
      out.error = cancel->Reason();
      return out;
    }
    if (i == attempts - 1) break;

    const auto delay = policy_.DelayAfter(i);
    if (!cancel) {
      std::this_thread::sleep_for(delay);
    } else if (!cancel->SleepFor(delay)) {
      out.cancelled = true;
      out.error = cancel->Reason();
      return out;
    }
  }

  exhausted_++;
  std::cout << "[dispatch] all " << attempts << " attempts failed err=" << last_err << "\n";
  out.error = "all retry attempts failed: " + last_err;
  return out;
}

nlohmann::json Dispatcher::Metrics() const {
  nlohmann::json j;
  j["attempts"] = attempts_.load();
  j["failed_attempts"] = failures_.load();
  j["exhausted"] = exhausted_.load();
  j["max_attempts"] = policy_.attempts;
  return j;
}

}  // namespace linebridge
