#include "chat_service.hpp"

#include "response_assembler.hpp"
#include "upstream/http_transport.hpp"
#include "upstream/proxy_provider.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

namespace linebridge {
namespace {

static const char* kFallbackCallerId = "default_user";

static int64_t NowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

static std::unique_ptr<IResponseCache> MakeCache(const CacheConfig& cfg) {
  if (!cfg.enabled) return std::make_unique<NullResponseCache>();
  return std::make_unique<TtlResponseCache>(cfg.response_ttl, cfg.model_ttl, cfg.cleanup_interval);
}

static std::unique_ptr<IRateLimiter> MakeLimiter(const RateLimitConfig& cfg) {
  if (!cfg.enabled) return std::make_unique<UnlimitedRateLimiter>();
  return std::make_unique<TokenBucketLimiter>(cfg.requests_per_second, cfg.burst);
}

static BackendRequestOptions MakeBackendOptions(const BackendConfig& cfg) {
  BackendRequestOptions opts;
  opts.base_url = cfg.base_url;
  opts.path = cfg.path;
  opts.time_zone = cfg.time_zone;
  return opts;
}

static RetryPolicy MakeRetryPolicy(const BackendConfig& cfg) {
  RetryPolicy p;
  p.attempts = cfg.retry;
  p.base_delay = cfg.retry_base_delay;
  p.max_delay = cfg.retry_max_delay;
  return p;
}

static std::string JoinModels(const std::vector<std::string>& models) {
  std::string out = "[";
  for (size_t i = 0; i < models.size(); i++) {
    if (i > 0) out += " ";
    out += models[i];
  }
  out += "]";
  return out;
}

static ApiError DispatchFailure(const DispatchOutcome& outcome) {
  if (outcome.cancelled) return InternalError("Request timeout: " + outcome.error);
  return ServiceUnavailableError("Chat service temporarily unavailable: " + outcome.error);
}

}  // namespace

ChatService::ChatService(GatewayConfig cfg, ChatServiceDeps deps)
    : cfg_(std::move(cfg)),
      owned_ids_(deps.ids ? nullptr : std::make_unique<IdGenerator>()),
      owned_proxies_(deps.transport ? nullptr : std::make_unique<StaticProxyProvider>(cfg_.backend.http_proxy)),
      owned_transport_(deps.transport ? nullptr
                                      : std::make_unique<HttpUpstreamTransport>(
                                            cfg_.backend.endpoint, cfg_.backend.timeout_sec, owned_proxies_.get())),
      owned_cache_(deps.cache ? nullptr : MakeCache(cfg_.cache)),
      owned_limiter_(deps.limiter ? nullptr : MakeLimiter(cfg_.rate_limit)),
      ids_(deps.ids ? deps.ids : owned_ids_.get()),
      transport_(deps.transport ? deps.transport : owned_transport_.get()),
      cache_(deps.cache ? deps.cache : owned_cache_.get()),
      limiter_(deps.limiter ? deps.limiter : owned_limiter_.get()),
      models_(cfg_.model_mapping),
      identities_(cfg_.caller_ids, kFallbackCallerId, ids_),
      dispatcher_(transport_, &identities_, &models_, MakeBackendOptions(cfg_.backend), MakeRetryPolicy(cfg_.backend)) {}

ChatService::~ChatService() = default;

std::optional<ApiError> ChatService::Admit(CancelToken* cancel) {
  requests_++;
  std::string err;
  if (!limiter_->Wait(cancel, &err)) {
    rejected_++;
    std::cout << "[admission] rejected err=" << err << "\n";
    return TooManyRequestsError("Too many requests, please retry later");
  }
  return std::nullopt;
}

std::optional<ApiError> ChatService::Validate(const ChatRequest& req) const {
  if (req.model.empty()) return InvalidRequestError("model is required");
  const auto& available = cfg_.models;
  const bool supported = std::find(available.begin(), available.end(), req.model) != available.end() ||
                         std::find(available.begin(), available.end(), models_.ToBackendName(req.model)) !=
                             available.end();
  if (!supported) {
    return InvalidRequestError("model '" + req.model + "' is not supported. Available models: " + JoinModels(available));
  }
  if (req.messages.empty()) return InvalidRequestError("messages is required");
  for (size_t i = 0; i < req.messages.size(); i++) {
    if (req.messages[i].role.empty()) {
      return InvalidRequestError("message[" + std::to_string(i) + "].role is required");
    }
    if (req.messages[i].content.empty()) {
      return InvalidRequestError("message[" + std::to_string(i) + "].content is required");
    }
  }
  return std::nullopt;
}

SyncResult ChatService::CompleteSync(const ChatRequest& req, CancelToken* cancel) {
  SyncResult out;
  const std::string fingerprint = Fingerprint(req);
  if (auto cached = cache_->Get(fingerprint)) {
    std::cout << "[cache] hit key=" << fingerprint << "\n";
    successes_++;
    out.body = std::move(*cached);
    out.cache_hit = true;
    return out;
  }

  TokenCounter counter;
  counter.SetInputTokens(EstimateMessageTokens(req.messages));

  auto outcome = dispatcher_.Dispatch(req, cancel);
  if (!outcome.ok()) {
    errors_++;
    const auto e = DispatchFailure(outcome);
    out.status = e.status;
    out.body = ToJson(e).dump();
    return out;
  }

  ResponseAssembler assembler(&counter, cfg_.stream.initial_buffer_size, cfg_.stream.max_buffer_size);
  std::string err;
  const auto status = assembler.Consume(outcome.response->body.get(), cancel, &err);
  if (status != ResponseAssembler::Status::kOk) {
    errors_++;
    std::cout << "[sync] chat_id=" << outcome.identity.conversation_id << " aborted err=" << err << "\n";
    const auto e = status == ResponseAssembler::Status::kCancelled ? InternalError("Request timeout: " + err)
                                                                  : InternalError("Failed to process response");
    out.status = e.status;
    out.body = ToJson(e).dump();
    return out;
  }

  CompletionMeta meta;
  meta.id = ids_->NewResponseId();
  meta.created = NowSeconds();
  meta.model = models_.ToExternalName(models_.ToBackendName(req.model));
  out.body = assembler.BuildCompletion(meta).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  cache_->Set(fingerprint, out.body);
  successes_++;
  return out;
}

PreparedStream ChatService::OpenStream(const ChatRequest& req, CancelToken* cancel) {
  PreparedStream out;
  out.counter = std::make_unique<TokenCounter>();
  out.counter->SetInputTokens(EstimateMessageTokens(req.messages));

  out.outcome = dispatcher_.Dispatch(req, cancel);
  if (!out.outcome.ok()) {
    errors_++;
    out.error = DispatchFailure(out.outcome);
    return out;
  }

  out.options.id = ids_->NewResponseId();
  out.options.created = NowSeconds();
  out.options.model = models_.ToExternalName(models_.ToBackendName(req.model));
  out.options.heartbeat_interval = cfg_.stream.heartbeat_interval;
  out.options.initial_buffer_size = cfg_.stream.initial_buffer_size;
  out.options.max_buffer_size = cfg_.stream.max_buffer_size;
  return out;
}

StreamResult ChatService::RunStream(PreparedStream* prepared, SseSink* sink, CancelToken* cancel) {
  streams_++;
  StreamSession session(prepared->options, sink, prepared->counter.get());
  auto result = session.Run(prepared->outcome.response->body.get(), cancel);
  if (result.terminal == StreamState::kFinishing) {
    successes_++;
  } else {
    errors_++;
  }
  // Closes the upstream connection before the handler returns.
  prepared->outcome.response.reset();
  return result;
}

std::string ChatService::ModelsBody() {
  if (auto cached = cache_->GetModels()) return *cached;
  nlohmann::json data = nlohmann::json::array();
  const auto created = NowSeconds();
  for (const auto& m : cfg_.models) {
    data.push_back(
        {{"id", models_.ToExternalName(m)}, {"object", "model"}, {"created", created}, {"owned_by", "linebridge"}});
  }
  nlohmann::json j;
  j["object"] = "list";
  j["data"] = std::move(data);
  auto body = j.dump();
  cache_->SetModels(body);
  return body;
}

nlohmann::json ChatService::Metrics() const {
  nlohmann::json j;
  j["requests"] = requests_.load();
  j["successes"] = successes_.load();
  j["errors"] = errors_.load();
  j["rejected"] = rejected_.load();
  j["streams"] = streams_.load();
  j["cache"] = cache_->Metrics();
  j["rate_limiter"] = limiter_->Metrics();
  j["dispatch"] = dispatcher_.Metrics();
  j["caller_pool_size"] = identities_.PoolSize();
  return j;
}

}  // namespace linebridge
