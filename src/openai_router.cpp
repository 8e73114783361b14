#include "openai_router.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstring>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace linebridge {
namespace {

static int64_t NowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

static std::string ToLowerAscii(std::string s) {
  for (char& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_content(body.dump(), "application/json");
}

static void SendRawJson(httplib::Response* res, int status, const std::string& body) {
  res->status = status;
  res->set_content(body, "application/json");
}

static void SendError(httplib::Response* res, const ApiError& e) {
  SendJson(res, e.status, ToJson(e));
}

static std::string TrimAscii(std::string s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t' || s.front() == '\r' || s.front() == '\n')) {
    s.erase(s.begin());
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
    s.pop_back();
  }
  return s;
}

static std::optional<std::string> ExtractBearerToken(const std::string& authorization_value) {
  const auto v = TrimAscii(authorization_value);
  const auto lower = ToLowerAscii(v);
  constexpr const char* kPrefix = "bearer ";
  if (lower.size() < std::strlen(kPrefix)) return std::nullopt;
  if (lower.compare(0, std::strlen(kPrefix), kPrefix) != 0) return std::nullopt;
  auto token = TrimAscii(v.substr(std::strlen(kPrefix)));
  if (token.empty()) return std::nullopt;
  return token;
}

static void SetCorsHeaders(httplib::Response* res) {
  res->set_header("Access-Control-Allow-Origin", "*");
  res->set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
  res->set_header("Access-Control-Allow-Headers", "Authorization, Content-Type");
}

}  // namespace

OpenAiRouter::OpenAiRouter(ChatService* service) : service_(service), started_(std::chrono::steady_clock::now()) {}

void OpenAiRouter::Register(httplib::Server* server) {
  const auto& cfg = service_->config();
  const std::string api_key = cfg.api_key;

  server->set_pre_routing_handler([api_key](const httplib::Request& req, httplib::Response& res) {
    SetCorsHeaders(&res);
    if (req.method == "OPTIONS") {
      res.status = 204;
      return httplib::Server::HandlerResponse::Handled;
    }
    if (api_key.empty() || req.path == "/health") return httplib::Server::HandlerResponse::Unhandled;

    const auto header = req.get_header_value("Authorization");
    if (TrimAscii(header).empty()) {
      SendError(&res, UnauthorizedError("Missing Authorization header"));
      return httplib::Server::HandlerResponse::Handled;
    }
    const auto token = ExtractBearerToken(header);
    if (!token || *token != api_key) {
      std::cout << "[http] rejected path=" << req.path << " reason=invalid_api_key\n";
      SendError(&res, UnauthorizedError("Invalid API key"));
      return httplib::Server::HandlerResponse::Handled;
    }
    return httplib::Server::HandlerResponse::Unhandled;
  });

  server->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j;
    j["ok"] = true;
    j["status"] = "ok";
    j["uptime_seconds"] =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_).count();
    j["unix_seconds"] = NowSeconds();
    SendJson(&res, 200, j);
  });

  server->Get("/metrics", [this](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j = service_->Metrics();
    j["uptime_seconds"] =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_).count();
    SendJson(&res, 200, j);
  });

  server->Get("/v1/models", [this](const httplib::Request&, httplib::Response& res) {
    SendRawJson(&res, 200, service_->ModelsBody());
  });

  server->Post("/v1/chat/completions", [this](const httplib::Request& req, httplib::Response& res) {
    const auto& cfg = service_->config();
    {
      CancelToken admission(cfg.rate_limit.admission_timeout);
      if (auto e = service_->Admit(&admission)) {
        SendError(&res, *e);
        return;
      }
    }

    auto body = nlohmann::json::parse(req.body, nullptr, false);
    if (body.is_discarded()) {
      SendError(&res, InvalidRequestError("Failed to parse request JSON"));
      return;
    }
    ChatRequest creq;
    std::string parse_err;
    if (!ParseChatRequest(body, &creq, &parse_err)) {
      SendError(&res, InvalidRequestError("Failed to parse request JSON: " + parse_err));
      return;
    }
    if (auto e = service_->Validate(creq)) {
      std::cout << "[http] invalid request err=" << e->message << "\n";
      SendError(&res, *e);
      return;
    }
    std::cout << "[http] chat model=" << creq.model << " messages=" << creq.messages.size()
              << " stream=" << (creq.stream ? 1 : 0) << "\n";

    const auto timeout = std::chrono::seconds(cfg.backend.timeout_sec);
    if (!creq.stream) {
      CancelToken cancel(timeout);
      auto out = service_->CompleteSync(creq, &cancel);
      SendRawJson(&res, out.status, out.body);
      return;
    }

    // Dispatch before committing SSE headers so that exhausted retries still
    // produce a JSON error status.
    auto prepared = std::make_shared<PreparedStream>();
    {
      CancelToken dispatch_cancel(timeout);
      *prepared = service_->OpenStream(creq, &dispatch_cancel);
    }
    if (prepared->error) {
      SendError(&res, *prepared->error);
      return;
    }

    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    res.set_header("X-Accel-Buffering", "no");
    res.set_chunked_content_provider(
        "text/event-stream",
        [this, prepared, timeout](size_t, httplib::DataSink& sink) {
          HttpSseSink sse(&sink);
          CancelToken cancel(timeout);
          cancel.SetLivenessProbe([&sse] { return sse.IsWritable(); });
          const auto result = service_->RunStream(prepared.get(), &sse, &cancel);
          if (result.terminal == StreamState::kClientGone) return false;
          sink.done();
          return true;
        },
        [](bool) {});
  });
}

}  // namespace linebridge
