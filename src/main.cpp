#include "chat_service.hpp"
#include "config.hpp"
#include "openai_router.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace {

static std::string JoinForLog(const std::vector<std::string>& items) {
  std::string out;
  for (const auto& s : items) {
    if (!out.empty()) out += ",";
    out += s;
  }
  return out.empty() ? "-" : out;
}

static void LogConfig(const linebridge::GatewayConfig& cfg) {
  std::cout << "[config] listen=" << cfg.listen.host << ":" << cfg.listen.port
            << " auth=" << (cfg.api_key.empty() ? "off" : "on") << " callers=" << cfg.caller_ids.size() << "\n";
  std::cout << "[config] backend=" << cfg.backend.base_url << " path=" << cfg.backend.path
            << " proxy=" << (cfg.backend.http_proxy.empty() ? "-" : cfg.backend.http_proxy)
            << " timeout_sec=" << cfg.backend.timeout_sec << " retry=" << cfg.backend.retry
            << " retry_delay_ms=" << cfg.backend.retry_base_delay.count()
            << " retry_max_delay_ms=" << cfg.backend.retry_max_delay.count() << "\n";
  std::cout << "[config] models=" << JoinForLog(cfg.models) << " mappings=" << cfg.model_mapping.size() << "\n";
  std::cout << "[config] cache=" << (cfg.cache.enabled ? 1 : 0) << " response_ttl_s=" << cfg.cache.response_ttl.count()
            << " rate_limit=" << (cfg.rate_limit.enabled ? 1 : 0) << " rps=" << cfg.rate_limit.requests_per_second
            << " burst=" << cfg.rate_limit.burst
            << " heartbeat_ms=" << cfg.stream.heartbeat_interval.count()
            << " max_line_bytes=" << cfg.stream.max_buffer_size << "\n";
}

}  // namespace

int main() {
  std::cout.setf(std::ios::unitbuf);

  auto cfg = linebridge::LoadConfigFromEnv();
  std::string err;
  if (!linebridge::ValidateConfig(cfg, &err)) {
    std::cout << "[config] invalid err=" << err << "\n";
    return 1;
  }
  LogConfig(cfg);

  linebridge::ChatService service(cfg, linebridge::ChatServiceDeps{});
  linebridge::OpenAiRouter router(&service);

  httplib::Server server;
  router.Register(&server);

  server.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
        message = "unknown exception";
      }
    }
    std::cout << "[http] handler exception path=" << req.path << " err=" << message << "\n";
    res.status = 500;
    res.set_content(linebridge::ToJson(linebridge::InternalError(message)).dump(), "application/json");
  });

  server.set_error_handler([](const httplib::Request&, httplib::Response& res) {
    if (!res.body.empty()) return;
    std::string message;
    std::string type = "invalid_request_error";
    if (res.status == 404) {
      message = "not found";
    } else if (res.status == 405) {
      message = "method not allowed";
    } else if (res.status >= 500) {
      message = "internal server error";
      type = "server_error";
    } else {
      message = "bad request";
    }
    res.set_content(linebridge::MakeError(message, type).dump(), "application/json");
  });

  server.set_keep_alive_timeout(5);
  server.set_read_timeout(cfg.listen.read_timeout_sec);
  server.set_write_timeout(cfg.listen.write_timeout_sec);

  std::cout << "[http] listen host=" << cfg.listen.host << " port=" << cfg.listen.port << "\n";
  const bool ok = server.listen(cfg.listen.host, cfg.listen.port);
  std::cout << "[http] listen returned ok=" << (ok ? 1 : 0) << "\n";
  return ok ? 0 : 1;
}
