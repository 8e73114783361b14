#include "config.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace linebridge {
namespace {

static const char* kDefaultModels = "gpt-4.1-mini,claude-3-7-sonnet,grok-3-mini,qwen-qwq";
static const char* kDefaultCallerId = "default_user";

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

static std::optional<long long> TryParseInt(const std::string& s) {
  if (s.empty()) return std::nullopt;
  char* end = nullptr;
  const long long v = std::strtoll(s.c_str(), &end, 10);
  if (!end || *end != '\0') return std::nullopt;
  return v;
}

// Accepts "250ms", "30s", "5m", "1h" or a bare number of seconds.
static std::optional<std::chrono::milliseconds> TryParseDuration(const std::string& s) {
  if (s.empty()) return std::nullopt;
  size_t i = 0;
  while (i < s.size() && s[i] >= '0' && s[i] <= '9') i++;
  if (i == 0) return std::nullopt;
  const auto n = TryParseInt(s.substr(0, i));
  if (!n) return std::nullopt;
  const std::string unit = ToLower(s.substr(i));
  if (unit.empty() || unit == "s") return std::chrono::milliseconds(*n * 1000);
  if (unit == "ms") return std::chrono::milliseconds(*n);
  if (unit == "m") return std::chrono::milliseconds(*n * 60 * 1000);
  if (unit == "h") return std::chrono::milliseconds(*n * 3600 * 1000);
  return std::nullopt;
}

static void LoadInt(const char* name, int* out) {
  auto raw = GetEnvStr(name);
  if (raw.empty()) return;
  auto v = TryParseInt(raw);
  if (!v) {
    std::cout << "[config] invalid integer " << name << "=" << raw << " using default=" << *out << "\n";
    return;
  }
  *out = static_cast<int>(*v);
}

static void LoadBool(const char* name, bool* out) {
  auto raw = GetEnvStr(name);
  if (raw.empty()) return;
  if (!TryParseBool(raw, out)) {
    std::cout << "[config] invalid boolean " << name << "=" << raw << " using default=" << (*out ? "true" : "false")
              << "\n";
  }
}

template <typename Duration>
static void LoadDuration(const char* name, Duration* out) {
  auto raw = GetEnvStr(name);
  if (raw.empty()) return;
  auto v = TryParseDuration(raw);
  if (!v) {
    std::cout << "[config] invalid duration " << name << "=" << raw << "\n";
    return;
  }
  *out = std::chrono::duration_cast<Duration>(*v);
}

static std::vector<std::pair<std::string, std::string>> ParseMapping(const std::string& s) {
  std::vector<std::pair<std::string, std::string>> out;
  for (const auto& item : SplitCsv(s)) {
    auto eq = item.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 >= item.size()) {
      std::cout << "[config] ignoring model mapping entry=" << item << "\n";
      continue;
    }
    out.emplace_back(item.substr(0, eq), item.substr(eq + 1));
  }
  return out;
}

}  // namespace

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = url;
  if (StartsWith(s, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(s, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
  }

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }
  if (ep.base_path == "/") ep.base_path.clear();

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    ep.port = std::atoi(s.substr(colon_pos + 1).c_str());
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.port == 0) ep.port = default_port;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

std::vector<std::string> SplitCsv(const std::string& s) {
  std::vector<std::string> out;
  std::string cur;
  for (char c : s) {
    if (c == ',') {
      out.push_back(cur);
      cur.clear();
      continue;
    }
    cur.push_back(c);
  }
  out.push_back(cur);
  std::vector<std::string> filtered;
  for (auto& v : out) {
    while (!v.empty() && (v.front() == ' ' || v.front() == '\t')) v.erase(v.begin());
    while (!v.empty() && (v.back() == ' ' || v.back() == '\t')) v.pop_back();
    if (!v.empty()) filtered.push_back(std::move(v));
  }
  return filtered;
}

GatewayConfig LoadConfigFromEnv() {
  GatewayConfig cfg;

  if (auto host = GetEnvStr("LINEBRIDGE_LISTEN_HOST"); !host.empty()) cfg.listen.host = host;
  LoadInt("LINEBRIDGE_LISTEN_PORT", &cfg.listen.port);
  LoadInt("LINEBRIDGE_READ_TIMEOUT", &cfg.listen.read_timeout_sec);
  LoadInt("LINEBRIDGE_WRITE_TIMEOUT", &cfg.listen.write_timeout_sec);

  cfg.api_key = GetEnvStr("LINEBRIDGE_API_KEY");
  cfg.caller_ids = SplitCsv(GetEnvStr("LINEBRIDGE_CALLER_IDS"));
  if (cfg.caller_ids.empty()) cfg.caller_ids.push_back(kDefaultCallerId);

  if (auto base = GetEnvStr("LINEBRIDGE_BASE_URL"); !base.empty()) cfg.backend.base_url = base;
  if (!cfg.backend.base_url.empty() && cfg.backend.base_url.back() != '/') cfg.backend.base_url.push_back('/');
  cfg.backend.endpoint =
      ParseHttpEndpoint(cfg.backend.base_url, StartsWith(cfg.backend.base_url, "http://") ? 80 : 443);
  if (auto path = GetEnvStr("LINEBRIDGE_BACKEND_PATH"); !path.empty()) cfg.backend.path = path;
  cfg.backend.http_proxy = GetEnvStr("HTTP_PROXY");
  if (cfg.backend.http_proxy.empty()) cfg.backend.http_proxy = GetEnvStr("http_proxy");
  LoadInt("LINEBRIDGE_CLIENT_TIMEOUT", &cfg.backend.timeout_sec);
  LoadInt("LINEBRIDGE_RETRY", &cfg.backend.retry);
  if (cfg.backend.retry < 1) cfg.backend.retry = 1;
  LoadDuration("LINEBRIDGE_RETRY_DELAY", &cfg.backend.retry_base_delay);
  LoadDuration("LINEBRIDGE_RETRY_MAX_DELAY", &cfg.backend.retry_max_delay);
  if (auto tz = GetEnvStr("LINEBRIDGE_TIME_ZONE"); !tz.empty()) cfg.backend.time_zone = tz;

  auto models = GetEnvStr("LINEBRIDGE_MODELS");
  cfg.models = SplitCsv(models.empty() ? std::string(kDefaultModels) : models);
  cfg.model_mapping = ParseMapping(GetEnvStr("LINEBRIDGE_MODEL_MAPPING"));

  LoadBool("LINEBRIDGE_CACHE_ENABLED", &cfg.cache.enabled);
  LoadDuration("LINEBRIDGE_RESPONSE_CACHE_TTL", &cfg.cache.response_ttl);
  LoadDuration("LINEBRIDGE_MODEL_CACHE_TTL", &cfg.cache.model_ttl);
  LoadDuration("LINEBRIDGE_CACHE_CLEANUP_INTERVAL", &cfg.cache.cleanup_interval);

  LoadBool("LINEBRIDGE_RATE_LIMIT_ENABLED", &cfg.rate_limit.enabled);
  if (auto rps = GetEnvStr("LINEBRIDGE_REQUESTS_PER_SECOND"); !rps.empty()) {
    char* end = nullptr;
    const double v = std::strtod(rps.c_str(), &end);
    if (end && *end == '\0') {
      cfg.rate_limit.requests_per_second = v;
    } else {
      std::cout << "[config] invalid number LINEBRIDGE_REQUESTS_PER_SECOND=" << rps << "\n";
    }
  }
  LoadInt("LINEBRIDGE_BURST", &cfg.rate_limit.burst);
  LoadDuration("LINEBRIDGE_ADMISSION_TIMEOUT", &cfg.rate_limit.admission_timeout);

  LoadDuration("LINEBRIDGE_HEARTBEAT_INTERVAL", &cfg.stream.heartbeat_interval);
  int max_line_kb = static_cast<int>(cfg.stream.max_buffer_size / 1024);
  LoadInt("LINEBRIDGE_MAX_LINE_KB", &max_line_kb);
  if (max_line_kb > 0) cfg.stream.max_buffer_size = static_cast<size_t>(max_line_kb) * 1024;
  if (cfg.stream.initial_buffer_size > cfg.stream.max_buffer_size) {
    cfg.stream.initial_buffer_size = cfg.stream.max_buffer_size;
  }

  return cfg;
}

bool ValidateConfig(const GatewayConfig& cfg, std::string* err) {
  if (cfg.listen.port <= 0 || cfg.listen.port > 65535) {
    if (err) *err = "invalid port: " + std::to_string(cfg.listen.port);
    return false;
  }
  if (cfg.models.empty()) {
    if (err) *err = "at least one model must be available";
    return false;
  }
  if (cfg.backend.retry < 1) {
    if (err) *err = "retry count must be at least 1";
    return false;
  }
  if (cfg.rate_limit.enabled && (cfg.rate_limit.requests_per_second <= 0 || cfg.rate_limit.burst < 1)) {
    if (err) *err = "rate limit requires a positive rate and a burst of at least 1";
    return false;
  }
  if (cfg.stream.heartbeat_interval.count() <= 0) {
    if (err) *err = "heartbeat interval must be positive";
    return false;
  }
  return true;
}

}  // namespace linebridge
