#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace linebridge {

struct HttpListenConfig {
  std::string host = "0.0.0.0";
  int port = 8080;
  int read_timeout_sec = 30;
  int write_timeout_sec = 30;
};

struct HttpEndpoint {
  std::string scheme = "https";
  std::string host = "scira.ai";
  int port = 443;
  std::string base_path;
};

struct BackendConfig {
  std::string base_url = "https://scira.ai/";
  HttpEndpoint endpoint;
  std::string path = "/api/search";
  std::string http_proxy;
  int timeout_sec = 300;
  int retry = 1;
  std::chrono::milliseconds retry_base_delay{500};
  std::chrono::milliseconds retry_max_delay{5000};
  std::string time_zone = "Asia/Shanghai";
};

struct CacheConfig {
  bool enabled = true;
  std::chrono::seconds response_ttl{300};
  std::chrono::seconds model_ttl{3600};
  std::chrono::seconds cleanup_interval{600};
};

struct RateLimitConfig {
  bool enabled = true;
  double requests_per_second = 1.0;
  int burst = 10;
  std::chrono::seconds admission_timeout{30};
};

struct StreamConfig {
  std::chrono::milliseconds heartbeat_interval{15000};
  size_t initial_buffer_size = 128 * 1024;
  size_t max_buffer_size = 2 * 1024 * 1024;
};

struct GatewayConfig {
  HttpListenConfig listen;
  std::string api_key;
  std::vector<std::string> caller_ids;
  BackendConfig backend;
  std::vector<std::string> models;
  std::vector<std::pair<std::string, std::string>> model_mapping;
  CacheConfig cache;
  RateLimitConfig rate_limit;
  StreamConfig stream;
};

GatewayConfig LoadConfigFromEnv();
bool ValidateConfig(const GatewayConfig& cfg, std::string* err);

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port);
std::vector<std::string> SplitCsv(const std::string& s);

}  // namespace linebridge
