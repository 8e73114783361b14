#include <gtest/gtest.h>

#include "config.hpp"

#include <cstdlib>

using namespace linebridge;

class ConfigTest : public ::testing::Test {
 protected:
  void TearDown() override {
    for (const char* key : kKeys) unsetenv(key);
  }

  static constexpr const char* kKeys[] = {
      "LINEBRIDGE_LISTEN_PORT",      "LINEBRIDGE_BASE_URL",  "LINEBRIDGE_RETRY",
      "LINEBRIDGE_RETRY_DELAY",      "LINEBRIDGE_MODELS",    "LINEBRIDGE_MODEL_MAPPING",
      "LINEBRIDGE_CALLER_IDS",       "LINEBRIDGE_CACHE_ENABLED", "LINEBRIDGE_HEARTBEAT_INTERVAL",
      "LINEBRIDGE_MAX_LINE_KB",      "LINEBRIDGE_REQUESTS_PER_SECOND",
  };
};

TEST_F(ConfigTest, DefaultsAreValid) {
  auto cfg = LoadConfigFromEnv();
  std::string err;
  EXPECT_TRUE(ValidateConfig(cfg, &err)) << err;
  EXPECT_EQ(cfg.listen.port, 8080);
  EXPECT_EQ(cfg.backend.retry, 1);
  EXPECT_EQ(cfg.caller_ids.size(), 1u);
  EXPECT_FALSE(cfg.models.empty());
  EXPECT_EQ(cfg.stream.heartbeat_interval.count(), 15000);
  EXPECT_EQ(cfg.backend.endpoint.scheme, "https");
  EXPECT_EQ(cfg.backend.endpoint.port, 443);
}

TEST_F(ConfigTest, ReadsEnvironment) {
  setenv("LINEBRIDGE_LISTEN_PORT", "9090", 1);
  setenv("LINEBRIDGE_BASE_URL", "http://backend.local:8000", 1);
  setenv("LINEBRIDGE_RETRY", "3", 1);
  setenv("LINEBRIDGE_RETRY_DELAY", "250ms", 1);
  setenv("LINEBRIDGE_MODELS", "a, b ,,c", 1);
  setenv("LINEBRIDGE_MODEL_MAPPING", "ext=int,broken", 1);
  setenv("LINEBRIDGE_CALLER_IDS", "u1,u2", 1);
  setenv("LINEBRIDGE_CACHE_ENABLED", "false", 1);
  setenv("LINEBRIDGE_HEARTBEAT_INTERVAL", "2s", 1);
  setenv("LINEBRIDGE_MAX_LINE_KB", "64", 1);

  auto cfg = LoadConfigFromEnv();
  EXPECT_EQ(cfg.listen.port, 9090);
  EXPECT_EQ(cfg.backend.base_url, "http://backend.local:8000/");
  EXPECT_EQ(cfg.backend.endpoint.scheme, "http");
  EXPECT_EQ(cfg.backend.endpoint.host, "backend.local");
  EXPECT_EQ(cfg.backend.endpoint.port, 8000);
  EXPECT_EQ(cfg.backend.retry, 3);
  EXPECT_EQ(cfg.backend.retry_base_delay.count(), 250);
  ASSERT_EQ(cfg.models.size(), 3u);
  EXPECT_EQ(cfg.models[1], "b");
  ASSERT_EQ(cfg.model_mapping.size(), 1u);
  EXPECT_EQ(cfg.model_mapping[0].first, "ext");
  EXPECT_EQ(cfg.model_mapping[0].second, "int");
  EXPECT_EQ(cfg.caller_ids.size(), 2u);
  EXPECT_FALSE(cfg.cache.enabled);
  EXPECT_EQ(cfg.stream.heartbeat_interval.count(), 2000);
  EXPECT_EQ(cfg.stream.max_buffer_size, 64u * 1024u);
  EXPECT_LE(cfg.stream.initial_buffer_size, cfg.stream.max_buffer_size);
}

TEST_F(ConfigTest, InvalidValuesKeepDefaults) {
  setenv("LINEBRIDGE_LISTEN_PORT", "eighty", 1);
  setenv("LINEBRIDGE_RETRY_DELAY", "soon", 1);
  setenv("LINEBRIDGE_REQUESTS_PER_SECOND", "fast", 1);
  setenv("LINEBRIDGE_RETRY", "0", 1);
  auto cfg = LoadConfigFromEnv();
  EXPECT_EQ(cfg.listen.port, 8080);
  EXPECT_EQ(cfg.backend.retry_base_delay.count(), 500);
  EXPECT_DOUBLE_EQ(cfg.rate_limit.requests_per_second, 1.0);
  EXPECT_EQ(cfg.backend.retry, 1);
}

TEST_F(ConfigTest, ValidationRejectsBadValues) {
  GatewayConfig cfg = LoadConfigFromEnv();
  std::string err;
  cfg.listen.port = 70000;
  EXPECT_FALSE(ValidateConfig(cfg, &err));
  EXPECT_NE(err.find("port"), std::string::npos);

  cfg = LoadConfigFromEnv();
  cfg.models.clear();
  EXPECT_FALSE(ValidateConfig(cfg, &err));

  cfg = LoadConfigFromEnv();
  cfg.rate_limit.requests_per_second = 0;
  EXPECT_FALSE(ValidateConfig(cfg, &err));
  cfg.rate_limit.enabled = false;
  EXPECT_TRUE(ValidateConfig(cfg, &err));
}

TEST_F(ConfigTest, ParseEndpoint) {
  auto ep = ParseHttpEndpoint("https://api.example.com/v2/", 443);
  EXPECT_EQ(ep.scheme, "https");
  EXPECT_EQ(ep.host, "api.example.com");
  EXPECT_EQ(ep.port, 443);
  EXPECT_EQ(ep.base_path, "/v2/");

  auto root = ParseHttpEndpoint("http://127.0.0.1:9000/", 80);
  EXPECT_EQ(root.port, 9000);
  EXPECT_TRUE(root.base_path.empty());
}

TEST_F(ConfigTest, SplitCsvDropsBlanks) {
  auto parts = SplitCsv(" a ,, b,");
  ASSERT_EQ(parts.size(), 2u);
  EXPECT_EQ(parts[0], "a");
  EXPECT_EQ(parts[1], "b");
  EXPECT_TRUE(SplitCsv("").empty());
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
