#pragma once

#include "chat_types.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace linebridge {

// "resp:" + hex SHA-256 of {model, messages, stream:false}.
std::string Fingerprint(const ChatRequest& req);

// Stores serialized bodies so a hit replays the original bytes.
class IResponseCache {
 public:
  virtual ~IResponseCache() = default;

  virtual std::optional<std::string> Get(const std::string& fingerprint) = 0;
  virtual void Set(const std::string& fingerprint, const std::string& body) = 0;
  virtual std::optional<std::string> GetModels() = 0;
  virtual void SetModels(const std::string& body) = 0;
  virtual bool Enabled() const = 0;
  virtual nlohmann::json Metrics() const = 0;
};

class NullResponseCache : public IResponseCache {
 public:
  std::optional<std::string> Get(const std::string&) override { return std::nullopt; }
  void Set(const std::string&, const std::string&) override {}
  std::optional<std::string> GetModels() override { return std::nullopt; }
  void SetModels(const std::string&) override {}
  bool Enabled() const override { return false; }
  nlohmann::json Metrics() const override { return {{"enabled", false}}; }
};

class TtlResponseCache : public IResponseCache {
 public:
  TtlResponseCache(std::chrono::milliseconds response_ttl,
                   std::chrono::milliseconds model_ttl,
                   std::chrono::milliseconds cleanup_interval);

  std::optional<std::string> Get(const std::string& fingerprint) override;
  void Set(const std::string& fingerprint, const std::string& body) override;
  std::optional<std::string> GetModels() override;
  void SetModels(const std::string& body) override;
  bool Enabled() const override { return true; }
  nlohmann::json Metrics() const override;

  size_t Size() const;

 private:
  using Clock = std::chrono::steady_clock;

  struct Entry {
    std::string body;
    Clock::time_point expires_at;
  };

  void SweepLocked(Clock::time_point now);

  std::chrono::milliseconds response_ttl_;
  std::chrono::milliseconds model_ttl_;
  std::chrono::milliseconds cleanup_interval_;

  mutable std::mutex mu_;
  std::unordered_map<std::string, Entry> entries_;
  std::optional<Entry> models_;
  Clock::time_point last_sweep_;

  std::atomic<uint64_t> hits_{0};
  std::atomic<uint64_t> misses_{0};
  std::atomic<uint64_t> evictions_{0};
};

}  // namespace linebridge
