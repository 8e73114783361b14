#pragma once

#include "cancel_token.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace linebridge {

class IRateLimiter {
 public:
  virtual ~IRateLimiter() = default;

  virtual bool Allow() = 0;
  // Blocks until admitted; false with the token's reason once it is cancelled.
  virtual bool Wait(CancelToken* cancel, std::string* err) = 0;
  virtual nlohmann::json Metrics() const = 0;
};

class UnlimitedRateLimiter : public IRateLimiter {
 public:
  bool Allow() override { return true; }
  bool Wait(CancelToken*, std::string*) override { return true; }
  nlohmann::json Metrics() const override { return {{"enabled", false}}; }
};

class TokenBucketLimiter : public IRateLimiter {
 public:
  TokenBucketLimiter(double rate_per_second, int burst);

  bool Allow() override;
  bool Wait(CancelToken* cancel, std::string* err) override;
  nlohmann::json Metrics() const override;

 private:
  double rate_;
  int burst_;
  mutable std::mutex mu_;
  double tokens_;
  std::chrono::steady_clock::time_point last_;

  std::atomic<uint64_t> requests_{0};
  std::atomic<uint64_t> allowed_{0};
  std::atomic<uint64_t> rejected_{0};
};

}  // namespace linebridge
