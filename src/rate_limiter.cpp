#include "rate_limiter.hpp"

#include <algorithm>
#include <thread>

namespace linebridge {

static constexpr std::chrono::milliseconds kWaitPollInterval{10};

TokenBucketLimiter::TokenBucketLimiter(double rate_per_second, int burst)
    : rate_(rate_per_second), burst_(burst), tokens_(burst), last_(std::chrono::steady_clock::now()) {}

bool TokenBucketLimiter::Allow() {
  requests_++;
  std::lock_guard<std::mutex> lock(mu_);
  const auto now = std::chrono::steady_clock::now();
  const double elapsed = std::chrono::duration<double>(now - last_).count();
  last_ = now;
  tokens_ = std::min(static_cast<double>(burst_), tokens_ + elapsed * rate_);
  if (tokens_ < 1.0) {
    rejected_++;
    return false;
  }
  tokens_ -= 1.0;
  allowed_++;
  return true;
}

bool TokenBucketLimiter::Wait(CancelToken* cancel, std::string* err) {
  while (true) {
    if (Allow()) return true;
    if (cancel) {
      if (!cancel->SleepFor(kWaitPollInterval)) {
        if (err) *err = cancel->Reason();
        return false;
      }
    } else {
      std::this_thread::sleep_for(kWaitPollInterval);
    }
  }
}

nlohmann::json TokenBucketLimiter::Metrics() const {
  nlohmann::json j;
  j["enabled"] = true;
  j["rate"] = rate_;
  j["burst"] = burst_;
  {
    std::lock_guard<std::mutex> lock(mu_);
    j["available_tokens"] = tokens_;
  }
  j["requests"] = requests_.load();
  j["allowed"] = allowed_.load();
  j["rejected"] = rejected_.load();
  return j;
}

}  // namespace linebridge
