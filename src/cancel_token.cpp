#include "cancel_token.hpp"

#include <algorithm>

namespace linebridge {

// The liveness probe cannot signal, so sleepers re-check it at this period.
static constexpr std::chrono::milliseconds kPollSlice{50};

CancelToken::CancelToken(std::chrono::steady_clock::duration timeout)
    : deadline_(std::chrono::steady_clock::now() + timeout) {}

void CancelToken::Cancel() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    cancelled_.store(true);
  }
  cv_.notify_all();
}

bool CancelToken::DeadlinePassed() const {
  return deadline_.has_value() && std::chrono::steady_clock::now() >= *deadline_;
}

bool CancelToken::IsCancelled() const {
  if (cancelled_.load()) return true;
  if (DeadlinePassed()) return true;
  if (alive_ && !alive_()) return true;
  return false;
}

bool CancelToken::SleepFor(std::chrono::milliseconds d) const {
  const auto until = std::chrono::steady_clock::now() + d;
  while (true) {
    if (IsCancelled()) return false;
    const auto now = std::chrono::steady_clock::now();
    if (now >= until) return true;
    const auto slice = std::min<std::chrono::steady_clock::duration>(until - now, kPollSlice);
    std::unique_lock<std::mutex> lock(mu_);
    cv_.wait_for(lock, slice, [&] { return cancelled_.load(); });
  }
}

std::string CancelToken::Reason() const {
  if (!cancelled_.load() && DeadlinePassed()) return "context deadline exceeded";
  return "context canceled";
}

}  // namespace linebridge
