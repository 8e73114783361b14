#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace linebridge {

// Request-scoped cancellation: explicit Cancel(), an optional deadline, and an
// optional liveness probe that reports whether the client is still attached.
class CancelToken {
 public:
  CancelToken() = default;
  explicit CancelToken(std::chrono::steady_clock::duration timeout);

  CancelToken(const CancelToken&) = delete;
  CancelToken& operator=(const CancelToken&) = delete;

  void Cancel();
  bool IsCancelled() const;

  // Must be installed before the token is shared with other threads.
  void SetLivenessProbe(std::function<bool()> probe) { alive_ = std::move(probe); }

  // Returns false when the wait was cut short by cancellation.
  bool SleepFor(std::chrono::milliseconds d) const;

  std::string Reason() const;

 private:
  bool DeadlinePassed() const;

  std::atomic<bool> cancelled_{false};
  std::optional<std::chrono::steady_clock::time_point> deadline_;
  std::function<bool()> alive_;
  mutable std::mutex mu_;
  mutable std::condition_variable cv_;
};

}  // namespace linebridge
