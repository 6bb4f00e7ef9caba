#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace relay::core {

/*
  Cooperative cancellation for one request.

  Cancel() may be called from any thread, any number of times.
*/
class CancellationToken {
 public:
  void Cancel();

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

  // Sleeps up to `ms`; returns false if cancelled before or during the wait.
  bool SleepFor(std::chrono::milliseconds ms) const;

 private:
  std::atomic<bool>               cancelled_{false};
  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
};

} // namespace relay::core
