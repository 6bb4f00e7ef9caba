#include "cancellation.hpp"

namespace relay::core {

void CancellationToken::Cancel() {
  {
    std::lock_guard lock(mutex_);
    cancelled_.store(true, std::memory_order_release);
  }
  cv_.notify_all();
}

bool CancellationToken::SleepFor(std::chrono::milliseconds ms) const {
  if (ms.count() <= 0) {
    return !IsCancelled();
  }
  std::unique_lock lock(mutex_);
  return !cv_.wait_for(lock, ms, [this] { return cancelled_.load(std::memory_order_acquire); });
}

} // namespace relay::core
