#include "request_queue.hpp"

#include "internal/util/errors.hpp"

namespace relay::runtime {

void RequestQueue::Enqueue(RequestTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      throw util::InvalidState("request queue is shut down");
    }
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<RequestTask> RequestQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  RequestTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void RequestQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t RequestQueue::Size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace relay::runtime
