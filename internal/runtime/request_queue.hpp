#pragma once

#include <condition_variable>
#include <cstddef>
#include <future>
#include <mutex>
#include <optional>
#include <queue>

#include "internal/core/retry_coordinator.hpp"
#include "internal/model/request.hpp"

namespace relay::runtime {

struct RequestTask {
  model::Request                        request;
  std::promise<core::TerminalRequest>   done;
};

/*
  Thread-safe blocking queue feeding the request workers.
*/
class RequestQueue {
 public:
  // Throws util::InvalidState after Shutdown().
  void Enqueue(RequestTask task);

  // blocking wait; nullopt once shut down and drained
  std::optional<RequestTask> Dequeue();

  void Shutdown();

  std::size_t Size() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<RequestTask> queue_;
  bool                    shutdown_ = false;
};

} // namespace relay::runtime
