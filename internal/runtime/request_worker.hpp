#pragma once

#include <atomic>
#include <cstddef>
#include <future>
#include <memory>
#include <thread>
#include <vector>

#include "request_queue.hpp"

namespace relay::service {
class RelayService;
}

namespace relay::runtime {

/*
  Fixed pool of threads, each running one request coordinator at a time.
  Attempts within a request stay sequential; requests run in parallel.
*/
class RequestWorkerPool {
 public:
  RequestWorkerPool(std::shared_ptr<service::RelayService> service, std::size_t threads);
  ~RequestWorkerPool();

  RequestWorkerPool(const RequestWorkerPool&)            = delete;
  RequestWorkerPool& operator=(const RequestWorkerPool&) = delete;

  void Start();

  // Drains queued requests, then joins.
  void Stop();

  std::future<core::TerminalRequest> Submit(model::Request request);

  std::size_t Threads() const {
    return threads_count_;
  }

 private:
  void Run();

  std::shared_ptr<RequestQueue>          queue_;
  std::shared_ptr<service::RelayService> service_;
  std::size_t                            threads_count_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace relay::runtime
