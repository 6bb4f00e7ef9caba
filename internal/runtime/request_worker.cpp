#include "request_worker.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/service/relay_service.hpp"
#include "internal/util/errors.hpp"

namespace relay::runtime {

using relay::observability::IntField;
using relay::observability::StringField;

RequestWorkerPool::RequestWorkerPool(std::shared_ptr<service::RelayService> service, std::size_t threads)
    : queue_(std::make_shared<RequestQueue>()), service_(std::move(service)), threads_count_(threads == 0 ? 1 : threads) {
  if (!service_) {
    throw util::InvalidArgument("request worker pool requires a service");
  }
}

RequestWorkerPool::~RequestWorkerPool() {
  Stop();
}

void RequestWorkerPool::Start() {
  if (running_.exchange(true)) {
    return;
  }
  threads_.reserve(threads_count_);
  for (std::size_t i = 0; i < threads_count_; ++i) {
    threads_.emplace_back(&RequestWorkerPool::Run, this);
  }
  RELAY_LOG_INFO("request workers started", {IntField("threads", static_cast<int64_t>(threads_count_))});
}

void RequestWorkerPool::Stop() {
  queue_->Shutdown();
  running_ = false;
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

std::future<core::TerminalRequest> RequestWorkerPool::Submit(model::Request request) {
  RequestTask task;
  task.request = std::move(request);
  auto future  = task.done.get_future();
  queue_->Enqueue(std::move(task));
  return future;
}

void RequestWorkerPool::Run() {
  while (true) {
    auto task = queue_->Dequeue();
    if (!task) break;

    try {
      task->done.set_value(service_->Handle(std::move(task->request)));
    } catch (const std::exception& e) {
      RELAY_LOG_ERROR("request worker failed", {StringField("error", e.what())});
      task->done.set_exception(std::current_exception());
    }
  }
}

} // namespace relay::runtime
