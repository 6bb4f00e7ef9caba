#include <assert.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "internal/balancer/balancer_set.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/config/policy_store.hpp"
#include "internal/core/cancellation.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/dispatch/simulated_dispatcher.hpp"
#include "internal/factory.hpp"
#include "internal/recorder/execution_recorder.hpp"
#include "internal/registry/auto_disable.hpp"
#include "internal/registry/channel_registry.hpp"
#include "internal/runtime/request_worker.hpp"
#include "internal/service/relay_service.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using relay::core::CancellationToken;
using relay::dispatch::ChannelProfile;
using relay::dispatch::ChunkSink;
using relay::dispatch::DispatchOutcome;
using relay::dispatch::DispatchRequest;
using relay::dispatch::Dispatcher;
using relay::dispatch::ErrorClassification;
using relay::dispatch::SimulatedDispatcher;
using relay::model::Channel;
using relay::model::ExecutionStatus;
using relay::model::Request;
using relay::model::RequestStatus;
using relay::model::RetryPolicy;
using relay::runtime::RequestWorkerPool;
using relay::service::RelayService;
using relay::service::ServiceContext;
using namespace std::chrono_literals;

/*
  Fails every attempt with a transient error. While the gate is closed each
  attempt blocks until the gate opens or the request is canceled.
*/
class GatedDispatcher : public Dispatcher {
 public:
  DispatchOutcome Dispatch(const DispatchRequest&, const Channel&, const CancellationToken& cancel, const ChunkSink&) override {
    DispatchOutcome outcome;
    outcome.started_at = relay::util::Now();
    {
      std::unique_lock lock(mutex_);
      ++entered;
      entered_cv_.notify_all();
      while (!open_ && !cancel.IsCancelled()) {
        cv_.wait_for(lock, 5ms);
      }
    }

    outcome.finished_at = relay::util::Now();
    if (cancel.IsCancelled()) {
      outcome.classification = ErrorClassification::kCancellation;
      outcome.error_message  = "canceled during dispatch";
      return outcome;
    }
    outcome.classification = ErrorClassification::kTransient;
    outcome.status_code    = 503;
    outcome.error_message  = "upstream returned HTTP 503";
    return outcome;
  }

  void Open() {
    {
      std::lock_guard lock(mutex_);
      open_ = true;
    }
    cv_.notify_all();
  }

  void WaitEntered(int n) {
    std::unique_lock lock(mutex_);
    entered_cv_.wait_for(lock, 5s, [&] { return entered.load() >= n; });
    assert(entered.load() >= n && "dispatcher was never reached");
  }

  std::atomic<int> entered{0};

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  std::condition_variable entered_cv_;
  bool                    open_ = false;
};

Channel MakeChannel(int64_t id) {
  Channel channel;
  channel.id   = id;
  channel.name = "ch-" + std::to_string(id);
  return channel;
}

Request MakeRequest(const std::string& id = "") {
  Request request;
  request.id           = id;
  request.model_id     = "gpt-4o";
  request.request_body = "{\"messages\":[]}";
  return request;
}

ServiceContext MakeContext(std::shared_ptr<Dispatcher> dispatcher, RetryPolicy policy, int channels) {
  std::vector<Channel> list;
  for (int i = 1; i <= channels; ++i) list.push_back(MakeChannel(i));

  relay::balancer::BalancerOptions options;
  options.seed = 5;

  ServiceContext ctx;
  ctx.recorder      = std::make_shared<relay::recorder::ExecutionRecorder>(std::make_shared<relay::db::memory::MemoryRepository>());
  ctx.registry      = std::make_shared<relay::registry::ChannelRegistry>(std::move(list));
  ctx.auto_disabler = std::make_shared<relay::registry::AutoDisabler>(ctx.registry);
  ctx.balancers     = std::make_shared<relay::balancer::LoadBalancerSet>(std::make_shared<relay::balancer::HealthTracker>(), options);
  ctx.dispatcher    = std::move(dispatcher);
  ctx.policies      = std::make_shared<relay::config::PolicyStore>(policy);
  ctx.sleeper       = [](std::chrono::milliseconds, const CancellationToken& cancel) { return !cancel.IsCancelled(); };
  return ctx;
}

RetryPolicy Policy(int32_t channels, int32_t same) {
  RetryPolicy policy;
  policy.max_channel_retries        = channels;
  policy.max_single_channel_retries = same;
  policy.retry_delay_ms             = 0;
  return policy;
}

void TestParallelRequestsKeepAttemptsSequential() {
  ChannelProfile flaky;
  flaky.failure_rate   = 0.4;
  flaky.latency_ms     = 2;
  flaky.first_chunk_ms = 1;

  auto dispatcher = std::make_shared<SimulatedDispatcher>(
      std::unordered_map<int64_t, ChannelProfile>{{1, flaky}, {2, flaky}, {3, flaky}}, 21);
  auto service = std::make_shared<RelayService>(MakeContext(dispatcher, Policy(3, 2), 3));

  RequestWorkerPool pool(service, 8);
  pool.Start();

  std::vector<std::future<relay::core::TerminalRequest>> futures;
  for (int i = 0; i < 48; ++i) {
    auto request   = MakeRequest();
    request.stream = i % 2 == 0;
    futures.push_back(pool.Submit(std::move(request)));
  }

  std::unordered_set<std::string> ids;
  for (auto& future : futures) {
    const auto terminal = future.get();
    assert(ids.insert(terminal.request.id).second);
    assert(terminal.request.status == RequestStatus::kCompleted || terminal.request.status == RequestStatus::kFailed);
    assert(terminal.executions.size() >= 1 && terminal.executions.size() <= 9);

    const auto trail = service->Audit(terminal.request.id);
    assert(trail.has_value());
    assert(trail->request.status == terminal.request.status);
    assert(trail->executions.size() == terminal.executions.size());
    for (size_t i = 0; i < trail->executions.size(); ++i) {
      const auto& execution = trail->executions[i];
      assert(execution.attempt == static_cast<int64_t>(i + 1));
      // attempts never overlap
      if (i > 0) assert(execution.created_at >= trail->executions[i - 1].updated_at);
    }
    if (terminal.request.status == RequestStatus::kCompleted) {
      assert(trail->executions.back().status == ExecutionStatus::kCompleted);
      assert(trail->usage.size() == 1);
    }
  }

  pool.Stop();
  assert(service->InFlight() == 0);

  const auto performance = service->Performance(relay::util::Now() - 1h);
  assert(!performance.empty());
  uint64_t attempts = 0;
  for (const auto& row : performance) attempts += row.attempts;
  assert(attempts >= 48);
}

void TestCancelInFlightRequestById() {
  auto dispatcher = std::make_shared<GatedDispatcher>();
  auto service    = std::make_shared<RelayService>(MakeContext(dispatcher, Policy(3, 2), 3));

  auto pending = std::async(std::launch::async, [&] { return service->Handle(MakeRequest("req-cancel")); });
  dispatcher->WaitEntered(1);

  assert(service->InFlight() == 1);
  assert(!service->Cancel("someone-else"));
  assert(service->Cancel("req-cancel"));

  const auto terminal = pending.get();
  assert(terminal.request.status == RequestStatus::kCanceled);
  assert(terminal.executions.size() == 1);
  assert(terminal.executions[0].status == ExecutionStatus::kCanceled);
  assert(service->InFlight() == 0);
  assert(!service->Cancel("req-cancel"));

  const auto trail = service->Audit("req-cancel");
  assert(trail->request.status == RequestStatus::kCanceled);
  assert(trail->executions.size() == 1);
}

void TestDuplicateInFlightIdIsRejected() {
  auto dispatcher = std::make_shared<GatedDispatcher>();
  auto service    = std::make_shared<RelayService>(MakeContext(dispatcher, Policy(1, 0), 1));

  auto first = std::async(std::launch::async, [&] { return service->Handle(MakeRequest("dup")); });
  dispatcher->WaitEntered(1);

  bool threw = false;
  try {
    (void)service->Handle(MakeRequest("dup"));
  } catch (const relay::util::AlreadyExists&) {
    threw = true;
  }
  assert(threw && "second in-flight request with the same id must be rejected");

  dispatcher->Open();
  const auto terminal = first.get();
  assert(terminal.request.status == RequestStatus::kFailed);
  assert(terminal.executions.size() == 1);
}

void TestPolicyChangeDoesNotAffectRunningRequest() {
  auto dispatcher = std::make_shared<GatedDispatcher>();
  auto ctx        = MakeContext(dispatcher, Policy(3, 2), 3);
  auto policies   = ctx.policies;
  auto service    = std::make_shared<RelayService>(std::move(ctx));

  auto running = std::async(std::launch::async, [&] { return service->Handle(MakeRequest("long")); });
  dispatcher->WaitEntered(1);

  RetryPolicy disabled = Policy(1, 0);
  disabled.enabled     = false;
  policies->Update(disabled);

  dispatcher->Open();
  const auto old_policy = running.get();
  assert(old_policy.request.status == RequestStatus::kFailed);
  assert(old_policy.executions.size() == 9);

  const auto new_policy = service->Handle(MakeRequest("short"));
  assert(new_policy.executions.size() == 1);
  assert(new_policy.reason == relay::core::TerminationReason::kSingleAttemptFailed);
}

void TestCancelAllStopsEveryRequest() {
  auto dispatcher = std::make_shared<GatedDispatcher>();
  auto service    = std::make_shared<RelayService>(MakeContext(dispatcher, Policy(3, 2), 3));

  std::vector<std::future<relay::core::TerminalRequest>> running;
  for (int i = 0; i < 4; ++i) {
    running.push_back(std::async(std::launch::async, [&service] { return service->Handle(MakeRequest()); }));
  }
  dispatcher->WaitEntered(4);

  assert(service->CancelAll() == 4);
  for (auto& future : running) {
    assert(future.get().request.status == RequestStatus::kCanceled);
  }
  assert(service->CancelAll() == 0);
}

void TestSubmitAfterStopIsRejected() {
  auto dispatcher = std::make_shared<SimulatedDispatcher>(std::unordered_map<int64_t, ChannelProfile>{}, 1);
  auto service    = std::make_shared<RelayService>(MakeContext(dispatcher, Policy(1, 0), 1));

  RequestWorkerPool pool(service, 2);
  pool.Start();
  pool.Stop();

  bool threw = false;
  try {
    (void)pool.Submit(MakeRequest());
  } catch (const relay::util::InvalidState&) {
    threw = true;
  }
  assert(threw && "stopped pool must reject work");
}

void TestFactoryBuildsSimulatedApplication() {
  const auto config = relay::config::ConfigLoader::LoadFromYamlString(R"(retry_policy:
  max_channel_retries: 2
  max_single_channel_retries: 1
  retry_delay_ms: 0
load_balancer:
  seed: 11
channels:
  - id: 1
    name: always-down
  - id: 2
    name: healthy
simulation:
  seed: 9
  profiles:
    - channel_id: 1
      failure_rate: 1
      failure_status: 500
      latency_ms: 1
    - channel_id: 2
      latency_ms: 1
      first_chunk_ms: 1
      chunks: 2
      completion_tokens: 10
workers:
  threads: 2
)");

  auto app = relay::factory::Build(config, "simulated");
  assert(app.workers->Threads() == 2);
  app.workers->Start();

  for (int i = 0; i < 10; ++i) {
    const auto terminal = app.workers->Submit(MakeRequest()).get();
    // channel 1 gets at most two attempts, then channel 2 answers
    assert(terminal.request.status == RequestStatus::kCompleted);
    assert(terminal.request.channel_id == 2);
    assert(terminal.executions.size() <= 3);
  }
  app.workers->Stop();

  const auto rows = app.service->Performance(relay::util::Now() - 1h);
  assert(rows.back().channel_id == 2);
  assert(rows.back().successes == 10);
}

} // namespace

int main() {
  TestParallelRequestsKeepAttemptsSequential();
  TestCancelInFlightRequestById();
  TestDuplicateInFlightIdIsRejected();
  TestPolicyChangeDoesNotAffectRunningRequest();
  TestCancelAllStopsEveryRequest();
  TestSubmitAfterStopIsRejected();
  TestFactoryBuildsSimulatedApplication();

  std::cout << "relay_unit_relay_service_concurrency: pass\n";
  return 0;
}
