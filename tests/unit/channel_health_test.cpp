#include <assert.h>

#include <chrono>
#include <cmath>
#include <iostream>
#include <vector>

#include "internal/balancer/channel_health.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using relay::balancer::AttemptOutcome;
using relay::balancer::HealthOptions;
using relay::balancer::HealthTracker;
using relay::model::ExecutionStatus;
using relay::model::RequestExecution;
using namespace std::chrono_literals;

AttemptOutcome Success(relay::util::TimePoint at, double latency_ms) {
  AttemptOutcome outcome;
  outcome.success    = true;
  outcome.latency_ms = latency_ms;
  outcome.at         = at;
  return outcome;
}

AttemptOutcome Failure(relay::util::TimePoint at) {
  AttemptOutcome outcome;
  outcome.at = at;
  return outcome;
}

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

void TestUnknownChannelLooksHealthy() {
  HealthTracker tracker;
  const auto    now  = relay::util::Now();
  const auto    snap = tracker.Snapshot(99, now);
  assert(snap.successes == 0 && snap.failures == 0);
  assert(snap.success_rate == 1.0);
  assert(!snap.mean_latency_ms.has_value());
  assert(Near(tracker.Score(99, now), 1.0));
}

void TestSuccessRateAndLatency() {
  HealthTracker tracker;
  const auto    now = relay::util::Now();

  tracker.RecordOutcome(1, Success(now - 5s, 200));
  tracker.RecordOutcome(1, Success(now - 4s, 400));
  tracker.RecordOutcome(1, Success(now - 3s, 600));
  tracker.RecordOutcome(1, Failure(now - 120s));

  const auto snap = tracker.Snapshot(1, now);
  assert(snap.successes == 3);
  assert(snap.failures == 1);
  assert(Near(snap.success_rate, 0.75));
  assert(snap.mean_latency_ms.has_value() && Near(*snap.mean_latency_ms, 400.0));
  assert(snap.consecutive_failures == 1);

  // failure is older than the cooldown: 0.75 / (1 + 400/1000)
  assert(Near(tracker.Score(1, now), 0.75 / 1.4));
}

void TestOutcomesOutsideWindowExpire() {
  HealthOptions options;
  options.window = 60s;
  HealthTracker tracker(options);

  const auto now = relay::util::Now();
  tracker.RecordOutcome(1, Failure(now - 90s));
  tracker.RecordOutcome(1, Success(now - 10s, 100));

  const auto snap = tracker.Snapshot(1, now);
  assert(snap.failures == 0);
  assert(snap.successes == 1);
  assert(snap.success_rate == 1.0);
}

void TestCanceledOutcomesAreIgnored() {
  HealthTracker tracker;
  const auto    now = relay::util::Now();

  AttemptOutcome canceled;
  canceled.canceled = true;
  canceled.at       = now;
  tracker.RecordOutcome(1, canceled);

  const auto snap = tracker.Snapshot(1, now);
  assert(snap.successes == 0 && snap.failures == 0);
  assert(!snap.last_failure_at.has_value());
}

void TestCooldownDecaysAfterFailure() {
  HealthOptions options;
  options.cooldown_ms      = 10000;
  options.cooldown_penalty = 0.9;
  HealthTracker tracker(options);

  const auto start = relay::util::Now();
  tracker.RecordOutcome(1, Success(start - 20s, 0));
  tracker.RecordOutcome(1, Failure(start));

  const double right_after = tracker.Score(1, start);
  const double halfway     = tracker.Score(1, start + 5s);
  const double cooled      = tracker.Score(1, start + 11s);

  assert(right_after < halfway);
  assert(halfway < cooled);
  // success_rate 0.5, latency 0ms: 0.5 * (1 - 0.9)
  assert(Near(right_after, 0.05));
  assert(Near(cooled, 0.5));
}

void TestConsecutiveFailuresDeepenCooldown() {
  HealthOptions options;
  options.cooldown_ms      = 10000;
  options.cooldown_penalty = 0.5;

  HealthTracker once(options);
  HealthTracker thrice(options);

  const auto now = relay::util::Now();
  once.RecordOutcome(1, Success(now - 30s, 0));
  once.RecordOutcome(1, Success(now - 29s, 0));
  once.RecordOutcome(1, Success(now - 28s, 0));
  once.RecordOutcome(1, Failure(now));

  thrice.RecordOutcome(1, Success(now - 30s, 0));
  thrice.RecordOutcome(1, Failure(now - 2ms));
  thrice.RecordOutcome(1, Failure(now - 1ms));
  thrice.RecordOutcome(1, Failure(now));

  assert(thrice.Snapshot(1, now).consecutive_failures == 3);
  assert(once.Snapshot(1, now).consecutive_failures == 1);
  assert(thrice.Score(1, now) < once.Score(1, now));
}

void TestSuccessClearsConsecutiveFailures() {
  HealthTracker tracker;
  const auto    now = relay::util::Now();
  tracker.RecordOutcome(1, Failure(now - 3s));
  tracker.RecordOutcome(1, Failure(now - 2s));
  tracker.RecordOutcome(1, Success(now - 1s, 10));
  assert(tracker.Snapshot(1, now).consecutive_failures == 0);
}

void TestSelectionIsTracked() {
  HealthTracker tracker;
  const auto    now = relay::util::Now();
  tracker.RecordSelection(4, now);
  tracker.RecordSelection(4, now + 1s);
  const auto snap = tracker.Snapshot(4, now + 1s);
  assert(snap.selections == 2);
  assert(snap.last_selected_at == now + 1s);
}

void TestHydrateReplaysTerminalExecutionsInWindow() {
  HealthOptions options;
  options.window = 600s;
  HealthTracker tracker(options);

  const auto now = relay::util::Now();

  auto make = [](int64_t channel, ExecutionStatus status, relay::util::TimePoint at, int64_t latency) {
    RequestExecution execution;
    execution.channel_id         = channel;
    execution.status             = status;
    execution.updated_at         = at;
    execution.metrics_latency_ms = latency;
    return execution;
  };

  std::vector<RequestExecution> history = {
      make(1, ExecutionStatus::kCompleted, now - 30s, 300),
      make(1, ExecutionStatus::kFailed, now - 20s, 9000),
      make(1, ExecutionStatus::kCanceled, now - 10s, 5),
      make(1, ExecutionStatus::kCompleted, now - 3600s, 100),
      make(2, ExecutionStatus::kCompleted, now - 5s, 100),
  };

  assert(tracker.Hydrate(history, now) == 3);

  const auto one = tracker.Snapshot(1, now);
  assert(one.successes == 1 && one.failures == 1);
  // failed attempts carry no latency signal
  assert(Near(*one.mean_latency_ms, 300.0));
  assert(tracker.Snapshot(2, now).successes == 1);
}

void TestInvalidOptionsAreRejected() {
  auto rejects = [](HealthOptions options) {
    try {
      HealthTracker tracker(options);
    } catch (const relay::util::InvalidArgument&) {
      return true;
    }
    return false;
  };

  HealthOptions no_window;
  no_window.window = 0s;
  assert(rejects(no_window) && "zero window must be rejected");

  HealthOptions bad_penalty;
  bad_penalty.cooldown_penalty = 1.5;
  assert(rejects(bad_penalty) && "penalty above 1 must be rejected");

  HealthOptions no_reference;
  no_reference.latency_reference_ms = 0;
  assert(rejects(no_reference) && "zero latency reference must be rejected");
}

} // namespace

int main() {
  TestUnknownChannelLooksHealthy();
  TestSuccessRateAndLatency();
  TestOutcomesOutsideWindowExpire();
  TestCanceledOutcomesAreIgnored();
  TestCooldownDecaysAfterFailure();
  TestConsecutiveFailuresDeepenCooldown();
  TestSuccessClearsConsecutiveFailures();
  TestSelectionIsTracked();
  TestHydrateReplaysTerminalExecutionsInWindow();
  TestInvalidOptionsAreRejected();

  std::cout << "relay_unit_channel_health: pass\n";
  return 0;
}
