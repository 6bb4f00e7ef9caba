#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/dispatch/dispatcher.hpp"
#include "internal/model/execution.hpp"
#include "internal/model/request.hpp"
#include "internal/model/retry_policy.hpp"

namespace relay::balancer {
class LoadBalancerSet;
}
namespace relay::recorder {
class ExecutionRecorder;
}
namespace relay::registry {
class ChannelRegistry;
class AutoDisabler;
} // namespace relay::registry

namespace relay::core {

class CancellationToken;

enum class TerminationReason : std::uint8_t {
  kSucceeded          = 0,
  kAttemptsExhausted  = 1,
  kNoAvailableChannel = 2,
  kCanceled           = 3,
  kSingleAttemptFailed = 4, // retries disabled
};

constexpr std::string_view ToString(TerminationReason reason) {
  switch (reason) {
    case TerminationReason::kSucceeded:
      return "succeeded";
    case TerminationReason::kAttemptsExhausted:
      return "attempts_exhausted";
    case TerminationReason::kNoAvailableChannel:
      return "no_available_channel";
    case TerminationReason::kCanceled:
      return "canceled";
    case TerminationReason::kSingleAttemptFailed:
      return "single_attempt_failed";
  }
  return "attempts_exhausted";
}

struct TerminalRequest {
  model::Request                       request;
  std::vector<model::RequestExecution> executions; // in attempt order
  TerminationReason                    reason = TerminationReason::kAttemptsExhausted;
};

// Returns false when the wait was interrupted by cancellation.
using Sleeper = std::function<bool(std::chrono::milliseconds, const CancellationToken&)>;

struct CoordinatorDeps {
  std::shared_ptr<recorder::ExecutionRecorder> recorder;
  std::shared_ptr<registry::ChannelRegistry>   registry;
  std::shared_ptr<balancer::LoadBalancerSet>   balancers;
  std::shared_ptr<dispatch::Dispatcher>        dispatcher;

  // optional
  std::shared_ptr<registry::AutoDisabler> auto_disabler;
  Sleeper                                 sleeper;
};

/*
  Drives one request through its attempts.

  Attempts are strictly sequential. Each produces exactly one recorded
  execution; the request itself is created once and finalized once. Provider
  failures are classified and handled here and never escape Execute();
  persistence failures do, after the request is finalized as failed.

  With retries enabled the number of attempts is bounded by
  max_channel_retries * (max_single_channel_retries + 1).
*/
class RetryCoordinator {
 public:
  RetryCoordinator(CoordinatorDeps deps, std::shared_ptr<const model::RetryPolicy> policy);

  TerminalRequest Execute(model::Request request, const CancellationToken& cancel, const dispatch::ChunkSink& sink = {});

 private:
  struct Attempt {
    model::RequestExecution        execution;
    dispatch::ErrorClassification  classification = dispatch::ErrorClassification::kNone;
  };

  Attempt RunAttempt(const model::Request& request, const model::Channel& channel, int64_t attempt, const CancellationToken& cancel,
                     const dispatch::ChunkSink& sink);

  TerminalRequest Drive(TerminalRequest terminal, const CancellationToken& cancel, const dispatch::ChunkSink& sink);

  TerminalRequest Finish(TerminalRequest terminal, TerminationReason reason);

  // Best-effort failed finalization when persistence throws mid-request.
  void FinalizeAfterFault(model::Request request, const std::exception& fault);

  bool Sleep(std::chrono::milliseconds delay, const CancellationToken& cancel) const;

  TerminalRequest ExecuteSingle(TerminalRequest terminal, const CancellationToken& cancel, const dispatch::ChunkSink& sink);

  CoordinatorDeps                           deps_;
  std::shared_ptr<const model::RetryPolicy> policy_;
};

// "#1 channel 3: upstream returned HTTP 503; #2 ..."
std::string SummarizeAttempts(const std::vector<model::RequestExecution>& executions);

} // namespace relay::core
