#include "retry_coordinator.hpp"

#include <exception>
#include <string>

#include "internal/balancer/balancer_set.hpp"
#include "internal/core/cancellation.hpp"
#include "internal/dispatch/error_classifier.hpp"
#include "internal/metrics/metrics_calculator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/recorder/execution_recorder.hpp"
#include "internal/registry/auto_disable.hpp"
#include "internal/registry/channel_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace relay::core {

using relay::observability::IntField;
using relay::observability::StringField;

namespace {

model::ExecutionStatus StatusFor(dispatch::ErrorClassification c) {
  switch (c) {
    case dispatch::ErrorClassification::kNone:
      return model::ExecutionStatus::kCompleted;
    case dispatch::ErrorClassification::kCancellation:
      return model::ExecutionStatus::kCanceled;
    default:
      return model::ExecutionStatus::kFailed;
  }
}

} // namespace

std::string SummarizeAttempts(const std::vector<model::RequestExecution>& executions) {
  std::string out;
  for (const auto& execution : executions) {
    if (!out.empty()) out += "; ";
    out += "#" + std::to_string(execution.attempt) + " channel " + std::to_string(execution.channel_id) + ": ";
    out += execution.error_message.value_or(std::string(model::ToString(execution.status)));
  }
  return out;
}

RetryCoordinator::RetryCoordinator(CoordinatorDeps deps, std::shared_ptr<const model::RetryPolicy> policy)
    : deps_(std::move(deps)), policy_(std::move(policy)) {
  if (!deps_.recorder || !deps_.registry || !deps_.balancers || !deps_.dispatcher) {
    throw util::InvalidArgument("retry coordinator: recorder, registry, balancers and dispatcher are required");
  }
  if (!policy_) {
    throw util::InvalidArgument("retry coordinator: policy snapshot is required");
  }
}

bool RetryCoordinator::Sleep(std::chrono::milliseconds delay, const CancellationToken& cancel) const {
  if (deps_.sleeper) {
    return deps_.sleeper(delay, cancel);
  }
  return cancel.SleepFor(delay);
}

RetryCoordinator::Attempt RetryCoordinator::RunAttempt(const model::Request&      request,
                                                       const model::Channel&      channel,
                                                       int64_t                    attempt,
                                                       const CancellationToken&   cancel,
                                                       const dispatch::ChunkSink& sink) {
  observability::SpanScope span("relay.attempt");
  span.SetAttribute("channel_id", static_cast<std::int64_t>(channel.id));
  span.SetAttribute("attempt", static_cast<std::int64_t>(attempt));

  dispatch::DispatchRequest outbound;
  outbound.request_id = request.id;
  outbound.model_id   = request.model_id;
  outbound.stream     = request.stream;
  outbound.body       = request.request_body;

  dispatch::DispatchOutcome outcome;
  try {
    outcome = deps_.dispatcher->Dispatch(outbound, channel, cancel, sink);
  } catch (const std::exception& e) {
    RELAY_LOG_ERROR("dispatcher raised", {StringField("request_id", request.id), IntField("channel_id", channel.id), StringField("error", e.what())});
    outcome                = dispatch::DispatchOutcome{};
    outcome.started_at     = util::Now();
    outcome.finished_at    = outcome.started_at;
    outcome.classification = cancel.IsCancelled() ? dispatch::ErrorClassification::kCancellation : dispatch::ErrorClassification::kTransient;
    outcome.error_message  = std::string("dispatcher error: ") + e.what();
  }

  Attempt result;
  result.classification = outcome.classification;

  auto& execution             = result.execution;
  execution.id                = util::GenerateId();
  execution.request_id        = request.id;
  execution.channel_id        = channel.id;
  execution.model_id          = request.model_id;
  execution.attempt           = attempt;
  execution.status            = StatusFor(outcome.classification);
  execution.stream            = request.stream;
  execution.request_body      = request.request_body;
  execution.response_body     = std::move(outcome.response_body);
  execution.response_chunks   = std::move(outcome.chunks);
  execution.error_status_code = execution.status == model::ExecutionStatus::kFailed ? outcome.status_code : 0;
  execution.created_at        = outcome.started_at;
  execution.updated_at        = outcome.finished_at;
  execution.first_chunk_at    = outcome.first_chunk_at;
  if (execution.status != model::ExecutionStatus::kCompleted) {
    execution.error_message = outcome.error_message.value_or(std::string(dispatch::ToString(outcome.classification)));
  }

  const auto m                             = metrics::ForExecution(execution, nullptr);
  execution.metrics_latency_ms             = m.latency_ms;
  execution.metrics_first_token_latency_ms = m.first_token_latency_ms;

  balancer::AttemptOutcome health;
  health.success  = execution.status == model::ExecutionStatus::kCompleted;
  health.canceled = execution.status == model::ExecutionStatus::kCanceled;
  health.at       = execution.updated_at;
  if (execution.metrics_latency_ms && health.success) {
    health.latency_ms = static_cast<double>(*execution.metrics_latency_ms);
  }
  deps_.balancers->Tracker()->RecordOutcome(channel.id, health);

  if (deps_.auto_disabler) {
    deps_.auto_disabler->Observe(policy_->auto_disable, channel.id, execution.status, execution.error_status_code);
  }

  auto& meters = observability::Metrics::Instance();
  meters.RecordAttempt(channel.id, model::ToString(execution.status));
  if (execution.metrics_latency_ms) {
    meters.ObserveAttemptLatencyMs(channel.id, static_cast<double>(*execution.metrics_latency_ms));
  }

  if (execution.status == model::ExecutionStatus::kFailed) {
    span.RecordException(*execution.error_message);
    RELAY_LOG_WARN("attempt failed",
                   {StringField("request_id", request.id),
                    IntField("attempt", attempt),
                    IntField("channel_id", channel.id),
                    StringField("classification", dispatch::ToString(outcome.classification)),
                    IntField("status", execution.error_status_code),
                    StringField("error", *execution.error_message)});
  } else {
    RELAY_LOG_DEBUG("attempt finished",
                    {StringField("request_id", request.id),
                     IntField("attempt", attempt),
                     IntField("channel_id", channel.id),
                     StringField("status", model::ToString(execution.status))});
  }

  // Health and auto-disable above reflect the upstream even when recording
  // the attempt fails below.
  deps_.recorder->RecordExecution(execution);

  if (outcome.usage && execution.status == model::ExecutionStatus::kCompleted) {
    auto usage         = *outcome.usage;
    usage.request_id   = request.id;
    usage.execution_id = execution.id;
    deps_.recorder->RecordUsage(usage);
  }
  return result;
}

TerminalRequest RetryCoordinator::Finish(TerminalRequest terminal, TerminationReason reason) {
  auto& request = terminal.request;
  terminal.reason = reason;

  switch (reason) {
    case TerminationReason::kSucceeded:
      request.status = model::RequestStatus::kCompleted;
      break;
    case TerminationReason::kCanceled:
      request.status = model::RequestStatus::kCanceled;
      break;
    default:
      request.status = model::RequestStatus::kFailed;
      break;
  }

  request.updated_at = util::Now();
  if (!terminal.executions.empty()) {
    request.channel_id = terminal.executions.back().channel_id;
  }

  if (request.status == model::RequestStatus::kFailed) {
    std::string summary = reason == TerminationReason::kNoAvailableChannel ? "no available channel" : "all attempts failed";
    if (!terminal.executions.empty()) {
      summary += ": " + SummarizeAttempts(terminal.executions);
    }
    request.error_message = std::move(summary);
  } else {
    request.error_message.reset();
  }

  if (request.status == model::RequestStatus::kCompleted) {
    const auto m                           = metrics::ForRequest(request, &terminal.executions.back());
    request.metrics_latency_ms             = m.latency_ms;
    request.metrics_first_token_latency_ms = m.first_token_latency_ms;
  }

  deps_.recorder->FinalizeRequest(request);

  observability::Metrics::Instance().RecordRequest(model::ToString(request.status), static_cast<std::int64_t>(terminal.executions.size()));
  RELAY_LOG_INFO("request finished",
                 {StringField("request_id", request.id),
                  StringField("status", model::ToString(request.status)),
                  StringField("reason", ToString(reason)),
                  IntField("attempts", static_cast<int64_t>(terminal.executions.size())),
                  IntField("channel_id", request.channel_id)});
  return terminal;
}

TerminalRequest RetryCoordinator::ExecuteSingle(TerminalRequest terminal, const CancellationToken& cancel, const dispatch::ChunkSink& sink) {
  auto& lb       = deps_.balancers->For(policy_->load_balancer_strategy);
  auto  selected = lb.SelectChannel(deps_.registry->Candidates(terminal.request.model_id), {});
  if (!selected) {
    return Finish(std::move(terminal), TerminationReason::kNoAvailableChannel);
  }
  if (cancel.IsCancelled()) {
    return Finish(std::move(terminal), TerminationReason::kCanceled);
  }

  auto attempt = RunAttempt(terminal.request, *selected, 1, cancel, sink);
  terminal.executions.push_back(std::move(attempt.execution));

  switch (attempt.classification) {
    case dispatch::ErrorClassification::kNone:
      return Finish(std::move(terminal), TerminationReason::kSucceeded);
    case dispatch::ErrorClassification::kCancellation:
      return Finish(std::move(terminal), TerminationReason::kCanceled);
    default:
      return Finish(std::move(terminal), TerminationReason::kSingleAttemptFailed);
  }
}

TerminalRequest RetryCoordinator::Execute(model::Request request, const CancellationToken& cancel, const dispatch::ChunkSink& sink) {
  observability::SpanScope span("relay.request");

  if (request.id.empty()) {
    request.id = util::GenerateId();
  }
  const auto now = util::Now();
  if (request.created_at == util::TimePoint{}) {
    request.created_at = now;
  }
  request.updated_at = now;
  request.status     = model::RequestStatus::kProcessing;
  request.channel_id = 0;
  request.error_message.reset();
  request.metrics_latency_ms.reset();
  request.metrics_first_token_latency_ms.reset();

  span.SetAttribute("request_id", request.id);
  span.SetAttribute("model_id", request.model_id);

  deps_.recorder->CreateRequest(request);

  TerminalRequest terminal;
  terminal.request = request;

  try {
    return Drive(std::move(terminal), cancel, sink);
  } catch (const std::exception& e) {
    FinalizeAfterFault(std::move(request), e);
    throw;
  }
}

void RetryCoordinator::FinalizeAfterFault(model::Request request, const std::exception& fault) {
  RELAY_LOG_ERROR("request aborted by infrastructure fault", {StringField("request_id", request.id), StringField("error", fault.what())});

  request.status        = model::RequestStatus::kFailed;
  request.updated_at    = util::Now();
  request.error_message = std::string("internal error: ") + fault.what();
  try {
    deps_.recorder->FinalizeRequest(request);
  } catch (const util::InvalidState&) {
    // already terminal: the fault came after FinalizeRequest committed
  } catch (const std::exception& e) {
    RELAY_LOG_ERROR("request left unfinalized", {StringField("request_id", request.id), StringField("error", e.what())});
  }
}

TerminalRequest RetryCoordinator::Drive(TerminalRequest terminal, const CancellationToken& cancel, const dispatch::ChunkSink& sink) {
  if (cancel.IsCancelled()) {
    return Finish(std::move(terminal), TerminationReason::kCanceled);
  }

  const auto& policy = *policy_;
  if (!policy.enabled) {
    return ExecuteSingle(std::move(terminal), cancel, sink);
  }

  auto&                      lb = deps_.balancers->For(policy.load_balancer_strategy);
  balancer::ExcludedChannels exhausted;
  int64_t                    attempt = 0;

  for (int64_t c = 1; c <= policy.max_channel_retries; ++c) {
    // Re-read per channel so a channel disabled mid-request is not picked.
    auto selected = lb.SelectChannel(deps_.registry->Candidates(terminal.request.model_id), exhausted);
    if (!selected) {
      return Finish(std::move(terminal), TerminationReason::kNoAvailableChannel);
    }

    const int64_t per_channel = static_cast<int64_t>(policy.max_single_channel_retries) + 1;
    for (int64_t s = 1; s <= per_channel; ++s) {
      if (cancel.IsCancelled()) {
        return Finish(std::move(terminal), TerminationReason::kCanceled);
      }

      auto result = RunAttempt(terminal.request, *selected, ++attempt, cancel, sink);
      terminal.executions.push_back(std::move(result.execution));

      if (result.classification == dispatch::ErrorClassification::kNone) {
        return Finish(std::move(terminal), TerminationReason::kSucceeded);
      }
      if (result.classification == dispatch::ErrorClassification::kCancellation) {
        return Finish(std::move(terminal), TerminationReason::kCanceled);
      }
      if (!dispatch::IsRetryable(result.classification)) {
        break;
      }
      if (s <= policy.max_single_channel_retries) {
        if (!Sleep(std::chrono::milliseconds(policy.retry_delay_ms), cancel)) {
          return Finish(std::move(terminal), TerminationReason::kCanceled);
        }
      }
    }
    exhausted.insert(selected->id);
  }

  return Finish(std::move(terminal), TerminationReason::kAttemptsExhausted);
}

} // namespace relay::core
