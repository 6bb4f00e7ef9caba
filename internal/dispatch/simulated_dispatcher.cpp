#include "simulated_dispatcher.hpp"

#include <chrono>
#include <string>

#include "internal/core/cancellation.hpp"
#include "internal/dispatch/chunk_tee.hpp"
#include "internal/dispatch/error_classifier.hpp"

namespace relay::dispatch {

SimulatedDispatcher::SimulatedDispatcher(std::unordered_map<int64_t, ChannelProfile> profiles, std::optional<uint64_t> seed)
    : profiles_(std::move(profiles)), engine_(seed ? *seed : std::random_device{}()) {
}

void SimulatedDispatcher::SetProfile(int64_t channel_id, const ChannelProfile& profile) {
  std::lock_guard lock(mutex_);
  profiles_[channel_id] = profile;
}

ChannelProfile SimulatedDispatcher::ProfileFor(int64_t channel_id) const {
  std::lock_guard lock(mutex_);
  auto            it = profiles_.find(channel_id);
  return it == profiles_.end() ? ChannelProfile{} : it->second;
}

bool SimulatedDispatcher::Fails(double failure_rate) {
  if (failure_rate <= 0.0) return false;
  if (failure_rate >= 1.0) return true;
  std::lock_guard                        lock(mutex_);
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  return dist(engine_) < failure_rate;
}

DispatchOutcome SimulatedDispatcher::Dispatch(const DispatchRequest&         request,
                                              const model::Channel&          channel,
                                              const core::CancellationToken& cancel,
                                              const ChunkSink&               sink) {
  const auto profile = ProfileFor(channel.id);

  DispatchOutcome outcome;
  outcome.started_at = util::Now();

  ChunkTee tee(sink);
  auto     canceled = [&] {
    outcome.classification = ErrorClassification::kCancellation;
    outcome.error_message  = "canceled during dispatch";
    outcome.first_chunk_at = tee.FirstChunkAt();
    outcome.chunks         = tee.TakeChunks();
    outcome.finished_at    = util::Now();
    return std::move(outcome);
  };

  if (cancel.IsCancelled()) {
    return canceled();
  }

  if (Fails(profile.failure_rate)) {
    if (!cancel.SleepFor(std::chrono::milliseconds(profile.latency_ms))) {
      return canceled();
    }
    outcome.status_code    = profile.failure_status;
    outcome.classification = profile.failure_status == 0 ? ErrorClassification::kTransient : ClassifyHttpStatus(profile.failure_status);
    if (outcome.classification == ErrorClassification::kNone) {
      outcome.classification = ErrorClassification::kTransient;
    }
    outcome.error_message = profile.failure_status == 0 ? std::string("transport: simulated connection reset")
                                                        : "upstream returned HTTP " + std::to_string(profile.failure_status);
    outcome.finished_at   = util::Now();
    return outcome;
  }

  const std::string text = "simulated reply from " + channel.name;

  if (request.stream) {
    if (!cancel.SleepFor(std::chrono::milliseconds(profile.first_chunk_ms))) {
      return canceled();
    }
    const uint32_t chunks = profile.chunks == 0 ? 1 : profile.chunks;
    const auto     rest   = profile.latency_ms > profile.first_chunk_ms ? profile.latency_ms - profile.first_chunk_ms : 0;
    const auto     step   = std::chrono::milliseconds(chunks > 1 ? rest / (chunks - 1) : rest);
    for (uint32_t i = 0; i < chunks; ++i) {
      if (i > 0 && !cancel.SleepFor(step)) {
        return canceled();
      }
      tee.Push("data: {\"index\":" + std::to_string(i) + ",\"delta\":\"" + text + "\"}");
    }
    tee.Push("data: {\"usage\":{\"prompt_tokens\":8,\"completion_tokens\":" + std::to_string(profile.completion_tokens) + "}}");
    tee.Push("data: [DONE]");
  } else {
    if (!cancel.SleepFor(std::chrono::milliseconds(profile.latency_ms))) {
      return canceled();
    }
    outcome.response_body = "{\"model\":\"" + request.model_id + "\",\"content\":\"" + text +
                            "\",\"usage\":{\"prompt_tokens\":8,\"completion_tokens\":" + std::to_string(profile.completion_tokens) + "}}";
  }

  model::UsageLog usage;
  usage.prompt_tokens     = 8;
  usage.completion_tokens = profile.completion_tokens;

  outcome.status_code    = 200;
  outcome.usage          = usage;
  outcome.first_chunk_at = tee.FirstChunkAt();
  outcome.chunks         = tee.TakeChunks();
  outcome.finished_at    = util::Now();
  return outcome;
}

} // namespace relay::dispatch
