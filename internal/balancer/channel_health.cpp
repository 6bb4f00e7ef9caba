#include "channel_health.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace relay::balancer {

namespace {

int64_t SecondOf(util::TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace

// ------------------------------------------------------------
// ChannelHealth
// ------------------------------------------------------------

ChannelHealth::ChannelHealth(const HealthOptions& options) : options_(options) {
  const auto size = std::max<int64_t>(1, options_.window.count());
  slots_.resize(static_cast<size_t>(size));
}

ChannelHealth::Slot& ChannelHealth::SlotFor(int64_t second) {
  const auto n    = static_cast<int64_t>(slots_.size());
  auto&      slot = slots_[static_cast<size_t>(((second % n) + n) % n)];
  if (slot.second != second) {
    slot = Slot{};
    slot.second = second;
  }
  return slot;
}

void ChannelHealth::Record(const AttemptOutcome& outcome) {
  if (outcome.canceled) {
    return;
  }

  std::lock_guard lock(mutex_);

  const auto second = SecondOf(outcome.at);
  auto&      slot   = SlotFor(second);

  if (outcome.success) {
    ++slot.successes;
    consecutive_failures_ = 0;
  } else {
    ++slot.failures;
    ++consecutive_failures_;
    if (!last_failure_at_ || *last_failure_at_ < outcome.at) {
      last_failure_at_ = outcome.at;
    }
  }

  if (outcome.latency_ms && *outcome.latency_ms >= 0.0) {
    ++slot.latency_n;
    slot.latency_ms += *outcome.latency_ms;
  }
}

void ChannelHealth::MarkSelected(util::TimePoint at) {
  std::lock_guard lock(mutex_);
  ++selections_;
  last_selected_at_ = at;
}

HealthSnapshot ChannelHealth::Snapshot(util::TimePoint now) const {
  std::lock_guard lock(mutex_);

  HealthSnapshot snap;
  snap.consecutive_failures = consecutive_failures_;
  snap.last_failure_at      = last_failure_at_;
  snap.last_selected_at     = last_selected_at_;
  snap.selections           = selections_;

  const auto newest = SecondOf(now);
  const auto oldest = newest - static_cast<int64_t>(slots_.size()) + 1;

  uint64_t latency_n   = 0;
  double   latency_sum = 0.0;
  for (const auto& slot : slots_) {
    if (slot.second < oldest || slot.second > newest) continue;
    snap.successes += slot.successes;
    snap.failures += slot.failures;
    latency_n += slot.latency_n;
    latency_sum += slot.latency_ms;
  }

  const auto total = snap.successes + snap.failures;
  if (total > 0) {
    snap.success_rate = static_cast<double>(snap.successes) / static_cast<double>(total);
  }
  if (latency_n > 0) {
    snap.mean_latency_ms = latency_sum / static_cast<double>(latency_n);
  }
  return snap;
}

// ------------------------------------------------------------
// HealthTracker
// ------------------------------------------------------------

HealthTracker::HealthTracker(HealthOptions options) : options_(options) {
  if (options_.window.count() <= 0) {
    throw util::InvalidArgument("health window must be positive");
  }
  if (options_.latency_reference_ms == 0) {
    throw util::InvalidArgument("latency reference must be positive");
  }
  if (options_.cooldown_penalty < 0.0 || options_.cooldown_penalty > 1.0) {
    throw util::InvalidArgument("cooldown penalty must be within [0, 1]");
  }
}

std::shared_ptr<ChannelHealth> HealthTracker::Get(int64_t channel_id) const {
  std::shared_lock lock(mutex_);
  auto             it = channels_.find(channel_id);
  return it == channels_.end() ? nullptr : it->second;
}

std::shared_ptr<ChannelHealth> HealthTracker::GetOrCreate(int64_t channel_id) {
  if (auto existing = Get(channel_id)) {
    return existing;
  }
  std::unique_lock lock(mutex_);
  auto&            slot = channels_[channel_id];
  if (!slot) {
    slot = std::make_shared<ChannelHealth>(options_);
  }
  return slot;
}

void HealthTracker::RecordOutcome(int64_t channel_id, const AttemptOutcome& outcome) {
  GetOrCreate(channel_id)->Record(outcome);
}

void HealthTracker::RecordSelection(int64_t channel_id, util::TimePoint at) {
  GetOrCreate(channel_id)->MarkSelected(at);
}

HealthSnapshot HealthTracker::Snapshot(int64_t channel_id, util::TimePoint now) const {
  auto health = Get(channel_id);
  return health ? health->Snapshot(now) : HealthSnapshot{};
}

double HealthTracker::Score(int64_t channel_id, util::TimePoint now) const {
  const auto snap = Snapshot(channel_id, now);

  double score = snap.success_rate;
  if (snap.mean_latency_ms) {
    score /= 1.0 + *snap.mean_latency_ms / static_cast<double>(options_.latency_reference_ms);
  }

  if (snap.last_failure_at && options_.cooldown_ms > 0) {
    const auto elapsed = util::MillisBetween(*snap.last_failure_at, now);
    if (elapsed < static_cast<int64_t>(options_.cooldown_ms)) {
      const double remaining = 1.0 - static_cast<double>(std::max<int64_t>(0, elapsed)) / options_.cooldown_ms;
      const double depth     = 1.0 + 0.5 * std::max(0.0, static_cast<double>(snap.consecutive_failures) - 1.0);
      const double penalty   = std::min(1.0, options_.cooldown_penalty * remaining * depth);
      score *= 1.0 - penalty;
    }
  }
  return std::max(0.0, score);
}

size_t HealthTracker::Hydrate(const std::vector<model::RequestExecution>& executions, util::TimePoint now) {
  const auto cutoff = now - options_.window;

  std::vector<const model::RequestExecution*> ordered;
  ordered.reserve(executions.size());
  for (const auto& execution : executions) {
    if (execution.updated_at < cutoff || execution.updated_at > now) continue;
    if (execution.status != model::ExecutionStatus::kCompleted && execution.status != model::ExecutionStatus::kFailed) continue;
    ordered.push_back(&execution);
  }
  std::sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) { return a->updated_at < b->updated_at; });

  for (const auto* execution : ordered) {
    AttemptOutcome outcome;
    outcome.success = execution->status == model::ExecutionStatus::kCompleted;
    outcome.at      = execution->updated_at;
    if (outcome.success && execution->metrics_latency_ms) {
      outcome.latency_ms = static_cast<double>(*execution->metrics_latency_ms);
    }
    RecordOutcome(execution->channel_id, outcome);
  }
  return ordered.size();
}

} // namespace relay::balancer
