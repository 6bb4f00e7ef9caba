#include "adaptive_balancer.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace relay::balancer {

using relay::observability::DoubleField;
using relay::observability::IntField;

AdaptiveBalancer::AdaptiveBalancer(std::shared_ptr<HealthTracker> tracker, AdaptiveOptions options)
    : tracker_(std::move(tracker)), options_(options), picker_(options.seed) {
  if (!tracker_) {
    throw util::InvalidArgument("adaptive balancer requires a health tracker");
  }
  if (!(options_.exploration_score >= 0.0 && options_.exploration_score <= 1.0)) {
    throw util::InvalidArgument("exploration score must be within [0, 1]");
  }
  options_.debug = options_.debug || DebugEnabledByEnv();
}

std::optional<model::Channel> AdaptiveBalancer::SelectChannel(const std::vector<model::Channel>& candidates, const ExcludedChannels& excluded) {
  const auto eligible = Eligible(candidates, excluded);
  if (eligible.empty()) {
    return std::nullopt;
  }

  const auto now = util::Now();

  std::vector<double> scores;
  scores.reserve(eligible.size());
  double best = 0.0;
  for (const auto* channel : eligible) {
    scores.push_back(tracker_->Score(channel->id, now));
    best = std::max(best, scores.back());
  }

  // The floor scales with the best score so slow but healthy channels keep
  // their lead. All-zero scores fall through to the uniform draw.
  const double floor = options_.exploration_score * best;
  for (auto& score : scores) {
    score = std::max(score, floor);
  }

  const auto  index  = picker_.Draw(scores);
  const auto& chosen = *eligible[index];
  tracker_->RecordSelection(chosen.id, now);

  if (options_.debug) {
    for (size_t i = 0; i < eligible.size(); ++i) {
      const auto snap = tracker_->Snapshot(eligible[i]->id, now);
      RELAY_LOG_DEBUG("adaptive candidate",
                      {IntField("channel_id", eligible[i]->id),
                       DoubleField("score", scores[i]),
                       DoubleField("success_rate", snap.success_rate),
                       DoubleField("mean_latency_ms", snap.mean_latency_ms.value_or(0.0)),
                       IntField("consecutive_failures", snap.consecutive_failures)});
    }
    RELAY_LOG_DEBUG("adaptive selection", {IntField("channel_id", chosen.id), IntField("candidates", static_cast<int64_t>(eligible.size()))});
  }

  observability::Metrics::Instance().RecordSelection(model::ToString(Strategy()), chosen.id);
  return chosen;
}

} // namespace relay::balancer
