#include "weighted_balancer.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace relay::balancer {

using relay::observability::DoubleField;
using relay::observability::IntField;

WeightedBalancer::WeightedBalancer(std::optional<uint64_t> seed, bool debug) : picker_(seed), debug_(debug || DebugEnabledByEnv()) {
}

std::optional<model::Channel> WeightedBalancer::SelectChannel(const std::vector<model::Channel>& candidates, const ExcludedChannels& excluded) {
  const auto eligible = Eligible(candidates, excluded);
  if (eligible.empty()) {
    return std::nullopt;
  }

  std::vector<double> weights;
  weights.reserve(eligible.size());
  for (const auto* channel : eligible) {
    weights.push_back(channel->weight.value_or(1.0));
  }

  const auto  index  = picker_.Draw(weights);
  const auto& chosen = *eligible[index];

  if (debug_) {
    for (size_t i = 0; i < eligible.size(); ++i) {
      RELAY_LOG_DEBUG("weighted candidate", {IntField("channel_id", eligible[i]->id), DoubleField("weight", weights[i])});
    }
    RELAY_LOG_DEBUG("weighted selection", {IntField("channel_id", chosen.id), IntField("candidates", static_cast<int64_t>(eligible.size()))});
  }

  observability::Metrics::Instance().RecordSelection(model::ToString(Strategy()), chosen.id);
  return chosen;
}

} // namespace relay::balancer
