#include "weighted_draw.hpp"

#include <cmath>

#include "internal/util/errors.hpp"

namespace relay::balancer {

namespace {

uint64_t RandomSeed() {
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

} // namespace

WeightedPicker::WeightedPicker(std::optional<uint64_t> seed) : engine_(seed ? *seed : RandomSeed()) {
}

size_t WeightedPicker::Draw(const std::vector<double>& weights) {
  if (weights.empty()) {
    throw util::InvalidArgument("weighted draw over an empty set");
  }

  double total = 0.0;
  for (double w : weights) {
    if (w > 0.0 && std::isfinite(w)) total += w;
  }

  std::lock_guard lock(mutex_);

  if (total <= 0.0) {
    std::uniform_int_distribution<size_t> uniform(0, weights.size() - 1);
    return uniform(engine_);
  }

  std::uniform_real_distribution<double> dist(0.0, total);
  const double                           target = dist(engine_);

  double acc  = 0.0;
  size_t last = 0;
  for (size_t i = 0; i < weights.size(); ++i) {
    const double w = weights[i];
    if (!(w > 0.0) || !std::isfinite(w)) continue;
    acc += w;
    last = i;
    if (target < acc) return i;
  }
  // target == total after rounding
  return last;
}

} // namespace relay::balancer
