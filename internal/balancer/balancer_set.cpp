#include "balancer_set.hpp"

namespace relay::balancer {

namespace {

AdaptiveOptions ToAdaptive(const BalancerOptions& options) {
  AdaptiveOptions out;
  out.exploration_score = options.exploration_score;
  out.seed              = options.seed;
  out.debug             = options.debug;
  return out;
}

} // namespace

LoadBalancerSet::LoadBalancerSet(std::shared_ptr<HealthTracker> tracker, const BalancerOptions& options)
    : tracker_(tracker), adaptive_(std::move(tracker), ToAdaptive(options)), weighted_(options.seed, options.debug) {
}

LoadBalancer& LoadBalancerSet::For(model::LoadBalancerStrategy strategy) {
  if (strategy == model::LoadBalancerStrategy::kWeighted) {
    return weighted_;
  }
  return adaptive_;
}

} // namespace relay::balancer
