#pragma once

#include <memory>

#include "adaptive_balancer.hpp"
#include "load_balancer.hpp"
#include "weighted_balancer.hpp"

namespace relay::balancer {

struct BalancerOptions {
  HealthOptions           health;
  double                  exploration_score = 0.01;
  std::optional<uint64_t> seed;
  bool                    debug = false;
};

/*
  One long-lived instance per strategy. A request picks its strategy from
  its policy snapshot; the random state is shared so a fixed seed gives one
  reproducible sequence across requests instead of replaying it per request.
*/
class LoadBalancerSet {
 public:
  LoadBalancerSet(std::shared_ptr<HealthTracker> tracker, const BalancerOptions& options);

  LoadBalancer& For(model::LoadBalancerStrategy strategy);

  const std::shared_ptr<HealthTracker>& Tracker() const {
    return tracker_;
  }

 private:
  std::shared_ptr<HealthTracker> tracker_;
  AdaptiveBalancer               adaptive_;
  WeightedBalancer               weighted_;
};

} // namespace relay::balancer
