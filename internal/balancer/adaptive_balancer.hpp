#pragma once

#include <memory>

#include "channel_health.hpp"
#include "load_balancer.hpp"
#include "weighted_draw.hpp"

namespace relay::balancer {

struct AdaptiveOptions {
  // Fraction of the best candidate's score that every candidate is raised
  // to, so channels in cooldown or with a poor record are still tried now
  // and then. Must be within [0, 1].
  double                  exploration_score = 0.01;
  std::optional<uint64_t> seed;
  bool                    debug = false;
};

/*
  Health-driven strategy: a weighted draw over HealthTracker scores.
*/
class AdaptiveBalancer final : public LoadBalancer {
 public:
  AdaptiveBalancer(std::shared_ptr<HealthTracker> tracker, AdaptiveOptions options = {});

  std::optional<model::Channel> SelectChannel(const std::vector<model::Channel>& candidates, const ExcludedChannels& excluded) override;

  model::LoadBalancerStrategy Strategy() const override {
    return model::LoadBalancerStrategy::kAdaptive;
  }

 private:
  std::shared_ptr<HealthTracker> tracker_;
  AdaptiveOptions                options_;
  WeightedPicker                 picker_;
};

} // namespace relay::balancer
