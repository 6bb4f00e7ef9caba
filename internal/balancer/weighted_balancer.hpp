#pragma once

#include <memory>

#include "load_balancer.hpp"
#include "weighted_draw.hpp"

namespace relay::balancer {

/*
  Static-weight strategy. A channel without a configured weight counts as 1.
*/
class WeightedBalancer final : public LoadBalancer {
 public:
  explicit WeightedBalancer(std::optional<uint64_t> seed = std::nullopt, bool debug = false);

  std::optional<model::Channel> SelectChannel(const std::vector<model::Channel>& candidates, const ExcludedChannels& excluded) override;

  model::LoadBalancerStrategy Strategy() const override {
    return model::LoadBalancerStrategy::kWeighted;
  }

 private:
  WeightedPicker picker_;
  bool           debug_;
};

} // namespace relay::balancer
