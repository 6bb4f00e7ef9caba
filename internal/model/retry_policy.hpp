#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace relay::model {

enum class LoadBalancerStrategy : std::uint8_t {
  kAdaptive = 0,
  kWeighted = 1,
};

constexpr std::string_view ToString(LoadBalancerStrategy strategy) {
  return strategy == LoadBalancerStrategy::kWeighted ? "weighted" : "adaptive";
}

inline std::optional<LoadBalancerStrategy> ParseLoadBalancerStrategy(std::string_view name) {
  if (name.empty() || name == "adaptive") return LoadBalancerStrategy::kAdaptive;
  if (name == "weighted") return LoadBalancerStrategy::kWeighted;
  return std::nullopt;
}

// Disable a channel after `times` consecutive failures with `status_code`.
struct AutoDisableRule {
  int32_t status_code = 0;
  int32_t times       = 1;
};

struct AutoDisablePolicy {
  bool                         enabled = false;
  std::vector<AutoDisableRule> rules;
};

/*
  Retry configuration. A copy is taken when a request starts, so later
  changes never affect a request already in flight.
*/
struct RetryPolicy {
  bool                 enabled                    = true;
  int32_t              max_channel_retries        = 3;
  int32_t              max_single_channel_retries = 2;
  int32_t              retry_delay_ms             = 1000;
  LoadBalancerStrategy load_balancer_strategy     = LoadBalancerStrategy::kAdaptive;
  AutoDisablePolicy    auto_disable;

  int64_t MaxAttempts() const {
    if (!enabled) {
      return 1;
    }
    return static_cast<int64_t>(max_channel_retries) * (static_cast<int64_t>(max_single_channel_retries) + 1);
  }
};

} // namespace relay::model
