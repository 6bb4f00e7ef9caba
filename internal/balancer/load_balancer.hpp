#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "internal/model/channel.hpp"
#include "internal/model/retry_policy.hpp"

namespace relay::balancer {

// Channels already exhausted by the current request.
using ExcludedChannels = std::unordered_set<int64_t>;

class LoadBalancer {
 public:
  virtual ~LoadBalancer() = default;

  // nullopt when no candidate remains after exclusion.
  virtual std::optional<model::Channel> SelectChannel(const std::vector<model::Channel>& candidates, const ExcludedChannels& excluded) = 0;

  virtual model::LoadBalancerStrategy Strategy() const = 0;
};

std::vector<const model::Channel*> Eligible(const std::vector<model::Channel>& candidates, const ExcludedChannels& excluded);

// RELAY_DEBUG_LOAD_BALANCER_ENABLED=1|true
bool DebugEnabledByEnv();

} // namespace relay::balancer
