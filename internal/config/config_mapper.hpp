#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>

#include "config/config.pb.h"
#include "internal/balancer/balancer_set.hpp"
#include "internal/dispatch/http_dispatcher.hpp"
#include "internal/dispatch/simulated_dispatcher.hpp"
#include "internal/model/channel.hpp"
#include "internal/model/retry_policy.hpp"

namespace relay::config {

/*
  Translation from the protobuf RuntimeConfig to runtime types.

  ValidateConfig throws util::InvalidArgument on the first problem found;
  the To* helpers assume a validated config.
*/

void ValidateConfig(const relay::runtime::config::RuntimeConfig& config);

void ValidatePolicy(const model::RetryPolicy& policy);

model::RetryPolicy ToRetryPolicy(const relay::runtime::config::RetryPolicyConfig& config);

std::vector<model::Channel> ToChannels(const relay::runtime::config::RuntimeConfig& config);

balancer::BalancerOptions ToBalancerOptions(const relay::runtime::config::LoadBalancerConfig& config);

dispatch::HttpOptions ToHttpOptions(const relay::runtime::config::DispatchConfig& config);

std::unordered_map<int64_t, dispatch::ChannelProfile> ToChannelProfiles(const relay::runtime::config::SimulationConfig& config);

} // namespace relay::config
