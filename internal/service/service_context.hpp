#pragma once

#include <memory>

#include "internal/core/retry_coordinator.hpp"

namespace relay::balancer { class LoadBalancerSet; }
namespace relay::config { class PolicyStore; }
namespace relay::dispatch { class Dispatcher; }
namespace relay::recorder { class ExecutionRecorder; }
namespace relay::registry { class ChannelRegistry; class AutoDisabler; }

namespace relay::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<relay::recorder::ExecutionRecorder> recorder;
  std::shared_ptr<relay::registry::ChannelRegistry>   registry;
  std::shared_ptr<relay::registry::AutoDisabler>      auto_disabler;
  std::shared_ptr<relay::balancer::LoadBalancerSet>   balancers;
  std::shared_ptr<relay::dispatch::Dispatcher>        dispatcher;
  std::shared_ptr<relay::config::PolicyStore>         policies;

  // Empty means the cancellation token's own interruptible wait.
  relay::core::Sleeper sleeper;
};

}
