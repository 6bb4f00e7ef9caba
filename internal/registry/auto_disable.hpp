#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

#include "internal/model/retry_policy.hpp"
#include "internal/model/state_machine.hpp"

namespace relay::registry {

class ChannelRegistry;

/*
  Disables a channel once it has failed with a configured HTTP status
  `times` times in a row. Any successful attempt on the channel resets its
  counters; canceled attempts are ignored.
*/
class AutoDisabler {
 public:
  explicit AutoDisabler(std::shared_ptr<ChannelRegistry> registry);

  // Returns true when this observation disabled the channel.
  bool Observe(const model::AutoDisablePolicy& policy, int64_t channel_id, model::ExecutionStatus status, int32_t status_code);

  int32_t Count(int64_t channel_id, int32_t status_code) const;

 private:
  void ResetLocked(int64_t channel_id);

  std::shared_ptr<ChannelRegistry> registry_;

  mutable std::mutex                          mutex_;
  std::map<std::pair<int64_t, int32_t>, int32_t> counts_;
};

} // namespace relay::registry
