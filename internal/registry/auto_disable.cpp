#include "auto_disable.hpp"

#include <limits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/registry/channel_registry.hpp"

namespace relay::registry {

using relay::observability::IntField;

AutoDisabler::AutoDisabler(std::shared_ptr<ChannelRegistry> registry) : registry_(std::move(registry)) {
}

bool AutoDisabler::Observe(const model::AutoDisablePolicy& policy, int64_t channel_id, model::ExecutionStatus status, int32_t status_code) {
  if (!policy.enabled || status == model::ExecutionStatus::kCanceled) {
    return false;
  }

  std::unique_lock lock(mutex_);

  if (status == model::ExecutionStatus::kCompleted) {
    ResetLocked(channel_id);
    return false;
  }

  if (status != model::ExecutionStatus::kFailed || status_code == 0) {
    return false;
  }

  for (const auto& rule : policy.rules) {
    if (rule.status_code != status_code) continue;

    auto& count = counts_[{channel_id, status_code}];
    ++count;
    if (count < rule.times) return false;

    ResetLocked(channel_id);
    lock.unlock();

    if (!registry_->SetStatus(channel_id, model::ChannelStatus::kDisabled)) {
      return false;
    }
    RELAY_LOG_WARN("channel auto-disabled", {IntField("channel_id", channel_id), IntField("status", status_code), IntField("times", rule.times)});
    observability::Metrics::Instance().RecordChannelDisabled(channel_id);
    return true;
  }
  return false;
}

void AutoDisabler::ResetLocked(int64_t channel_id) {
  auto it = counts_.lower_bound({channel_id, std::numeric_limits<int32_t>::min()});
  while (it != counts_.end() && it->first.first == channel_id) {
    it = counts_.erase(it);
  }
}

int32_t AutoDisabler::Count(int64_t channel_id, int32_t status_code) const {
  std::lock_guard lock(mutex_);
  auto            it = counts_.find({channel_id, status_code});
  return it == counts_.end() ? 0 : it->second;
}

} // namespace relay::registry
