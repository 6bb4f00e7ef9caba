#include "policy_store.hpp"

#include "internal/config/config_mapper.hpp"
#include "internal/observability/logging.hpp"

namespace relay::config {

using relay::observability::BoolField;
using relay::observability::IntField;
using relay::observability::StringField;

PolicyStore::PolicyStore(model::RetryPolicy initial) {
  ValidatePolicy(initial);
  current_ = std::make_shared<const model::RetryPolicy>(std::move(initial));
}

std::shared_ptr<const model::RetryPolicy> PolicyStore::Snapshot() const {
  std::lock_guard lock(mutex_);
  return current_;
}

void PolicyStore::Update(model::RetryPolicy policy) {
  ValidatePolicy(policy);
  auto next = std::make_shared<const model::RetryPolicy>(std::move(policy));
  {
    std::lock_guard lock(mutex_);
    current_ = next;
  }
  RELAY_LOG_INFO("retry policy updated",
                 {BoolField("enabled", next->enabled),
                  IntField("max_channel_retries", next->max_channel_retries),
                  IntField("max_single_channel_retries", next->max_single_channel_retries),
                  IntField("retry_delay_ms", next->retry_delay_ms),
                  StringField("strategy", model::ToString(next->load_balancer_strategy))});
}

} // namespace relay::config
