#pragma once

#include <memory>
#include <mutex>

#include "internal/model/retry_policy.hpp"

namespace relay::config {

/*
  Holds the live RetryPolicy. Each request takes one Snapshot() when it
  starts and keeps it for its whole life; Update() only affects requests
  started afterwards.
*/
class PolicyStore {
 public:
  explicit PolicyStore(model::RetryPolicy initial = {});

  std::shared_ptr<const model::RetryPolicy> Snapshot() const;

  // Throws util::InvalidArgument and keeps the current policy when invalid.
  void Update(model::RetryPolicy policy);

 private:
  mutable std::mutex                        mutex_;
  std::shared_ptr<const model::RetryPolicy> current_;
};

} // namespace relay::config
