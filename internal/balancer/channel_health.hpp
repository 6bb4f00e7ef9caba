#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "internal/model/execution.hpp"
#include "internal/util/time.hpp"

namespace relay::balancer {

struct HealthOptions {
  std::chrono::seconds window{600};
  uint32_t             cooldown_ms          = 30000;
  double               cooldown_penalty     = 0.9;
  uint32_t             latency_reference_ms = 1000;
};

struct AttemptOutcome {
  bool                  success  = false;
  bool                  canceled = false;
  std::optional<double> latency_ms;
  util::TimePoint       at;
};

struct HealthSnapshot {
  uint64_t              successes    = 0;
  uint64_t              failures     = 0;
  double                success_rate = 1.0;
  std::optional<double> mean_latency_ms;

  uint32_t                       consecutive_failures = 0;
  std::optional<util::TimePoint> last_failure_at;
  std::optional<util::TimePoint> last_selected_at;
  uint64_t                       selections = 0;
};

/*
  Rolling health of one channel.

  Outcomes are bucketed into one-second slots of a ring sized to the window,
  so recording and reading are O(window) at worst and memory is fixed.
*/
class ChannelHealth {
 public:
  explicit ChannelHealth(const HealthOptions& options);

  void Record(const AttemptOutcome& outcome);
  void MarkSelected(util::TimePoint at);

  HealthSnapshot Snapshot(util::TimePoint now) const;

 private:
  struct Slot {
    int64_t  second     = -1;
    uint64_t successes  = 0;
    uint64_t failures   = 0;
    uint64_t latency_n  = 0;
    double   latency_ms = 0.0;
  };

  Slot& SlotFor(int64_t second);

  HealthOptions     options_;
  mutable std::mutex mutex_;
  std::vector<Slot> slots_;

  uint32_t                       consecutive_failures_ = 0;
  std::optional<util::TimePoint> last_failure_at_;
  std::optional<util::TimePoint> last_selected_at_;
  uint64_t                       selections_ = 0;
};

/*
  Health of every channel seen so far, shared by all concurrently running
  requests.
*/
class HealthTracker {
 public:
  explicit HealthTracker(HealthOptions options = {});

  void RecordOutcome(int64_t channel_id, const AttemptOutcome& outcome);
  void RecordSelection(int64_t channel_id, util::TimePoint at);

  HealthSnapshot Snapshot(int64_t channel_id, util::TimePoint now) const;

  // successRate / (1 + meanLatency / latencyReference), reduced while the
  // channel is cooling down after a failure.
  double Score(int64_t channel_id, util::TimePoint now) const;

  // Replays terminal executions inside the window; returns how many were used.
  size_t Hydrate(const std::vector<model::RequestExecution>& executions, util::TimePoint now);

  const HealthOptions& Options() const {
    return options_;
  }

 private:
  std::shared_ptr<ChannelHealth> Get(int64_t channel_id) const;
  std::shared_ptr<ChannelHealth> GetOrCreate(int64_t channel_id);

  HealthOptions options_;

  mutable std::shared_mutex                                   mutex_;
  std::unordered_map<int64_t, std::shared_ptr<ChannelHealth>> channels_;
};

} // namespace relay::balancer
