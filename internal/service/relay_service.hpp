#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/core/cancellation.hpp"
#include "internal/core/retry_coordinator.hpp"
#include "internal/metrics/metrics_calculator.hpp"
#include "internal/recorder/execution_recorder.hpp"
#include "service_context.hpp"

namespace relay::service {

/*
  Entry point for inbound requests and for the read side of the audit trail.

  Every Handle() call runs its own coordinator with the policy snapshot
  current at that moment. In-flight requests can be canceled by id.
*/
class RelayService {
 public:
  explicit RelayService(ServiceContext ctx);

  core::TerminalRequest Handle(model::Request request, const dispatch::ChunkSink& sink = {});

  // false when no request with that id is in flight
  bool Cancel(const std::string& request_id);

  // Cancels every in-flight request; returns how many were signaled.
  std::size_t CancelAll();

  std::size_t InFlight() const;

  std::optional<recorder::AuditTrail> Audit(const std::string& request_id);

  std::vector<metrics::ChannelPerformance> Performance(util::TimePoint since);

  uint64_t Prune(util::TimePoint cutoff);

 private:
  std::shared_ptr<core::CancellationToken> Register(const std::string& request_id);
  void                                     Unregister(const std::string& request_id);

  ServiceContext ctx_;

  mutable std::mutex                                                        inflight_mutex_;
  std::unordered_map<std::string, std::shared_ptr<core::CancellationToken>> inflight_;
};

} // namespace relay::service
