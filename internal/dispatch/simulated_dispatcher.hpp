#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <unordered_map>

#include "dispatcher.hpp"

namespace relay::dispatch {

// Synthetic behavior of one upstream channel.
struct ChannelProfile {
  double   failure_rate      = 0.0;
  int32_t  failure_status    = 503; // 0 simulates a transport failure
  uint32_t latency_ms        = 50;
  uint32_t first_chunk_ms    = 10;
  uint32_t chunks            = 4;
  int64_t  completion_tokens = 32;
};

/*
  Dispatcher backed by per-channel profiles instead of real upstreams.
  Used by `relayctl simulate` and by tests that need realistic timing.
*/
class SimulatedDispatcher final : public Dispatcher {
 public:
  explicit SimulatedDispatcher(std::unordered_map<int64_t, ChannelProfile> profiles, std::optional<uint64_t> seed = std::nullopt);

  DispatchOutcome Dispatch(const DispatchRequest&         request,
                           const model::Channel&          channel,
                           const core::CancellationToken& cancel,
                           const ChunkSink&               sink) override;

  void SetProfile(int64_t channel_id, const ChannelProfile& profile);

 private:
  ChannelProfile ProfileFor(int64_t channel_id) const;
  bool           Fails(double failure_rate);

  mutable std::mutex                          mutex_;
  std::unordered_map<int64_t, ChannelProfile> profiles_;
  std::mt19937_64                             engine_;
};

} // namespace relay::dispatch
