#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/execution.hpp"
#include "internal/model/request.hpp"
#include "internal/model/usage.hpp"
#include "internal/util/time.hpp"

namespace relay::metrics {

/*
  Derived performance metrics.

  Every function is pure. A value that cannot be computed (clock skew,
  missing timestamps, zero tokens) is returned as nullopt and must be shown
  as "no data", never as zero.
*/

// end - start; nullopt when negative.
std::optional<int64_t> LatencyMs(util::TimePoint start, util::TimePoint end);

// Streaming only.
std::optional<int64_t> FirstTokenLatencyMs(bool stream, util::TimePoint start, const std::optional<util::TimePoint>& first_chunk_at);

// stream: max(0, latency - ttft) / 1000, falling back to latency when no
// chunk arrived; otherwise latency / 1000.
std::optional<double> EffectiveGenerationSeconds(bool stream, const std::optional<int64_t>& latency_ms, const std::optional<int64_t>& ttft_ms);

// completion_tokens / seconds when both are positive.
std::optional<double> TokensPerSecond(int64_t completion_tokens, const std::optional<double>& effective_seconds);

struct ExecutionMetrics {
  std::optional<int64_t> latency_ms;
  std::optional<int64_t> first_token_latency_ms;
  std::optional<double>  tokens_per_second;
};

ExecutionMetrics ForExecution(const model::RequestExecution& execution, const model::UsageLog* usage);

struct RequestMetrics {
  std::optional<int64_t> latency_ms;
  std::optional<int64_t> first_token_latency_ms;
};

// Only a completed request has metrics. `decisive` is the completed attempt.
RequestMetrics ForRequest(const model::Request& request, const model::RequestExecution* decisive);

struct ChannelPerformance {
  int64_t  channel_id = 0;
  uint64_t attempts   = 0;
  uint64_t successes  = 0;
  uint64_t failures   = 0;
  uint64_t canceled   = 0;

  std::optional<double> mean_latency_ms;
  std::optional<double> mean_first_token_latency_ms;
  std::optional<double> mean_tokens_per_second;
};

// One entry per channel, ordered by channel id. Means cover completed
// attempts that have data.
std::vector<ChannelPerformance> SummarizeByChannel(const std::vector<model::RequestExecution>& executions,
                                                   const std::vector<model::UsageLog>&         usage);

} // namespace relay::metrics
