#include "metrics_calculator.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace relay::metrics {

std::optional<int64_t> LatencyMs(util::TimePoint start, util::TimePoint end) {
  const auto ms = util::MillisBetween(start, end);
  if (ms < 0) {
    return std::nullopt;
  }
  return ms;
}

std::optional<int64_t> FirstTokenLatencyMs(bool stream, util::TimePoint start, const std::optional<util::TimePoint>& first_chunk_at) {
  if (!stream || !first_chunk_at) {
    return std::nullopt;
  }
  return LatencyMs(start, *first_chunk_at);
}

std::optional<double> EffectiveGenerationSeconds(bool stream, const std::optional<int64_t>& latency_ms, const std::optional<int64_t>& ttft_ms) {
  if (!latency_ms) {
    return std::nullopt;
  }
  if (stream && ttft_ms) {
    return static_cast<double>(std::max<int64_t>(0, *latency_ms - *ttft_ms)) / 1000.0;
  }
  return static_cast<double>(*latency_ms) / 1000.0;
}

std::optional<double> TokensPerSecond(int64_t completion_tokens, const std::optional<double>& effective_seconds) {
  if (completion_tokens <= 0 || !effective_seconds || !(*effective_seconds > 0.0)) {
    return std::nullopt;
  }
  const double tps = static_cast<double>(completion_tokens) / *effective_seconds;
  if (!std::isfinite(tps) || tps < 0.0) {
    return std::nullopt;
  }
  return tps;
}

ExecutionMetrics ForExecution(const model::RequestExecution& execution, const model::UsageLog* usage) {
  ExecutionMetrics out;
  out.latency_ms             = LatencyMs(execution.created_at, execution.updated_at);
  out.first_token_latency_ms = FirstTokenLatencyMs(execution.stream, execution.created_at, execution.first_chunk_at);

  if (usage && execution.status == model::ExecutionStatus::kCompleted) {
    out.tokens_per_second =
        TokensPerSecond(usage->completion_tokens, EffectiveGenerationSeconds(execution.stream, out.latency_ms, out.first_token_latency_ms));
  }
  return out;
}

RequestMetrics ForRequest(const model::Request& request, const model::RequestExecution* decisive) {
  RequestMetrics out;
  if (request.status != model::RequestStatus::kCompleted) {
    return out;
  }
  out.latency_ms = LatencyMs(request.created_at, request.updated_at);
  if (decisive) {
    out.first_token_latency_ms = FirstTokenLatencyMs(request.stream, request.created_at, decisive->first_chunk_at);
  }
  return out;
}

std::vector<ChannelPerformance> SummarizeByChannel(const std::vector<model::RequestExecution>& executions,
                                                   const std::vector<model::UsageLog>&         usage) {
  std::unordered_map<std::string, const model::UsageLog*> usage_by_execution;
  for (const auto& u : usage) {
    usage_by_execution[u.execution_id] = &u;
  }

  struct Acc {
    ChannelPerformance perf;
    double             latency_sum = 0.0;
    uint64_t           latency_n   = 0;
    double             ttft_sum    = 0.0;
    uint64_t           ttft_n      = 0;
    double             tps_sum     = 0.0;
    uint64_t           tps_n       = 0;
  };
  std::map<int64_t, Acc> by_channel;

  for (const auto& execution : executions) {
    if (!model::IsTerminal(execution.status)) continue;

    auto& acc           = by_channel[execution.channel_id];
    acc.perf.channel_id = execution.channel_id;
    ++acc.perf.attempts;

    switch (execution.status) {
      case model::ExecutionStatus::kCompleted:
        ++acc.perf.successes;
        break;
      case model::ExecutionStatus::kFailed:
        ++acc.perf.failures;
        break;
      case model::ExecutionStatus::kCanceled:
        ++acc.perf.canceled;
        break;
      default:
        break;
    }
    if (execution.status != model::ExecutionStatus::kCompleted) continue;

    auto it = usage_by_execution.find(execution.id);
    const auto m = ForExecution(execution, it == usage_by_execution.end() ? nullptr : it->second);
    if (m.latency_ms) {
      acc.latency_sum += static_cast<double>(*m.latency_ms);
      ++acc.latency_n;
    }
    if (m.first_token_latency_ms) {
      acc.ttft_sum += static_cast<double>(*m.first_token_latency_ms);
      ++acc.ttft_n;
    }
    if (m.tokens_per_second) {
      acc.tps_sum += *m.tokens_per_second;
      ++acc.tps_n;
    }
  }

  std::vector<ChannelPerformance> out;
  out.reserve(by_channel.size());
  for (auto& [id, acc] : by_channel) {
    if (acc.latency_n) acc.perf.mean_latency_ms = acc.latency_sum / static_cast<double>(acc.latency_n);
    if (acc.ttft_n) acc.perf.mean_first_token_latency_ms = acc.ttft_sum / static_cast<double>(acc.ttft_n);
    if (acc.tps_n) acc.perf.mean_tokens_per_second = acc.tps_sum / static_cast<double>(acc.tps_n);
    out.push_back(acc.perf);
  }
  return out;
}

} // namespace relay::metrics
