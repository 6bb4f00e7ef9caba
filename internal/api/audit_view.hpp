#pragma once

#include <string>
#include <vector>

#include "internal/metrics/metrics_calculator.hpp"
#include "internal/model/channel.hpp"
#include "internal/recorder/execution_recorder.hpp"
#include "relay/v1.hpp"

namespace relay::api {

// Builds the read view of one request, with derived metrics per attempt.
relay::v1::RequestView ToRequestView(const recorder::AuditTrail& trail);

relay::v1::ExecutionView ToExecutionView(const model::RequestExecution& execution, const model::UsageLog* usage);

relay::v1::PerformanceReport ToPerformanceReport(const std::vector<metrics::ChannelPerformance>& rows,
                                                 const std::vector<model::Channel>&              channels);

// Pretty-printed JSON; throws std::runtime_error if serialization fails.
std::string ToJson(const google::protobuf::Message& message);

} // namespace relay::api
