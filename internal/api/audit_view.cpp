#include "audit_view.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <unordered_map>

#include "internal/util/time.hpp"

namespace relay::api {

relay::v1::ExecutionView ToExecutionView(const model::RequestExecution& execution, const model::UsageLog* usage) {
  relay::v1::ExecutionView view;
  view.set_id(execution.id);
  view.set_request_id(execution.request_id);
  view.set_channel_id(execution.channel_id);
  view.set_model_id(execution.model_id);
  view.set_attempt(execution.attempt);
  view.set_status(std::string(model::ToString(execution.status)));
  view.set_stream(execution.stream);
  view.set_response_body(execution.response_body);
  for (const auto& chunk : execution.response_chunks) {
    view.add_response_chunks(chunk);
  }
  if (execution.error_message) {
    view.set_error_message(*execution.error_message);
  }
  view.set_error_status_code(execution.error_status_code);
  view.set_created_at_ms(util::ToUnixMillis(execution.created_at));
  view.set_updated_at_ms(util::ToUnixMillis(execution.updated_at));

  // stored values win; recompute for rows written without them
  const auto derived = metrics::ForExecution(execution, usage);
  if (auto v = execution.metrics_latency_ms ? execution.metrics_latency_ms : derived.latency_ms) {
    view.set_latency_ms(*v);
  }
  if (auto v = execution.metrics_first_token_latency_ms ? execution.metrics_first_token_latency_ms : derived.first_token_latency_ms) {
    view.set_first_token_latency_ms(*v);
  }
  if (derived.tokens_per_second) {
    view.set_tokens_per_second(*derived.tokens_per_second);
  }
  return view;
}

relay::v1::RequestView ToRequestView(const recorder::AuditTrail& trail) {
  const auto& request = trail.request;

  relay::v1::RequestView view;
  view.set_id(request.id);
  view.set_source(std::string(model::ToString(request.source)));
  view.set_model_id(request.model_id);
  view.set_stream(request.stream);
  view.set_status(std::string(model::ToString(request.status)));
  view.set_channel_id(request.channel_id);
  if (request.error_message) {
    view.set_error_message(*request.error_message);
  }
  view.set_created_at_ms(util::ToUnixMillis(request.created_at));
  view.set_updated_at_ms(util::ToUnixMillis(request.updated_at));
  if (request.metrics_latency_ms) {
    view.set_latency_ms(*request.metrics_latency_ms);
  }
  if (request.metrics_first_token_latency_ms) {
    view.set_first_token_latency_ms(*request.metrics_first_token_latency_ms);
  }

  std::unordered_map<std::string, const model::UsageLog*> usage_by_execution;
  for (const auto& usage : trail.usage) {
    usage_by_execution[usage.execution_id] = &usage;
  }
  for (const auto& execution : trail.executions) {
    auto it = usage_by_execution.find(execution.id);
    *view.add_executions() = ToExecutionView(execution, it == usage_by_execution.end() ? nullptr : it->second);
  }
  return view;
}

relay::v1::PerformanceReport ToPerformanceReport(const std::vector<metrics::ChannelPerformance>& rows,
                                                 const std::vector<model::Channel>&              channels) {
  std::unordered_map<int64_t, std::string> names;
  for (const auto& channel : channels) {
    names[channel.id] = channel.name;
  }

  relay::v1::PerformanceReport report;
  for (const auto& row : rows) {
    auto* view = report.add_channels();
    view->set_channel_id(row.channel_id);
    if (auto it = names.find(row.channel_id); it != names.end()) {
      view->set_channel_name(it->second);
    }
    view->set_attempts(row.attempts);
    view->set_successes(row.successes);
    view->set_failures(row.failures);
    view->set_canceled(row.canceled);
    if (row.mean_latency_ms) view->set_mean_latency_ms(*row.mean_latency_ms);
    if (row.mean_first_token_latency_ms) view->set_mean_first_token_latency_ms(*row.mean_first_token_latency_ms);
    if (row.mean_tokens_per_second) view->set_mean_tokens_per_second(*row.mean_tokens_per_second);
  }
  return report;
}

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(message, &out, options);
  if (!status.ok()) {
    throw std::runtime_error("serialize " + message.GetTypeName() + ": " + std::string(status.message()));
  }
  return out;
}

} // namespace relay::api
