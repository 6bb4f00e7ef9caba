#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace relay::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> attempt_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      attempt_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_attempts;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> selection_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> channel_disabled_count;
};

bool InitializeMetrics(const relay::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint  = observability.otlp_endpoint();
  otlp_config.transport = observability.transport() == relay::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  auto endpoint = ResolveEndpoint(otlp_config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto interval_ms = observability.export_interval_ms() > 0 ? observability.export_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", otlp_config.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("relay-manager", "0.1.0");

  impl_->attempt_count      = impl_->meter->CreateUInt64Counter("relay.attempt.count", "Upstream attempts by outcome", "1");
  impl_->attempt_latency_ms = impl_->meter->CreateDoubleHistogram("relay.attempt.latency_ms", "Upstream attempt latency in milliseconds", "ms");
  impl_->request_count      = impl_->meter->CreateUInt64Counter("relay.request.count", "Requests by terminal status", "1");
  impl_->request_attempts   = impl_->meter->CreateDoubleHistogram("relay.request.attempts", "Attempts used per request", "1");
  impl_->selection_count    = impl_->meter->CreateUInt64Counter("relay.balancer.selection.count", "Channel selections by strategy", "1");
  impl_->channel_disabled_count =
      impl_->meter->CreateUInt64Counter("relay.channel.disabled.count", "Channels disabled by the auto-disable policy", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordAttempt(std::int64_t channel_id, std::string_view outcome) {
  if (!impl_ || !impl_->attempt_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"channel_id", channel_id}, {"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->attempt_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveAttemptLatencyMs(std::int64_t channel_id, double latency_ms) {
  if (!impl_ || !impl_->attempt_latency_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"channel_id", channel_id}};
  RecordWithAttributes(impl_->attempt_latency_ms, latency_ms, attributes);
}

void Metrics::RecordRequest(std::string_view status, std::int64_t attempts) {
  if (!impl_ || !impl_->request_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"status", std::string(status)}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
  RecordWithAttributes(impl_->request_attempts, static_cast<double>(attempts), attributes);
}

void Metrics::RecordSelection(std::string_view strategy, std::int64_t channel_id) {
  if (!impl_ || !impl_->selection_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"strategy", std::string(strategy)}, {"channel_id", channel_id}};
  AddWithAttributes(impl_->selection_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordChannelDisabled(std::int64_t channel_id) {
  if (!impl_ || !impl_->channel_disabled_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"channel_id", channel_id}};
  AddWithAttributes(impl_->channel_disabled_count, static_cast<std::uint64_t>(1), attributes);
}

} // namespace relay::observability

#endif
