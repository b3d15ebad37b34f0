#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace upload::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

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

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveOtlpEndpoint(config, "metrics");
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> chunk_bytes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> session_transitions;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   live_connections_gauge;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      finalize_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<std::uint64_t>> artifact_bytes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> malformed_frames;

  std::atomic<std::int64_t> live_connections{0};
};

bool InitializeMetrics(const upload::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = ToOtlpConfig(config);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(otlp_config.export_interval_ms);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeMetricExporter(otlp_config), reader_options);

  auto res   = resource::Resource::Create({{"service.name", otlp_config.service_name}});
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), res);
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
  impl_->meter  = provider->GetMeter("upload-manager", "0.1.0");

  impl_->request_count       = impl_->meter->CreateUInt64Counter("upload.request.count", "Total number of service requests", "1");
  impl_->request_latency_ms  = impl_->meter->CreateDoubleHistogram("upload.request.latency_ms", "End-to-end request latency in milliseconds", "ms");
  impl_->chunk_bytes         = impl_->meter->CreateUInt64Counter("upload.chunk.bytes", "Chunk payload bytes accepted", "By");
  impl_->session_transitions = impl_->meter->CreateUInt64Counter("upload.session.transitions", "Session status transitions", "1");
  impl_->live_connections_gauge =
      impl_->meter->CreateInt64ObservableGauge("upload.channel.live_connections", "Duplex connections currently bound", "1");
  impl_->finalize_ms      = impl_->meter->CreateDoubleHistogram("upload.finalize.duration_ms", "Staging flush and publish time", "ms");
  impl_->artifact_bytes   = impl_->meter->CreateUInt64Histogram("upload.artifact.bytes", "Size of published artifacts", "By");
  impl_->malformed_frames = impl_->meter->CreateUInt64Counter("upload.channel.malformed_frames", "Undecodable channel frames", "1");
  impl_->live_connections_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->live_connections.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordChunkBytes(std::uint64_t bytes) {
  if (!impl_ || !impl_->chunk_bytes) {
    return;
  }

  AddWithAttributes(impl_->chunk_bytes, bytes, std::initializer_list<AttributePair>{});
}

void Metrics::RecordSessionTransition(std::string_view status) {
  if (!impl_ || !impl_->session_transitions) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"status", std::string(status)}};
  AddWithAttributes(impl_->session_transitions, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::SetLiveConnections(std::int64_t count) {
  if (!impl_) {
    return;
  }
  impl_->live_connections.store(count);
}

void Metrics::ObserveFinalizeMs(double duration_ms, bool success) {
  if (!impl_ || !impl_->finalize_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"success", success}};
  RecordWithAttributes(impl_->finalize_ms, duration_ms, attributes);
}

void Metrics::RecordArtifactBytes(std::uint64_t bytes) {
  if (!impl_ || !impl_->artifact_bytes) {
    return;
  }
  RecordWithAttributes(impl_->artifact_bytes, bytes, std::initializer_list<AttributePair>{});
}

void Metrics::RecordMalformedFrame(bool connection_closed) {
  if (!impl_ || !impl_->malformed_frames) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"closed", connection_closed}};
  AddWithAttributes(impl_->malformed_frames, static_cast<std::uint64_t>(1), attributes);
}

} // namespace upload::observability

#endif
