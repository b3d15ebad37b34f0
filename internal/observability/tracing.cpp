#include "internal/observability/spans.hpp"

#include <cctype>
#include <cstdlib>

#include "config/config.pb.h"

namespace upload::observability {

OtlpConfig ToOtlpConfig(const upload::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp_config;
  if (!observability.service_name().empty()) {
    otlp_config.service_name = observability.service_name();
  }
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == upload::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (observability.metrics_export_interval_ms() > 0) {
    otlp_config.export_interval_ms = observability.metrics_export_interval_ms();
  }
  const double ratio = observability.trace_sample_ratio();
  if (ratio > 0.0 && ratio < 1.0) {
    otlp_config.sample_ratio = ratio;
  }
  return otlp_config;
}

std::string ResolveOtlpEndpoint(const OtlpConfig& config, std::string_view signal) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  std::string signal_env = "OTEL_EXPORTER_OTLP_";
  for (char c : signal) {
    signal_env.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  signal_env += "_ENDPOINT";

  for (const char* name : {signal_env.c_str(), "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* endpoint = std::getenv(name)) {
      return endpoint;
    }
  }
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    return "http://localhost:4318/v1/" + std::string(signal);
  }
  return "localhost:4317";
}

} // namespace upload::observability

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/always_on_factory.h>
#include <opentelemetry/sdk/trace/samplers/parent_factory.h>
#include <opentelemetry/sdk/trace/samplers/trace_id_ratio_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <utility>

#include "internal/observability/logging.hpp"

namespace upload::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {
std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeSpanExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveOtlpEndpoint(config, "traces");
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

// Children follow the caller's decision; roots are sampled by ratio.
std::unique_ptr<sdktrace::Sampler> MakeSampler(const OtlpConfig& config) {
  if (config.sample_ratio >= 1.0) {
    return sdktrace::ParentBasedSamplerFactory::Create(sdktrace::AlwaysOnSamplerFactory::Create());
  }
  return sdktrace::ParentBasedSamplerFactory::Create(sdktrace::TraceIdRatioBasedSamplerFactory::Create(config.sample_ratio));
}

} // namespace

bool InitializeTracing(const upload::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto otlp_config = ToOtlpConfig(config);

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeSpanExporter(otlp_config), sdktrace::BatchSpanProcessorOptions{});
  auto provider  = sdktrace::TracerProviderFactory::Create(
      std::move(processor), resource::Resource::Create({{"service.name", otlp_config.service_name}}), MakeSampler(otlp_config));

  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer("upload-manager", "0.1.0");

  UPLOAD_LOG_INFO("tracing enabled", {StringField("service", otlp_config.service_name),
                                      StringField("sample_ratio", std::to_string(otlp_config.sample_ratio))});
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer) {
    return;
  }

  impl_->span  = g_tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) {
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent(std::string(name));
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
  }
}

} // namespace upload::observability

#endif
