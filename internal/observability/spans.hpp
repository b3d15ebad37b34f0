#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace upload::runtime::config {
class RuntimeConfig;
}

namespace upload::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"upload-manager"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t export_interval_ms{1000};
  // root spans kept; 1.0 keeps every trace
  double sample_ratio{1.0};
};

OtlpConfig ToOtlpConfig(const upload::runtime::config::RuntimeConfig& config);

// Configured endpoint, else OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, else
// OTEL_EXPORTER_OTLP_ENDPOINT, else the collector default for the
// transport. signal is "traces" or "metrics".
std::string ResolveOtlpEndpoint(const OtlpConfig& config, std::string_view signal);

bool InitializeTracing(const upload::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const upload::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void RecordChunkBytes(std::uint64_t bytes);
  void RecordSessionTransition(std::string_view status);
  void SetLiveConnections(std::int64_t count);

  void ObserveFinalizeMs(double duration_ms, bool success);
  void RecordArtifactBytes(std::uint64_t bytes);
  void RecordMalformedFrame(bool connection_closed);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const upload::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const upload::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordChunkBytes(std::uint64_t) {
}

inline void Metrics::RecordSessionTransition(std::string_view) {
}

inline void Metrics::SetLiveConnections(std::int64_t) {
}

inline void Metrics::ObserveFinalizeMs(double, bool) {
}

inline void Metrics::RecordArtifactBytes(std::uint64_t) {
}

inline void Metrics::RecordMalformedFrame(bool) {
}
#endif

} // namespace upload::observability
