#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <memory>
#include <string>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace upload::observability {
namespace {

constexpr const char* kLoggerName     = "upload-manager";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

thread_local std::vector<LogField> t_context;

bool g_include_trace_context{false};

std::string EnvOr(const char* name, const std::string& configured, const std::string& fallback) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool ResolveTraceContextEnabled(const upload::runtime::config::RuntimeConfig& config) {
  if (const char* include_trace = std::getenv("UPLOAD_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(include_trace);
    return value == "1" || value == "true";
  }
  return config.logging().include_trace_context();
}

// key=value, quoted when the value would break tokenizing
void AppendField(std::string& line, const LogField& field) {
  if (!line.empty()) line.push_back(' ');
  line.append(field.key);
  line.push_back('=');

  const bool quote = field.value.empty() || field.value.find_first_of(" \"=\t\n") != std::string::npos;
  if (!quote) {
    line.append(field.value);
    return;
  }
  line.push_back('"');
  for (char c : field.value) {
    if (c == '"' || c == '\\') line.push_back('\\');
    line.push_back(c == '\n' ? ' ' : c);
  }
  line.push_back('"');
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }
  auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  AppendField(line, {"trace_id", HexId(trace_bytes, 16)});
  AppendField(line, {"span_id", HexId(span_bytes, 8)});
}
#else
void AppendTraceContext(std::string&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

// FNV-1a, first 48 bits in hex
std::string TokenTag(std::string_view token) {
  std::uint64_t hash = 0xcbf29ce484222325ULL;
  for (unsigned char c : token) {
    hash ^= c;
    hash *= 0x100000001b3ULL;
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string tag(12, '0');
  for (int i = 11; i >= 0; --i) {
    tag[static_cast<std::size_t>(i)] = kHex[hash & 0x0F];
    hash >>= 4;
  }
  return tag;
}

LogField TokenField(std::string_view key, std::string_view token) {
  return {std::string(key), token.empty() ? std::string("-") : TokenTag(token)};
}

ScopedLogContext::ScopedLogContext(std::initializer_list<LogField> fields) : restore_size_(t_context.size()) {
  t_context.insert(t_context.end(), fields.begin(), fields.end());
}

ScopedLogContext::~ScopedLogContext() {
  t_context.resize(restore_size_);
}

std::vector<LogField> CurrentLogContext() {
  return t_context;
}

void InitializeLogging(const upload::runtime::config::RuntimeConfig& config) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!config.logging().file().empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.logging().file(), false));
  }

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(EnvOr("UPLOAD_LOG_PATTERN", config.logging().pattern(), kDefaultPattern));
  logger->set_level(spdlog::level::from_str(EnvOr("UPLOAD_LOG_LEVEL", config.logging().level(), "info")));
  logger->flush_on(spdlog::level::warn);

  spdlog::drop(kLoggerName);
  spdlog::set_default_logger(std::move(logger));
  g_include_trace_context = ResolveTraceContextEnabled(config);
}

void FlushLogging() {
  if (auto logger = spdlog::default_logger()) {
    logger->flush();
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  if (logger == nullptr || !logger->should_log(level)) {
    return;
  }

  std::string line;
  for (const auto& field : fields) {
    AppendField(line, field);
  }
  for (const auto& field : t_context) {
    AppendField(line, field);
  }
  AppendTraceContext(line);

  if (line.empty()) {
    logger->log(level, "{}", message);
    return;
  }
  logger->log(level, "{} {}", message, line);
}

} // namespace upload::observability
