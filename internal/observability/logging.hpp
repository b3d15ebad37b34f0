#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace upload::runtime::config {
class RuntimeConfig;
}

namespace upload::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);

// Session tokens are bearer credentials. Logs carry a short stable tag
// derived from the token instead of the token itself.
std::string TokenTag(std::string_view token);
LogField    TokenField(std::string_view key, std::string_view token);

/*
  Fields appended to every line logged on the current thread while the
  scope is alive. Scopes nest; inner fields come after outer ones.
*/
class ScopedLogContext {
 public:
  explicit ScopedLogContext(std::initializer_list<LogField> fields);
  ~ScopedLogContext();

  ScopedLogContext(const ScopedLogContext&)            = delete;
  ScopedLogContext& operator=(const ScopedLogContext&) = delete;

 private:
  std::size_t restore_size_;
};

std::vector<LogField> CurrentLogContext();

// Installs the "upload-manager" logger as spdlog's default: colored stdout,
// plus logging.file when configured.
// UPLOAD_LOG_LEVEL / UPLOAD_LOG_PATTERN / UPLOAD_LOG_INCLUDE_TRACE_CONTEXT
// override the config values.
void InitializeLogging(const upload::runtime::config::RuntimeConfig& config);
void FlushLogging();
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace upload::observability

#define UPLOAD_LOG_DEBUG(message, ...) ::upload::observability::LogDebug((message), ##__VA_ARGS__)
#define UPLOAD_LOG_INFO(message, ...) ::upload::observability::LogInfo((message), ##__VA_ARGS__)
#define UPLOAD_LOG_WARN(message, ...) ::upload::observability::LogWarn((message), ##__VA_ARGS__)
#define UPLOAD_LOG_ERROR(message, ...) ::upload::observability::LogError((message), ##__VA_ARGS__)
