#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace flotilla::runtime::config {
class RuntimeConfig;
}

namespace flotilla::observability {

// One key=value pair appended to a log line.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);
LogField BoolField(std::string_view key, bool value);

struct LogSettings {
  spdlog::level::level_enum level{spdlog::level::info};
  std::string               pattern;
  bool                      include_trace_context{false};

  // stamped on every line as controller=<id> when set
  std::string controller_id;
};

// Config values, overridden by FLOTILLA_LOG_LEVEL, FLOTILLA_LOG_PATTERN and
// FLOTILLA_LOG_INCLUDE_TRACE_CONTEXT. Throws std::invalid_argument on an
// unknown level name.
LogSettings ResolveLogSettings(const flotilla::runtime::config::RuntimeConfig& config);

void InitializeLogging(const flotilla::runtime::config::RuntimeConfig& config);
void InitializeLogging(const LogSettings& settings);
void ShutdownLogging();

// Values holding spaces, quotes or '=' are quoted and escaped.
std::string FormatFields(std::initializer_list<LogField> fields);

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

} // namespace flotilla::observability

#define FLOTILLA_LOG_DEBUG(message, ...) ::flotilla::observability::LogDebug((message), ##__VA_ARGS__)
#define FLOTILLA_LOG_INFO(message, ...) ::flotilla::observability::LogInfo((message), ##__VA_ARGS__)
#define FLOTILLA_LOG_WARN(message, ...) ::flotilla::observability::LogWarn((message), ##__VA_ARGS__)
#define FLOTILLA_LOG_ERROR(message, ...) ::flotilla::observability::LogError((message), ##__VA_ARGS__)
