#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/context.h>
#include <opentelemetry/trace/span.h>
#endif

namespace flotilla::observability {
namespace {

constexpr const char* kLoggerName     = "flotilla";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

// Written once by InitializeLogging before any worker thread starts.
bool        g_include_trace_context{false};
std::string g_controller_field;

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr && *value != '\0' ? value : nullptr;
}

bool ParseFlag(std::string_view value) {
  return value == "1" || value == "true" || value == "yes";
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  // from_str maps anything it does not know to off
  if (level == spdlog::level::off && name != "off") {
    throw std::invalid_argument("unknown log level: " + name);
  }
  return level;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) {
    return true;
  }
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\t' || c == '\n') {
      return true;
    }
  }
  return false;
}

void AppendValue(std::string& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value);
    return;
  }
  out.push_back('"');
  for (char c : value) {
    switch (c) {
      case '"':
        out.append("\\\"");
        break;
      case '\\':
        out.append("\\\\");
        break;
      case '\n':
        out.append("\\n");
        break;
      default:
        out.push_back(c);
    }
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
template <typename Id>
std::string Hex(const Id& id) {
  char buffer[2 * Id::kSize];
  id.ToLowerBase16(opentelemetry::nostd::span<char, 2 * Id::kSize>(buffer, 2 * Id::kSize));
  return std::string(buffer, sizeof(buffer));
}

void AppendTraceContext(std::string& out) {
  if (!g_include_trace_context) {
    return;
  }
  const auto context = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent())->GetContext();
  if (!context.IsValid()) {
    return;
  }
  out.append(" trace_id=").append(Hex(context.trace_id()));
  out.append(" span_id=").append(Hex(context.span_id()));
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

LogField UintField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogSettings ResolveLogSettings(const flotilla::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  LogSettings settings;
  if (const char* level = Env("FLOTILLA_LOG_LEVEL")) {
    settings.level = ParseLevel(level);
  } else if (!logging.level().empty()) {
    settings.level = ParseLevel(logging.level());
  }

  if (const char* pattern = Env("FLOTILLA_LOG_PATTERN")) {
    settings.pattern = pattern;
  } else {
    settings.pattern = logging.pattern().empty() ? kDefaultPattern : logging.pattern();
  }

  if (const char* include = Env("FLOTILLA_LOG_INCLUDE_TRACE_CONTEXT")) {
    settings.include_trace_context = ParseFlag(include);
  } else {
    settings.include_trace_context = logging.include_trace_context();
  }

  settings.controller_id = config.controller().id();
  return settings;
}

void InitializeLogging(const flotilla::runtime::config::RuntimeConfig& config) {
  InitializeLogging(ResolveLogSettings(config));
}

void InitializeLogging(const LogSettings& settings) {
  auto logger = spdlog::get(kLoggerName);
  if (!logger) {
    logger = spdlog::stdout_color_mt(kLoggerName);
  }
  logger->set_pattern(settings.pattern.empty() ? kDefaultPattern : settings.pattern);
  logger->set_level(settings.level);
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));

  g_include_trace_context = settings.include_trace_context;
  g_controller_field      = settings.controller_id.empty() ? std::string() : FormatFields({StringField("controller", settings.controller_id)});
}

void ShutdownLogging() {
  spdlog::shutdown();
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out.append(field.key).push_back('=');
    AppendValue(out, field.value);
  }
  return out;
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) {
    return;
  }

  std::string line(message);
  if (fields.size() > 0) {
    line.push_back(' ');
    line.append(FormatFields(fields));
  }
  if (!g_controller_field.empty()) {
    line.push_back(' ');
    line.append(g_controller_field);
  }
  AppendTraceContext(line);

  spdlog::log(level, "{}", line);
}

} // namespace flotilla::observability
