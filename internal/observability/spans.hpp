#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace flotilla::runtime::config {
class RuntimeConfig;
}

namespace flotilla::observability {

// Installs the OTLP tracer provider when tracing is enabled. Returns false
// when tracing is off or the build has no OpenTelemetry.
bool InitializeTracing(const flotilla::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

// One span, active for the lifetime of the object.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);

  // marks the span failed
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const flotilla::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::RecordException(std::string_view) {
}
#endif

} // namespace flotilla::observability
