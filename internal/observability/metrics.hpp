#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace flotilla::runtime::config {
class RuntimeConfig;
}

namespace flotilla::observability {

bool InitializeMetrics(const flotilla::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

// Controller instruments. Every call is a no-op until InitializeMetrics
// installs a provider, and always without ENABLE_OTEL.
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // status is the BackendStatus enum name the backend moved into
  void RecordBackendTransition(std::string_view cluster, std::string_view status);

  // outcome: "existing", "spawned" or the error kind name
  void RecordConnectOutcome(std::string_view cluster, std::string_view outcome);

  // kind: "soft" or "hard"
  void RecordWatchdogTermination(std::string_view kind);

  void RecordOrphanedBackends(std::string_view cluster, std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const flotilla::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() = default;

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordBackendTransition(std::string_view, std::string_view) {
}

inline void Metrics::RecordConnectOutcome(std::string_view, std::string_view) {
}

inline void Metrics::RecordWatchdogTermination(std::string_view) {
}

inline void Metrics::RecordOrphanedBackends(std::string_view, std::uint64_t) {
}
#endif

} // namespace flotilla::observability
