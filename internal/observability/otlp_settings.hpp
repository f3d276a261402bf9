#pragma once

#include <string>
#include <utility>
#include <vector>

namespace flotilla::runtime::config {
class RuntimeConfig;
}

namespace flotilla::observability {

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

// Exporter settings for one OTLP signal, resolved from the runtime config
// and the standard OTEL_EXPORTER_OTLP_* environment.
struct OtlpSettings {
  std::string endpoint;
  bool        http{false};
  bool        insecure{true};

  std::vector<std::pair<std::string, std::string>> resource_attributes;
};

OtlpSettings ResolveOtlpSettings(const flotilla::runtime::config::RuntimeConfig& config, OtlpSignal signal);

} // namespace flotilla::observability
