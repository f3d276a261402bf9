#include "internal/observability/otlp_settings.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace flotilla::observability {
namespace {

constexpr const char* kServiceName = "flotilla-controller";

const char* SignalEnv(OtlpSignal signal) {
  return signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
}

std::string DefaultEndpoint(OtlpSignal signal, bool http) {
  if (!http) {
    return "localhost:4317";
  }
  return signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

} // namespace

OtlpSettings ResolveOtlpSettings(const flotilla::runtime::config::RuntimeConfig& config, OtlpSignal signal) {
  const auto& observability = config.observability();

  OtlpSettings settings;
  settings.http = observability.transport() == flotilla::runtime::config::OTLP_TRANSPORT_HTTP;

  if (!observability.otlp_endpoint().empty()) {
    settings.endpoint = observability.otlp_endpoint();
  } else if (const char* endpoint = std::getenv(SignalEnv(signal))) {
    settings.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    settings.endpoint = endpoint;
  } else {
    settings.endpoint = DefaultEndpoint(signal, settings.http);
  }

  // an https endpoint means the collector terminates TLS
  settings.insecure = settings.endpoint.rfind("https://", 0) != 0;

  settings.resource_attributes.emplace_back("service.name", kServiceName);
  if (!config.controller().id().empty()) {
    settings.resource_attributes.emplace_back("service.instance.id", config.controller().id());
  }
  if (!config.controller().default_cluster().empty()) {
    settings.resource_attributes.emplace_back("flotilla.default_cluster", config.controller().default_cluster());
  }
  return settings;
}

} // namespace flotilla::observability
