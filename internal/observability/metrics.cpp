#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/common/key_value_iterable_view.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/noop.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <utility>
#include <vector>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define FLOTILLA_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define FLOTILLA_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"
#include "internal/observability/otlp_settings.hpp"

namespace flotilla::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

constexpr const char*   kMeterName         = "flotilla";
constexpr std::uint32_t kDefaultIntervalMs = 1000;

using Labels = std::vector<std::pair<std::string, std::string>>;

// Which instruments and labels are recorded; read by every Record* call.
struct MetricsOptions {
  bool requests{false};
  bool latency_histograms{false};
  bool lifecycle{false};
  bool route_labels{false};
  bool cluster_labels{false};
};

MetricsOptions                             g_options;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

using AttributeList = std::vector<std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>>;

AttributeList View(const Labels& labels) {
  AttributeList out;
  out.reserve(labels.size());
  for (const auto& [key, value] : labels) {
    out.emplace_back(opentelemetry::nostd::string_view(key), opentelemetry::nostd::string_view(value));
  }
  return out;
}

template <typename Counter, typename Value>
void Add(Counter& counter, Value value, const Labels& labels) {
  const auto attributes = View(labels);
  counter->Add(value, opentelemetry::common::KeyValueIterableView<AttributeList>(attributes), opentelemetry::context::Context{});
}

template <typename Histogram>
void Record(Histogram& histogram, double value, const Labels& labels) {
  const auto attributes = View(labels);
  histogram->Record(value, opentelemetry::common::KeyValueIterableView<AttributeList>(attributes), opentelemetry::context::Context{});
}

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpSettings& settings) {
  if (settings.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

sdkmetrics::PeriodicExportingMetricReaderOptions MakeReaderOptions(const flotilla::runtime::config::ObservabilityConfig::MetricsConfig& config) {
  const std::uint32_t configured = config.collection_interval_ms() > 0 ? config.collection_interval_ms() : kDefaultIntervalMs;

  sdkmetrics::PeriodicExportingMetricReaderOptions options;
  options.export_interval_millis = std::chrono::milliseconds(std::max(configured, config.min_collection_interval_ms()));
  if (config.export_timeout_ms() > 0) {
    options.export_timeout_millis = std::chrono::milliseconds(std::min(config.export_timeout_ms(), static_cast<std::uint32_t>(options.export_interval_millis.count())));
  }
  return options;
}

resource::Resource MakeResource(const OtlpSettings& settings) {
  resource::ResourceAttributes attrs;
  for (const auto& [key, value] : settings.resource_attributes) {
    attrs.SetAttribute(key, opentelemetry::nostd::string_view(value));
  }
  return resource::Resource::Create(attrs);
}

// AddMetricReader took a unique_ptr before the sdk switched to shared_ptr.
void AttachReader(sdkmetrics::MeterProvider& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider.AddMetricReader(std::move(reader)); }) {
    provider.AddMetricReader(std::move(reader));
  } else {
    provider.AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> requests;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> backend_transitions;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> connect_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> watchdog_terminations;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> orphaned_backends;

  explicit Impl(metrics_api::Meter& meter)
      : requests(meter.CreateUInt64Counter("flotilla.request.count", "Service requests by route and result", "1")),
        request_latency_ms(meter.CreateDoubleHistogram("flotilla.request.latency_ms", "End-to-end request latency", "ms")),
        backend_transitions(meter.CreateUInt64Counter("flotilla.backend.transitions", "Applied backend status transitions", "1")),
        connect_outcomes(meter.CreateUInt64Counter("flotilla.connect.outcomes", "Connect calls by outcome", "1")),
        watchdog_terminations(meter.CreateUInt64Counter("flotilla.watchdog.terminations", "Terminations issued by the watchdog", "1")),
        orphaned_backends(meter.CreateUInt64Counter("flotilla.backend.orphaned", "Backends left on drones that went stale", "1")) {
  }
};

bool InitializeMetrics(const flotilla::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto& metrics  = observability.metrics();
  const auto  settings = ResolveOtlpSettings(config, OtlpSignal::kMetrics);

#ifdef FLOTILLA_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(settings), MakeReaderOptions(metrics));
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(MakeExporter(settings), MakeReaderOptions(metrics));
#endif

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), MakeResource(settings));
  AttachReader(*g_provider, std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  g_options.requests           = metrics.request_metrics_enabled();
  g_options.latency_histograms = metrics.request_latency_histograms_enabled();
  g_options.lifecycle          = metrics.lifecycle_metrics_enabled();
  g_options.route_labels       = metrics.route_labels_enabled();
  g_options.cluster_labels     = metrics.cluster_labels_enabled();
  return true;
}

void ShutdownMetrics() {
  g_options = MetricsOptions{};
  if (!g_provider) {
    return;
  }
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(new metrics_api::NoopMeterProvider()));
}

// Instruments bind to whatever provider is installed on first use, so the
// controller initializes metrics before anything records.
Metrics::Metrics() : impl_(std::make_unique<Impl>(*metrics_api::Provider::GetMeterProvider()->GetMeter(kMeterName))) {
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!g_options.requests) {
    return;
  }
  Labels labels{{"success", success ? "true" : "false"}};
  if (g_options.route_labels) labels.emplace_back("route", std::string(route));
  Add(impl_->requests, static_cast<std::uint64_t>(1), labels);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!g_options.requests || !g_options.latency_histograms) {
    return;
  }
  Labels labels;
  if (g_options.route_labels) labels.emplace_back("route", std::string(route));
  Record(impl_->request_latency_ms, latency_ms, labels);
}

void Metrics::RecordBackendTransition(std::string_view cluster, std::string_view status) {
  if (!g_options.lifecycle) {
    return;
  }
  Labels labels{{"status", std::string(status)}};
  if (g_options.cluster_labels) labels.emplace_back("cluster", std::string(cluster));
  Add(impl_->backend_transitions, static_cast<std::uint64_t>(1), labels);
}

void Metrics::RecordConnectOutcome(std::string_view cluster, std::string_view outcome) {
  if (!g_options.requests) {
    return;
  }
  Labels labels{{"outcome", std::string(outcome)}};
  if (g_options.cluster_labels) labels.emplace_back("cluster", std::string(cluster));
  Add(impl_->connect_outcomes, static_cast<std::uint64_t>(1), labels);
}

void Metrics::RecordWatchdogTermination(std::string_view kind) {
  if (!g_options.lifecycle) {
    return;
  }
  Add(impl_->watchdog_terminations, static_cast<std::uint64_t>(1), Labels{{"kind", std::string(kind)}});
}

void Metrics::RecordOrphanedBackends(std::string_view cluster, std::uint64_t count) {
  if (!g_options.lifecycle || count == 0) {
    return;
  }
  Labels labels;
  if (g_options.cluster_labels) labels.emplace_back("cluster", std::string(cluster));
  Add(impl_->orphaned_backends, count, labels);
}

} // namespace flotilla::observability

#endif
