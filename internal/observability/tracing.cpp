#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/always_off_factory.h>
#include <opentelemetry/sdk/trace/samplers/always_on_factory.h>
#include <opentelemetry/sdk/trace/samplers/parent_factory.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/noop.h>
#include <opentelemetry/trace/provider.h>

#include <chrono>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_settings.hpp"

namespace flotilla::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

using TracingConfig = flotilla::runtime::config::ObservabilityConfig::TracingConfig;

namespace {

constexpr const char* kTracerName = "flotilla";

std::shared_ptr<sdktrace::TracerProvider>           g_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpSettings& settings) {
  if (settings.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

std::unique_ptr<sdktrace::SpanProcessor> MakeProcessor(const TracingConfig& tracing, std::unique_ptr<sdktrace::SpanExporter> exporter) {
  if (tracing.processor() == TracingConfig::TRACE_PROCESSOR_SIMPLE) {
    return sdktrace::SimpleSpanProcessorFactory::Create(std::move(exporter));
  }

  // zero keeps the sdk default
  sdktrace::BatchSpanProcessorOptions options;
  const auto&                         batch = tracing.batch();
  if (batch.max_queue_size() > 0) options.max_queue_size = batch.max_queue_size();
  if (batch.max_export_batch_size() > 0) options.max_export_batch_size = batch.max_export_batch_size();
  if (batch.schedule_delay_ms() > 0) options.schedule_delay_millis = std::chrono::milliseconds(batch.schedule_delay_ms());
  return sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), options);
}

// Unspecified follows the caller's sampling decision, sampling roots.
std::unique_ptr<sdktrace::Sampler> MakeSampler(const TracingConfig& tracing) {
  switch (tracing.trace_hint()) {
    case TracingConfig::TRACE_HINT_ALWAYS:
      return sdktrace::AlwaysOnSamplerFactory::Create();
    case TracingConfig::TRACE_HINT_NEVER:
      return sdktrace::AlwaysOffSamplerFactory::Create();
    default:
      return sdktrace::ParentBasedSamplerFactory::Create(std::shared_ptr<sdktrace::Sampler>(sdktrace::AlwaysOnSamplerFactory::Create()));
  }
}

resource::Resource MakeResource(const OtlpSettings& settings) {
  resource::ResourceAttributes attrs;
  for (const auto& [key, value] : settings.resource_attributes) {
    attrs.SetAttribute(key, opentelemetry::nostd::string_view(value));
  }
  return resource::Resource::Create(attrs);
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> Tracer() {
  if (!g_tracer) {
    g_tracer = trace_api::Provider::GetTracerProvider()->GetTracer(kTracerName);
  }
  return g_tracer;
}

} // namespace

bool InitializeTracing(const flotilla::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto settings  = ResolveOtlpSettings(config, OtlpSignal::kTraces);
  auto       processor = MakeProcessor(observability.tracing(), MakeExporter(settings));

  g_provider = std::shared_ptr<sdktrace::TracerProvider>(
      sdktrace::TracerProviderFactory::Create(std::move(processor), MakeResource(settings), MakeSampler(observability.tracing())));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_provider));
  g_tracer = g_provider->GetTracer(kTracerName);
  return true;
}

void ShutdownTracing() {
  g_tracer = nullptr;
  if (!g_provider) {
    return;
  }
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(new trace_api::NoopTracerProvider()));
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  trace_api::Scope                                  scope;

  explicit Impl(opentelemetry::nostd::shared_ptr<trace_api::Span> s) : span(s), scope(s) {
  }
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>(Tracer()->StartSpan(std::string(name)))) {
}

SpanScope::~SpanScope() {
  impl_->span->End();
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::RecordException(std::string_view description) {
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace flotilla::observability

#endif
