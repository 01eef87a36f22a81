#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <mutex>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace buildq::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

constexpr const char* kInstrumentationName    = "buildq";
constexpr const char* kInstrumentationVersion = "0.1.0";

std::mutex                                          g_mutex;
std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveOtlpEndpoint(config, OtlpSignal::kTraces);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> CurrentTracer() {
  std::lock_guard lock(g_mutex);
  if (g_tracer) return g_tracer;
  return trace_api::Provider::GetTracerProvider()->GetTracer(kInstrumentationName, kInstrumentationVersion);
}

} // namespace

bool InitializeTracing(const OtlpConfig& config) {
  const resource::ResourceAttributes attributes = {{"service.name", config.service_name}, {"service.version", kInstrumentationVersion}};

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(config), sdktrace::BatchSpanProcessorOptions{});
  auto provider  = sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attributes));

  std::lock_guard lock(g_mutex);
  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kInstrumentationName, kInstrumentationVersion);
  return static_cast<bool>(g_tracer);
}

bool InitializeTracing(const buildq::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    return false;
  }
  return InitializeTracing(FromRuntimeConfig(config));
}

void ShutdownTracing() {
  std::lock_guard lock(g_mutex);
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  trace_api::Scope                                  scope;

  explicit Impl(opentelemetry::nostd::shared_ptr<trace_api::Span> s) : span(s), scope(s) {
  }
};

SpanScope::SpanScope(std::string_view name) {
  auto tracer = CurrentTracer();
  if (!tracer) return;

  trace_api::StartSpanOptions options;
  options.kind = trace_api::SpanKind::kServer;
  impl_        = std::make_unique<Impl>(tracer->StartSpan(std::string(name), options));
}

SpanScope::~SpanScope() {
  if (impl_) {
    impl_->span->End();
  }
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (impl_) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
  }
}

} // namespace buildq::observability

#endif
