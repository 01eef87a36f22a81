#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace buildq::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

std::mutex                                 g_provider_mutex;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveOtlpEndpoint(config, OtlpSignal::kMetrics);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> rpc_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      rpc_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      claim_wait_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   queue_depth;

  std::mutex                                       depth_mutex;
  std::map<std::string, std::int64_t, std::less<>> depth_by_queue;

  static void ObserveDepth(metrics_api::ObserverResult result, void* state) {
    auto*           impl = static_cast<Impl*>(state);
    std::lock_guard lock(impl->depth_mutex);
    auto observer = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
    for (const auto& [queue, depth] : impl->depth_by_queue) {
      const std::initializer_list<AttributePair> attributes = {{"queue", opentelemetry::nostd::string_view(queue)}};
      observer->Observe(depth, attributes);
    }
  }
};

bool InitializeMetrics(const OtlpConfig& config) {
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = config.export_interval;
  reader_options.export_timeout_millis  = config.export_interval / 2;

  const resource::ResourceAttributes attributes = {{"service.name", config.service_name}};

  auto reader   = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(config), reader_options);
  auto provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource::Resource::Create(attributes));
  provider->AddMetricReader(std::move(reader));

  std::lock_guard lock(g_provider_mutex);
  g_provider = std::move(provider);
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

bool InitializeMetrics(const buildq::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    return false;
  }
  return InitializeMetrics(FromRuntimeConfig(config));
}

void ShutdownMetrics() {
  std::lock_guard lock(g_provider_mutex);
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

// Instruments bind to whichever provider is global on first use, so the
// server initializes metrics before building any service.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto meter = metrics_api::Provider::GetMeterProvider()->GetMeter("buildq", "0.1.0");

  impl_->rpc_count      = meter->CreateUInt64Counter("buildq.rpc.count", "RPCs handled", "1");
  impl_->rpc_latency_ms = meter->CreateDoubleHistogram("buildq.rpc.latency_ms", "RPC handling time", "ms");
  impl_->claim_wait_ms  = meter->CreateDoubleHistogram("buildq.claim.wait_ms", "Time a worker spent blocked in ClaimJob", "ms");
  impl_->queue_depth    = meter->CreateInt64ObservableGauge("buildq.queue.depth", "Entries waiting per queue", "1");
  impl_->queue_depth->AddCallback(&Impl::ObserveDepth, impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRpc(std::string_view route, RpcOutcome outcome, double latency_ms) {
  const std::string route_value(route);
  const std::string outcome_value(ToString(outcome));

  const std::initializer_list<AttributePair> attributes = {{"route", route_value}, {"outcome", outcome_value}};
  impl_->rpc_count->Add(static_cast<std::uint64_t>(1), attributes, opentelemetry::context::Context{});
  impl_->rpc_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordClaim(bool claimed, double wait_ms) {
  const std::initializer_list<AttributePair> attributes = {{"claimed", claimed}};
  impl_->claim_wait_ms->Record(wait_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::SetQueueDepth(std::string_view queue, std::uint64_t depth) {
  std::lock_guard lock(impl_->depth_mutex);
  auto            it = impl_->depth_by_queue.find(queue);
  if (it == impl_->depth_by_queue.end()) {
    impl_->depth_by_queue.emplace(std::string(queue), static_cast<std::int64_t>(depth));
  } else {
    it->second = static_cast<std::int64_t>(depth);
  }
}

} // namespace buildq::observability

#endif
