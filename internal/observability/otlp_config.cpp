#include "internal/observability/otlp_config.hpp"

#include <cstdlib>

#include "config/config.pb.h"
#include "internal/util/time.hpp"

namespace buildq::observability {

OtlpConfig FromRuntimeConfig(const buildq::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpConfig otlp;
  otlp.endpoint  = observability.otlp_endpoint();
  otlp.transport = observability.transport() == buildq::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  otlp.insecure  = !observability.otlp_use_tls();
  if (!observability.service_name().empty()) {
    otlp.service_name = observability.service_name();
  }
  if (observability.has_metrics_export_interval()) {
    const auto interval = util::ToDuration(observability.metrics_export_interval());
    if (interval.count() > 0) otlp.export_interval = interval;
  }
  return otlp;
}

std::string ResolveOtlpEndpoint(const OtlpConfig& config, OtlpSignal signal) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  const char* signal_env = signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  if (const char* endpoint = std::getenv(signal_env); endpoint && *endpoint) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT"); endpoint && *endpoint) {
    return endpoint;
  }

  if (config.transport == OtlpTransport::kGrpc) {
    return "localhost:4317";
  }
  return signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

} // namespace buildq::observability
