#pragma once

#include <chrono>
#include <string>

namespace buildq::runtime::config {
class RuntimeConfig;
}

namespace buildq::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

struct OtlpConfig {
  std::string               service_name{"buildq"};
  std::string               endpoint{};
  OtlpTransport             transport{OtlpTransport::kGrpc};
  bool                      insecure{true};
  std::chrono::milliseconds export_interval{1000};
};

OtlpConfig FromRuntimeConfig(const buildq::runtime::config::RuntimeConfig& config);

/*
  Collector endpoint for one signal. Precedence: the configured endpoint,
  then OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT, then
  OTEL_EXPORTER_OTLP_ENDPOINT, then the transport's local default.
*/
std::string ResolveOtlpEndpoint(const OtlpConfig& config, OtlpSignal signal);

} // namespace buildq::observability
