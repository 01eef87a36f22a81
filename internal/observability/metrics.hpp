#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

#include "internal/observability/otlp_config.hpp"

namespace buildq::observability {

bool InitializeMetrics(const OtlpConfig& config);
bool InitializeMetrics(const buildq::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

enum class RpcOutcome {
  kOk,
  kRejected, // caller error: validation, unknown id, wrong state
  kFailed,
};

inline std::string_view ToString(RpcOutcome outcome) {
  switch (outcome) {
    case RpcOutcome::kOk:
      return "ok";
    case RpcOutcome::kRejected:
      return "rejected";
    case RpcOutcome::kFailed:
      return "failed";
  }
  return "unknown";
}

/*
  Process-wide instruments:

    buildq.rpc.count          counter    {route, outcome}
    buildq.rpc.latency_ms     histogram  {route, outcome}
    buildq.claim.wait_ms      histogram  {claimed}
    buildq.queue.depth        gauge      {queue}

  Queue depth is a snapshot refreshed by GetStats; the gauge reports the last
  value seen per queue.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRpc(std::string_view route, RpcOutcome outcome, double latency_ms);
  void RecordClaim(bool claimed, double wait_ms);
  void SetQueueDepth(std::string_view queue, std::uint64_t depth);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const buildq::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() = default;

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRpc(std::string_view, RpcOutcome, double) {
}

inline void Metrics::RecordClaim(bool, double) {
}

inline void Metrics::SetQueueDepth(std::string_view, std::uint64_t) {
}
#endif

} // namespace buildq::observability
