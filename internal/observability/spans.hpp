#pragma once

#include <memory>
#include <string_view>

#include "internal/observability/otlp_config.hpp"

namespace buildq::observability {

// Tracing is a no-op unless built with ENABLE_OTEL. Initialize returns
// whether an exporter was installed.
bool InitializeTracing(const OtlpConfig& config);
bool InitializeTracing(const buildq::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

// Active span for the lifetime of the scope; ended on destruction.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);

  // Adds an "exception" event and sets the span status to error.
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const OtlpConfig&) {
  return false;
}

inline bool InitializeTracing(const buildq::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}
#endif

} // namespace buildq::observability
