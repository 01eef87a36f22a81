#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace buildq::service {

namespace detail {

inline void RecordOutcome(std::string_view route, observability::RpcOutcome outcome, std::chrono::steady_clock::time_point started_at) {
  observability::Metrics::Instance().RecordRpc(route, outcome,
                                               std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
}

// Expected outcomes a caller can act on; everything else is a server fault.
inline bool IsClientError(const std::exception& ex) {
  return dynamic_cast<const util::ValidationError*>(&ex) || dynamic_cast<const util::NotFound*>(&ex) ||
         dynamic_cast<const util::InvalidState*>(&ex);
}

} // namespace detail

/*
  Wraps one RPC body with a span, request metrics and failure logging.
  Exceptions are rethrown unchanged for the transport to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject_id, Fn&& fn) {
  observability::SpanScope span(route);
  if (!subject_id.empty()) {
    span.SetAttribute("buildq.id", subject_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      detail::RecordOutcome(route, observability::RpcOutcome::kOk, started_at);
      return;
    } else {
      auto result = fn();
      detail::RecordOutcome(route, observability::RpcOutcome::kOk, started_at);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    const bool rejected = detail::IsClientError(ex);
    if (rejected) {
      BUILDQ_LOG_DEBUG("RPC rejected", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                        observability::StringField("id", subject_id)});
    } else {
      BUILDQ_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                      observability::StringField("id", subject_id)});
    }
    detail::RecordOutcome(route, rejected ? observability::RpcOutcome::kRejected : observability::RpcOutcome::kFailed, started_at);
    throw;
  }
}

} // namespace buildq::service
