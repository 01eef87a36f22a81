#include "callback_retry_service.hpp"

#include <algorithm>

#include "internal/queue/callback_retry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace buildq::service {

using namespace buildq::v1;

namespace {
constexpr uint32_t kDefaultClaimLimit = 10;
constexpr uint32_t kMaxClaimLimit     = 1000;
} // namespace

CallbackRetryService::CallbackRetryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ScheduleRetryResponse CallbackRetryService::ScheduleRetry(const ScheduleRetryRequest& req) {
  return ObserveRpc("CallbackRetryService.ScheduleRetry", req.job_id(), [&] {
    if (!req.has_next_retry_at()) {
      throw util::ValidationError("schedule retry: next_retry_at is required");
    }

    buildq::queue::RetryDraft draft;
    draft.job_id        = req.job_id();
    draft.callback_url  = req.callback_url();
    draft.result        = req.result();
    draft.last_error    = req.last_error();
    draft.next_retry_at = util::FromProto(req.next_retry_at());

    ScheduleRetryResponse resp;
    resp.set_attempt_id(ctx_.callbacks->ScheduleRetry(draft));
    return resp;
  });
}

ClaimReadyResponse CallbackRetryService::ClaimReady(const ClaimReadyRequest& req) {
  return ObserveRpc("CallbackRetryService.ClaimReady", "", [&] {
    const auto limit = req.limit() == 0 ? kDefaultClaimLimit : std::min(req.limit(), kMaxClaimLimit);

    ClaimReadyResponse resp;
    for (auto& attempt : ctx_.callbacks->ClaimReady(limit)) {
      *resp.add_attempts() = std::move(attempt);
    }
    return resp;
  });
}

RescheduleResponse CallbackRetryService::Reschedule(const RescheduleRequest& req) {
  return ObserveRpc("CallbackRetryService.Reschedule", req.attempt().id(), [&] {
    if (!req.has_next_retry_at()) {
      throw util::ValidationError("reschedule: next_retry_at is required");
    }

    RescheduleResponse resp;
    *resp.mutable_attempt() = ctx_.callbacks->Reschedule(req.attempt(), util::FromProto(req.next_retry_at()), req.last_error());
    return resp;
  });
}

void CallbackRetryService::Abandon(const AbandonRequest& req) {
  ObserveRpc("CallbackRetryService.Abandon", req.attempt_id(), [&] { ctx_.callbacks->Abandon(req.attempt_id()); });
}

PendingCountResponse CallbackRetryService::PendingCount() {
  return ObserveRpc("CallbackRetryService.PendingCount", "", [&] {
    PendingCountResponse resp;
    resp.set_pending(ctx_.callbacks->PendingCount());
    return resp;
  });
}

} // namespace buildq::service
