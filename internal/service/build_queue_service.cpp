#include "build_queue_service.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/queue/callback_retry.hpp"
#include "internal/queue/dispatcher.hpp"
#include "internal/queue/job_admission.hpp"
#include "internal/queue/lifecycle_tracker.hpp"
#include "internal/queue/worker_registry.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace buildq::service {

using namespace buildq::v1;

BuildQueueService::BuildQueueService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

EnqueueResponse BuildQueueService::Enqueue(const EnqueueRequest& req) {
  return ObserveRpc("BuildQueueService.Enqueue", req.job().release_id(), [&] {
    EnqueueResponse resp;
    resp.set_job_id(ctx_.admission->Enqueue(req.job()));

    // the job is admitted at this point; position is informational only
    try {
      if (auto position = ctx_.dispatcher->Position(resp.job_id(), req.job().priority() > 0)) {
        resp.set_queue_position(*position);
      }
    } catch (const util::StoreUnavailable& e) {
      BUILDQ_LOG_WARN("queue position unavailable", {observability::StringField("job_id", resp.job_id()), observability::StringField("error", e.what())});
    }
    return resp;
  });
}

GetJobResponse BuildQueueService::GetJob(const GetJobRequest& req) {
  return ObserveRpc("BuildQueueService.GetJob", req.job_id(), [&] {
    auto record = ctx_.lifecycle->GetJob(req.job_id());

    GetJobResponse resp;
    *resp.mutable_job()   = std::move(record.job);
    *resp.mutable_state() = std::move(record.state);
    if (record.result) {
      *resp.mutable_result() = std::move(*record.result);
    }
    return resp;
  });
}

GetResultResponse BuildQueueService::GetResult(const GetResultRequest& req) {
  return ObserveRpc("BuildQueueService.GetResult", req.job_id(), [&] {
    GetResultResponse resp;
    if (auto result = ctx_.lifecycle->GetResult(req.job_id())) {
      resp.set_found(true);
      *resp.mutable_result() = std::move(*result);
    }
    return resp;
  });
}

void BuildQueueService::CancelJob(const CancelJobRequest& req) {
  ObserveRpc("BuildQueueService.CancelJob", req.job_id(), [&] { ctx_.lifecycle->Cancel(req.job_id()); });
}

RetryJobResponse BuildQueueService::RetryJob(const RetryJobRequest& req) {
  return ObserveRpc("BuildQueueService.RetryJob", req.job_id(), [&] {
    RetryJobResponse resp;
    resp.set_original_job_id(req.job_id());
    resp.set_new_job_id(ctx_.admission->Resubmit(req.job_id()));
    return resp;
  });
}

buildq::queue::LogTail BuildQueueService::StreamLogs(const StreamLogsRequest& req, std::stop_token stop) {
  return ObserveRpc("BuildQueueService.StreamLogs", req.job_id(), [&] { return ctx_.logs->StreamLogs(req.job_id(), req.from_cursor(), std::move(stop)); });
}

ListWorkersResponse BuildQueueService::ListWorkers() {
  return ObserveRpc("BuildQueueService.ListWorkers", "", [&] {
    ListWorkersResponse resp;
    for (auto& worker_id : ctx_.workers->ListActive()) {
      resp.add_worker_ids(std::move(worker_id));
    }
    return resp;
  });
}

GetStatsResponse BuildQueueService::GetStats() {
  return ObserveRpc("BuildQueueService.GetStats", "", [&] {
    const auto depth   = ctx_.dispatcher->Depth();
    const auto pending = ctx_.callbacks->PendingCount();

    GetStatsResponse resp;
    resp.set_priority_depth(depth.priority);
    resp.set_fifo_depth(depth.fifo);
    resp.set_pending_callbacks(pending);
    resp.set_active_workers(ctx_.workers->ListActive().size());

    auto& metrics = observability::Metrics::Instance();
    metrics.SetQueueDepth("priority", depth.priority);
    metrics.SetQueueDepth("fifo", depth.fifo);
    metrics.SetQueueDepth("callback_retry", pending);
    return resp;
  });
}

} // namespace buildq::service
