#include "worker_service.hpp"

#include <chrono>

#include "internal/observability/metrics.hpp"
#include "internal/queue/dispatcher.hpp"
#include "internal/queue/lifecycle_tracker.hpp"
#include "internal/queue/log_stream.hpp"
#include "internal/queue/worker_registry.hpp"
#include "observe_rpc.hpp"

namespace buildq::service {

using namespace buildq::v1;

WorkerService::WorkerService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void WorkerService::RegisterWorker(const RegisterWorkerRequest& req) {
  ObserveRpc("WorkerService.RegisterWorker", req.worker_id(), [&] { ctx_.workers->Register(req.worker_id()); });
}

void WorkerService::UnregisterWorker(const UnregisterWorkerRequest& req) {
  ObserveRpc("WorkerService.UnregisterWorker", req.worker_id(), [&] { ctx_.workers->Unregister(req.worker_id()); });
}

ClaimJobResponse WorkerService::ClaimJob(const ClaimJobRequest& req) {
  return ObserveRpc("WorkerService.ClaimJob", req.worker_id(), [&] {
    const auto started_at = std::chrono::steady_clock::now();
    auto       job        = ctx_.dispatcher->Claim(req.worker_id(), std::chrono::milliseconds(req.max_wait_ms()));
    observability::Metrics::Instance().RecordClaim(
        job.has_value(), std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());

    ClaimJobResponse resp;
    if (job) {
      resp.set_claimed(true);
      *resp.mutable_job() = std::move(*job);
    }
    return resp;
  });
}

void WorkerService::UpdateStatus(const UpdateStatusRequest& req) {
  ObserveRpc("WorkerService.UpdateStatus", req.job_id(), [&] { ctx_.lifecycle->UpdateStatus(req.job_id(), req.status(), req.worker_id()); });
}

void WorkerService::SetResult(const SetResultRequest& req) {
  ObserveRpc("WorkerService.SetResult", req.job_id(), [&] {
    auto result = req.result();
    if (result.job_id().empty()) {
      result.set_job_id(req.job_id());
    }
    ctx_.lifecycle->SetResult(req.job_id(), result);
  });
}

AppendLogResponse WorkerService::AppendLog(const AppendLogRequest& req) {
  return ObserveRpc("WorkerService.AppendLog", req.job_id(), [&] {
    AppendLogResponse resp;
    resp.set_cursor(ctx_.logs->AppendLog(req.job_id(), req.line()));
    return resp;
  });
}

} // namespace buildq::service
