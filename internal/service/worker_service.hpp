#pragma once

#include "buildq/v1.hpp"
#include "service_context.hpp"

namespace buildq::service {

/*
  Endpoints used by build workers: registration, claiming, progress.
*/
class WorkerService {
 public:
  explicit WorkerService(ServiceContext ctx);

  void RegisterWorker(const buildq::v1::RegisterWorkerRequest& req);
  void UnregisterWorker(const buildq::v1::UnregisterWorkerRequest& req);

  buildq::v1::ClaimJobResponse ClaimJob(const buildq::v1::ClaimJobRequest& req);

  void UpdateStatus(const buildq::v1::UpdateStatusRequest& req);
  void SetResult(const buildq::v1::SetResultRequest& req);

  buildq::v1::AppendLogResponse AppendLog(const buildq::v1::AppendLogRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace buildq::service
