#pragma once

#include <stop_token>

#include "buildq/v1.hpp"
#include "internal/queue/log_stream.hpp"
#include "service_context.hpp"

namespace buildq::service {

class BuildQueueService {
 public:
  explicit BuildQueueService(ServiceContext ctx);

  buildq::v1::EnqueueResponse Enqueue(const buildq::v1::EnqueueRequest& req);

  buildq::v1::GetJobResponse GetJob(const buildq::v1::GetJobRequest& req);

  buildq::v1::GetResultResponse GetResult(const buildq::v1::GetResultRequest& req);

  void CancelJob(const buildq::v1::CancelJobRequest& req);

  buildq::v1::RetryJobResponse RetryJob(const buildq::v1::RetryJobRequest& req);

  // Tail bound to stop; the caller drives it.
  buildq::queue::LogTail StreamLogs(const buildq::v1::StreamLogsRequest& req, std::stop_token stop);

  buildq::v1::ListWorkersResponse ListWorkers();

  buildq::v1::GetStatsResponse GetStats();

 private:
  ServiceContext ctx_;
};

} // namespace buildq::service
