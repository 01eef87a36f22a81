#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "buildq/services/v1/build_queue_service.grpc.pb.h"
#include "internal/service/build_queue_service.hpp"

namespace buildq::grpc {

class BuildQueueServer final : public buildq::services::v1::BuildQueueService::Service {
 public:
  explicit BuildQueueServer(std::shared_ptr<buildq::service::BuildQueueService> svc);

  ::grpc::Status Enqueue(::grpc::ServerContext*, const buildq::services::v1::EnqueueRequest*, buildq::services::v1::EnqueueResponse*) override;

  ::grpc::Status GetJob(::grpc::ServerContext*, const buildq::services::v1::GetJobRequest*, buildq::services::v1::GetJobResponse*) override;

  ::grpc::Status GetResult(::grpc::ServerContext*, const buildq::services::v1::GetResultRequest*,
                           buildq::services::v1::GetResultResponse*) override;

  ::grpc::Status CancelJob(::grpc::ServerContext*, const buildq::services::v1::CancelJobRequest*, google::protobuf::Empty*) override;

  ::grpc::Status RetryJob(::grpc::ServerContext*, const buildq::services::v1::RetryJobRequest*, buildq::services::v1::RetryJobResponse*) override;

  ::grpc::Status StreamLogs(::grpc::ServerContext*, const buildq::services::v1::StreamLogsRequest*,
                            ::grpc::ServerWriter<buildq::core::v1::LogLine>*) override;

  ::grpc::Status ListWorkers(::grpc::ServerContext*, const google::protobuf::Empty*, buildq::services::v1::ListWorkersResponse*) override;

  ::grpc::Status GetStats(::grpc::ServerContext*, const google::protobuf::Empty*, buildq::services::v1::GetStatsResponse*) override;

 private:
  std::shared_ptr<buildq::service::BuildQueueService> service_;
};

} // namespace buildq::grpc
