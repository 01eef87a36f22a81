#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "buildq/services/v1/worker_service.grpc.pb.h"
#include "internal/service/worker_service.hpp"

namespace buildq::grpc {

class WorkerServer final : public buildq::services::v1::WorkerService::Service {
 public:
  explicit WorkerServer(std::shared_ptr<buildq::service::WorkerService> svc);

  ::grpc::Status RegisterWorker(::grpc::ServerContext*, const buildq::services::v1::RegisterWorkerRequest*, google::protobuf::Empty*) override;

  ::grpc::Status UnregisterWorker(::grpc::ServerContext*, const buildq::services::v1::UnregisterWorkerRequest*, google::protobuf::Empty*) override;

  ::grpc::Status ClaimJob(::grpc::ServerContext*, const buildq::services::v1::ClaimJobRequest*, buildq::services::v1::ClaimJobResponse*) override;

  ::grpc::Status UpdateStatus(::grpc::ServerContext*, const buildq::services::v1::UpdateStatusRequest*, google::protobuf::Empty*) override;

  ::grpc::Status SetResult(::grpc::ServerContext*, const buildq::services::v1::SetResultRequest*, google::protobuf::Empty*) override;

  ::grpc::Status AppendLog(::grpc::ServerContext*, const buildq::services::v1::AppendLogRequest*, buildq::services::v1::AppendLogResponse*) override;

 private:
  std::shared_ptr<buildq::service::WorkerService> service_;
};

} // namespace buildq::grpc
