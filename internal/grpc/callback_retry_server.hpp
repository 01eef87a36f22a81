#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "buildq/services/v1/callback_retry_service.grpc.pb.h"
#include "internal/service/callback_retry_service.hpp"

namespace buildq::grpc {

class CallbackRetryServer final : public buildq::services::v1::CallbackRetryService::Service {
 public:
  explicit CallbackRetryServer(std::shared_ptr<buildq::service::CallbackRetryService> svc);

  ::grpc::Status ScheduleRetry(::grpc::ServerContext*, const buildq::services::v1::ScheduleRetryRequest*,
                               buildq::services::v1::ScheduleRetryResponse*) override;

  ::grpc::Status ClaimReady(::grpc::ServerContext*, const buildq::services::v1::ClaimReadyRequest*,
                            buildq::services::v1::ClaimReadyResponse*) override;

  ::grpc::Status Reschedule(::grpc::ServerContext*, const buildq::services::v1::RescheduleRequest*,
                            buildq::services::v1::RescheduleResponse*) override;

  ::grpc::Status Abandon(::grpc::ServerContext*, const buildq::services::v1::AbandonRequest*, google::protobuf::Empty*) override;

  ::grpc::Status PendingCount(::grpc::ServerContext*, const google::protobuf::Empty*, buildq::services::v1::PendingCountResponse*) override;

 private:
  std::shared_ptr<buildq::service::CallbackRetryService> service_;
};

} // namespace buildq::grpc
