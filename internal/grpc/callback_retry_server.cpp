#include "callback_retry_server.hpp"

#include "grpc_error.hpp"

namespace buildq::grpc {

using namespace buildq::services::v1;

CallbackRetryServer::CallbackRetryServer(std::shared_ptr<buildq::service::CallbackRetryService> svc) : service_(std::move(svc)) {
}

::grpc::Status CallbackRetryServer::ScheduleRetry(::grpc::ServerContext*, const ScheduleRetryRequest* req, ScheduleRetryResponse* resp) {
  try {
    *resp = service_->ScheduleRetry(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CallbackRetryServer::ClaimReady(::grpc::ServerContext*, const ClaimReadyRequest* req, ClaimReadyResponse* resp) {
  try {
    *resp = service_->ClaimReady(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CallbackRetryServer::Reschedule(::grpc::ServerContext*, const RescheduleRequest* req, RescheduleResponse* resp) {
  try {
    *resp = service_->Reschedule(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CallbackRetryServer::Abandon(::grpc::ServerContext*, const AbandonRequest* req, google::protobuf::Empty*) {
  try {
    service_->Abandon(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status CallbackRetryServer::PendingCount(::grpc::ServerContext*, const google::protobuf::Empty*, PendingCountResponse* resp) {
  try {
    *resp = service_->PendingCount();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace buildq::grpc
