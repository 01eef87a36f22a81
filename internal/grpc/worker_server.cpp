#include "worker_server.hpp"

#include "grpc_error.hpp"

namespace buildq::grpc {

using namespace buildq::services::v1;

WorkerServer::WorkerServer(std::shared_ptr<buildq::service::WorkerService> svc) : service_(std::move(svc)) {
}

::grpc::Status WorkerServer::RegisterWorker(::grpc::ServerContext*, const RegisterWorkerRequest* req, google::protobuf::Empty*) {
  try {
    service_->RegisterWorker(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::UnregisterWorker(::grpc::ServerContext*, const UnregisterWorkerRequest* req, google::protobuf::Empty*) {
  try {
    service_->UnregisterWorker(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::ClaimJob(::grpc::ServerContext*, const ClaimJobRequest* req, ClaimJobResponse* resp) {
  try {
    *resp = service_->ClaimJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::UpdateStatus(::grpc::ServerContext*, const UpdateStatusRequest* req, google::protobuf::Empty*) {
  try {
    service_->UpdateStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::SetResult(::grpc::ServerContext*, const SetResultRequest* req, google::protobuf::Empty*) {
  try {
    service_->SetResult(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status WorkerServer::AppendLog(::grpc::ServerContext*, const AppendLogRequest* req, AppendLogResponse* resp) {
  try {
    *resp = service_->AppendLog(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace buildq::grpc
