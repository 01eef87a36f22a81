#include "build_queue_server.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <thread>

#include "grpc_error.hpp"

namespace buildq::grpc {

using namespace buildq::services::v1;

namespace {

constexpr auto kCancelPollInterval = std::chrono::milliseconds(100);

// Sync ServerContext only exposes IsCancelled(); poll it and forward to stop.
void WatchCancellation(std::stop_token self, ::grpc::ServerContext* ctx, std::stop_source stop) {
  std::mutex                  m;
  std::condition_variable_any cv;
  std::unique_lock            lock(m);
  while (!self.stop_requested() && !ctx->IsCancelled()) {
    cv.wait_for(lock, self, kCancelPollInterval, [] { return false; });
  }
  stop.request_stop();
}

} // namespace

BuildQueueServer::BuildQueueServer(std::shared_ptr<buildq::service::BuildQueueService> svc) : service_(std::move(svc)) {
}

::grpc::Status BuildQueueServer::Enqueue(::grpc::ServerContext*, const EnqueueRequest* req, EnqueueResponse* resp) {
  try {
    *resp = service_->Enqueue(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BuildQueueServer::GetJob(::grpc::ServerContext*, const GetJobRequest* req, GetJobResponse* resp) {
  try {
    *resp = service_->GetJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BuildQueueServer::GetResult(::grpc::ServerContext*, const GetResultRequest* req, GetResultResponse* resp) {
  try {
    *resp = service_->GetResult(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BuildQueueServer::CancelJob(::grpc::ServerContext*, const CancelJobRequest* req, google::protobuf::Empty*) {
  try {
    service_->CancelJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BuildQueueServer::RetryJob(::grpc::ServerContext*, const RetryJobRequest* req, RetryJobResponse* resp) {
  try {
    *resp = service_->RetryJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BuildQueueServer::StreamLogs(::grpc::ServerContext* ctx, const StreamLogsRequest* req,
                                            ::grpc::ServerWriter<buildq::core::v1::LogLine>* writer) {
  try {
    std::stop_source stop;
    std::jthread     watcher(WatchCancellation, ctx, stop);

    auto tail = service_->StreamLogs(*req, stop.get_token());
    while (auto line = tail.Next()) {
      if (!writer->Write(*line)) {
        break;
      }
    }
    return ctx->IsCancelled() ? ::grpc::Status::CANCELLED : ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BuildQueueServer::ListWorkers(::grpc::ServerContext*, const google::protobuf::Empty*, ListWorkersResponse* resp) {
  try {
    *resp = service_->ListWorkers();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BuildQueueServer::GetStats(::grpc::ServerContext*, const google::protobuf::Empty*, GetStatsResponse* resp) {
  try {
    *resp = service_->GetStats();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace buildq::grpc
