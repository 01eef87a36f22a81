#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "buildq/v1.hpp"
#include "internal/grpc/build_queue_server.hpp"
#include "internal/grpc/callback_retry_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/worker_server.hpp"
#include "internal/queue/callback_retry.hpp"
#include "internal/queue/dispatcher.hpp"
#include "internal/queue/job_admission.hpp"
#include "internal/queue/lifecycle_tracker.hpp"
#include "internal/queue/log_stream.hpp"
#include "internal/queue/worker_registry.hpp"
#include "internal/service/build_queue_service.hpp"
#include "internal/service/callback_retry_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/worker_service.hpp"
#include "internal/store/memory/memory_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace buildq::v1;

buildq::service::ServiceContext BuildServiceContext() {
  buildq::queue::QueueOptions options;

  buildq::service::ServiceContext ctx;
  ctx.store      = std::make_shared<buildq::store::memory::MemoryStore>();
  ctx.admission  = std::make_shared<buildq::queue::JobAdmission>(ctx.store, options);
  ctx.dispatcher = std::make_shared<buildq::queue::Dispatcher>(ctx.store, options);
  ctx.lifecycle  = std::make_shared<buildq::queue::LifecycleTracker>(ctx.store, options);
  ctx.logs       = std::make_shared<buildq::queue::LogStream>(ctx.store, options);
  ctx.workers    = std::make_shared<buildq::queue::WorkerRegistry>(ctx.store, options);
  ctx.callbacks  = std::make_shared<buildq::queue::CallbackRetry>(ctx.store, options);
  return ctx;
}

BuildJob MakeJob() {
  BuildJob job;
  job.set_release_id("rel");
  job.set_service_id("svc");
  job.set_project_id("proj");
  job.set_git_repo("https://example.com/app.git");
  job.set_git_sha("c0ffee");
  return job;
}

void TestExceptionMapping() {
  using buildq::grpc::ToStatus;

  assert(ToStatus(buildq::util::ValidationError("bad")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(buildq::util::NotFound("gone")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(buildq::util::JobRecordMissing("j", "gone")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(buildq::util::InvalidState("no")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(buildq::util::StoreUnavailable("down")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(buildq::util::SerializationError("corrupt")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);

  assert(ToStatus(buildq::util::NotFound("job not found: x")).error_message() == "job not found: x");
}

void TestEnqueueIncompleteJobReturnsInvalidArgument() {
  auto                           ctx = BuildServiceContext();
  buildq::grpc::BuildQueueServer server(std::make_shared<buildq::service::BuildQueueService>(ctx));

  EnqueueRequest req;
  *req.mutable_job() = MakeJob();
  req.mutable_job()->clear_git_sha();
  EnqueueResponse       resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.Enqueue(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestEnqueueReportsQueuePosition() {
  auto                           ctx = BuildServiceContext();
  buildq::grpc::BuildQueueServer server(std::make_shared<buildq::service::BuildQueueService>(ctx));

  for (uint64_t expected = 1; expected <= 3; ++expected) {
    EnqueueRequest req;
    *req.mutable_job() = MakeJob();
    EnqueueResponse       resp;
    ::grpc::ServerContext grpc_ctx;

    assert(server.Enqueue(&grpc_ctx, &req, &resp).ok());
    assert(!resp.job_id().empty());
    assert(resp.queue_position() == expected);
  }
}

void TestEnqueueReportsDispatchRank() {
  auto                           ctx = BuildServiceContext();
  buildq::grpc::BuildQueueServer server(std::make_shared<buildq::service::BuildQueueService>(ctx));

  auto enqueue = [&](int priority) {
    EnqueueRequest req;
    *req.mutable_job() = MakeJob();
    req.mutable_job()->set_priority(priority);
    EnqueueResponse       resp;
    ::grpc::ServerContext grpc_ctx;
    assert(server.Enqueue(&grpc_ctx, &req, &resp).ok());
    return resp.queue_position();
  };

  assert(enqueue(1) == 1);
  // jumps ahead of the older, lower-priority job
  assert(enqueue(5) == 1);
  assert(enqueue(1) == 3);
  // FIFO work waits behind every priority job
  assert(enqueue(0) == 4);
  assert(enqueue(0) == 5);
}

void TestFinishingUnclaimedJobReturnsFailedPrecondition() {
  auto                       ctx = BuildServiceContext();
  buildq::grpc::WorkerServer server(std::make_shared<buildq::service::WorkerService>(ctx));

  UpdateStatusRequest req;
  req.set_job_id(ctx.admission->Enqueue(MakeJob()));
  req.set_status(JOB_STATUS_COMPLETED);
  req.set_worker_id("w");
  google::protobuf::Empty resp;
  ::grpc::ServerContext   grpc_ctx;

  assert(server.UpdateStatus(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestUpdateStatusOnUnknownJobReturnsNotFound() {
  auto                       ctx = BuildServiceContext();
  buildq::grpc::WorkerServer server(std::make_shared<buildq::service::WorkerService>(ctx));

  UpdateStatusRequest req;
  req.set_job_id("missing-job");
  req.set_status(JOB_STATUS_BUILDING);
  req.set_worker_id("w");
  google::protobuf::Empty resp;
  ::grpc::ServerContext   grpc_ctx;

  const auto status = server.UpdateStatus(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestCancelCompletedJobReturnsFailedPrecondition() {
  auto                           ctx = BuildServiceContext();
  buildq::grpc::BuildQueueServer server(std::make_shared<buildq::service::BuildQueueService>(ctx));

  const auto id = ctx.admission->Enqueue(MakeJob());
  ctx.lifecycle->UpdateStatus(id, JOB_STATUS_BUILDING, "w");
  ctx.lifecycle->UpdateStatus(id, JOB_STATUS_COMPLETED, "w");

  CancelJobRequest req;
  req.set_job_id(id);
  google::protobuf::Empty resp;
  ::grpc::ServerContext   grpc_ctx;

  const auto status = server.CancelJob(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestClaimOnEmptyQueueIsNotAnError() {
  auto                       ctx = BuildServiceContext();
  buildq::grpc::WorkerServer server(std::make_shared<buildq::service::WorkerService>(ctx));

  ClaimJobRequest req;
  req.set_worker_id("w");
  req.set_max_wait_ms(10);
  ClaimJobResponse      resp;
  ::grpc::ServerContext grpc_ctx;

  assert(server.ClaimJob(&grpc_ctx, &req, &resp).ok());
  assert(!resp.claimed());
}

void TestGetResultWithoutResultIsNotFoundFlag() {
  auto                           ctx = BuildServiceContext();
  buildq::grpc::BuildQueueServer server(std::make_shared<buildq::service::BuildQueueService>(ctx));

  GetResultRequest req;
  req.set_job_id(ctx.admission->Enqueue(MakeJob()));
  GetResultResponse     resp;
  ::grpc::ServerContext grpc_ctx;

  assert(server.GetResult(&grpc_ctx, &req, &resp).ok());
  assert(!resp.found());

  req.set_job_id("missing-job");
  ::grpc::ServerContext missing_ctx;
  assert(server.GetResult(&missing_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestScheduleRetryWithoutDueTimeReturnsInvalidArgument() {
  auto                              ctx = BuildServiceContext();
  buildq::grpc::CallbackRetryServer server(std::make_shared<buildq::service::CallbackRetryService>(ctx));

  ScheduleRetryRequest req;
  req.set_job_id("job");
  req.set_callback_url("https://example.com/hook");
  ScheduleRetryResponse resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.ScheduleRetry(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestRescheduleUnknownAttemptReturnsNotFound() {
  auto                              ctx = BuildServiceContext();
  buildq::grpc::CallbackRetryServer server(std::make_shared<buildq::service::CallbackRetryService>(ctx));

  RescheduleRequest req;
  req.mutable_attempt()->set_id("missing-attempt");
  *req.mutable_next_retry_at() = buildq::util::ToProto(buildq::util::Now());
  RescheduleResponse    resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.Reschedule(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestEnqueueIncompleteJobReturnsInvalidArgument();
  TestEnqueueReportsQueuePosition();
  TestEnqueueReportsDispatchRank();
  TestFinishingUnclaimedJobReturnsFailedPrecondition();
  TestUpdateStatusOnUnknownJobReturnsNotFound();
  TestCancelCompletedJobReturnsFailedPrecondition();
  TestClaimOnEmptyQueueIsNotAnError();
  TestGetResultWithoutResultIsNotFoundFlag();
  TestScheduleRetryWithoutDueTimeReturnsInvalidArgument();
  TestRescheduleUnknownAttemptReturnsNotFound();

  std::cout << "buildq_unit_grpc_status: pass\n";
  return 0;
}
