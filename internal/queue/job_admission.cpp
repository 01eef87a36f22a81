#include "job_admission.hpp"

#include <algorithm>
#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/queue/job_codec.hpp"
#include "internal/queue/job_status.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace buildq::queue {

using buildq::core::v1::BuildJob;

JobAdmission::JobAdmission(std::shared_ptr<store::CoordinationStore> store, QueueOptions options)
    : store_(std::move(store)), options_(std::move(options)), keys_(options_.key_prefix) {
  if (!store_) {
    throw std::invalid_argument("JobAdmission: store is null");
  }
}

void JobAdmission::Validate(const BuildJob& job) {
  if (job.release_id().empty()) throw util::ValidationError("enqueue: release_id is required");
  if (job.service_id().empty()) throw util::ValidationError("enqueue: service_id is required");
  if (job.project_id().empty()) throw util::ValidationError("enqueue: project_id is required");
  if (job.git_repo().empty()) throw util::ValidationError("enqueue: git_repo is required");
  if (job.git_sha().empty()) throw util::ValidationError("enqueue: git_sha is required");
  if (job.priority() < 0) throw util::ValidationError("enqueue: priority must be >= 0");
}

int64_t JobAdmission::NextAdmissionMicros(util::TimePoint created_at) {
  const auto now_us = util::ToUnixMicros(created_at);
  auto       last   = last_admission_us_.load(std::memory_order_relaxed);
  for (;;) {
    const auto next = std::max(now_us, last + 1);
    if (last_admission_us_.compare_exchange_weak(last, next, std::memory_order_relaxed)) {
      return next;
    }
  }
}

double JobAdmission::PriorityScore(const BuildJob& job, int64_t admitted_us) const {
  // lower score pops first: older jobs and higher priorities win
  const auto weight_us = std::chrono::duration_cast<std::chrono::microseconds>(options_.priority_weight).count();
  return static_cast<double>(admitted_us) - static_cast<double>(job.priority()) * static_cast<double>(weight_us);
}

std::string JobAdmission::Enqueue(BuildJob job) {
  Validate(job);

  const auto created_at = options_.clock();
  job.set_id(util::NewId());
  *job.mutable_created_at() = util::ToProto(created_at);

  const auto  key  = keys_.Job(job.id());
  const auto  data = EncodeJob(job);

  try {
    store_->HashSet(key, {
                             {job_field::kData, data},
                             {job_field::kStatus, std::string(ToString(buildq::core::v1::JOB_STATUS_QUEUED))},
                             {job_field::kCreatedAt, EncodeMillis(created_at)},
                         });
    if (!store_->Expire(key, options_.job_retention)) {
      throw util::StoreUnavailable("job record vanished before expiry was set");
    }

    if (job.priority() > 0) {
      store_->SortedSetAdd(keys_.PriorityQueue(), job.id(), PriorityScore(job, NextAdmissionMicros(created_at)));
    } else {
      store_->ListPushFront(keys_.FifoQueue(), job.id());
    }
  } catch (const util::StoreUnavailable& e) {
    try {
      store_->Delete(key);
    } catch (const util::StoreUnavailable& cleanup) {
      BUILDQ_LOG_ERROR("enqueue rollback failed",
                       {observability::StringField("job_id", job.id()), observability::StringField("error", cleanup.what())});
    }
    throw util::StoreUnavailable("enqueue " + job.id() + ": " + e.what());
  }

  BUILDQ_LOG_INFO("job enqueued", {observability::StringField("job_id", job.id()), observability::StringField("release_id", job.release_id()),
                                   observability::IntField("priority", job.priority())});
  return job.id();
}

std::string JobAdmission::Resubmit(const std::string& job_id) {
  if (job_id.empty()) {
    throw util::ValidationError("resubmit: job_id is required");
  }

  const auto fields = store_->HashGetAll(keys_.Job(job_id));
  if (!HasJobRecord(fields)) {
    throw util::NotFound("job not found: " + job_id);
  }

  const auto record = DecodeJobRecord(fields);
  const auto status = record.state.status();
  if (status != buildq::core::v1::JOB_STATUS_FAILED && status != buildq::core::v1::JOB_STATUS_CANCELLED) {
    throw util::InvalidState("resubmit " + job_id + ": only failed or cancelled jobs can be retried (status " + std::string(ToString(status)) + ")");
  }

  BuildJob copy = record.job;
  copy.set_priority(copy.priority() + 1);
  const auto new_id = Enqueue(std::move(copy));

  BUILDQ_LOG_INFO("job resubmitted", {observability::StringField("job_id", job_id), observability::StringField("new_job_id", new_id)});
  return new_id;
}

} // namespace buildq::queue
