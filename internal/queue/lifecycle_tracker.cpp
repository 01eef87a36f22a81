#include "lifecycle_tracker.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace buildq::queue {

namespace {

void RequireId(const std::string& job_id, const char* op) {
  if (job_id.empty()) {
    throw util::ValidationError(std::string(op) + ": job_id is required");
  }
}

} // namespace

LifecycleTracker::LifecycleTracker(std::shared_ptr<store::CoordinationStore> store, QueueOptions options)
    : store_(std::move(store)), options_(std::move(options)), keys_(options_.key_prefix) {
  if (!store_) {
    throw std::invalid_argument("LifecycleTracker: store is null");
  }
}

void LifecycleTracker::WriteExisting(const std::string& key, const std::string& job_id, const store::FieldMap& fields) {
  if (!store_->HashUpdate(key, fields)) {
    BUILDQ_LOG_DEBUG("job expired before update", {observability::StringField("job_id", job_id)});
    throw util::NotFound("job not found: " + job_id);
  }
}

JobStatus LifecycleTracker::CurrentStatus(const std::string& key, const std::string& job_id) {
  const auto raw = store_->HashGet(key, job_field::kStatus);
  if (!raw) {
    throw util::NotFound("job not found: " + job_id);
  }
  return ParseJobStatus(*raw);
}

void LifecycleTracker::UpdateStatus(const std::string& job_id, JobStatus status, const std::string& worker_id) {
  RequireId(job_id, "update status");
  if (status == buildq::core::v1::JOB_STATUS_UNSPECIFIED) {
    throw util::ValidationError("update status: status is required");
  }

  const auto key     = keys_.Job(job_id);
  const auto current = CurrentStatus(key, job_id);
  if (!CanTransition(current, status)) {
    throw util::InvalidState("job " + job_id + ": cannot move from " + std::string(ToString(current)) + " to " + std::string(ToString(status)));
  }

  store::FieldMap fields{{job_field::kStatus, std::string(ToString(status))}};
  if (!worker_id.empty()) {
    fields[job_field::kWorkerId] = worker_id;
  }
  // a building job stays with the worker that claimed it
  if (current == buildq::core::v1::JOB_STATUS_BUILDING && status == buildq::core::v1::JOB_STATUS_BUILDING) {
    if (auto owner = store_->HashGet(key, job_field::kWorkerId); owner && !owner->empty()) {
      fields.erase(job_field::kWorkerId);
    }
  }
  if (current != status) {
    if (status == buildq::core::v1::JOB_STATUS_BUILDING) {
      fields[job_field::kStartedAt] = EncodeMillis(options_.clock());
    } else if (IsTerminal(status)) {
      fields[job_field::kCompletedAt] = EncodeMillis(options_.clock());
    }
  }
  WriteExisting(key, job_id, fields);

  BUILDQ_LOG_INFO("job status updated", {observability::StringField("job_id", job_id), observability::StringField("status", ToString(status))});
}

void LifecycleTracker::SetResult(const std::string& job_id, const buildq::core::v1::BuildResult& result) {
  RequireId(job_id, "set result");

  WriteExisting(keys_.Job(job_id), job_id, {{job_field::kResult, EncodeResult(result)}});
}

JobRecord LifecycleTracker::GetJob(const std::string& job_id) {
  RequireId(job_id, "get job");

  const auto fields = store_->HashGetAll(keys_.Job(job_id));
  if (!HasJobRecord(fields)) {
    BUILDQ_LOG_DEBUG("job lookup missed", {observability::StringField("job_id", job_id)});
    throw util::NotFound("job not found: " + job_id);
  }
  return DecodeJobRecord(fields);
}

std::optional<buildq::core::v1::BuildResult> LifecycleTracker::GetResult(const std::string& job_id) {
  RequireId(job_id, "get result");

  const auto key = keys_.Job(job_id);
  if (auto raw = store_->HashGet(key, job_field::kResult); raw && !raw->empty()) {
    return DecodeResult(*raw);
  }

  CurrentStatus(key, job_id);
  return std::nullopt;
}

void LifecycleTracker::Cancel(const std::string& job_id) {
  RequireId(job_id, "cancel");

  const auto key     = keys_.Job(job_id);
  const auto current = CurrentStatus(key, job_id);
  if (current != buildq::core::v1::JOB_STATUS_QUEUED && current != buildq::core::v1::JOB_STATUS_BUILDING) {
    throw util::InvalidState("job " + job_id + " cannot be cancelled in status " + std::string(ToString(current)));
  }

  WriteExisting(key, job_id,
                {
                    {job_field::kStatus, std::string(ToString(buildq::core::v1::JOB_STATUS_CANCELLED))},
                    {job_field::kCompletedAt, EncodeMillis(options_.clock())},
                });

  BUILDQ_LOG_INFO("job cancelled", {observability::StringField("job_id", job_id), observability::StringField("previous", ToString(current))});
}

} // namespace buildq::queue
