#include "dispatcher.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/queue/job_codec.hpp"
#include "internal/queue/job_status.hpp"
#include "internal/util/errors.hpp"

namespace buildq::queue {

Dispatcher::Dispatcher(std::shared_ptr<store::CoordinationStore> store, QueueOptions options)
    : store_(std::move(store)), options_(std::move(options)), keys_(options_.key_prefix) {
  if (!store_) {
    throw std::invalid_argument("Dispatcher: store is null");
  }
}

std::optional<std::string> Dispatcher::PopNext(std::chrono::milliseconds wait) {
  if (auto expedited = store_->SortedSetPopMin(keys_.PriorityQueue())) {
    return std::move(expedited->member);
  }
  return store_->ListBlockingPopBack(keys_.FifoQueue(), wait);
}

std::optional<buildq::core::v1::BuildJob> Dispatcher::Claim(const std::string& worker_id, std::chrono::milliseconds max_wait) {
  if (worker_id.empty()) {
    throw util::ValidationError("claim: worker_id is required");
  }

  max_wait            = std::clamp(max_wait, std::chrono::milliseconds::zero(), options_.max_claim_wait);
  const auto deadline = std::chrono::steady_clock::now() + max_wait;

  for (;;) {
    const auto remaining =
        std::max(std::chrono::milliseconds::zero(), std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()));

    auto job_id = PopNext(remaining);
    if (!job_id) {
      return std::nullopt;
    }

    const auto key    = keys_.Job(*job_id);
    const auto fields = store_->HashGetAll(key);
    if (!HasJobRecord(fields)) {
      BUILDQ_LOG_WARN("claimed job has no record", {observability::StringField("job_id", *job_id), observability::StringField("worker_id", worker_id)});
      throw util::JobRecordMissing(*job_id, "claim: record for job " + *job_id + " has expired");
    }

    auto record = DecodeJobRecord(fields);
    if (record.state.status() != buildq::core::v1::JOB_STATUS_QUEUED) {
      BUILDQ_LOG_INFO("skipping dequeued job",
                      {observability::StringField("job_id", *job_id), observability::StringField("status", ToString(record.state.status()))});
      continue;
    }

    const bool marked = store_->HashUpdate(key, {
                                                    {job_field::kStatus, std::string(ToString(buildq::core::v1::JOB_STATUS_BUILDING))},
                                                    {job_field::kWorkerId, worker_id},
                                                    {job_field::kStartedAt, EncodeMillis(options_.clock())},
                                                });
    if (!marked) {
      BUILDQ_LOG_WARN("claimed job expired before it was marked", {observability::StringField("job_id", *job_id), observability::StringField("worker_id", worker_id)});
      throw util::JobRecordMissing(*job_id, "claim: record for job " + *job_id + " has expired");
    }

    BUILDQ_LOG_INFO("job claimed", {observability::StringField("job_id", *job_id), observability::StringField("worker_id", worker_id),
                                    observability::IntField("priority", record.job.priority())});
    return std::move(record.job);
  }
}

QueueDepth Dispatcher::Depth() {
  QueueDepth depth;
  depth.priority = store_->SortedSetCard(keys_.PriorityQueue());
  depth.fifo     = store_->ListLength(keys_.FifoQueue());
  return depth;
}

std::optional<uint64_t> Dispatcher::Position(const std::string& job_id, bool expedited) {
  if (expedited) {
    const auto rank = store_->SortedSetRank(keys_.PriorityQueue(), job_id);
    if (!rank) return std::nullopt;
    return *rank + 1;
  }
  const auto depth = Depth();
  return depth.priority + depth.fifo;
}

} // namespace buildq::queue
