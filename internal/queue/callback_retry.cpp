#include "callback_retry.hpp"

#include <optional>

#include "internal/observability/logging.hpp"
#include "internal/queue/job_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace buildq::queue {

using buildq::core::v1::CallbackAttempt;

namespace {
constexpr const char* kDataField      = "data";
constexpr const char* kCreatedAtField = "created_at";

double DueScore(util::TimePoint tp) {
  return static_cast<double>(util::ToUnixMillis(tp));
}
} // namespace

CallbackRetry::CallbackRetry(std::shared_ptr<store::CoordinationStore> store, QueueOptions options)
    : store_(std::move(store)), options_(std::move(options)), keys_(options_.key_prefix) {
  if (!store_) {
    throw std::invalid_argument("CallbackRetry: store is null");
  }
}

std::string CallbackRetry::ScheduleRetry(const RetryDraft& draft) {
  if (draft.job_id.empty()) {
    throw util::ValidationError("schedule retry: job_id is required");
  }
  if (draft.callback_url.empty()) {
    throw util::ValidationError("schedule retry: callback_url is required");
  }

  const auto now = options_.clock();

  CallbackAttempt attempt;
  attempt.set_id(util::NewId());
  attempt.set_job_id(draft.job_id);
  attempt.set_callback_url(draft.callback_url);
  *attempt.mutable_result() = draft.result;
  attempt.set_attempts(1);
  *attempt.mutable_next_retry_at() = util::ToProto(draft.next_retry_at);
  attempt.set_last_error(draft.last_error);
  *attempt.mutable_created_at() = util::ToProto(now);

  const auto key  = keys_.Callback(attempt.id());
  const auto data = EncodeAttempt(attempt);

  try {
    store_->HashSet(key, {{kDataField, data}, {kCreatedAtField, EncodeMillis(now)}});
    if (!store_->Expire(key, options_.callback_retention)) {
      throw util::StoreUnavailable("callback attempt vanished before expiry was set");
    }
    store_->SortedSetAdd(keys_.CallbackRetryQueue(), attempt.id(), DueScore(draft.next_retry_at));
  } catch (const util::StoreUnavailable& e) {
    try {
      store_->Delete(key);
    } catch (const util::StoreUnavailable& cleanup) {
      BUILDQ_LOG_ERROR("schedule retry rollback failed",
                       {observability::StringField("attempt_id", attempt.id()), observability::StringField("error", cleanup.what())});
    }
    throw;
  }

  BUILDQ_LOG_INFO("callback retry scheduled", {observability::StringField("attempt_id", attempt.id()), observability::StringField("job_id", draft.job_id)});
  return attempt.id();
}

std::vector<CallbackAttempt> CallbackRetry::ClaimReady(std::size_t limit) {
  std::vector<CallbackAttempt> claimed;
  if (limit == 0) {
    return claimed;
  }

  const auto queue      = keys_.CallbackRetryQueue();
  const auto candidates = store_->SortedSetRangeByScore(queue, DueScore(options_.clock()), limit);

  for (const auto& candidate : candidates) {
    std::optional<std::string> data;
    try {
      // another dispatcher may have taken it between range and remove
      if (!store_->SortedSetRemove(queue, candidate.member)) {
        continue;
      }
    } catch (const util::StoreUnavailable& e) {
      if (claimed.empty()) throw;
      BUILDQ_LOG_WARN("callback claim cut short", {observability::UintField("claimed", claimed.size()), observability::StringField("error", e.what())});
      break;
    }

    try {
      data = store_->HashGet(keys_.Callback(candidate.member), kDataField);
    } catch (const util::StoreUnavailable& e) {
      // put it back at its original due time so no dispatcher loses it
      try {
        store_->SortedSetAdd(queue, candidate.member, candidate.score);
      } catch (const util::StoreUnavailable& requeue) {
        BUILDQ_LOG_ERROR("callback attempt requeue failed",
                         {observability::StringField("attempt_id", candidate.member), observability::StringField("error", requeue.what())});
      }
      if (claimed.empty()) throw;
      BUILDQ_LOG_WARN("callback claim cut short", {observability::UintField("claimed", claimed.size()), observability::StringField("error", e.what())});
      break;
    }

    if (!data) {
      BUILDQ_LOG_INFO("dropping expired callback attempt", {observability::StringField("attempt_id", candidate.member)});
      continue;
    }

    try {
      claimed.push_back(DecodeAttempt(*data));
    } catch (const util::SerializationError& e) {
      BUILDQ_LOG_ERROR("dropping unreadable callback attempt",
                       {observability::StringField("attempt_id", candidate.member), observability::StringField("error", e.what())});
    }
  }
  if (!claimed.empty()) {
    BUILDQ_LOG_DEBUG("callback retries claimed", {observability::UintField("count", claimed.size()), observability::UintField("due", candidates.size())});
  }
  return claimed;
}

CallbackAttempt CallbackRetry::Reschedule(const CallbackAttempt& attempt, util::TimePoint next_retry_at, const std::string& last_error) {
  if (attempt.id().empty()) {
    throw util::ValidationError("reschedule: attempt id is required");
  }

  const auto key  = keys_.Callback(attempt.id());
  const auto data = store_->HashGet(key, kDataField);
  if (!data) {
    throw util::NotFound("callback attempt not found: " + attempt.id());
  }

  auto stored = DecodeAttempt(*data);
  if (next_retry_at <= util::FromProto(stored.next_retry_at())) {
    throw util::ValidationError("reschedule " + attempt.id() + ": next_retry_at must be later than the current due time");
  }

  stored.set_attempts(stored.attempts() + 1);
  *stored.mutable_next_retry_at() = util::ToProto(next_retry_at);
  stored.set_last_error(last_error);

  // expiry stays anchored to the first schedule
  if (!store_->HashUpdate(key, {{kDataField, EncodeAttempt(stored)}})) {
    throw util::NotFound("callback attempt not found: " + attempt.id());
  }
  store_->SortedSetAdd(keys_.CallbackRetryQueue(), stored.id(), DueScore(next_retry_at));

  BUILDQ_LOG_INFO("callback retry rescheduled",
                  {observability::StringField("attempt_id", stored.id()), observability::IntField("attempts", stored.attempts())});
  return stored;
}

void CallbackRetry::Abandon(const std::string& attempt_id) {
  if (attempt_id.empty()) {
    throw util::ValidationError("abandon: attempt id is required");
  }

  store_->Delete(keys_.Callback(attempt_id));
  if (store_->SortedSetRemove(keys_.CallbackRetryQueue(), attempt_id)) {
    BUILDQ_LOG_INFO("callback retry abandoned", {observability::StringField("attempt_id", attempt_id)});
  }
}

uint64_t CallbackRetry::PendingCount() {
  return store_->SortedSetCard(keys_.CallbackRetryQueue());
}

} // namespace buildq::queue
