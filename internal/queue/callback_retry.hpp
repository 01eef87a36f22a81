#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "buildq/core/v1/job.pb.h"
#include "internal/queue/keys.hpp"
#include "internal/queue/queue_options.hpp"
#include "internal/store/api/coordination_store.hpp"
#include "internal/util/time.hpp"

namespace buildq::queue {

// Input of ScheduleRetry: the delivery that just failed and when to try again.
struct RetryDraft {
  std::string                   job_id;
  std::string                   callback_url;
  buildq::core::v1::BuildResult result;
  std::string                   last_error;
  util::TimePoint               next_retry_at;
};

/*
  Timing store for completion callbacks that failed delivery.

  The queue only decides *when* an attempt is due and *who* gets to run it;
  the HTTP delivery itself belongs to the caller. An attempt record expires
  callback_retention after it was first scheduled no matter how often it is
  rescheduled.

  ClaimReady is safe to call from several dispatchers at once: each due
  attempt is handed to exactly one of them. If the store fails partway
  through, the attempts already claimed are returned and the one in flight
  goes back into the retry queue; the error surfaces only when nothing was
  claimed. Undecodable attempts are logged and dropped.
*/
class CallbackRetry {
 public:
  CallbackRetry(std::shared_ptr<store::CoordinationStore> store, QueueOptions options);

  std::string ScheduleRetry(const RetryDraft& draft);

  std::vector<buildq::core::v1::CallbackAttempt> ClaimReady(std::size_t limit);

  // next_retry_at must be strictly later than the stored due time. Throws
  // NotFound once the attempt record has expired.
  buildq::core::v1::CallbackAttempt Reschedule(const buildq::core::v1::CallbackAttempt& attempt, util::TimePoint next_retry_at,
                                               const std::string& last_error);

  // Idempotent.
  void Abandon(const std::string& attempt_id);

  uint64_t PendingCount();

 private:
  std::shared_ptr<store::CoordinationStore> store_;
  QueueOptions                              options_;
  Keys                                      keys_;
};

} // namespace buildq::queue
