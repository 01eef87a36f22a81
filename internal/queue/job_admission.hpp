#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "buildq/core/v1/job.pb.h"
#include "internal/queue/keys.hpp"
#include "internal/queue/queue_options.hpp"
#include "internal/store/api/coordination_store.hpp"
#include "internal/util/time.hpp"

namespace buildq::queue {

/*
  Turns a build description into a queued job.

  Admission is all-or-nothing: the job record is written first, then the id is
  queued. If queueing fails the record is deleted again, so a job is never
  visible without being dispatchable.

  Priority scores are built from a per-instance microsecond clock that never
  repeats, so two equal-priority jobs admitted in the same microsecond still
  pop in admission order. Across server processes the tie falls back to the
  id order of the ordered set.
*/
class JobAdmission {
 public:
  JobAdmission(std::shared_ptr<store::CoordinationStore> store, QueueOptions options);

  // Assigns id and created_at (caller supplied values are discarded).
  // priority > 0 goes to the priority queue, 0 to the FIFO queue.
  std::string Enqueue(buildq::core::v1::BuildJob job);

  // Re-admits a failed or cancelled job under a new id with priority + 1.
  std::string Resubmit(const std::string& job_id);

 private:
  static void Validate(const buildq::core::v1::BuildJob& job);

  // created_at in unix micros, bumped past the previous admission on ties.
  int64_t NextAdmissionMicros(util::TimePoint created_at);

  double PriorityScore(const buildq::core::v1::BuildJob& job, int64_t admitted_us) const;

  std::shared_ptr<store::CoordinationStore> store_;
  QueueOptions                              options_;
  Keys                                      keys_;
  std::atomic<int64_t>                      last_admission_us_{0};
};

} // namespace buildq::queue
