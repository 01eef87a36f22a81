#pragma once

#include <memory>
#include <optional>
#include <string>

#include "buildq/core/v1/job.pb.h"
#include "internal/queue/job_codec.hpp"
#include "internal/queue/job_status.hpp"
#include "internal/queue/keys.hpp"
#include "internal/queue/queue_options.hpp"
#include "internal/store/api/coordination_store.hpp"

namespace buildq::queue {

/*
  Status, result and read access for admitted jobs.

  Writes touch only the fields they own; the job data blob is never
  rewritten, and a record that expired is never brought back by a write. The transition check reads before it writes, so two racing
  writers can both pass it. Workers own a job exclusively once claimed,
  which keeps that window to operator cancels.
*/
class LifecycleTracker {
 public:
  LifecycleTracker(std::shared_ptr<store::CoordinationStore> store, QueueOptions options);

  // Throws NotFound for unknown ids, InvalidState for regressing transitions.
  void UpdateStatus(const std::string& job_id, JobStatus status, const std::string& worker_id);

  // Allowed before the terminal status lands.
  void SetResult(const std::string& job_id, const buildq::core::v1::BuildResult& result);

  JobRecord GetJob(const std::string& job_id);

  // nullopt when the job exists but has no result yet.
  std::optional<buildq::core::v1::BuildResult> GetResult(const std::string& job_id);

  // queued or building -> cancelled.
  void Cancel(const std::string& job_id);

 private:
  JobStatus CurrentStatus(const std::string& key, const std::string& job_id);

  // Throws NotFound when the record is gone by the time of the write.
  void WriteExisting(const std::string& key, const std::string& job_id, const store::FieldMap& fields);

  std::shared_ptr<store::CoordinationStore> store_;
  QueueOptions                              options_;
  Keys                                      keys_;
};

} // namespace buildq::queue
