#pragma once

#include <string>

namespace buildq::queue {

/*
  Store key layout. Every key lives under one configurable prefix so several
  queues can share a backend.
*/
class Keys {
 public:
  explicit Keys(std::string prefix) : prefix_(std::move(prefix)) {
  }

  std::string Job(const std::string& job_id) const {
    return prefix_ + ":job:" + job_id;
  }

  std::string PriorityQueue() const {
    return prefix_ + ":queue:priority";
  }

  std::string FifoQueue() const {
    return prefix_ + ":queue:builds";
  }

  std::string Logs(const std::string& job_id) const {
    return prefix_ + ":logs:" + job_id;
  }

  std::string ActiveWorkers() const {
    return prefix_ + ":workers:active";
  }

  std::string Callback(const std::string& attempt_id) const {
    return prefix_ + ":callback:" + attempt_id;
  }

  std::string CallbackRetryQueue() const {
    return prefix_ + ":queue:callback_retry";
  }

 private:
  std::string prefix_;
};

// Hash field names of a job record.
namespace job_field {
inline constexpr const char* kData        = "data";
inline constexpr const char* kStatus      = "status";
inline constexpr const char* kWorkerId    = "worker_id";
inline constexpr const char* kCreatedAt   = "created_at";
inline constexpr const char* kStartedAt   = "started_at";
inline constexpr const char* kCompletedAt = "completed_at";
inline constexpr const char* kResult      = "result";
} // namespace job_field

} // namespace buildq::queue
