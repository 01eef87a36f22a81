#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "buildq/core/v1/job.pb.h"
#include "internal/queue/keys.hpp"
#include "internal/queue/queue_options.hpp"
#include "internal/store/api/coordination_store.hpp"

namespace buildq::queue {

struct QueueDepth {
  uint64_t priority = 0;
  uint64_t fifo     = 0;
};

/*
  Hands queued jobs to workers.

  Order: the priority queue is drained first (never blocks), then the FIFO
  queue is waited on. Exclusivity comes entirely from the store's atomic
  pops: an id is delivered to at most one caller.

  FIFO work starves while priority work keeps arriving.
*/
class Dispatcher {
 public:
  Dispatcher(std::shared_ptr<store::CoordinationStore> store, QueueOptions options);

  /*
    Returns the claimed job, already marked building for worker_id, or
    nullopt when nothing arrived within max_wait (capped at max_claim_wait).

    Throws util::JobRecordMissing when the popped id's record has expired;
    that id is consumed. Jobs cancelled while queued are skipped silently.
  */
  std::optional<buildq::core::v1::BuildJob> Claim(const std::string& worker_id, std::chrono::milliseconds max_wait);

  QueueDepth Depth();

  /*
    1-based place of a queued job in dispatch order: its rank in the priority
    queue, or for FIFO jobs every priority job plus the FIFO backlog (exact
    for the job just pushed when no other admission raced it). nullopt when a
    priority job has already left the queue.
  */
  std::optional<uint64_t> Position(const std::string& job_id, bool expedited);

 private:
  std::optional<std::string> PopNext(std::chrono::milliseconds wait);

  std::shared_ptr<store::CoordinationStore> store_;
  QueueOptions                              options_;
  Keys                                      keys_;
};

} // namespace buildq::queue
