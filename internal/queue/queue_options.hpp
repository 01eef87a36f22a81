#pragma once

#include <chrono>
#include <string>

#include "internal/util/time.hpp"

namespace buildq::queue {

/*
  Tunables shared by every queue component. Defaults match a production
  deployment; the composition root overrides them from RuntimeConfig.
*/
struct QueueOptions {
  std::string key_prefix{"buildq"};

  // Job records and their log streams.
  std::chrono::milliseconds job_retention{std::chrono::hours(24 * 7)};
  // Callback attempt records; never refreshed on reschedule.
  std::chrono::milliseconds callback_retention{std::chrono::hours(24)};

  // How much queue age one priority level is worth.
  std::chrono::milliseconds priority_weight{std::chrono::seconds(1000)};

  // Upper bound of a single blocking stream read inside LogTail::Next.
  std::chrono::milliseconds log_tail_block{std::chrono::seconds(1)};
  // Cap applied to worker supplied claim waits.
  std::chrono::milliseconds max_claim_wait{std::chrono::seconds(30)};

  util::ClockFn clock{util::Now};
};

} // namespace buildq::queue
