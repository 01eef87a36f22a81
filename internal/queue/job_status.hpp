#pragma once

#include <string>
#include <string_view>

#include "buildq/core/v1/job.pb.h"

namespace buildq::queue {

using JobStatus = buildq::core::v1::JobStatus;

// Text form stored in the job hash: queued, building, completed, failed, cancelled.
std::string_view ToString(JobStatus status);

// Throws util::SerializationError on unknown text.
JobStatus ParseJobStatus(std::string_view text);

constexpr bool IsTerminal(JobStatus status) {
  return status == buildq::core::v1::JOB_STATUS_COMPLETED || status == buildq::core::v1::JOB_STATUS_FAILED ||
         status == buildq::core::v1::JOB_STATUS_CANCELLED;
}

constexpr bool IsKnown(JobStatus status) {
  return status == buildq::core::v1::JOB_STATUS_QUEUED || status == buildq::core::v1::JOB_STATUS_BUILDING || IsTerminal(status);
}

/*
  queued -> {building | cancelled}, building -> {completed | failed | cancelled}.
  Re-asserting the current status is allowed; nothing leaves a terminal state.
*/
constexpr bool CanTransition(JobStatus from, JobStatus to) {
  if (!IsKnown(from) || !IsKnown(to)) {
    return false;
  }
  if (from == to) {
    return true;
  }

  switch (from) {
    case buildq::core::v1::JOB_STATUS_QUEUED:
      return to == buildq::core::v1::JOB_STATUS_BUILDING || to == buildq::core::v1::JOB_STATUS_CANCELLED;
    case buildq::core::v1::JOB_STATUS_BUILDING:
      return IsTerminal(to);
    default:
      return false;
  }
}

} // namespace buildq::queue
