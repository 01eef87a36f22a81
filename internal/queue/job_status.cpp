#include "job_status.hpp"

#include "internal/util/errors.hpp"

namespace buildq::queue {

std::string_view ToString(JobStatus status) {
  switch (status) {
    case buildq::core::v1::JOB_STATUS_QUEUED:
      return "queued";
    case buildq::core::v1::JOB_STATUS_BUILDING:
      return "building";
    case buildq::core::v1::JOB_STATUS_COMPLETED:
      return "completed";
    case buildq::core::v1::JOB_STATUS_FAILED:
      return "failed";
    case buildq::core::v1::JOB_STATUS_CANCELLED:
      return "cancelled";
    default:
      return "unspecified";
  }
}

JobStatus ParseJobStatus(std::string_view text) {
  if (text == "queued") return buildq::core::v1::JOB_STATUS_QUEUED;
  if (text == "building") return buildq::core::v1::JOB_STATUS_BUILDING;
  if (text == "completed") return buildq::core::v1::JOB_STATUS_COMPLETED;
  if (text == "failed") return buildq::core::v1::JOB_STATUS_FAILED;
  if (text == "cancelled") return buildq::core::v1::JOB_STATUS_CANCELLED;

  throw util::SerializationError("unknown job status '" + std::string(text) + "'");
}

} // namespace buildq::queue
