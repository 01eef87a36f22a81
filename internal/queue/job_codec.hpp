#pragma once

#include <optional>
#include <string>

#include "buildq/core/v1/job.pb.h"
#include "internal/store/api/coordination_store.hpp"
#include "internal/util/time.hpp"

namespace buildq::queue {

/*
  Protobuf JSON encoding of everything stored as an opaque blob (job data,
  build result, callback attempt). Field names are kept in proto form so the
  stored documents stay readable by non-C++ tooling.

  All functions throw util::SerializationError.
*/

std::string EncodeJob(const buildq::core::v1::BuildJob& job);
std::string EncodeResult(const buildq::core::v1::BuildResult& result);
std::string EncodeAttempt(const buildq::core::v1::CallbackAttempt& attempt);

buildq::core::v1::BuildJob        DecodeJob(const std::string& raw);
buildq::core::v1::BuildResult     DecodeResult(const std::string& raw);
buildq::core::v1::CallbackAttempt DecodeAttempt(const std::string& raw);

// Timestamps inside hashes are unix milliseconds in decimal.
std::string     EncodeMillis(util::TimePoint tp);
util::TimePoint DecodeMillis(const std::string& raw);

// Decoded view of a job hash.
struct JobRecord {
  buildq::core::v1::BuildJob                   job;
  buildq::core::v1::JobState                   state;
  std::optional<buildq::core::v1::BuildResult> result;
};

// False for an absent key and for a stray hash left without data or status.
bool HasJobRecord(const store::FieldMap& fields);

// Requires the data and status fields.
JobRecord DecodeJobRecord(const store::FieldMap& fields);

} // namespace buildq::queue
