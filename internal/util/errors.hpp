#pragma once

#include <stdexcept>
#include <string>

namespace buildq::util {

/*
  Central error types.

  These get translated later to gRPC status codes (see grpc/grpc_error.cpp).
  None of them are retried inside the core; retry policy belongs to callers.
*/

// Malformed request. Raised before any store mutation.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Coordination store could not be reached or rejected the operation.
// Safe to retry the whole operation.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Identity unknown. Expected near retention boundaries.
class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A claimed job id whose record is gone. The id has been consumed from the
// queue and must not be re-inserted.
class JobRecordMissing : public NotFound {
 public:
  JobRecordMissing(const std::string& job_id, const std::string& msg) : NotFound(msg), job_id_(job_id) {
  }

  const std::string& job_id() const {
    return job_id_;
  }

 private:
  std::string job_id_;
};

// Encoding/decoding failure. Always a bug.
class SerializationError : public std::runtime_error {
 public:
  explicit SerializationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace buildq::util
