#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace buildq::grpc {

/*
  Converts internal exceptions into gRPC status codes.

    ValidationError     INVALID_ARGUMENT
    NotFound            NOT_FOUND (JobRecordMissing included)
    InvalidState        FAILED_PRECONDITION
    StoreUnavailable    UNAVAILABLE
    anything else       INTERNAL
*/
::grpc::Status ToStatus(const std::exception& e);

} // namespace buildq::grpc
