#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace buildq::util {

// Everything that reads the time takes a ClockFn; tests pass a manual one.
using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn   = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// Truncates sub-millisecond precision.
std::chrono::milliseconds ToDuration(const google::protobuf::Duration& d);

// Store-facing encodings: expiry deadlines and ordered-set scores are Unix
// milliseconds, queue tie-breaks use microseconds.
uint64_t  ToUnixMillis(TimePoint tp);
int64_t   ToUnixMicros(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

} // namespace buildq::util
