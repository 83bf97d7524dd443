#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace workledger::util {

/*
  Time utilities: single place to control the clock source.

  The store keeps epoch milliseconds. Every timestamp written by the core
  comes from a ClockFn so tests can move time without sleeping.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn   = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
// Throws InvalidArgument for a timestamp the clock cannot represent.
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d);

// Pre-epoch time points clamp to 0.
uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

} // namespace workledger::util
