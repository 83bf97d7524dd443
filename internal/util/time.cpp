#include "time.hpp"

#include <string>

#include "errors.hpp"

namespace workledger::util {
namespace {

// Seconds a Clock::duration can hold without overflowing.
constexpr int64_t kMaxClockSeconds = std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::max()).count() - 1;
constexpr int64_t kMinClockSeconds = std::chrono::duration_cast<std::chrono::seconds>(Clock::duration::min()).count() + 1;

constexpr int32_t kNanosPerSecond = 1'000'000'000;
constexpr int32_t kNanosPerMilli  = 1'000'000;

} // namespace

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  if (ts.nanos() < 0 || ts.nanos() >= kNanosPerSecond) {
    throw InvalidArgument("timestamp nanos out of range");
  }
  if (ts.seconds() > kMaxClockSeconds || ts.seconds() < kMinClockSeconds) {
    throw InvalidArgument("timestamp out of range: seconds=" + std::to_string(ts.seconds()));
  }
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds())) +
         std::chrono::duration_cast<Clock::duration>(std::chrono::nanoseconds(ts.nanos()));
}

// Converted straight to milliseconds; a Duration's full range fits.
std::chrono::milliseconds FromProto(const google::protobuf::Duration& d) {
  return std::chrono::milliseconds(d.seconds() * 1000 + d.nanos() / kNanosPerMilli);
}

uint64_t ToUnixMillis(TimePoint tp) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  return ms < 0 ? 0 : static_cast<uint64_t>(ms);
}

TimePoint FromUnixMillis(uint64_t ms) {
  constexpr uint64_t kMaxMillis = static_cast<uint64_t>(kMaxClockSeconds) * 1000;
  if (ms > kMaxMillis) ms = kMaxMillis;
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(static_cast<int64_t>(ms)));
}

} // namespace workledger::util
