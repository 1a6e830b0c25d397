#include "time.hpp"

namespace routebid::util {

TimePoint SystemClock::Now() const {
  return SystemClockType::now();
}

ManualClock::ManualClock(TimePoint start) : now_(start) {
}

TimePoint ManualClock::Now() const {
  std::lock_guard lock(mutex_);
  return now_;
}

void ManualClock::Set(TimePoint tp) {
  std::lock_guard lock(mutex_);
  now_ = tp;
}

void ManualClock::Advance(Duration d) {
  std::lock_guard lock(mutex_);
  now_ += d;
}

TimePoint Now() {
  return SystemClockType::now();
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
  return TimePoint{} + std::chrono::duration_cast<SystemClockType::duration>(std::chrono::seconds(ts.seconds()) +
                                                                             std::chrono::nanoseconds(ts.nanos()));
}

Duration FromProto(const google::protobuf::Duration& d) {
  return std::chrono::duration_cast<Duration>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<SystemClockType::duration>(std::chrono::milliseconds(ms));
}

} // namespace routebid::util
