#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace routebid::util {

/*
  Time utilities.

  Components never read the wall clock directly; they hold a Clock so
  deadline handling can be driven from tests.
*/

using SystemClockType = std::chrono::system_clock;
using TimePoint       = SystemClockType::time_point;
using Duration        = std::chrono::milliseconds;

class Clock {
 public:
  virtual ~Clock()              = default;
  virtual TimePoint Now() const = 0;
};

class SystemClock final : public Clock {
 public:
  TimePoint Now() const override;
};

class ManualClock final : public Clock {
 public:
  explicit ManualClock(TimePoint start);

  TimePoint Now() const override;

  void Set(TimePoint tp);
  void Advance(Duration d);

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

Duration FromProto(const google::protobuf::Duration& d);

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

} // namespace routebid::util
