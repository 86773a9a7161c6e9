#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace settlement::util {

/*
  Time utilities. Single place to control the clock source.

  Everything that stamps or compares times goes through a TimeSource so
  tests can move time across the request timeout deterministically.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration  = Clock::duration;

TimePoint Now();

class TimeSource {
 public:
  virtual ~TimeSource() = default;

  virtual TimePoint Now() const = 0;
};

class SystemTimeSource final : public TimeSource {
 public:
  TimePoint Now() const override;
};

class ManualTimeSource final : public TimeSource {
 public:
  explicit ManualTimeSource(TimePoint start = TimePoint{} + std::chrono::hours(24 * 365 * 50));

  TimePoint Now() const override;

  void Advance(Duration delta);
  void Set(TimePoint at);

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

Duration FromProto(const google::protobuf::Duration& d);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

} // namespace settlement::util
