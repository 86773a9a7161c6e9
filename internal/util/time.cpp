#include "time.hpp"

namespace settlement::util {

TimePoint Now() {
  return Clock::now();
}

TimePoint SystemTimeSource::Now() const {
  return Clock::now();
}

ManualTimeSource::ManualTimeSource(TimePoint start) : now_(start) {
}

TimePoint ManualTimeSource::Now() const {
  std::lock_guard lock(mutex_);
  return now_;
}

void ManualTimeSource::Advance(Duration delta) {
  std::lock_guard lock(mutex_);
  now_ += delta;
}

void ManualTimeSource::Set(TimePoint at) {
  std::lock_guard lock(mutex_);
  now_ = at;
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
  return TimePoint{} + std::chrono::duration_cast<Duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

Duration FromProto(const google::protobuf::Duration& d) {
  return std::chrono::duration_cast<Duration>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<Duration>(std::chrono::milliseconds(ms));
}

} // namespace settlement::util
