#include "time.hpp"

#include <google/protobuf/util/time_util.h>

namespace capsule::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  // time_point_cast truncates toward zero; keep nanos non-negative.
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

int CompareTimestamps(const google::protobuf::Timestamp& a, const google::protobuf::Timestamp& b) {
  if (a.seconds() != b.seconds()) {
    return a.seconds() < b.seconds() ? -1 : 1;
  }
  if (a.nanos() != b.nanos()) {
    return a.nanos() < b.nanos() ? -1 : 1;
  }
  return 0;
}

google::protobuf::Timestamp StrictlyAfter(const google::protobuf::Timestamp& candidate, const google::protobuf::Timestamp& floor) {
  if (CompareTimestamps(candidate, floor) > 0) {
    return candidate;
  }

  google::protobuf::Timestamp bumped = floor;
  bumped.set_nanos(bumped.nanos() + 1000);
  if (bumped.nanos() >= 1'000'000'000) {
    bumped.set_seconds(bumped.seconds() + 1);
    bumped.set_nanos(bumped.nanos() - 1'000'000'000);
  }
  return bumped;
}

std::int64_t ToUnixMicros(const google::protobuf::Timestamp& ts) {
  return ts.seconds() * 1'000'000 + ts.nanos() / 1000;
}

std::string FormatTimestamp(const google::protobuf::Timestamp& ts) {
  return google::protobuf::util::TimeUtil::ToString(ts);
}

} // namespace capsule::util
