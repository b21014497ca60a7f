#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace capsule::util {

/*
  Time utilities. All clock reads go through Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// <0, 0, >0 like strcmp.
int CompareTimestamps(const google::protobuf::Timestamp& a, const google::protobuf::Timestamp& b);

// Smallest timestamp strictly after `floor` that is not before `candidate`.
google::protobuf::Timestamp StrictlyAfter(const google::protobuf::Timestamp& candidate, const google::protobuf::Timestamp& floor);

std::int64_t ToUnixMicros(const google::protobuf::Timestamp& ts);

// RFC 3339, for logs and CLI output.
std::string FormatTimestamp(const google::protobuf::Timestamp& ts);

} // namespace capsule::util
