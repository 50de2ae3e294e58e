#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/timestamp.pb.h"

namespace fieldwake::util {

/*
  Time utilities. Components that need "now" take a NowFn so tests can pin
  the clock; production code passes util::Now.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn     = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Millisecond timestamp to protobuf; zero stays unset (epoch).
google::protobuf::Timestamp MillisToProto(uint64_t ms);

} // namespace fieldwake::util
