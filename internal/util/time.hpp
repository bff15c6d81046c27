#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace chainweave::util {

/*
  Time utilities. Every timestamp in the engine comes from Now().
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

uint64_t ToUnixMillis(TimePoint tp);

// Zero when either side is unset.
double ElapsedMillis(TimePoint start, TimePoint end);

} // namespace chainweave::util
