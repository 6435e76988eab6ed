#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/duration.pb.h"

namespace hosting::util {

/*
  Time utilities. Single place to control the clock source.

  Expiry and timeouts use the monotonic clock so wall clock jumps never
  resurrect or prematurely expire redirect entries.
*/

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// Injected by tests that need to move time forward.
using ClockFn = std::function<TimePoint()>;

TimePoint Now();

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d);
google::protobuf::Duration ToProto(std::chrono::milliseconds d);

uint64_t ToMillis(Clock::duration d);

} // namespace hosting::util
