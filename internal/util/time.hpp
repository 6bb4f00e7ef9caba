#pragma once

#include <chrono>
#include <cstdint>

namespace relay::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// Signed difference end - start in milliseconds.
int64_t MillisBetween(TimePoint start, TimePoint end);

} // namespace relay::util
