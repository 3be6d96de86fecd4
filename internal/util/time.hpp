#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace airspace::util {

/*
  Time utilities — single place to control clock source later.

  All persisted timestamps have microsecond resolution.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = std::chrono::time_point<Clock, std::chrono::microseconds>;

TimePoint Now();

TimePoint FromUnixMicros(int64_t micros);
int64_t   ToUnixMicros(TimePoint tp);

// 2024-01-01T00:00:00.000000Z
std::string FormatRfc3339(TimePoint tp);

} // namespace airspace::util
