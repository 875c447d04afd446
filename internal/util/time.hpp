#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace codeintel::util {

/*
  Time utilities; the single place that reads the clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
uint64_t  ToUnixMicros(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// 2024-05-01T12:30:45.123456+00:00
std::string FormatIso8601Utc(TimePoint tp);

// 20240501_123045_123456Z (filesystem friendly, sorts chronologically)
std::string FormatCompactUtc(TimePoint tp);

} // namespace codeintel::util
