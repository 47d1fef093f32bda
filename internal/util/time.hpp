#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace lieko::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

// UTC with milliseconds, e.g. 2024-05-01T12:00:00.000Z
std::string ToIso8601(TimePoint tp);
std::string ToIso8601(uint64_t unix_ms);

} // namespace lieko::util
