#pragma once

#include <chrono>
#include <cstdint>

namespace reconciler::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

std::chrono::milliseconds MillisOr(uint64_t value_ms, std::chrono::milliseconds fallback);

} // namespace reconciler::util
