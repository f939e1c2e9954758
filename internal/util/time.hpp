#pragma once

#include <chrono>
#include <cstdint>

namespace resource::util {

/*
  Time utilities. Wall clock is only used for cache aging and logs,
  never for staleness decisions.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMillis();

} // namespace resource::util
