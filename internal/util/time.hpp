#pragma once

#include <chrono>
#include <cstdint>

namespace taskgate::util {

/*
  Time utilities, single place to control clock source later.

  Task instants travel as whole seconds since the epoch.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t   ToUnixSeconds(TimePoint tp);
TimePoint FromUnixSeconds(int64_t seconds);

uint64_t ToUnixMillis(TimePoint tp);

} // namespace taskgate::util
