#pragma once

#include <chrono>
#include <cstdint>

namespace failover::util {

/*
  Clock helpers shared by stores and log stamps.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

int64_t ToUnixMillis(TimePoint tp);
int64_t NowUnixMillis();

} // namespace failover::util
