#pragma once

#include <chrono>
#include <cstdint>

namespace workbundle::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

uint64_t NowUnixMillis();

} // namespace workbundle::util
