#pragma once

#include <chrono>

namespace filecast {

/// Alias some types to make it easier to use
/// The main clock is system_clock as it is the only one guaranteed to provide conversions to Unix epoch time.
/// It is not monotonic - transfer progress tracking uses steady_clock instead.
using SysClock = std::chrono::system_clock;
using SysDuration = SysClock::duration;

using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

}  // namespace filecast
