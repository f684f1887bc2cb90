#pragma once

#include <chrono>

namespace halyard {

/// The main clock is system_clock as it is the only one guaranteed to provide conversions to Unix epoch time.
/// Elapsed request times are measured with the monotonic steady_clock.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;

using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

}  // namespace halyard
