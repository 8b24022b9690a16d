#ifndef KILN_COMMON_CLOCK_HPP
#define KILN_COMMON_CLOCK_HPP
/**
 * @file Clock.hpp
 * @brief Clock aliases.
 *
 * SteadyTime orders snapshots and drives timeouts; WallTime stamps records
 * that leave the process (job history, alerts, exports).
 */

#include <chrono>

namespace kiln {

using SteadyClock = std::chrono::steady_clock;
using SteadyTime = SteadyClock::time_point;

using WallClock = std::chrono::system_clock;
using WallTime = WallClock::time_point;

} // namespace kiln

#endif // KILN_COMMON_CLOCK_HPP
