#ifndef TIMEPIECE_PLATFORM_HPP
#define TIMEPIECE_PLATFORM_HPP

/**
 * @file platform.hpp
 * @brief Build-time defines and the monotonic clock.
 *
 * Build-time defines:
 *   TIMEPIECE_ENABLED             (default 1)   // 0 turns Scope and the scope macros into no-ops
 *   TIMEPIECE_DEFAULT_CAPACITY    (default 10)  // samples kept when no capacity is given
 *   TIMEPIECE_MAX_REPR_INTERVALS  (default 5)   // samples listed by render()
 */

#include <chrono>

#ifndef TIMEPIECE_ENABLED
#define TIMEPIECE_ENABLED 1
#endif

#ifndef TIMEPIECE_DEFAULT_CAPACITY
#define TIMEPIECE_DEFAULT_CAPACITY 10
#endif

#ifndef TIMEPIECE_MAX_REPR_INTERVALS
#define TIMEPIECE_MAX_REPR_INTERVALS 5
#endif

// Version information
#define TIMEPIECE_VERSION "0.3.0"
#define TIMEPIECE_VERSION_MAJOR 0
#define TIMEPIECE_VERSION_MINOR 3
#define TIMEPIECE_VERSION_PATCH 0

namespace timepiece {

/// Monotonic clock used for every measurement. Wall-clock time is never read.
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

inline TimePoint now() {
    return Clock::now();
}

/**
 * @brief Elapsed time from @p from to @p to in seconds.
 */
inline double seconds_between(TimePoint from, TimePoint to) {
    return std::chrono::duration<double>(to - from).count();
}

} // namespace timepiece

#endif // TIMEPIECE_PLATFORM_HPP
