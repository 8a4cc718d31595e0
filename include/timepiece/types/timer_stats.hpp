#ifndef TIMEPIECE_TIMER_STATS_HPP
#define TIMEPIECE_TIMER_STATS_HPP

/**
 * @file timer_stats.hpp
 * @brief Flattened statistics row for one timer
 */

#include <cstddef>
#include <string>

namespace timepiece {

/**
 * @brief Statistics snapshot of a single ScopeTimer.
 */
struct TimerStats {
    std::string qualified_name;  ///< Dot-joined path from the root
    std::string name;            ///< Timer name
    int         depth = 0;       ///< Number of ancestors
    size_t      count = 0;       ///< Retained samples
    double      total = 0.0;     ///< Sum of retained samples (s)
    double      min = 0.0;       ///< Shortest retained sample (s)
    double      mean = 0.0;      ///< Mean of retained samples (s)
    double      max = 0.0;       ///< Longest retained sample (s)
    double      frequency = 0.0; ///< 1 / mean (Hz), 0 when mean is 0
};

} // namespace timepiece

#endif // TIMEPIECE_TIMER_STATS_HPP
