#ifndef TIMEPIECE_ENUMS_HPP
#define TIMEPIECE_ENUMS_HPP

/**
 * @file enums.hpp
 * @brief Enum definitions for timepiece
 */

#include <cstdint>

namespace timepiece {

/**
 * @brief Kind of interval recorder, fixed at construction.
 *
 * Selects the type name printed by render(). The names match the ones
 * emitted by earlier releases so existing snapshots keep parsing.
 */
enum class ClockKind : uint8_t {
    Ticker = 0,     ///< Flat repeated-mark recorder
    StopWatch = 1   ///< Tree-structured scope timer
};

inline const char* kind_name(ClockKind kind) {
    switch (kind) {
        case ClockKind::Ticker:    return "Ticker";
        case ClockKind::StopWatch: return "StopWatch";
    }
    return "?";
}

} // namespace timepiece

#endif // TIMEPIECE_ENUMS_HPP
