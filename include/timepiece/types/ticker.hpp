#ifndef TIMEPIECE_TICKER_HPP
#define TIMEPIECE_TICKER_HPP

/**
 * @file ticker.hpp
 * @brief Interval recorder for repeatedly occurring events.
 */

#include <optional>
#include <string>

#include "../platform.hpp"
#include "enums.hpp"
#include "interval_history.hpp"

namespace timepiece {

/**
 * @brief Measures the time between successive calls to mark().
 *
 * The first mark only sets the baseline; every later mark records exactly
 * one interval. A Ticker is always armed and has no stop operation.
 *
 * Not thread-safe: one Ticker must only be marked from one thread at a time.
 *
 * @code
 * timepiece::Ticker ticker(5);
 * for (int i = 0; i < 10; ++i) {
 *     ticker.mark();
 *     do_frame();
 * }
 * timepiece::print(ticker);
 * // <Ticker intervals=[0.0899, 0.0632, 0.0543, 0.0713, 0.0681] min=0.0543 mean=0.0694 max=0.0899>
 * @endcode
 */
class Ticker {
public:
    /**
     * @param capacity Number of most recent intervals kept (must be > 0)
     * @throws std::invalid_argument if capacity is not positive
     */
    explicit Ticker(int capacity = TIMEPIECE_DEFAULT_CAPACITY)
        : history_(capacity) {}

    /// Register an event at the current monotonic time.
    void mark() {
        mark(timepiece::now());
    }

    /// Register an event at @p t.
    void mark(TimePoint t) {
        if (last_mark_) {
            history_.append(seconds_between(*last_mark_, t));
        }
        last_mark_ = t;
    }

    /// Forget the last mark so the next one starts a new baseline. History is kept.
    void reset() {
        last_mark_.reset();
    }

    bool has_baseline() const { return last_mark_.has_value(); }

    const IntervalHistory& history() const { return history_; }
    IntervalHistory& history() { return history_; }

    ClockKind kind() const { return kind_; }

    /// Single-line representation, see render.hpp.
    inline std::string render() const;

private:
    IntervalHistory history_;
    std::optional<TimePoint> last_mark_;
    ClockKind kind_ = ClockKind::Ticker;
};

} // namespace timepiece

#endif // TIMEPIECE_TICKER_HPP
