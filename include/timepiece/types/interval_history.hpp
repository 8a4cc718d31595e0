#ifndef TIMEPIECE_INTERVAL_HISTORY_HPP
#define TIMEPIECE_INTERVAL_HISTORY_HPP

/**
 * @file interval_history.hpp
 * @brief Bounded ring buffer of measured intervals with derived statistics.
 */

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <vector>

#include "../platform.hpp"

namespace timepiece {

/**
 * @brief Fixed-capacity history of elapsed times in seconds.
 *
 * Samples are written into a circular buffer. When the buffer is full the
 * oldest sample is overwritten, so the retained samples are always the most
 * recent min(appended, capacity) values in chronological order.
 *
 * Statistics over an empty history are 0.0 rather than an error: an
 * incomplete history is an expected transient state.
 */
class IntervalHistory {
public:
    /**
     * @brief Create an empty history.
     * @param capacity Maximum number of samples kept (must be > 0)
     * @throws std::invalid_argument if capacity is not positive
     */
    explicit IntervalHistory(int capacity = TIMEPIECE_DEFAULT_CAPACITY)
        : buf_(checked_capacity(capacity)) {}

    /**
     * @brief Append one sample, evicting the oldest when at capacity.
     *
     * Negative values are a caller bug and are stored as given.
     */
    void append(double seconds) {
        buf_[head_] = seconds;
        head_ = (head_ + 1) % buf_.size();
        if (count_ < buf_.size()) {
            ++count_;
        }
    }

    /// Drop all samples; capacity is unchanged.
    void clear() {
        head_ = 0;
        count_ = 0;
    }

    size_t size() const { return count_; }
    size_t capacity() const { return buf_.size(); }
    bool empty() const { return count_ == 0; }

    /**
     * @brief Sample by chronological index (0 = oldest retained).
     * @throws std::out_of_range if i >= size()
     */
    double at(size_t i) const {
        if (i >= count_) {
            throw std::out_of_range("timepiece: IntervalHistory index out of range");
        }
        return buf_[(oldest() + i) % buf_.size()];
    }

    /// Retained samples, oldest first.
    std::vector<double> values() const {
        std::vector<double> out;
        out.reserve(count_);
        for (size_t i = 0; i < count_; ++i) {
            out.push_back(buf_[(oldest() + i) % buf_.size()]);
        }
        return out;
    }

    /// Shortest interval in seconds (0.0 when empty).
    double min() const {
        if (empty()) return 0.0;
        double m = at(0);
        for (size_t i = 1; i < count_; ++i) m = std::min(m, at(i));
        return m;
    }

    /// Longest interval in seconds (0.0 when empty).
    double max() const {
        if (empty()) return 0.0;
        double m = at(0);
        for (size_t i = 1; i < count_; ++i) m = std::max(m, at(i));
        return m;
    }

    /// Total of the retained samples in seconds (0.0 when empty).
    double sum() const {
        double total = 0.0;
        for (size_t i = 0; i < count_; ++i) total += at(i);
        return total;
    }

    /// Mean interval in seconds (0.0 when empty).
    double mean() const {
        return empty() ? 0.0 : sum() / (double)count_;
    }

    /// Mean event frequency in Hertz; 0.0 unless mean() > 0.
    double frequency() const {
        double m = mean();
        return m > 0.0 ? 1.0 / m : 0.0;
    }

private:
    std::vector<double> buf_;   ///< Circular storage, size() == capacity
    size_t head_ = 0;           ///< Next write position
    size_t count_ = 0;          ///< Number of valid samples

    size_t oldest() const {
        return count_ < buf_.size() ? 0 : head_;
    }

    static size_t checked_capacity(int capacity) {
        if (capacity <= 0) {
            throw std::invalid_argument("timepiece: capacity must be positive");
        }
        return (size_t)capacity;
    }
};

} // namespace timepiece

#endif // TIMEPIECE_INTERVAL_HISTORY_HPP
