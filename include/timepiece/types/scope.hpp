#ifndef TIMEPIECE_SCOPE_HPP
#define TIMEPIECE_SCOPE_HPP

/**
 * @file scope.hpp
 * @brief RAII measurement bracket for a ScopeTimer.
 */

#include "../platform.hpp"
#include "scope_timer.hpp"

namespace timepiece {

/**
 * @brief Scope guard that records one interval on a ScopeTimer.
 *
 * Enters the timer on construction and exits it on destruction, so exactly
 * one sample is recorded however the enclosing block is left (normal
 * completion, early return or exception).
 *
 * Compiles to nothing when TIMEPIECE_ENABLED is 0.
 *
 * @code
 * timepiece::Scope s(root.get_or_create_child("load"));
 * s->get_or_create_child("parse");  // fluent access to the timer
 * @endcode
 */
struct Scope {
    ScopeTimer& timer;  ///< Timer being measured

    /**
     * @brief Open the bracket.
     * @throws std::logic_error when @p t is already active and Config::strict_reentry is set
     */
    explicit Scope(ScopeTimer& t) : timer(t) {
#if TIMEPIECE_ENABLED
        timer.enter();
#endif
    }

    ~Scope() {
#if TIMEPIECE_ENABLED
        timer.exit();
#endif
    }

    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

    ScopeTimer* operator->() const { return &timer; }
    ScopeTimer& operator*() const { return timer; }
};

} // namespace timepiece

#endif // TIMEPIECE_SCOPE_HPP
