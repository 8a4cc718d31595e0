#ifndef TIMEPIECE_MACROS_HPP
#define TIMEPIECE_MACROS_HPP

/**
 * @file macros.hpp
 * @brief TIMEPIECE_* scope macros
 */

#include "platform.hpp"
#include "types/scope.hpp"

#define TIMEPIECE_CONCAT_INNER(a, b) a##b
#define TIMEPIECE_CONCAT(a, b) TIMEPIECE_CONCAT_INNER(a, b)

// __LINE__ alone collides when two scope macros share a line
#ifdef __COUNTER__
#define TIMEPIECE_UNIQUE_NAME(prefix) TIMEPIECE_CONCAT(prefix, __COUNTER__)
#else
#define TIMEPIECE_UNIQUE_NAME(prefix) TIMEPIECE_CONCAT(prefix, __LINE__)
#endif

#if TIMEPIECE_ENABLED

/**
 * @def TIMEPIECE_SCOPE(timer)
 * @brief Measure the rest of the enclosing block on @p timer.
 *
 * Example:
 * @code
 * void load(timepiece::ScopeTimer& t) {
 *     TIMEPIECE_SCOPE(t);
 *     // ...
 * }
 * @endcode
 */
#define TIMEPIECE_SCOPE(timer) \
    ::timepiece::Scope TIMEPIECE_UNIQUE_NAME(_timepiece_scope_)(timer)

/**
 * @def TIMEPIECE_CHILD_SCOPE(parent, name)
 * @brief Measure the rest of the enclosing block on the child @p name of @p parent.
 *
 * The child is created on first use and reused afterwards, so a loop body
 * wrapped in this macro collects one sample per iteration.
 */
#define TIMEPIECE_CHILD_SCOPE(parent, name) \
    ::timepiece::Scope TIMEPIECE_UNIQUE_NAME(_timepiece_scope_)((parent).get_or_create_child(name))

#else

// Disabled: arguments are not evaluated, so no child is ever created
#define TIMEPIECE_SCOPE(timer) ((void)sizeof(timer))
#define TIMEPIECE_CHILD_SCOPE(parent, name) ((void)sizeof((parent).get_or_create_child(name)))

#endif // TIMEPIECE_ENABLED

#endif // TIMEPIECE_MACROS_HPP
