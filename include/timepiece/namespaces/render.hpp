#ifndef TIMEPIECE_RENDER_HPP
#define TIMEPIECE_RENDER_HPP

/**
 * @file render.hpp
 * @brief Textual representation of tickers and timer trees.
 *
 * Format (values with 4 decimals, at most TIMEPIECE_MAX_REPR_INTERVALS
 * intervals listed, oldest first):
 * @code
 * <StopWatch name=root intervals=[0.5000] min=0.5000 mean=0.5000 max=0.5000 children=[
 *     <StopWatch name=task1 intervals=[0.1000, 0.2000] min=0.1000 mean=0.1500 max=0.2000>, 
 *     <StopWatch name=task2>
 * ]>
 * @endcode
 * Timers without samples omit the intervals/min/mean/max fields. Nested
 * timers start on a new line indented by four spaces per level.
 */

#include <cstdio>
#include <string>

#include "../platform.hpp"
#include "../types/config.hpp"
#include "../types/enums.hpp"
#include "../types/interval_history.hpp"
#include "../types/scope_timer.hpp"
#include "../types/ticker.hpp"

namespace timepiece {

namespace render {

/**
 * @brief Format @p seconds with "%.4f", sized to the full result.
 */
inline std::string format_seconds(double seconds) {
    int n = std::snprintf(nullptr, 0, "%.4f", seconds);
    if (n <= 0) return std::string();
    std::string out((size_t)n + 1, '\0');
    std::snprintf(&out[0], out.size(), "%.4f", seconds);
    out.resize((size_t)n);
    return out;
}

inline std::string indent(int depth) {
    return std::string((size_t)depth * 4, ' ');
}

/**
 * @brief Append " intervals=[...] min=.. mean=.. max=.." for a non-empty history.
 */
inline void append_history_fields(std::string& out, const IntervalHistory& h) {
    if (h.empty()) return;

    size_t shown = h.size() < (size_t)TIMEPIECE_MAX_REPR_INTERVALS ? h.size() : (size_t)TIMEPIECE_MAX_REPR_INTERVALS;
    out += " intervals=[";
    for (size_t i = 0; i < shown; ++i) {
        if (i > 0) out += ", ";
        out += format_seconds(h.at(i));
    }
    if (h.size() > shown) {
        out += ", ...";
    }
    out += ']';
    out += " min=" + format_seconds(h.min());
    out += " mean=" + format_seconds(h.mean());
    out += " max=" + format_seconds(h.max());
}

inline void append_timer(std::string& out, const ScopeTimer& t, int depth) {
    std::string ind = indent(depth);
    if (depth > 0) {
        out += '\n';
    }
    out += ind;
    out += '<';
    out += kind_name(t.kind());
    out += " name=";
    out += t.name();
    append_history_fields(out, t.history());

    if (!t.children().empty()) {
        out += " children=[";
        bool first = true;
        for (const auto& child : t.children()) {
            if (!first) out += ", ";
            first = false;
            append_timer(out, *child, depth + 1);
        }
        out += '\n';
        out += ind;
        out += ']';
    }
    out += '>';
}

/**
 * @brief Render @p t and its subtree.
 *
 * A non-root timer is indented according to its own depth in the tree.
 */
inline std::string render_timer(const ScopeTimer& t) {
    std::string out;
    append_timer(out, t, t.depth());
    return out;
}

inline std::string render_ticker(const Ticker& t) {
    std::string out = "<";
    out += kind_name(t.kind());
    append_history_fields(out, t.history());
    out += '>';
    return out;
}

} // namespace render

inline std::string ScopeTimer::render() const {
    return render::render_timer(*this);
}

inline std::string Ticker::render() const {
    return render::render_ticker(*this);
}

/**
 * @brief Write render() and a newline to @p out (nullptr = Config::out).
 */
inline void print(const ScopeTimer& t, FILE* out = nullptr) {
    FILE* dst = out ? out : (get_config().out ? get_config().out : stdout);
    std::fprintf(dst, "%s\n", t.render().c_str());
}

inline void print(const Ticker& t, FILE* out = nullptr) {
    FILE* dst = out ? out : (get_config().out ? get_config().out : stdout);
    std::fprintf(dst, "%s\n", t.render().c_str());
}

} // namespace timepiece

#endif // TIMEPIECE_RENDER_HPP
