#ifndef TIMEPIECE_STATS_HPP
#define TIMEPIECE_STATS_HPP

/**
 * @file stats.hpp
 * @brief Flat statistics table over a timer tree.
 */

#include <cstdio>
#include <string>
#include <vector>

#include "../types/config.hpp"
#include "../types/scope_timer.hpp"
#include "../types/timer_stats.hpp"

namespace timepiece {

namespace stats {

/**
 * @brief Format a duration in human-readable units.
 *
 * @param seconds Duration in seconds
 * @return Formatted string (e.g., "1.23 ms", "456.00 µs", "2.500 s")
 */
inline std::string format_duration_str(double seconds) {
    const char* fmt = "%.3f s";
    double value = seconds;
    if (seconds < 1e-6) {
        fmt = "%.0f ns";
        value = seconds * 1e9;
    } else if (seconds < 1e-3) {
        fmt = "%.2f µs";
        value = seconds * 1e6;
    } else if (seconds < 1.0) {
        fmt = "%.2f ms";
        value = seconds * 1e3;
    }
    int n = std::snprintf(nullptr, 0, fmt, value);
    if (n <= 0) return std::string();
    std::string out((size_t)n + 1, '\0');
    std::snprintf(&out[0], out.size(), fmt, value);
    out.resize((size_t)n);
    return out;
}

inline TimerStats snapshot(const ScopeTimer& t, int depth) {
    const IntervalHistory& h = t.history();
    TimerStats s;
    s.qualified_name = t.qualified_name();
    s.name = t.name();
    s.depth = depth;
    s.count = h.size();
    s.total = h.sum();
    s.min = h.min();
    s.mean = h.mean();
    s.max = h.max();
    s.frequency = h.frequency();
    return s;
}

inline void collect_into(const ScopeTimer& t, int depth, std::vector<TimerStats>& out) {
    out.push_back(snapshot(t, depth));
    for (const auto& child : t.children()) {
        collect_into(*child, depth + 1, out);
    }
}

/**
 * @brief Statistics of @p root and every descendant, in pre-order.
 *
 * Children appear in creation order right after their parent.
 */
inline std::vector<TimerStats> collect(const ScopeTimer& root) {
    std::vector<TimerStats> result;
    collect_into(root, root.depth(), result);
    return result;
}

/**
 * @brief Print a statistics table for @p root and its subtree.
 *
 * Names are indented two spaces per level below @p root. Timers without
 * samples show "-" in the time columns.
 *
 * @param out Output stream (nullptr = Config::out)
 */
inline void print_summary(const ScopeTimer& root, FILE* out = nullptr) {
    const Config& cfg = get_config();
    if (!out) out = cfg.out ? cfg.out : stdout;

    auto rows = collect(root);
    const int width = cfg.summary.name_width > 0 ? cfg.summary.name_width : 40;
    const int base_depth = root.depth();

    std::fprintf(out, "\n");
    std::fprintf(out, "================================================================================\n");
    std::fprintf(out, " Timing Summary: %s\n", root.qualified_name().c_str());
    std::fprintf(out, "================================================================================\n");
    std::fprintf(out, "%-*s %8s %12s %12s %12s %12s", width, "Timer", "Count", "Total", "Mean", "Min", "Max");
    if (cfg.summary.print_frequency) {
        std::fprintf(out, " %12s", "Freq");
    }
    std::fprintf(out, "\n");
    std::fprintf(out, "--------------------------------------------------------------------------------\n");

    for (const auto& r : rows) {
        std::string label = std::string((size_t)(r.depth - base_depth) * 2, ' ') + r.name;
        std::fprintf(out, "%-*s %8lu", width, label.c_str(), (unsigned long)r.count);
        if (r.count == 0) {
            std::fprintf(out, " %12s %12s %12s %12s", "-", "-", "-", "-");
            if (cfg.summary.print_frequency) {
                std::fprintf(out, " %12s", "-");
            }
        } else {
            std::fprintf(out, " %12s %12s %12s %12s",
                         format_duration_str(r.total).c_str(),
                         format_duration_str(r.mean).c_str(),
                         format_duration_str(r.min).c_str(),
                         format_duration_str(r.max).c_str());
            if (cfg.summary.print_frequency) {
                char freq[32];
                std::snprintf(freq, sizeof(freq), "%.2f Hz", r.frequency);
                std::fprintf(out, " %12s", freq);
            }
        }
        std::fprintf(out, "\n");
    }

    std::fprintf(out, "================================================================================\n\n");
}

} // namespace stats

} // namespace timepiece

#endif // TIMEPIECE_STATS_HPP
