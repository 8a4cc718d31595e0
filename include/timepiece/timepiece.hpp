#pragma once
/**
 * @file timepiece.hpp
 * @brief Header-only hierarchical interval timing.
 *
 * Features:
 *  - IntervalHistory: bounded ring buffer of durations with min/mean/max/frequency.
 *  - Ticker: records the time between successive mark() calls.
 *  - ScopeTimer: tree of named timers, one sample per enter()/exit() bracket.
 *  - Scope / TIMEPIECE_SCOPE(): RAII brackets that record on every exit path.
 *  - render()/print(): indented textual dump; stats::print_summary(): flat table.
 *  - Config: output stream and misuse policy, loadable from an INI file.
 *
 * Threading: nothing is synchronized. A Ticker or ScopeTimer node must only
 * be used from one thread at a time; give each thread its own child.
 *
 * Build-time defines: see platform.hpp.
 */

#include "platform.hpp"
#include "namespaces/ini_parser.hpp"
#include "types/enums.hpp"
#include "types/config.hpp"
#include "types/interval_history.hpp"
#include "types/ticker.hpp"
#include "types/scope_timer.hpp"
#include "types/scope.hpp"
#include "types/timer_stats.hpp"
#include "namespaces/render.hpp"
#include "namespaces/stats.hpp"
#include "macros.hpp"
