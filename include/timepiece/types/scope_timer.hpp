#ifndef TIMEPIECE_SCOPE_TIMER_HPP
#define TIMEPIECE_SCOPE_TIMER_HPP

/**
 * @file scope_timer.hpp
 * @brief Tree of named timers measuring enter/exit brackets.
 */

#include <cstddef>
#include <cstdio>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../platform.hpp"
#include "config.hpp"
#include "enums.hpp"
#include "interval_history.hpp"

namespace timepiece {

/**
 * @brief Named, tree-structured interval recorder.
 *
 * Each enter()/exit() pair records one interval in the timer's history.
 * Named children are created on first request and cached, so the same
 * child collects one sample per iteration when used inside a loop.
 *
 * The root owns its children (and they own theirs); the parent link is a
 * plain non-owning pointer. Timers are neither copyable nor movable because
 * children keep the address of their parent.
 *
 * Not thread-safe: a node must only be used from one thread at a time. Use
 * a distinct child per thread for concurrent measurement.
 *
 * @code
 * timepiece::ScopeTimer root("root");
 * {
 *     timepiece::Scope r(root);
 *     for (int i = 0; i < 3; ++i) {
 *         timepiece::Scope t(root.get_or_create_child("task1", 5));
 *         work();
 *     }
 * }
 * timepiece::print(root);
 * @endcode
 */
class ScopeTimer {
public:
    /**
     * @brief Forward range over the ancestors of a timer, nearest first.
     *
     * Walks parent links lazily; nothing is collected up front.
     */
    class AncestorRange {
    public:
        class iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = ScopeTimer;
            using difference_type = std::ptrdiff_t;
            using pointer = const ScopeTimer*;
            using reference = const ScopeTimer&;

            explicit iterator(const ScopeTimer* node = nullptr) : node_(node) {}

            reference operator*() const { return *node_; }
            pointer operator->() const { return node_; }

            iterator& operator++() {
                node_ = node_->parent();
                return *this;
            }

            iterator operator++(int) {
                iterator prev = *this;
                ++*this;
                return prev;
            }

            bool operator==(const iterator& other) const { return node_ == other.node_; }
            bool operator!=(const iterator& other) const { return node_ != other.node_; }

        private:
            const ScopeTimer* node_;
        };

        explicit AncestorRange(const ScopeTimer* first) : first_(first) {}

        iterator begin() const { return iterator(first_); }
        iterator end() const { return iterator(); }
        bool empty() const { return first_ == nullptr; }

    private:
        const ScopeTimer* first_;
    };

    /**
     * @brief Create a root timer.
     * @param name Non-empty timer name
     * @param capacity Number of most recent intervals kept (must be > 0)
     * @throws std::invalid_argument on an empty name or non-positive capacity
     */
    explicit ScopeTimer(std::string name, int capacity = TIMEPIECE_DEFAULT_CAPACITY)
        : ScopeTimer(std::move(name), capacity, nullptr) {}

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;
    ScopeTimer(ScopeTimer&&) = delete;
    ScopeTimer& operator=(ScopeTimer&&) = delete;

    /**
     * @brief Return the child called @p name, creating it if needed.
     *
     * A new child gets this timer's capacity.
     */
    ScopeTimer& get_or_create_child(const std::string& name) {
        return get_or_create_child(name, (int)history_.capacity());
    }

    /**
     * @brief Return the child called @p name, creating it with @p capacity if needed.
     *
     * @p capacity only applies when the child is created; an existing child
     * is returned unchanged.
     */
    ScopeTimer& get_or_create_child(const std::string& name, int capacity) {
        auto it = index_.find(name);
        if (it != index_.end()) {
            return *it->second;
        }
        std::unique_ptr<ScopeTimer> child(new ScopeTimer(name, capacity, this));
        ScopeTimer* raw = child.get();
        children_.push_back(std::move(child));
        index_.emplace(name, raw);
        return *raw;
    }

    /// Existing child called @p name, or nullptr. Never creates.
    ScopeTimer* find_child(const std::string& name) {
        auto it = index_.find(name);
        return it != index_.end() ? it->second : nullptr;
    }

    const ScopeTimer* find_child(const std::string& name) const {
        auto it = index_.find(name);
        return it != index_.end() ? it->second : nullptr;
    }

    /**
     * @brief Open a measurement bracket at the current time.
     *
     * Entering an already active timer overwrites the start time, losing the
     * first bracket's measurement, unless Config::strict_reentry is set.
     *
     * @return *this, for fluent nesting
     * @throws std::logic_error on re-entry when Config::strict_reentry is set
     */
    ScopeTimer& enter() {
        return enter(timepiece::now());
    }

    ScopeTimer& enter(TimePoint t) {
        if (active_start_ && get_config().strict_reentry) {
            throw std::logic_error("timepiece: timer '" + qualified_name() + "' entered while already active");
        }
        active_start_ = t;
        return *this;
    }

    /**
     * @brief Close the bracket and record its duration.
     *
     * Exiting a timer that is not active records nothing. Never throws, so
     * it is safe to call from destructors.
     */
    void exit() noexcept {
        exit(timepiece::now());
    }

    void exit(TimePoint t) noexcept {
        if (!active_start_) {
            if (get_config().warn_on_misuse) {
                std::fprintf(stderr, "timepiece: Warning: exit() on inactive timer '%s'\n", name_.c_str());
            }
            return;
        }
        history_.append(seconds_between(*active_start_, t));
        active_start_.reset();
    }

    bool is_active() const { return active_start_.has_value(); }

    /// Ancestors from the immediate parent up to the root. Empty for the root.
    AncestorRange ancestors() const {
        return AncestorRange(parent_);
    }

    /// Number of ancestors; the root has depth 0.
    int depth() const {
        int d = 0;
        for (auto it = ancestors().begin(); it != ancestors().end(); ++it) {
            ++d;
        }
        return d;
    }

    /// Dot-joined names from the root down to this timer, e.g. "root.task1.sub".
    std::string qualified_name() const {
        std::vector<const std::string*> path;
        path.push_back(&name_);
        for (const ScopeTimer& a : ancestors()) {
            path.push_back(&a.name_);
        }
        std::string out;
        for (auto it = path.rbegin(); it != path.rend(); ++it) {
            if (!out.empty()) out += '.';
            out += **it;
        }
        return out;
    }

    const std::string& name() const { return name_; }
    const ScopeTimer* parent() const { return parent_; }
    ScopeTimer* parent() { return parent_; }
    bool is_root() const { return parent_ == nullptr; }

    /// Children in creation order.
    const std::vector<std::unique_ptr<ScopeTimer>>& children() const { return children_; }

    const IntervalHistory& history() const { return history_; }
    IntervalHistory& history() { return history_; }

    ClockKind kind() const { return kind_; }

    /// Indented multi-line representation of this subtree, see render.hpp.
    inline std::string render() const;

private:
    ScopeTimer(std::string name, int capacity, ScopeTimer* parent)
        : name_(checked_name(std::move(name))),
          history_(capacity),
          parent_(parent) {}

    static std::string checked_name(std::string name) {
        if (name.empty()) {
            throw std::invalid_argument("timepiece: timer name must not be empty");
        }
        return name;
    }

    std::string name_;
    IntervalHistory history_;
    ScopeTimer* parent_;                                ///< Non-owning; null for the root
    std::vector<std::unique_ptr<ScopeTimer>> children_; ///< Owned, in creation order
    std::map<std::string, ScopeTimer*> index_;          ///< Name lookup into children_
    std::optional<TimePoint> active_start_;             ///< Set only while a bracket is open
    ClockKind kind_ = ClockKind::StopWatch;
};

} // namespace timepiece

#endif // TIMEPIECE_SCOPE_TIMER_HPP
