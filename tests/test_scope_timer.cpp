/**
 * @file test_scope_timer.cpp
 * @brief Tests for the timer tree, brackets and the Scope guard.
 */

#include <timepiece/timepiece.hpp>
#include "test_framework.hpp"
#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

static timepiece::TimePoint at_ms(int ms) {
    return timepiece::TimePoint{} + std::chrono::milliseconds(ms);
}

/**
 * @brief Redirects stderr into a temporary file for its lifetime.
 */
struct StderrCapture {
    FILE* file = std::tmpfile();
    int saved = -1;

    StderrCapture() {
        std::fflush(stderr);
        if (file) {
            saved = dup(fileno(stderr));
            dup2(fileno(file), fileno(stderr));
        }
    }

    ~StderrCapture() {
        restore();
        if (file) std::fclose(file);
    }

    void restore() {
        if (saved >= 0) {
            std::fflush(stderr);
            dup2(saved, fileno(stderr));
            close(saved);
            saved = -1;
        }
    }

    std::string text() {
        restore();
        std::string content;
        if (!file) return content;
        std::rewind(file);
        char buf[256];
        size_t n;
        while ((n = std::fread(buf, 1, sizeof(buf), file)) > 0) {
            content.append(buf, n);
        }
        return content;
    }
};

/**
 * @brief Restores the global config flags touched by a test.
 */
struct ConfigRestore {
    bool strict = timepiece::config.strict_reentry;
    bool warn = timepiece::config.warn_on_misuse;
    ~ConfigRestore() {
        timepiece::config.strict_reentry = strict;
        timepiece::config.warn_on_misuse = warn;
    }
};

TEST(child_is_cached_by_name) {
    timepiece::ScopeTimer root("root", 10);
    timepiece::ScopeTimer& x1 = root.get_or_create_child("x");
    timepiece::ScopeTimer& x2 = root.get_or_create_child("x");
    timepiece::ScopeTimer& y = root.get_or_create_child("y");
    TEST_ASSERT(&x1 == &x2, "Same name returns the same node");
    TEST_ASSERT(&x1 != &y, "Different names return distinct nodes");
    TEST_ASSERT(x1.parent() == &root, "x parent is root");
    TEST_ASSERT(y.parent() == &root, "y parent is root");
    TEST_ASSERT_EQ(root.children().size(), (size_t)2, "Two children");
}

TEST(children_keep_creation_order) {
    timepiece::ScopeTimer root("root");
    root.get_or_create_child("zeta");
    root.get_or_create_child("alpha");
    root.get_or_create_child("mid");
    root.get_or_create_child("alpha");
    const auto& c = root.children();
    TEST_ASSERT_EQ(c.size(), (size_t)3, "No duplicate");
    TEST_ASSERT_STR_EQ(c[0]->name(), "zeta", "First created");
    TEST_ASSERT_STR_EQ(c[1]->name(), "alpha", "Second created");
    TEST_ASSERT_STR_EQ(c[2]->name(), "mid", "Third created");
}

TEST(child_capacity_inherited_at_creation) {
    timepiece::ScopeTimer root("root", 7);
    TEST_ASSERT_EQ(root.get_or_create_child("a").history().capacity(), (size_t)7, "Inherits parent capacity");
    TEST_ASSERT_EQ(root.get_or_create_child("b", 3).history().capacity(), (size_t)3, "Explicit capacity");
    TEST_ASSERT_EQ(root.get_or_create_child("b", 9).history().capacity(), (size_t)3, "Existing child unchanged");
    timepiece::ScopeTimer& b = root.get_or_create_child("b");
    TEST_ASSERT_EQ(b.get_or_create_child("c").history().capacity(), (size_t)3, "Grandchild inherits from b");
}

TEST(find_child_never_creates) {
    timepiece::ScopeTimer root("root");
    TEST_ASSERT(root.find_child("x") == nullptr, "Missing child");
    TEST_ASSERT(root.children().empty(), "Lookup did not create");
    timepiece::ScopeTimer& x = root.get_or_create_child("x");
    TEST_ASSERT(root.find_child("x") == &x, "Existing child found");
    const timepiece::ScopeTimer& croot = root;
    TEST_ASSERT(croot.find_child("x") == &x, "Const lookup");
}

TEST(depth_and_qualified_name) {
    timepiece::ScopeTimer root("root");
    timepiece::ScopeTimer& a = root.get_or_create_child("a");
    timepiece::ScopeTimer& b = a.get_or_create_child("b");
    TEST_ASSERT_EQ(root.depth(), 0, "Root depth");
    TEST_ASSERT_EQ(a.depth(), 1, "a depth");
    TEST_ASSERT_EQ(b.depth(), 2, "b depth");
    TEST_ASSERT_STR_EQ(root.qualified_name(), "root", "Root name");
    TEST_ASSERT_STR_EQ(b.qualified_name(), "root.a.b", "Dot-joined path");
    TEST_ASSERT(root.is_root(), "root is root");
    TEST_ASSERT(!b.is_root(), "b is not root");
}

TEST(ancestors_walk_to_root) {
    timepiece::ScopeTimer root("root");
    timepiece::ScopeTimer& b = root.get_or_create_child("a").get_or_create_child("b");
    std::vector<std::string> names;
    for (const timepiece::ScopeTimer& p : b.ancestors()) {
        names.push_back(p.name());
    }
    TEST_ASSERT_EQ(names.size(), (size_t)2, "Two ancestors");
    TEST_ASSERT_STR_EQ(names[0], "a", "Immediate parent first");
    TEST_ASSERT_STR_EQ(names[1], "root", "Root last");
    TEST_ASSERT(root.ancestors().empty(), "Root has no ancestors");
    TEST_ASSERT(root.ancestors().begin() == root.ancestors().end(), "Empty range");
}

TEST(bracket_records_one_sample) {
    timepiece::ScopeTimer t("t", 5);
    TEST_ASSERT(!t.is_active(), "Idle initially");
    timepiece::ScopeTimer& same = t.enter(at_ms(0));
    TEST_ASSERT(&same == &t, "enter() returns the timer");
    TEST_ASSERT(t.is_active(), "Active inside bracket");
    t.exit(at_ms(250));
    TEST_ASSERT(!t.is_active(), "Idle after exit");
    TEST_ASSERT_EQ(t.history().size(), (size_t)1, "One sample");
    TEST_ASSERT_NEAR(t.history().at(0), 0.25, 1e-12, "Bracket duration");
}

TEST(repeated_brackets_accumulate) {
    timepiece::ScopeTimer t("t", 5);
    for (int i = 0; i < 4; ++i) {
        t.enter();
        t.exit();
    }
    TEST_ASSERT_EQ(t.history().size(), (size_t)4, "N brackets give N samples");
    TEST_ASSERT(t.history().min() >= 0.0, "Samples are non-negative");
}

TEST(reentry_overwrites_start) {
    ConfigRestore restore;
    timepiece::config.strict_reentry = false;
    timepiece::ScopeTimer t("t");
    t.enter(at_ms(0));
    t.enter(at_ms(100));
    t.exit(at_ms(250));
    TEST_ASSERT_EQ(t.history().size(), (size_t)1, "One sample for two enters");
    TEST_ASSERT_NEAR(t.history().at(0), 0.15, 1e-12, "Last enter wins");
}

TEST(strict_reentry_throws) {
    ConfigRestore restore;
    timepiece::config.strict_reentry = true;
    timepiece::ScopeTimer t("t");
    t.enter(at_ms(0));
    TEST_ASSERT_THROWS(t.enter(at_ms(10)), std::logic_error, "Double entry rejected");
    t.exit(at_ms(30));
    TEST_ASSERT_NEAR(t.history().at(0), 0.03, 1e-12, "Original start kept");
}

TEST(exit_without_enter_is_tolerated) {
    ConfigRestore restore;
    timepiece::config.warn_on_misuse = false;
    timepiece::ScopeTimer t("t");
    t.exit();
    TEST_ASSERT(t.history().empty(), "Nothing recorded");
    t.enter(at_ms(0));
    t.exit(at_ms(5));
    t.exit(at_ms(9));
    TEST_ASSERT_EQ(t.history().size(), (size_t)1, "Second exit records nothing");
}

TEST(exit_without_enter_warns_on_stderr) {
    ConfigRestore restore;
    timepiece::config.warn_on_misuse = true;
    timepiece::ScopeTimer root("root");
    timepiece::ScopeTimer& t = root.get_or_create_child("t");
    StderrCapture capture;
    TEST_ASSERT(capture.file != nullptr, "tmpfile available");
    t.exit();
    TEST_ASSERT_STR_EQ(capture.text(), "timepiece: Warning: exit() on inactive timer 't'\n",
                       "One warning line naming the timer");
    TEST_ASSERT(t.history().empty(), "Nothing recorded");
}

TEST(exit_without_enter_silent_when_disabled) {
    ConfigRestore restore;
    timepiece::config.warn_on_misuse = false;
    timepiece::ScopeTimer t("t");
    StderrCapture capture;
    TEST_ASSERT(capture.file != nullptr, "tmpfile available");
    t.exit();
    TEST_ASSERT_STR_EQ(capture.text(), "", "No diagnostics");
}

TEST(scope_guard_records_on_normal_exit) {
    timepiece::ScopeTimer t("t");
    {
        timepiece::Scope s(t);
        TEST_ASSERT(t.is_active(), "Guard opened the bracket");
        TEST_ASSERT(&*s == &t, "Guard exposes its timer");
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    TEST_ASSERT(!t.is_active(), "Guard closed the bracket");
    TEST_ASSERT_EQ(t.history().size(), (size_t)1, "One sample");
    TEST_ASSERT(t.history().at(0) >= 0.002, "Sleep measured");
}

TEST(scope_guard_records_on_exception) {
    timepiece::ScopeTimer t("t");
    bool caught = false;
    try {
        timepiece::Scope s(t);
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
        caught = true;
    }
    TEST_ASSERT(caught, "Exception propagated through the guard");
    TEST_ASSERT_EQ(t.history().size(), (size_t)1, "Sample recorded during unwinding");
    TEST_ASSERT(!t.is_active(), "Bracket closed");
}

static int early_return(timepiece::ScopeTimer& t, bool early) {
    TIMEPIECE_SCOPE(t);
    if (early) {
        return 1;
    }
    return 2;
}

TEST(scope_macro_records_on_early_return) {
    timepiece::ScopeTimer t("t");
    early_return(t, true);
    early_return(t, false);
    TEST_ASSERT_EQ(t.history().size(), (size_t)2, "One sample per call");
}

TEST(child_scope_macro_in_loop) {
    timepiece::ScopeTimer root("root", 10);
    {
        TIMEPIECE_SCOPE(root);
        for (int i = 0; i < 3; ++i) {
            TIMEPIECE_CHILD_SCOPE(root, "iteration");
        }
    }
    timepiece::ScopeTimer* it = root.find_child("iteration");
    TEST_ASSERT(it != nullptr, "Child created by macro");
    TEST_ASSERT_EQ(it->history().size(), (size_t)3, "One sample per iteration");
    TEST_ASSERT_EQ(root.history().size(), (size_t)1, "Outer bracket recorded once");
}

TEST(scope_macros_share_a_line) {
    timepiece::ScopeTimer root("root", 10);
    {
        TIMEPIECE_SCOPE(root); TIMEPIECE_CHILD_SCOPE(root, "inner");
        TEST_ASSERT(root.is_active(), "Outer bracket open");
        TEST_ASSERT(root.find_child("inner")->is_active(), "Inner bracket open");
    }
    TEST_ASSERT_EQ(root.history().size(), (size_t)1, "Outer recorded");
    TEST_ASSERT_EQ(root.find_child("inner")->history().size(), (size_t)1, "Inner recorded");
}

TEST(nested_end_to_end) {
    timepiece::ScopeTimer root("root", 10);
    {
        timepiece::Scope r(root);
    }
    timepiece::ScopeTimer& task1 = root.get_or_create_child("task1", 5);
    for (int i = 0; i < 3; ++i) {
        timepiece::Scope t(task1);
    }
    {
        timepiece::Scope s(task1.get_or_create_child("sub", 10));
    }
    timepiece::ScopeTimer* sub = task1.find_child("sub");
    TEST_ASSERT(sub != nullptr, "sub exists");
    TEST_ASSERT_EQ(root.history().size(), (size_t)1, "root history");
    TEST_ASSERT_EQ(task1.history().size(), (size_t)3, "task1 history");
    TEST_ASSERT_EQ(sub->history().size(), (size_t)1, "sub history");
    TEST_ASSERT_STR_EQ(task1.qualified_name(), "root.task1", "task1 path");
    TEST_ASSERT_STR_EQ(sub->qualified_name(), "root.task1.sub", "sub path");
}

TEST(invalid_construction_rejected) {
    TEST_ASSERT_THROWS(timepiece::ScopeTimer("root", 0), std::invalid_argument, "capacity 0");
    TEST_ASSERT_THROWS(timepiece::ScopeTimer("", 5), std::invalid_argument, "empty name");
    timepiece::ScopeTimer root("root");
    TEST_ASSERT_THROWS(root.get_or_create_child("c", 0), std::invalid_argument, "child capacity 0");
    TEST_ASSERT_THROWS(root.get_or_create_child(""), std::invalid_argument, "empty child name");
    TEST_ASSERT(root.children().empty(), "Failed creation leaves no child");
}

TEST(scope_timer_kind_tag) {
    timepiece::ScopeTimer root("root");
    TEST_ASSERT(root.kind() == timepiece::ClockKind::StopWatch, "StopWatch tag");
}

int main(int argc, char** argv) {
    return run_tests(argc, argv);
}
