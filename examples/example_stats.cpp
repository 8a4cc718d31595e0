/**
 * @file example_stats.cpp
 * @brief Loading an INI config and printing the summary table.
 *
 * Run from the build directory so ../examples/timepiece.ini is found.
 */

#include <timepiece/timepiece.hpp>
#include <chrono>
#include <cstdio>
#include <thread>
#include <vector>

static void parse(timepiece::ScopeTimer& parent) {
    TIMEPIECE_CHILD_SCOPE(parent, "parse");
    std::vector<int> buffer(100000);
    for (size_t i = 0; i < buffer.size(); ++i) {
        buffer[i] = (int)i;
    }
}

static void load(timepiece::ScopeTimer& parent) {
    timepiece::Scope s(parent.get_or_create_child("load"));
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    parse(*s);
}

int main() {
    if (!timepiece::load_config("../examples/timepiece.ini")) {
        std::printf("Using default configuration\n");
    }

    timepiece::ScopeTimer root("pipeline", 50);
    for (int i = 0; i < 25; ++i) {
        TIMEPIECE_SCOPE(root);
        load(root);
        TIMEPIECE_CHILD_SCOPE(root, "store");
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    timepiece::print(root);
    timepiece::stats::print_summary(root);
    return 0;
}
