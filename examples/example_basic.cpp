/**
 * @file example_basic.cpp
 * @brief Nested and repeated scope timing with an indented dump.
 */

#include <timepiece/timepiece.hpp>
#include <chrono>
#include <thread>

static void sleep_ms(int ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

int main() {
    timepiece::ScopeTimer root("root");
    {
        TIMEPIECE_SCOPE(root);

        timepiece::ScopeTimer& task1 = root.get_or_create_child("task1", 5);
        for (int i = 0; i < 3; ++i) {
            timepiece::Scope t(task1);
            sleep_ms(10);
            {
                TIMEPIECE_CHILD_SCOPE(task1, "subtask1_1");
                sleep_ms(3);
            }
            {
                TIMEPIECE_CHILD_SCOPE(task1, "subtask1_2");
                sleep_ms(7);
            }
        }

        TIMEPIECE_CHILD_SCOPE(root, "task2");
        sleep_ms(17);
    }

    timepiece::print(root);
    return 0;
}
