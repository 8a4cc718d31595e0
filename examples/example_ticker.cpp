/**
 * @file example_ticker.cpp
 * @brief Frame-rate style measurement with a Ticker.
 */

#include <timepiece/timepiece.hpp>
#include <chrono>
#include <cstdio>
#include <random>
#include <thread>

int main() {
    timepiece::Ticker ticker(20);
    std::mt19937 rng(42);
    std::uniform_int_distribution<int> jitter(5, 40);

    for (int i = 0; i < 20; ++i) {
        ticker.mark();
        std::this_thread::sleep_for(std::chrono::milliseconds(jitter(rng)));
    }

    timepiece::print(ticker);
    std::printf("mean frequency: %.2f Hz\n", ticker.history().frequency());
    return 0;
}
