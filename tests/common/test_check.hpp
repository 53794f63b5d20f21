#pragma once

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>

// -----------------------------------------------------------------------------
// Minimal test assertion helper
// -----------------------------------------------------------------------------
#define TEST_CHECK(expr)                                                     \
    do {                                                                     \
        if (!(expr)) {                                                       \
            std::cerr << "[TEST FAILED] " << #expr                            \
                      << " at " << __FILE__ << ":" << __LINE__ << std::endl; \
            std::abort();                                                    \
        }                                                                    \
    } while (0)


namespace flowline::test {

// Polls pred until it holds or timeout expires. Returns the last result.
template<class Pred>
inline bool wait_until(Pred&& pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return pred();
        }
        std::this_thread::sleep_for(std::chrono::microseconds(100));
    }
    return true;
}

} // namespace flowline::test
