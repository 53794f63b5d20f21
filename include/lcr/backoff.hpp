#pragma once

#include <thread>
#include <chrono>
#include <cstddef>
#include <algorithm>

#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__)
    #include <immintrin.h>
#endif

namespace lcr {

namespace system {

// Spin-wait hint: pause on x86, yield on ARM, scheduler yield elsewhere
inline void cpu_relax() noexcept {
#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__)
    _mm_pause();
#elif defined(__aarch64__) || defined(__arm__)
    asm volatile("yield" ::: "memory");
#else
    std::this_thread::yield();
#endif
}

} // namespace system


/**
 * Adaptive backoff loop.
 *
 * Template parameters:
 *   Op:   () -> bool      operation attempted repeatedly until success
 *   Stop: () -> bool      external stop predicate (e.g., deadline reached)
 *
 * Returns:
 *   true  → operation succeeded
 *   false → stop condition activated before success
 */
template <typename Op, typename Stop>
inline bool adaptive_backoff_until(
    Op&& op,
    Stop&& stop,
    std::size_t spin1 = 1000,      // Stage 1: pure CPU spin
    std::size_t spin2 = 5000,      // Stage 2: scheduler hint
    std::chrono::microseconds sleep_time = std::chrono::microseconds(50)
) noexcept
{
    std::size_t spins = 0;

    while (true) {
        // 1. Try the operation
        if (op()) [[likely]]
            return true;
        // 2. Stop condition
        if (stop()) [[unlikely]]
            return false;
        // 3. Adaptive backoff
        if (spins < spin1) {
            lcr::system::cpu_relax();
        }
        else if (spins < spin2) {
            std::this_thread::yield();
        }
        else {
            std::this_thread::sleep_for(sleep_time);
        }

        ++spins;
    }
}


// -----------------------------------------------------------------------------
// adaptive_idle
// -----------------------------------------------------------------------------
// Stateful idle strategy for polling loops that own a parking primitive.
//
// Each call to idle() represents one empty poll:
//   • the first `spins` calls relax the CPU
//   • the next `yields` calls yield the time slice
//   • after that the caller is asked to park for a duration that doubles on
//     every empty poll, from `min_park` up to `max_park`
//
// reset() must be called as soon as the loop finds work again.
// Not thread-safe: one instance per polling thread.
// -----------------------------------------------------------------------------
class adaptive_idle {
public:
    adaptive_idle(std::size_t spins,
                  std::size_t yields,
                  std::chrono::nanoseconds min_park,
                  std::chrono::nanoseconds max_park) noexcept
        : spins_(spins)
        , yields_(yields)
        , min_park_(min_park)
        , max_park_(std::max(min_park, max_park))
        , park_(min_park)
    {}

    inline void reset() noexcept {
        rounds_ = 0;
        park_ = min_park_;
    }

    // Returns zero when the idle round was spent inline, otherwise the duration
    // the caller should block for.
    [[nodiscard]] inline std::chrono::nanoseconds idle() noexcept {
        const std::size_t round = rounds_++;
        if (round < spins_) {
            lcr::system::cpu_relax();
            return std::chrono::nanoseconds::zero();
        }
        if (round < spins_ + yields_) {
            std::this_thread::yield();
            return std::chrono::nanoseconds::zero();
        }
        const auto park = park_;
        park_ = std::min(park_ * 2, max_park_);
        return park;
    }

private:
    std::size_t spins_;
    std::size_t yields_;
    std::chrono::nanoseconds min_park_;
    std::chrono::nanoseconds max_park_;
    std::chrono::nanoseconds park_;
    std::size_t rounds_{0};
};

} // namespace lcr
