#pragma once

#include <atomic>
#include <type_traits>
#include <cstdint>


namespace lcr {
namespace metrics {
namespace atomic {

// ---------------------------------------------------------------------------
// counter - monotonically increasing, relaxed, cache-line isolated.
//
// Written from any thread on hot paths; readers only need eventual values,
// so every operation is memory_order_relaxed.
// ---------------------------------------------------------------------------
template<typename T = uint64_t>
struct alignas(64) counter {
    counter() = default;
    explicit counter(T initial) noexcept : value_(initial) {}

    counter(const counter&) = delete;
    counter& operator=(const counter&) = delete;

    // Snapshot support
    void copy_to(counter& other) const noexcept {
        other.value_.store(value_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    }

    inline T load() const noexcept { return value_.load(std::memory_order_relaxed); }
    inline void inc(T n = 1) noexcept { value_.fetch_add(n, std::memory_order_relaxed); }
    inline void reset() noexcept { value_.store(0, std::memory_order_relaxed); }

    // High-water mark update (only ever raises the stored value)
    inline void raise_to(T v) noexcept {
        T current = value_.load(std::memory_order_relaxed);
        while (current < v &&
               !value_.compare_exchange_weak(current, v, std::memory_order_relaxed, std::memory_order_relaxed)) {
        }
    }

private:
    std::atomic<T> value_{0};
};

using counter32 = counter<uint32_t>;
static_assert(std::is_standard_layout_v<counter32>, "counter32 must be standard layout");
using counter64 = counter<uint64_t>;
static_assert(std::is_standard_layout_v<counter64>, "counter64 must be standard layout");

} // namespace atomic
} // namespace metrics
} // namespace lcr
