#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include <xxhash.h>

namespace flowline::integrity {

// -----------------------------------------------------------------------------
// ChainedDigest
// -----------------------------------------------------------------------------
// Order-sensitive running XXH64 digest over a sequence of payloads:
//
//     chain_0 = seed
//     chain_n = XXH64(payload_n, chain_{n-1})
//
// A producer and a consumer that observe the same payloads in the same order
// end up with equal values. One instance per (stream, side); not thread-safe.
// -----------------------------------------------------------------------------
class ChainedDigest {
public:
    explicit ChainedDigest(std::uint64_t seed = 0) noexcept
        : chain_(seed)
    {}

    inline void update(std::span<const std::byte> payload) noexcept {
        chain_ = XXH64(payload.data(), payload.size(), chain_);
        ++count_;
    }

    [[nodiscard]] inline std::uint64_t value() const noexcept { return chain_; }

    [[nodiscard]] inline std::uint64_t count() const noexcept { return count_; }

    [[nodiscard]] inline bool operator==(const ChainedDigest& other) const noexcept {
        return chain_ == other.chain_ && count_ == other.count_;
    }

private:
    std::uint64_t chain_;
    std::uint64_t count_ = 0;
};

} // namespace flowline::integrity
