#pragma once

#include <cstdint>

namespace flowline::actor {

// -----------------------------------------------------------------------------
// Consumable
// -----------------------------------------------------------------------------
// Condition an actor can attach a recurring job to (ActorControl::consume).
//
// The scheduler polls has_available() from any worker thread, so it must be
// cheap and thread-safe. progress() is a monotonically increasing value that
// changes whenever the consumer moves forward; a consume job run that leaves
// it unchanged counts as a stall and backs the condition off.
class Consumable {
public:
    virtual ~Consumable() = default;

    [[nodiscard]] virtual bool has_available() const noexcept = 0;

    [[nodiscard]] virtual std::int64_t progress() const noexcept = 0;
};

} // namespace flowline::actor
