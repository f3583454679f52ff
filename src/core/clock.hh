#pragma once

#include "core/types.hh"
#include <atomic>

namespace mesh {

// ============================================================================
// Clock
// ============================================================================

// Source of wall-clock time. Everything time dependent takes a Clock so tests
// can drive it by hand.
class Clock {
public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual timestamp_t now() const = 0;
};

class SystemClock : public Clock {
public:
    [[nodiscard]] timestamp_t now() const override;
};

class ManualClock : public Clock {
public:
    explicit ManualClock(timestamp_t start = timestamp_t{0}) : now_(start.count()) {}

    [[nodiscard]] timestamp_t now() const override { return timestamp_t{now_.load()}; }

    void set(timestamp_t t) { now_.store(t.count()); }
    void advance(timestamp_t delta) { now_.fetch_add(delta.count()); }

private:
    std::atomic<std::int64_t> now_;
};

}  // namespace mesh
