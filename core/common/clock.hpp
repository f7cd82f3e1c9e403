#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace reasongraph {

/// Milliseconds since the Unix epoch.
using Timestamp = uint64_t;

/// Injectable time source.
class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override {
        auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<Timestamp>(
            std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
    }
};

/// Deterministic clock for tests and replay tooling.
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}

    Timestamp now() const override { return now_.load(); }
    void set(Timestamp t) { now_.store(t); }
    void advance(Timestamp delta_ms) { now_.fetch_add(delta_ms); }

private:
    std::atomic<Timestamp> now_;
};

} // namespace reasongraph
