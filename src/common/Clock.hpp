#pragma once

#include <chrono>

namespace eod::common {

// Time source shared by pacing, planning and retry pauses. Tests substitute a manual clock.
class Clock {
public:
    using MonotonicTime = std::chrono::steady_clock::time_point;
    using WallTime = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;

    virtual MonotonicTime monotonicNow() const = 0;
    virtual WallTime wallNow() const = 0;
    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

class SystemClock final : public Clock {
public:
    MonotonicTime monotonicNow() const override;
    WallTime wallNow() const override;
    void sleepFor(std::chrono::milliseconds duration) override;

    static SystemClock& instance();
};

}  // namespace eod::common
