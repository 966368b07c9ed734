#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>

#include "common/Clock.hpp"

namespace app {

// Process-wide pacing for outbound provider calls. Owns the only cross-batch mutable state of a run.
class RateController {
public:
    struct Options {
        std::chrono::milliseconds baseInterval{1500};
        std::chrono::milliseconds slowInterval{6000};
        std::chrono::milliseconds maxJitter{400};
        std::uint32_t seed{std::random_device{}()};
    };

    RateController(eod::common::Clock& clock, Options options);

    RateController(const RateController&) = delete;
    RateController& operator=(const RateController&) = delete;

    // Blocks until the next request may be issued; callers are served one at a time.
    void waitBeforeCall();

    // Extends the shared cool-down to now + duration. An existing longer cool-down is kept.
    void signalSlowdown(std::chrono::milliseconds duration);

    bool inSlowdown() const;
    std::chrono::milliseconds requiredInterval() const;
    std::chrono::milliseconds slowInterval() const noexcept { return options_.slowInterval; }
    std::optional<eod::common::Clock::MonotonicTime> lastCall() const;

private:
    std::chrono::milliseconds nextJitter();

    eod::common::Clock& clock_;
    const Options options_;

    mutable std::mutex pacingMutex_;
    std::optional<eod::common::Clock::MonotonicTime> lastCall_;
    std::mt19937 rng_;

    mutable std::mutex slowdownMutex_;
    std::optional<eod::common::Clock::MonotonicTime> slowdownUntil_;
};

}  // namespace app
