#include "app/RateController.hpp"

#include <algorithm>
#include <stdexcept>

#include "common/Log.hpp"

namespace app {

RateController::RateController(eod::common::Clock& clock, Options options)
    : clock_(clock), options_(options), rng_(options.seed) {
    if (options_.baseInterval.count() < 0 || options_.slowInterval.count() < 0 || options_.maxJitter.count() < 0) {
        throw std::invalid_argument("RateController: intervals must be non-negative");
    }
}

void RateController::waitBeforeCall() {
    std::lock_guard<std::mutex> lock(pacingMutex_);

    const auto required = requiredInterval();
    if (lastCall_.has_value()) {
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(clock_.monotonicNow() - *lastCall_);
        const auto need = required - elapsed;
        if (need.count() > 0) {
            const auto pause = need + nextJitter();
            LOG_DEBUG("RateController: pausing " << pause.count() << " ms (interval=" << required.count()
                                                 << " ms)");
            clock_.sleepFor(pause);
        }
    }

    lastCall_ = clock_.monotonicNow();
}

void RateController::signalSlowdown(std::chrono::milliseconds duration) {
    if (duration.count() <= 0) {
        return;
    }

    const auto candidate = clock_.monotonicNow() + duration;
    std::lock_guard<std::mutex> lock(slowdownMutex_);
    if (!slowdownUntil_.has_value() || candidate > *slowdownUntil_) {
        slowdownUntil_ = candidate;
        LOG_WARN("RateController: adaptive slowdown for " << duration.count() << " ms, interval raised to "
                                                          << options_.slowInterval.count() << " ms");
    }
}

bool RateController::inSlowdown() const {
    const auto now = clock_.monotonicNow();
    std::lock_guard<std::mutex> lock(slowdownMutex_);
    return slowdownUntil_.has_value() && now < *slowdownUntil_;
}

std::chrono::milliseconds RateController::requiredInterval() const {
    if (inSlowdown()) {
        return std::max(options_.baseInterval, options_.slowInterval);
    }
    return options_.baseInterval;
}

std::optional<eod::common::Clock::MonotonicTime> RateController::lastCall() const {
    std::lock_guard<std::mutex> lock(pacingMutex_);
    return lastCall_;
}

std::chrono::milliseconds RateController::nextJitter() {
    if (options_.maxJitter.count() <= 0) {
        return std::chrono::milliseconds{0};
    }
    std::uniform_int_distribution<std::chrono::milliseconds::rep> distribution(0, options_.maxJitter.count());
    return std::chrono::milliseconds{distribution(rng_)};
}

}  // namespace app
