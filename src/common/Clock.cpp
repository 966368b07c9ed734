#include "common/Clock.hpp"

#include <thread>

namespace eod::common {

Clock::MonotonicTime SystemClock::monotonicNow() const { return std::chrono::steady_clock::now(); }

Clock::WallTime SystemClock::wallNow() const { return std::chrono::system_clock::now(); }

void SystemClock::sleepFor(std::chrono::milliseconds duration) {
    if (duration.count() <= 0) {
        return;
    }
    std::this_thread::sleep_for(duration);
}

SystemClock& SystemClock::instance() {
    static SystemClock clock;
    return clock;
}

}  // namespace eod::common
