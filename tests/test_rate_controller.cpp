#include <chrono>
#include <iostream>
#include <stdexcept>

#include "TestSupport.hpp"
#include "app/RateController.hpp"

using namespace std::chrono_literals;

namespace {

app::RateController::Options pacing(std::chrono::milliseconds base,
                                    std::chrono::milliseconds slow,
                                    std::chrono::milliseconds jitter) {
    app::RateController::Options options;
    options.baseInterval = base;
    options.slowInterval = slow;
    options.maxJitter = jitter;
    options.seed = 42U;
    return options;
}

int testFirstCallDoesNotWait() {
    testsupport::FakeClock clock;
    app::RateController controller(clock, pacing(1500ms, 6000ms, 400ms));

    EXPECT(!controller.lastCall().has_value());
    controller.waitBeforeCall();
    EXPECT(clock.sleeps.empty());
    EXPECT(controller.lastCall().has_value());
    return 0;
}

int testConsecutiveCallsRespectBaseInterval() {
    testsupport::FakeClock clock;
    app::RateController controller(clock, pacing(1500ms, 6000ms, 0ms));

    controller.waitBeforeCall();
    auto previous = *controller.lastCall();
    for (int i = 0; i < 5; ++i) {
        clock.advance(200ms);
        controller.waitBeforeCall();
        const auto current = *controller.lastCall();
        EXPECT(current > previous);
        EXPECT(current - previous >= 1500ms);
        previous = current;
    }
    EXPECT(clock.sleeps.size() == 5U);
    EXPECT(clock.sleeps.front() == 1300ms);
    return 0;
}

int testNoWaitWhenIntervalAlreadyElapsed() {
    testsupport::FakeClock clock;
    app::RateController controller(clock, pacing(1500ms, 6000ms, 400ms));

    controller.waitBeforeCall();
    clock.advance(2000ms);
    controller.waitBeforeCall();
    EXPECT(clock.sleeps.empty());
    return 0;
}

int testJitterIsBounded() {
    testsupport::FakeClock clock;
    app::RateController controller(clock, pacing(1000ms, 6000ms, 400ms));

    controller.waitBeforeCall();
    for (int i = 0; i < 50; ++i) {
        controller.waitBeforeCall();
    }
    EXPECT(clock.sleeps.size() == 50U);
    for (const auto& sleep : clock.sleeps) {
        EXPECT(sleep >= 1000ms);
        EXPECT(sleep <= 1400ms);
    }
    return 0;
}

int testSlowdownRaisesIntervalAndNeverShortens() {
    testsupport::FakeClock clock;
    app::RateController controller(clock, pacing(1500ms, 6000ms, 0ms));

    EXPECT(controller.requiredInterval() == 1500ms);
    controller.signalSlowdown(10s);
    EXPECT(controller.inSlowdown());
    EXPECT(controller.requiredInterval() == 6000ms);

    controller.signalSlowdown(1s);
    clock.advance(5s);
    EXPECT(controller.inSlowdown());

    controller.waitBeforeCall();
    controller.waitBeforeCall();
    EXPECT(clock.sleeps.back() == 6000ms);

    clock.advance(10s);
    EXPECT(!controller.inSlowdown());
    EXPECT(controller.requiredInterval() == 1500ms);
    return 0;
}

int testNegativeOptionsRejected() {
    testsupport::FakeClock clock;
    try {
        app::RateController controller(clock, pacing(-1ms, 6000ms, 0ms));
        std::cerr << "expected invalid_argument for negative base interval\n";
        return 1;
    } catch (const std::invalid_argument&) {
    }
    return 0;
}

}  // namespace

int main() {
    int failures = 0;
    failures += testFirstCallDoesNotWait();
    failures += testConsecutiveCallsRespectBaseInterval();
    failures += testNoWaitWhenIntervalAlreadyElapsed();
    failures += testJitterIsBounded();
    failures += testSlowdownRaisesIntervalAndNeverShortens();
    failures += testNegativeOptionsRejected();
    return failures == 0 ? 0 : 1;
}
