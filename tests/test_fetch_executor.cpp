#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "TestSupport.hpp"
#include "app/FetchExecutor.hpp"
#include "app/RateController.hpp"
#include "common/Metrics.hpp"

using namespace std::chrono_literals;

namespace {

namespace metrics = eod::common::metrics;

app::RateController::Options pacing() {
    app::RateController::Options options;
    options.baseInterval = 1500ms;
    options.slowInterval = 6000ms;
    options.maxJitter = 0ms;
    options.seed = 7U;
    return options;
}

domain::FetchWindow window() {
    return domain::FetchWindow{*domain::Date::parse("2024-01-01"), *domain::Date::parse("2024-01-10")};
}

int testClassification() {
    using Kind = app::FetchError::Kind;
    EXPECT(app::FetchExecutor::classify("HTTP 429") == Kind::Throttled);
    EXPECT(app::FetchExecutor::classify("Too Many Requests. Rate limited. Try after a while.") == Kind::Throttled);
    EXPECT(app::FetchExecutor::classify("YFRateLimitError: Rate-Limit exceeded") == Kind::Throttled);
    EXPECT(app::FetchExecutor::classify("ratelimit") == Kind::Throttled);
    EXPECT(app::FetchExecutor::classify("connection reset by peer") == Kind::Transient);
    EXPECT(app::FetchExecutor::classify("HTTP 500") == Kind::Transient);
    EXPECT(app::FetchExecutor::classify("") == Kind::Transient);
    EXPECT(app::FetchExecutor::classify("status=429;") == Kind::Throttled);
    return 0;
}

// Digits inside epochs, symbols or ports must not read as a 429 status.
int testStatusDigitsInsideTokensAreTransient() {
    using Kind = app::FetchError::Kind;
    EXPECT(app::FetchExecutor::classify("Yahoo chart request /v8/finance/chart/AAPL?period1=1742947200&period2="
                                        "1743552000&interval=1d failed after 6 attempts: connect: Connection "
                                        "refused") == Kind::Transient);
    EXPECT(app::FetchExecutor::classify("Yahoo chart request for 4290.T failed after 6 attempts with HTTP 503") ==
           Kind::Transient);
    EXPECT(app::FetchExecutor::classify("connect to 10.0.0.1:14290 timed out") == Kind::Transient);
    EXPECT(app::FetchExecutor::classify("upstream 4429 error") == Kind::Transient);
    return 0;
}

int testProviderErrorStatusDecidesKind() {
    metrics::Registry::instance().reset();
    testsupport::FakeClock clock(testsupport::epochOf("2025-03-26"));
    app::RateController controller(clock, pacing());
    const domain::FetchWindow recent{*domain::Date::parse("2025-03-26"), *domain::Date::parse("2025-04-02")};

    testsupport::FakeProvider unavailable([](const std::vector<domain::Ticker>&, const domain::FetchWindow&)
                                              -> domain::RawResponse {
        throw domain::contracts::ProviderError(
            "Yahoo chart request for 4290.T failed after 6 attempts with HTTP 503", 503U, false);
    });
    app::FetchExecutor executor(unavailable, controller, 180s);
    try {
        executor.fetch({"4290.T"}, recent);
        std::cerr << "expected FetchError\n";
        return 1;
    } catch (const app::FetchError& error) {
        EXPECT(error.kind() == app::FetchError::Kind::Transient);
    }
    EXPECT(!controller.inSlowdown());

    // The typed flag wins even when the text carries no rate-limit wording.
    testsupport::FakeProvider throttled([](const std::vector<domain::Ticker>&, const domain::FetchWindow&)
                                            -> domain::RawResponse {
        throw domain::contracts::ProviderError("Yahoo chart request for AAPL rejected", 429U, true);
    });
    app::FetchExecutor throttledExecutor(throttled, controller, 180s);
    try {
        throttledExecutor.fetch({"AAPL"}, recent);
        std::cerr << "expected FetchError\n";
        return 1;
    } catch (const app::FetchError& error) {
        EXPECT(error.kind() == app::FetchError::Kind::Throttled);
    }
    EXPECT(controller.inSlowdown());
    EXPECT(metrics::Registry::instance().counter(metrics::keys::kFetchThrottled) == 1U);
    return 0;
}

int testResetKeepsLiveTimers() {
    auto& registry = metrics::Registry::instance();
    const std::string key = "fetch_reset_window";
    {
        metrics::Registry::ScopedTimer timer(key);
    }
    EXPECT(registry.snapshot().timers.at(key).samples == 1U);
    {
        metrics::Registry::ScopedTimer timer(key);
        registry.reset();
        EXPECT(registry.snapshot().timers.at(key).samples == 0U);
        EXPECT(!registry.snapshot().timers.at(key).p95Ms.has_value());
    }
    EXPECT(registry.snapshot().timers.at(key).samples == 1U);
    EXPECT(registry.counter(metrics::keys::kFetchAttempts) == 0U);
    return 0;
}

int testSuccessIsPacedAndCounted() {
    metrics::Registry::instance().reset();
    testsupport::FakeClock clock;
    app::RateController controller(clock, pacing());
    testsupport::FakeProvider provider([](const std::vector<domain::Ticker>&, const domain::FetchWindow&) {
        return domain::RawResponse{testsupport::singleFrame({{"2024-01-02", 10.0}})};
    });
    app::FetchExecutor executor(provider, controller);

    const auto first = executor.fetch({"AAPL"}, window());
    const auto second = executor.fetch({"MSFT"}, window());
    EXPECT(std::holds_alternative<domain::SingleTickerFrame>(first));
    EXPECT(std::holds_alternative<domain::SingleTickerFrame>(second));
    EXPECT(executor.attempts() == 2U);
    EXPECT(provider.calls.size() == 2U);
    EXPECT(clock.sleeps.size() == 1U);
    EXPECT(clock.sleeps.front() == 1500ms);
    EXPECT(metrics::Registry::instance().counter(metrics::keys::kFetchAttempts) == 2U);
    EXPECT(metrics::Registry::instance().snapshot().timers.at(metrics::keys::kFetchTimer).samples == 2U);
    return 0;
}

int testEmptyResponseIsSuccess() {
    testsupport::FakeClock clock;
    app::RateController controller(clock, pacing());
    testsupport::FakeProvider provider([](const std::vector<domain::Ticker>&, const domain::FetchWindow&) {
        return domain::RawResponse{domain::EmptyResponse{}};
    });
    app::FetchExecutor executor(provider, controller);

    const auto response = executor.fetch({"AAPL", "MSFT"}, window());
    EXPECT(domain::isEmpty(response));
    return 0;
}

int testThrottledFailureSignalsSlowdown() {
    metrics::Registry::instance().reset();
    testsupport::FakeClock clock;
    app::RateController controller(clock, pacing());
    testsupport::FakeProvider provider([](const std::vector<domain::Ticker>&, const domain::FetchWindow&)
                                           -> domain::RawResponse {
        throw std::runtime_error("Yahoo chart request failed after 6 attempts with HTTP 429");
    });
    app::FetchExecutor executor(provider, controller, 180s);

    try {
        executor.fetch({"AAPL"}, window());
        std::cerr << "expected FetchError\n";
        return 1;
    } catch (const app::FetchError& error) {
        EXPECT(error.kind() == app::FetchError::Kind::Throttled);
        EXPECT(std::string{error.what()}.find("429") != std::string::npos);
    }
    EXPECT(controller.inSlowdown());
    EXPECT(controller.requiredInterval() == 6000ms);
    clock.advance(179s);
    EXPECT(controller.inSlowdown());
    clock.advance(2s);
    EXPECT(!controller.inSlowdown());
    EXPECT(metrics::Registry::instance().counter(metrics::keys::kFetchThrottled) == 1U);
    EXPECT(metrics::Registry::instance().counter(metrics::keys::kFetchFailures) == 1U);
    return 0;
}

int testTransientFailureKeepsBaseInterval() {
    testsupport::FakeClock clock;
    app::RateController controller(clock, pacing());
    testsupport::FakeProvider provider([](const std::vector<domain::Ticker>&, const domain::FetchWindow&)
                                           -> domain::RawResponse {
        throw std::runtime_error("TLS handshake failed");
    });
    app::FetchExecutor executor(provider, controller);

    try {
        executor.fetch({"AAPL"}, window());
        std::cerr << "expected FetchError\n";
        return 1;
    } catch (const app::FetchError& error) {
        EXPECT(error.kind() == app::FetchError::Kind::Transient);
    }
    EXPECT(!controller.inSlowdown());
    EXPECT(executor.attempts() == 1U);
    return 0;
}

}  // namespace

int main() {
    int failures = 0;
    failures += testClassification();
    failures += testStatusDigitsInsideTokensAreTransient();
    failures += testProviderErrorStatusDecidesKind();
    failures += testSuccessIsPacedAndCounted();
    failures += testEmptyResponseIsSuccess();
    failures += testThrottledFailureSignalsSlowdown();
    failures += testTransientFailureKeepsBaseInterval();
    failures += testResetKeepsLiveTimers();
    return failures == 0 ? 0 : 1;
}
