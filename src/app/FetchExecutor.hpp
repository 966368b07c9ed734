#pragma once

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

#include "domain/Models.hpp"
#include "domain/Ports.hpp"
#include "domain/RawResponse.hpp"

namespace app {

class RateController;

class FetchError : public std::runtime_error {
public:
    enum class Kind {
        Transient,
        Throttled,
    };

    FetchError(Kind kind, const std::string& message);

    Kind kind() const noexcept { return kind_; }

private:
    Kind kind_;
};

const char* toString(FetchError::Kind kind) noexcept;

// Issues one paced provider request per call and classifies its failure.
class FetchExecutor {
public:
    static constexpr std::chrono::milliseconds kDefaultThrottleCooldown{180'000};

    FetchExecutor(domain::contracts::IMarketDataProvider& provider,
                  RateController& rateController,
                  std::chrono::milliseconds throttleCooldown = kDefaultThrottleCooldown);

    // An empty frame is a successful result: the window may hold no new bars.
    domain::RawResponse fetch(const std::vector<domain::Ticker>& batch, const domain::FetchWindow& window);

    static FetchError::Kind classify(const std::string& message);

    std::size_t attempts() const noexcept { return attempts_; }

private:
    domain::contracts::IMarketDataProvider& provider_;
    RateController& rateController_;
    std::chrono::milliseconds throttleCooldown_;
    std::size_t attempts_{0};
};

}  // namespace app
