#include "app/FetchExecutor.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

#include "app/RateController.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace app {
namespace {

namespace metrics = eod::common::metrics;

constexpr std::array<std::string_view, 5> kThrottlePhrases{
    "too many requests", "rate limit", "rate-limit", "ratelimit", "rate limited"};

constexpr std::string_view kThrottleStatus{"429"};

bool isTokenChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '.' || c == '_';
}

// "429" counts only as a standalone token, never as part of an epoch, a port or a symbol like 4290.T.
bool containsStatusToken(const std::string& text) {
    for (auto pos = text.find(kThrottleStatus); pos != std::string::npos;
         pos = text.find(kThrottleStatus, pos + 1)) {
        const auto end = pos + kThrottleStatus.size();
        const bool leftClear = pos == 0 || !isTokenChar(text[pos - 1]);
        const bool rightClear = end == text.size() || !isTokenChar(text[end]);
        if (leftClear && rightClear) {
            return true;
        }
    }
    return false;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string joinBatch(const std::vector<domain::Ticker>& batch) {
    std::string joined;
    for (const auto& ticker : batch) {
        if (!joined.empty()) {
            joined.push_back(',');
        }
        joined += ticker;
    }
    return joined;
}

}  // namespace

FetchError::FetchError(Kind kind, const std::string& message) : std::runtime_error(message), kind_(kind) {}

const char* toString(FetchError::Kind kind) noexcept {
    switch (kind) {
    case FetchError::Kind::Throttled:
        return "throttled";
    case FetchError::Kind::Transient:
    default:
        return "transient";
    }
}

FetchExecutor::FetchExecutor(domain::contracts::IMarketDataProvider& provider,
                             RateController& rateController,
                             std::chrono::milliseconds throttleCooldown)
    : provider_(provider), rateController_(rateController), throttleCooldown_(throttleCooldown) {}

domain::RawResponse FetchExecutor::fetch(const std::vector<domain::Ticker>& batch,
                                         const domain::FetchWindow& window) {
    rateController_.waitBeforeCall();
    ++attempts_;
    metrics::Registry::instance().incrementCounter(metrics::keys::kFetchAttempts);

    LOG_INFO("FetchExecutor: requesting batch size=" << batch.size() << " tickers=" << joinBatch(batch)
                                                      << " window=" << window.start.toString() << "->"
                                                      << window.end.toString());

    std::string failure;
    std::optional<FetchError::Kind> providerKind;
    try {
        metrics::Registry::ScopedTimer timer(metrics::keys::kFetchTimer);
        auto response = provider_.download(batch, window);
        LOG_INFO("FetchExecutor: response shape=" << domain::shapeName(response)
                                                   << " rows=" << domain::rowCount(response));
        return response;
    } catch (const domain::contracts::ProviderError& ex) {
        failure = ex.what();
        providerKind = ex.throttled() ? FetchError::Kind::Throttled : FetchError::Kind::Transient;
    } catch (const std::exception& ex) {
        failure = ex.what();
    }

    metrics::Registry::instance().incrementCounter(metrics::keys::kFetchFailures);
    const auto kind = providerKind.value_or(classify(failure));
    if (kind == FetchError::Kind::Throttled) {
        metrics::Registry::instance().incrementCounter(metrics::keys::kFetchThrottled);
        rateController_.signalSlowdown(throttleCooldown_);
    }

    LOG_WARN("FetchExecutor: batch failed kind=" << toString(kind) << " tickers=" << joinBatch(batch)
                                                 << " error=" << failure);
    throw FetchError(kind, failure);
}

FetchError::Kind FetchExecutor::classify(const std::string& message) {
    const auto lowered = toLower(message);
    if (containsStatusToken(lowered)) {
        return FetchError::Kind::Throttled;
    }
    for (const auto phrase : kThrottlePhrases) {
        if (lowered.find(phrase) != std::string::npos) {
            return FetchError::Kind::Throttled;
        }
    }
    return FetchError::Kind::Transient;
}

}  // namespace app
