#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "app/FetchExecutor.hpp"
#include "domain/Models.hpp"
#include "domain/RawResponse.hpp"

namespace eod::common {
class Clock;
}

namespace app {

class RateController;

struct FetchedBatch {
    std::vector<domain::Ticker> tickers;
    domain::RawResponse response;
};

struct SkippedTicker {
    domain::Ticker ticker;
    FetchError::Kind reason{FetchError::Kind::Transient};
    std::string message;
};

struct RetryOutcome {
    std::vector<FetchedBatch> batches;
    std::vector<SkippedTicker> skipped;
    std::size_t attempts{0};
};

// Runs the batch -> halves -> singletons cascade on an explicit worklist. A failing batch is
// split at size / 2 (smaller first half on odd sizes) and each half retried independently; a
// singleton that still fails is dropped for the run and reported in the skip list.
class RetrySplitter {
public:
    RetrySplitter(FetchExecutor& executor, RateController& rateController, eod::common::Clock& clock);

    // Never throws on fetch failures; partial coverage of the batch is an accepted outcome.
    RetryOutcome fetchWithRetry(const std::vector<domain::Ticker>& batch, const domain::FetchWindow& window);

private:
    struct BatchAttempt {
        std::vector<domain::Ticker> tickers;
        std::size_t depth{0};
    };

    FetchExecutor& executor_;
    RateController& rateController_;
    eod::common::Clock& clock_;
};

}  // namespace app
