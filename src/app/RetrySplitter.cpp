#include "app/RetrySplitter.hpp"

#include <iterator>
#include <utility>

#include "app/RateController.hpp"
#include "common/Clock.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace app {

RetrySplitter::RetrySplitter(FetchExecutor& executor, RateController& rateController, eod::common::Clock& clock)
    : executor_(executor), rateController_(rateController), clock_(clock) {}

RetryOutcome RetrySplitter::fetchWithRetry(const std::vector<domain::Ticker>& batch,
                                           const domain::FetchWindow& window) {
    RetryOutcome outcome;
    if (batch.empty()) {
        return outcome;
    }

    std::vector<BatchAttempt> worklist;
    worklist.push_back(BatchAttempt{batch, 0});

    while (!worklist.empty()) {
        BatchAttempt attempt = std::move(worklist.back());
        worklist.pop_back();

        ++outcome.attempts;
        try {
            auto response = executor_.fetch(attempt.tickers, window);
            outcome.batches.push_back(FetchedBatch{std::move(attempt.tickers), std::move(response)});
            continue;
        } catch (const FetchError& error) {
            if (attempt.tickers.size() > 1) {
                const auto mid = attempt.tickers.size() / 2;
                const auto splitAt = attempt.tickers.begin() + static_cast<std::ptrdiff_t>(mid);
                BatchAttempt first{{attempt.tickers.begin(), splitAt}, attempt.depth + 1};
                BatchAttempt second{{splitAt, attempt.tickers.end()}, attempt.depth + 1};

                LOG_WARN("RetrySplitter: batch of " << attempt.tickers.size() << " failed at depth "
                                                     << attempt.depth << ", splitting into " << first.tickers.size()
                                                     << " + " << second.tickers.size());

                // LIFO: the first half is retried first.
                worklist.push_back(std::move(second));
                worklist.push_back(std::move(first));
                continue;
            }

            const auto& ticker = attempt.tickers.front();
            LOG_ERR("RetrySplitter: skipping " << ticker << " for this run kind=" << toString(error.kind())
                                               << " error=" << error.what());
            outcome.skipped.push_back(SkippedTicker{ticker, error.kind(), error.what()});
            eod::common::metrics::Registry::instance().incrementCounter(
                eod::common::metrics::keys::kTickersSkipped);
            clock_.sleepFor(rateController_.slowInterval());
        }
    }

    return outcome;
}

}  // namespace app
