#pragma once

#include <chrono>
#include <cstddef>
#include <vector>

#include "app/BatchPlanner.hpp"
#include "app/FetchExecutor.hpp"
#include "app/RetrySplitter.hpp"
#include "domain/Models.hpp"
#include "domain/Ports.hpp"

namespace eod::common {
class Clock;
}

namespace app {

class RateController;

struct RunReport {
    domain::FetchWindow window{};
    std::size_t batches{0};
    std::size_t attempts{0};
    std::size_t rowsNormalized{0};
    std::size_t rowsUsable{0};
    std::size_t rowsUpserted{0};
    std::vector<SkippedTicker> skipped;
};

// One incremental ingestion pass: plan the window from the store, fetch every batch through
// the split cascade, normalize and persist the usable rows.
class IngestionWorker {
public:
    struct Options {
        std::size_t batchSize{BatchPlanner::kDefaultBatchSize};
        int lookbackDays{BatchPlanner::kDefaultLookbackDays};
        std::chrono::milliseconds throttleCooldown{FetchExecutor::kDefaultThrottleCooldown};
    };

    IngestionWorker(domain::contracts::IMarketDataProvider& provider,
                    domain::contracts::IPriceStore& store,
                    RateController& rateController,
                    eod::common::Clock& clock,
                    Options options);

    // Throws StoreError when the store cannot be read or written; fetch failures only shrink
    // the result.
    RunReport run(const std::vector<domain::Ticker>& universe);

private:
    domain::Date today() const;

    domain::contracts::IPriceStore& store_;
    eod::common::Clock& clock_;
    BatchPlanner planner_;
    FetchExecutor executor_;
    RetrySplitter splitter_;
};

}  // namespace app
