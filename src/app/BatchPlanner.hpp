#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "domain/Models.hpp"

namespace app {

using Batch = std::vector<domain::Ticker>;

struct IngestionPlan {
    domain::FetchWindow window;
    std::vector<Batch> batches;
};

class BatchPlanner {
public:
    static constexpr std::size_t kDefaultBatchSize = 25;
    static constexpr int kDefaultLookbackDays = 365;

    BatchPlanner(std::size_t batchSize, int lookbackDays);

    // Backfill from today - lookback when the store is empty, otherwise resume the day after
    // the newest stored date. The end is exclusive and always includes today.
    domain::FetchWindow window(std::optional<domain::Date> maxStoredDate, domain::Date today) const;

    std::vector<Batch> batches(const std::vector<domain::Ticker>& universe) const;

    IngestionPlan plan(const std::vector<domain::Ticker>& universe,
                       std::optional<domain::Date> maxStoredDate,
                       domain::Date today) const;

    std::size_t batchSize() const noexcept { return batchSize_; }
    int lookbackDays() const noexcept { return lookbackDays_; }

private:
    std::size_t batchSize_;
    int lookbackDays_;
};

}  // namespace app
