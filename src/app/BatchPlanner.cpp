#include "app/BatchPlanner.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace app {

BatchPlanner::BatchPlanner(std::size_t batchSize, int lookbackDays)
    : batchSize_(batchSize), lookbackDays_(lookbackDays) {
    if (batchSize_ == 0) {
        throw std::invalid_argument("BatchPlanner: batch size must be >= 1");
    }
    if (lookbackDays_ < 0) {
        throw std::invalid_argument("BatchPlanner: lookback days must be >= 0");
    }
}

domain::FetchWindow BatchPlanner::window(std::optional<domain::Date> maxStoredDate, domain::Date today) const {
    domain::FetchWindow window;
    window.start = maxStoredDate.has_value() ? maxStoredDate->plusDays(1) : today.plusDays(-lookbackDays_);
    window.end = today.plusDays(1);
    return window;
}

std::vector<Batch> BatchPlanner::batches(const std::vector<domain::Ticker>& universe) const {
    std::vector<Batch> out;
    out.reserve((universe.size() + batchSize_ - 1) / batchSize_);

    for (auto it = universe.begin(); it != universe.end();) {
        const auto remaining = static_cast<std::size_t>(std::distance(it, universe.end()));
        const auto take = std::min(batchSize_, remaining);
        out.emplace_back(it, it + static_cast<std::ptrdiff_t>(take));
        it += static_cast<std::ptrdiff_t>(take);
    }
    return out;
}

IngestionPlan BatchPlanner::plan(const std::vector<domain::Ticker>& universe,
                                 std::optional<domain::Date> maxStoredDate,
                                 domain::Date today) const {
    return IngestionPlan{window(maxStoredDate, today), batches(universe)};
}

}  // namespace app
