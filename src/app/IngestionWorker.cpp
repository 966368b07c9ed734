#include "app/IngestionWorker.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

#include "app/RateController.hpp"
#include "app/ResponseNormalizer.hpp"
#include "common/Clock.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace app {
namespace {

namespace metrics = eod::common::metrics;

using domain::contracts::StoreError;

// Keeps a stage set by the store itself.
StoreError tagStage(const StoreError& ex, const char* stage) {
    if (!ex.stage().empty()) {
        return ex;
    }
    return StoreError(ex.what(), stage);
}

}  // namespace

IngestionWorker::IngestionWorker(domain::contracts::IMarketDataProvider& provider,
                                 domain::contracts::IPriceStore& store,
                                 RateController& rateController,
                                 eod::common::Clock& clock,
                                 Options options)
    : store_(store),
      clock_(clock),
      planner_(options.batchSize, options.lookbackDays),
      executor_(provider, rateController, options.throttleCooldown),
      splitter_(executor_, rateController, clock) {}

domain::Date IngestionWorker::today() const {
    const auto now = clock_.wallNow();
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    return domain::Date::fromEpochSeconds(static_cast<std::int64_t>(seconds));
}

RunReport IngestionWorker::run(const std::vector<domain::Ticker>& universe) {
    RunReport report;
    auto& registry = metrics::Registry::instance();

    std::optional<domain::Date> maxDate;
    try {
        maxDate = store_.maxPriceDate();
    } catch (const StoreError& ex) {
        throw tagStage(ex, "read");
    }
    const auto plan = planner_.plan(universe, maxDate, today());
    report.window = plan.window;
    report.batches = plan.batches.size();
    registry.setGauge(metrics::keys::kRunBatches, static_cast<double>(plan.batches.size()));

    LOG_INFO("IngestionWorker: " << universe.size() << " tickers, " << plan.batches.size() << " batches, window "
                                 << plan.window.start.toString() << " .. " << plan.window.end.toString()
                                 << (maxDate ? " (incremental)" : " (backfill)"));

    if (plan.batches.empty()) {
        LOG_INFO("IngestionWorker: universo vacio, nada que hacer");
        return report;
    }
    if (plan.window.empty()) {
        LOG_INFO("IngestionWorker: store already current through " << maxDate->toString() << ", skipping fetch");
        return report;
    }

    std::vector<domain::PriceRow> rows;
    std::size_t batchNumber = 0;
    for (const auto& batch : plan.batches) {
        ++batchNumber;
        auto outcome = splitter_.fetchWithRetry(batch, plan.window);
        report.attempts += outcome.attempts;

        std::size_t batchRows = 0;
        for (const auto& fetched : outcome.batches) {
            auto normalized = normalizeResponse(fetched.response, fetched.tickers);
            batchRows += normalized.size();
            rows.insert(rows.end(), std::make_move_iterator(normalized.begin()),
                        std::make_move_iterator(normalized.end()));
        }
        report.rowsNormalized += batchRows;
        std::move(outcome.skipped.begin(), outcome.skipped.end(), std::back_inserter(report.skipped));

        LOG_INFO("IngestionWorker: batch " << batchNumber << "/" << plan.batches.size() << " rows=" << batchRows
                                           << " attempts=" << outcome.attempts
                                           << " skipped=" << outcome.skipped.size());
    }
    registry.incrementCounter(metrics::keys::kRowsNormalized, report.rowsNormalized);

    rows.erase(std::remove_if(rows.begin(), rows.end(), [](const domain::PriceRow& row) { return !row.usable(); }),
               rows.end());
    report.rowsUsable = rows.size();

    if (!rows.empty()) {
        try {
            const auto stats = store_.upsertPrices(rows);
            report.rowsUpserted = stats.rowsMerged;
        } catch (const StoreError& ex) {
            throw tagStage(ex, "upsert");
        }
    }

    LOG_INFO("IngestionWorker: rows normalized=" << report.rowsNormalized << " usable=" << report.rowsUsable
                                                 << " upserted=" << report.rowsUpserted
                                                 << " attempts=" << report.attempts);
    if (!report.skipped.empty()) {
        std::string names;
        for (const auto& skipped : report.skipped) {
            if (!names.empty()) {
                names += ", ";
            }
            names += skipped.ticker;
        }
        LOG_WARN("IngestionWorker: skipped " << report.skipped.size() << " tickers: " << names);
    }
    LOG_INFO("IngestionWorker metrics: " << metrics::Registry::describe(registry.snapshot()));

    return report;
}

}  // namespace app
