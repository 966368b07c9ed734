#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "domain/Ports.hpp"

namespace adapters::duckdb {

// Keyed (ticker, date) merge into the DuckDB price table. Each chunk is staged into a
// temporary table and merged inside its own transaction, so chunks committed before a
// failure stay in place and a re-run converges to the same state.
class DuckPriceRepo : public domain::contracts::IPriceStore, public domain::contracts::IPriceReadRepo {
public:
    static constexpr std::size_t kDefaultChunkSize = 5000;

    explicit DuckPriceRepo(std::string dbPath = "data/market.duckdb", std::size_t chunkSize = kDefaultChunkSize);

    std::optional<domain::Date> maxPriceDate() const override;

    domain::contracts::UpsertStats upsertPrices(const std::vector<domain::PriceRow>& rows) override;

    std::vector<domain::PriceRow> getPrices(const domain::Ticker& ticker,
                                            std::optional<domain::Date> from,
                                            std::optional<domain::Date> to) const override;

    std::vector<domain::Ticker> listTickers() const override;

    std::int64_t countPrices() const;

private:
    std::string dbPath_;
    std::size_t chunkSize_;
};

}  // namespace adapters::duckdb
