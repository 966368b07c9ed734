#include "adapters/duckdb/DuckPriceRepo.hpp"

#include <algorithm>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <duckdb.hpp>

#include "common/Log.hpp"
#include "common/Metrics.hpp"

namespace fs = std::filesystem;

namespace adapters::duckdb {
namespace {

using domain::contracts::StoreError;
// DuckDB exposes its own vector alias; using it keeps Execute(values) on the
// non-variadic overload.
using DuckdbValueVector = ::duckdb::vector<::duckdb::Value>;

constexpr const char* kCreateStaging = R"SQL(
    CREATE TEMP TABLE IF NOT EXISTS staging_prices (
        ticker VARCHAR,
        "date" DATE,
        open DOUBLE,
        high DOUBLE,
        low DOUBLE,
        close DOUBLE,
        volume BIGINT
    )
)SQL";

constexpr const char* kInsertStaging =
    "INSERT INTO staging_prices (ticker, \"date\", open, high, low, close, volume) "
    "VALUES (?, CAST(? AS DATE), ?, ?, ?, ?, ?)";

constexpr const char* kMergeStaging = R"SQL(
    INSERT INTO prices (ticker, "date", open, high, low, close, volume)
    SELECT ticker, "date", open, high, low, close, volume FROM staging_prices
    ON CONFLICT (ticker, "date") DO UPDATE SET
        open = EXCLUDED.open,
        high = EXCLUDED.high,
        low = EXCLUDED.low,
        close = EXCLUDED.close,
        volume = EXCLUDED.volume
)SQL";

constexpr const char* kRegisterTicker = "INSERT INTO tickers (ticker) VALUES (?) ON CONFLICT DO NOTHING";

template <typename Result>
void throwIfFailed(const Result& result, const std::string& context) {
    if (!result || result->HasError()) {
        const std::string errorMessage = result ? result->GetError() : std::string{"no result returned"};
        throw StoreError("DuckPriceRepo " + context + " failed: " + errorMessage);
    }
}

template <typename Result>
std::int64_t firstInt64(Result& result) {
    if (auto chunk = result->Fetch()) {
        if (chunk->size() > 0) {
            const auto value = chunk->GetValue(0, 0);
            if (!value.IsNull()) {
                return value.GetValue<std::int64_t>();
            }
        }
    }
    return 0;
}

::duckdb::Value optionalDouble(const std::optional<double>& value) {
    return value ? ::duckdb::Value::DOUBLE(*value) : ::duckdb::Value(::duckdb::LogicalType::DOUBLE);
}

::duckdb::Value optionalBigint(const std::optional<std::int64_t>& value) {
    return value ? ::duckdb::Value::BIGINT(*value) : ::duckdb::Value(::duckdb::LogicalType::BIGINT);
}

std::optional<double> readDouble(const ::duckdb::Value& value) {
    if (value.IsNull()) {
        return std::nullopt;
    }
    return value.GetValue<double>();
}

std::optional<std::int64_t> readBigint(const ::duckdb::Value& value) {
    if (value.IsNull()) {
        return std::nullopt;
    }
    return value.GetValue<std::int64_t>();
}

bool databaseExists(const std::string& path) {
    std::error_code ec;
    const fs::path dbPath{path};
    return fs::exists(dbPath, ec) && !fs::is_directory(dbPath, ec);
}

// Last occurrence of a (ticker, date) key wins; first-seen order is kept.
std::vector<domain::PriceRow> collapseKeys(const std::vector<domain::PriceRow>& rows) {
    std::vector<domain::PriceRow> unique;
    unique.reserve(rows.size());
    std::map<std::pair<std::string, std::int64_t>, std::size_t> positions;

    for (const auto& row : rows) {
        if (row.ticker.empty()) {
            LOG_WARN("DuckPriceRepo: dropping row without ticker date=" << row.date.toString());
            continue;
        }
        const auto key = std::make_pair(row.ticker, row.date.days);
        auto [it, inserted] = positions.emplace(key, unique.size());
        if (inserted) {
            unique.push_back(row);
        } else {
            unique[it->second] = row;
        }
    }
    return unique;
}

}  // namespace

DuckPriceRepo::DuckPriceRepo(std::string dbPath, std::size_t chunkSize)
    : dbPath_(std::move(dbPath)), chunkSize_(chunkSize) {
    if (chunkSize_ == 0) {
        throw std::invalid_argument("DuckPriceRepo: chunk size must be >= 1");
    }
}

std::optional<domain::Date> DuckPriceRepo::maxPriceDate() const {
    if (!databaseExists(dbPath_)) {
        return std::nullopt;
    }

    try {
        ::duckdb::DuckDB database(dbPath_);
        ::duckdb::Connection connection(database);

        auto result = connection.Query("SELECT strftime(MAX(\"date\"), '%Y-%m-%d') FROM prices");
        throwIfFailed(result, "max date");

        if (auto chunk = result->Fetch()) {
            if (chunk->size() > 0) {
                const auto value = chunk->GetValue(0, 0);
                if (!value.IsNull()) {
                    const auto text = value.GetValue<std::string>();
                    auto parsed = domain::Date::parse(text);
                    if (!parsed) {
                        throw StoreError("DuckPriceRepo max date returned unparseable value '" + text + "'", "read");
                    }
                    return parsed;
                }
            }
        }
        return std::nullopt;
    }
    catch (const StoreError& ex) {
        throw StoreError(ex.what(), "read");
    }
    catch (const std::exception& ex) {
        throw StoreError(std::string{"DuckPriceRepo max date failed: "} + ex.what(), "read");
    }
}

domain::contracts::UpsertStats DuckPriceRepo::upsertPrices(const std::vector<domain::PriceRow>& rows) {
    domain::contracts::UpsertStats stats;
    const auto unique = collapseKeys(rows);
    if (unique.empty()) {
        return stats;
    }

    eod::common::metrics::Registry::ScopedTimer timer(eod::common::metrics::keys::kUpsertTimer);

    const fs::path dbPath{dbPath_};
    const auto parent = dbPath.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw StoreError("DuckPriceRepo: unable to create database directory '" + parent.string() +
                             "': " + ec.message());
        }
    }

    try {
        ::duckdb::DuckDB database(dbPath.string());
        ::duckdb::Connection connection(database);

        bool inTransaction = false;
        auto rollback = [&]() {
            if (!inTransaction) {
                return;
            }
            try {
                connection.Rollback();
            }
            catch (const std::exception& ex) {
                LOG_WARN("DuckPriceRepo rollback failed: " << ex.what());
            }
            inTransaction = false;
        };

        try {
            // Ticker registry first so every merged row has a registered identity.
            std::vector<domain::Ticker> tickers;
            for (const auto& row : unique) {
                if (std::find(tickers.begin(), tickers.end(), row.ticker) == tickers.end()) {
                    tickers.push_back(row.ticker);
                }
            }

            connection.BeginTransaction();
            inTransaction = true;
            auto registerStatement = connection.Prepare(kRegisterTicker);
            throwIfFailed(registerStatement, "prepare ticker registration");
            DuckdbValueVector parameters;
            for (const auto& ticker : tickers) {
                parameters.clear();
                parameters.emplace_back(ticker);
                auto result = registerStatement->Execute(parameters);
                throwIfFailed(result, "ticker registration");
                stats.tickersRegistered += static_cast<std::size_t>(firstInt64(result));
            }
            connection.Commit();
            inTransaction = false;

            const std::size_t total = unique.size();
            for (std::size_t offset = 0; offset < total; offset += chunkSize_) {
                const std::size_t end = std::min(offset + chunkSize_, total);

                connection.BeginTransaction();
                inTransaction = true;

                throwIfFailed(connection.Query(kCreateStaging), "create staging table");
                throwIfFailed(connection.Query("DELETE FROM staging_prices"), "clear staging table");

                auto stageStatement = connection.Prepare(kInsertStaging);
                throwIfFailed(stageStatement, "prepare staging insert");

                for (std::size_t index = offset; index < end; ++index) {
                    const auto& row = unique[index];
                    parameters.clear();
                    parameters.emplace_back(row.ticker);
                    parameters.emplace_back(row.date.toString());
                    parameters.emplace_back(optionalDouble(row.open));
                    parameters.emplace_back(optionalDouble(row.high));
                    parameters.emplace_back(optionalDouble(row.low));
                    parameters.emplace_back(optionalDouble(row.close));
                    parameters.emplace_back(optionalBigint(row.volume));

                    auto result = stageStatement->Execute(parameters);
                    throwIfFailed(result, "staging insert");
                }
                stats.rowsStaged += end - offset;

                auto merged = connection.Query(kMergeStaging);
                throwIfFailed(merged, "merge");
                stats.rowsMerged += static_cast<std::size_t>(firstInt64(merged));

                connection.Commit();
                inTransaction = false;
                ++stats.chunksCommitted;

                LOG_DEBUG("DuckPriceRepo: committed chunk rows=" << (end - offset) << " offset=" << offset);
            }
        }
        catch (...) {
            rollback();
            throw;
        }
    }
    catch (const StoreError& ex) {
        LOG_ERR("DuckPriceRepo upsert failed path=" << dbPath_ << " error=" << ex.what());
        throw StoreError(ex.what(), "upsert");
    }
    catch (const std::exception& ex) {
        LOG_ERR("DuckPriceRepo upsert exception path=" << dbPath_ << " error=" << ex.what());
        throw StoreError(std::string{"DuckPriceRepo upsert failed: "} + ex.what(), "upsert");
    }

    eod::common::metrics::Registry::instance().incrementCounter(eod::common::metrics::keys::kRowsUpserted,
                                                                stats.rowsMerged);
    LOG_INFO("DuckPriceRepo: upserted rows=" << stats.rowsMerged << " chunks=" << stats.chunksCommitted
                                             << " new_tickers=" << stats.tickersRegistered);
    return stats;
}

std::vector<domain::PriceRow> DuckPriceRepo::getPrices(const domain::Ticker& ticker,
                                                       std::optional<domain::Date> from,
                                                       std::optional<domain::Date> to) const {
    std::vector<domain::PriceRow> rows;
    if (ticker.empty() || !databaseExists(dbPath_)) {
        return rows;
    }

    try {
        ::duckdb::DuckDB database(dbPath_);
        ::duckdb::Connection connection(database);

        std::string query =
            "SELECT ticker, strftime(\"date\", '%Y-%m-%d'), open, high, low, close, volume "
            "FROM prices WHERE ticker = ?";
        DuckdbValueVector parameters;
        parameters.reserve(3);
        parameters.emplace_back(ticker);
        if (from) {
            query += " AND \"date\" >= CAST(? AS DATE)";
            parameters.emplace_back(from->toString());
        }
        if (to) {
            query += " AND \"date\" <= CAST(? AS DATE)";
            parameters.emplace_back(to->toString());
        }
        query += " ORDER BY \"date\" ASC";

        auto statement = connection.Prepare(query);
        throwIfFailed(statement, "prepare price query");
        auto result = statement->Execute(parameters);
        throwIfFailed(result, "price query");

        while (auto chunk = result->Fetch()) {
            const auto count = chunk->size();
            for (::duckdb::idx_t row = 0; row < count; ++row) {
                const auto dateValue = chunk->GetValue(1, row);
                if (dateValue.IsNull()) {
                    continue;
                }
                const auto date = domain::Date::parse(dateValue.GetValue<std::string>());
                if (!date) {
                    continue;
                }

                domain::PriceRow price;
                price.ticker = chunk->GetValue(0, row).GetValue<std::string>();
                price.date = *date;
                price.open = readDouble(chunk->GetValue(2, row));
                price.high = readDouble(chunk->GetValue(3, row));
                price.low = readDouble(chunk->GetValue(4, row));
                price.close = readDouble(chunk->GetValue(5, row));
                price.volume = readBigint(chunk->GetValue(6, row));
                rows.push_back(std::move(price));
            }
        }
        return rows;
    }
    catch (const StoreError& ex) {
        throw StoreError(ex.what(), "read");
    }
    catch (const std::exception& ex) {
        throw StoreError(std::string{"DuckPriceRepo price query failed: "} + ex.what(), "read");
    }
}

std::vector<domain::Ticker> DuckPriceRepo::listTickers() const {
    std::vector<domain::Ticker> tickers;
    if (!databaseExists(dbPath_)) {
        return tickers;
    }

    try {
        ::duckdb::DuckDB database(dbPath_);
        ::duckdb::Connection connection(database);

        auto result = connection.Query("SELECT ticker FROM tickers ORDER BY ticker");
        throwIfFailed(result, "ticker listing");

        while (auto chunk = result->Fetch()) {
            const auto count = chunk->size();
            for (::duckdb::idx_t row = 0; row < count; ++row) {
                const auto value = chunk->GetValue(0, row);
                if (!value.IsNull()) {
                    tickers.push_back(value.GetValue<std::string>());
                }
            }
        }
        return tickers;
    }
    catch (const StoreError&) {
        throw;
    }
    catch (const std::exception& ex) {
        throw StoreError(std::string{"DuckPriceRepo ticker listing failed: "} + ex.what());
    }
}

std::int64_t DuckPriceRepo::countPrices() const {
    if (!databaseExists(dbPath_)) {
        return 0;
    }

    try {
        ::duckdb::DuckDB database(dbPath_);
        ::duckdb::Connection connection(database);

        auto result = connection.Query("SELECT COUNT(*) FROM prices");
        throwIfFailed(result, "price count");
        return firstInt64(result);
    }
    catch (const StoreError&) {
        throw;
    }
    catch (const std::exception& ex) {
        throw StoreError(std::string{"DuckPriceRepo price count failed: "} + ex.what());
    }
}

}  // namespace adapters::duckdb
