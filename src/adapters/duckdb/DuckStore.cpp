#include "adapters/duckdb/DuckStore.hpp"

#include <filesystem>
#include <initializer_list>
#include <string>
#include <system_error>
#include <utility>

#include <duckdb.hpp>

#include "common/Log.hpp"
#include "domain/Ports.hpp"

namespace fs = std::filesystem;

namespace adapters::duckdb {
namespace {

constexpr const char* kCreateTickersTable = R"SQL(
    CREATE TABLE IF NOT EXISTS tickers (
        ticker VARCHAR PRIMARY KEY,
        name VARCHAR,
        sector VARCHAR,
        exchange VARCHAR
    )
)SQL";

constexpr const char* kCreatePricesTable = R"SQL(
    CREATE TABLE IF NOT EXISTS prices (
        ticker VARCHAR NOT NULL,
        "date" DATE NOT NULL,
        open DOUBLE,
        high DOUBLE,
        low DOUBLE,
        close DOUBLE,
        volume BIGINT,
        PRIMARY KEY (ticker, "date")
    )
)SQL";

}  // namespace

DuckStore::DuckStore(std::string dbPath) : dbPath_(std::move(dbPath)) {}

void DuckStore::migrate() {
    const fs::path dbPath{dbPath_};

    if (dbPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(dbPath.parent_path(), ec);
        if (ec) {
            throw domain::contracts::StoreError("DuckStore: unable to create directory '" +
                                                dbPath.parent_path().string() + "': " + ec.message(),
                                                "migrate");
        }
    }

    ::duckdb::DuckDB db(dbPath.string());
    ::duckdb::Connection connection(db);

    for (const auto* statement : {kCreateTickersTable, kCreatePricesTable}) {
        auto result = connection.Query(statement);
        if (!result || result->HasError()) {
            const std::string errorMessage =
                result ? result->GetError() : std::string("unknown error applying schema");
            throw domain::contracts::StoreError("DuckStore: migration failed: " + errorMessage, "migrate");
        }
    }

    LOG_INFO("DuckStore migration finished for " << dbPath.string());
}

}  // namespace adapters::duckdb
