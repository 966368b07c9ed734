#pragma once

#include <string>

namespace adapters::duckdb {

// Creates the ticker registry and the price table when absent.
class DuckStore {
public:
    explicit DuckStore(std::string dbPath = "data/market.duckdb");

    void migrate();

private:
    std::string dbPath_;
};

}  // namespace adapters::duckdb
