#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "common/Log.hpp"

namespace eod::common {

struct Config {
    eod::log::Level logLevel = eod::log::Level::Info;
    std::string duckdbPath = "/data/market.duckdb";

    std::size_t batchSize = 25;
    double sleepSec = 1.5;
    int maxRetries = 6;
    double backoffFactor = 1.5;
    // Cap on a server-supplied Retry-After, in whole seconds.
    int maxRetryAfterSec = 60;
    double adaptiveSlowSec = 6.0;
    double throttleCooldownSec = 180.0;
    double jitterSec = 0.4;
    bool threads = false;
    int periodDays = 365;
    int timeoutSec = 30;
    std::string yfHost = "query1.finance.yahoo.com";
    std::size_t chunkSize = 5000;

    // Normalized and de-duplicated, in the order given.
    std::vector<std::string> tickers{};
    std::string tickersFile;

    static Config fromArgs(int argc, char** argv);

    static std::chrono::milliseconds toMillis(double seconds);
};

// Reads one symbol per line; blank lines and '#' comments are ignored, commas split a line.
std::vector<std::string> readTickersFile(const std::string& path);

}  // namespace eod::common
