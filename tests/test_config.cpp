#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "TestSupport.hpp"
#include "common/Config.hpp"

namespace {

// Restores every touched variable on destruction.
struct EnvGuard {
    ~EnvGuard() {
        for (const auto& [key, original] : saved) {
            if (original) {
                ::setenv(key.c_str(), original->c_str(), 1);
            } else {
                ::unsetenv(key.c_str());
            }
        }
    }

    void remember(const std::string& key) {
        if (saved.count(key) != 0U) {
            return;
        }
        const char* current = std::getenv(key.c_str());
        saved[key] = current ? std::optional<std::string>{current} : std::nullopt;
    }

    void set(const std::string& key, const std::string& value) {
        remember(key);
        ::setenv(key.c_str(), value.c_str(), 1);
    }

    void clear(const std::string& key) {
        remember(key);
        ::unsetenv(key.c_str());
    }

    std::map<std::string, std::optional<std::string>> saved;
};

const std::vector<std::string> kKeys{"DUCKDB_PATH",         "LOG_LEVEL",        "YF_MAX_BATCH",
                                     "YF_SLEEP_SEC",        "YF_MAX_RETRIES",   "YF_BACKOFF_FACTOR",
                                     "YF_ADAPTIVE_SLOWSEC", "YF_THREADS",       "YF_PERIOD_DAYS",
                                     "YF_TIMEOUT_SEC",      "YF_HOST",          "UPSERT_CHUNK_SIZE",
                                     "TICKERS",             "YF_JITTER_SEC",    "YF_THROTTLE_COOLDOWN_SEC",
                                     "YF_MAX_RETRY_AFTER_SEC"};

::eod::common::Config runConfig(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size());
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return ::eod::common::Config::fromArgs(static_cast<int>(argv.size()), argv.data());
}

const std::filesystem::path kRoot = std::filesystem::temp_directory_path() / "eod_ingest_config_test";

int testDefaults(EnvGuard& env) {
    const auto dbPath = (kRoot / "default" / "market.duckdb").string();
    env.set("DUCKDB_PATH", dbPath);
    const auto config = runConfig({"eod_ingest"});
    EXPECT(config.duckdbPath == dbPath);
    EXPECT(config.batchSize == 25U);
    EXPECT(config.sleepSec == 1.5);
    EXPECT(config.maxRetries == 6);
    EXPECT(config.backoffFactor == 1.5);
    EXPECT(config.maxRetryAfterSec == 60);
    EXPECT(config.adaptiveSlowSec == 6.0);
    EXPECT(config.throttleCooldownSec == 180.0);
    EXPECT(config.jitterSec == 0.4);
    EXPECT(!config.threads);
    EXPECT(config.periodDays == 365);
    EXPECT(config.chunkSize == 5000U);
    EXPECT(config.yfHost == "query1.finance.yahoo.com");
    EXPECT(config.tickers.empty());
    EXPECT(config.logLevel == eod::log::Level::Info);
    EXPECT(std::filesystem::exists(kRoot / "default"));
    EXPECT(::eod::common::Config::toMillis(config.sleepSec).count() == 1500);
    return 0;
}

int testEnvironmentThenFlags(EnvGuard& env) {
    env.set("DUCKDB_PATH", (kRoot / "env" / "market.duckdb").string());
    env.set("YF_MAX_BATCH", "10");
    env.set("YF_SLEEP_SEC", "2.5");
    env.set("YF_THREADS", "true");
    env.set("TICKERS", " aapl, msft ,brk.b,AAPL");
    env.set("LOG_LEVEL", "DEBUG");
    env.set("YF_MAX_RETRY_AFTER_SEC", "15");

    auto fromEnv = runConfig({"eod_ingest"});
    EXPECT(fromEnv.batchSize == 10U);
    EXPECT(fromEnv.sleepSec == 2.5);
    EXPECT(fromEnv.maxRetryAfterSec == 15);
    EXPECT(fromEnv.threads);
    EXPECT(fromEnv.logLevel == eod::log::Level::Debug);
    EXPECT((fromEnv.tickers == std::vector<std::string>{"AAPL", "MSFT", "BRK-B"}));

    const auto flagPath = (kRoot / "flag" / "market.duckdb").string();
    auto fromFlags = runConfig({"eod_ingest", "--batch-size", "5", "--sleep-sec=0", "--threads=off", "--duckdb",
                                flagPath, "--tickers", "spy", "--chunk-size", "100"});
    EXPECT(fromFlags.batchSize == 5U);
    EXPECT(fromFlags.sleepSec == 0.0);
    EXPECT(!fromFlags.threads);
    EXPECT(fromFlags.duckdbPath == flagPath);
    EXPECT(fromFlags.chunkSize == 100U);
    EXPECT((fromFlags.tickers == std::vector<std::string>{"SPY"}));
    EXPECT(std::filesystem::exists(kRoot / "flag"));

    env.set("YF_THREADS", "false");
    auto bareFlag = runConfig({"eod_ingest", "--threads", "--tickers", "QQQ"});
    EXPECT(bareFlag.threads);
    EXPECT((bareFlag.tickers == std::vector<std::string>{"QQQ"}));
    return 0;
}

int testTickersFile(EnvGuard& env) {
    env.set("DUCKDB_PATH", (kRoot / "file" / "market.duckdb").string());
    env.set("TICKERS", "AAPL");
    std::filesystem::create_directories(kRoot);
    const auto file = kRoot / "tickers.txt";
    {
        std::ofstream out(file);
        out << "# S&P sample\nmsft\n\n brk.b  # class B\nGOOGL,aapl\n";
    }

    const auto config = runConfig({"eod_ingest", "--tickers-file", file.string()});
    EXPECT((config.tickers == std::vector<std::string>{"AAPL", "MSFT", "BRK-B", "GOOGL"}));
    EXPECT(config.tickersFile == file.string());

    try {
        runConfig({"eod_ingest", "--tickers-file", (kRoot / "missing.txt").string()});
        std::cerr << "expected error for missing tickers file\n";
        return 1;
    } catch (const std::runtime_error&) {
    }
    return 0;
}

int testInvalidValuesNameTheKey(EnvGuard& env) {
    env.set("DUCKDB_PATH", (kRoot / "invalid" / "market.duckdb").string());
    env.set("YF_MAX_BATCH", "0");
    try {
        runConfig({"eod_ingest"});
        std::cerr << "expected error for YF_MAX_BATCH=0\n";
        return 1;
    } catch (const std::runtime_error& ex) {
        EXPECT(std::string{ex.what()}.find("YF_MAX_BATCH") != std::string::npos);
    }
    env.clear("YF_MAX_BATCH");

    try {
        runConfig({"eod_ingest", "--sleep-sec", "-1"});
        std::cerr << "expected error for negative --sleep-sec\n";
        return 1;
    } catch (const std::runtime_error& ex) {
        EXPECT(std::string{ex.what()}.find("--sleep-sec") != std::string::npos);
    }

    try {
        runConfig({"eod_ingest", "--max-retry-after-sec", "99999999999999999999"});
        std::cerr << "expected error for out of range --max-retry-after-sec\n";
        return 1;
    } catch (const std::runtime_error& ex) {
        EXPECT(std::string{ex.what()}.find("--max-retry-after-sec") != std::string::npos);
    }

    try {
        runConfig({"eod_ingest", "--threads=maybe"});
        std::cerr << "expected error for --threads=maybe\n";
        return 1;
    } catch (const std::runtime_error&) {
    }

    try {
        runConfig({"eod_ingest", "--log-level", "verbose"});
        std::cerr << "expected error for unknown log level\n";
        return 1;
    } catch (const std::exception&) {
    }
    return 0;
}

}  // namespace

int main() {
    int failures = 0;
    {
        EnvGuard env;
        for (const auto& key : kKeys) {
            env.clear(key);
        }
        std::filesystem::remove_all(kRoot);

        failures += testDefaults(env);
        failures += testEnvironmentThenFlags(env);
        failures += testTickersFile(env);
        failures += testInvalidValuesNameTheKey(env);
    }
    std::error_code ec;
    std::filesystem::remove_all(kRoot, ec);
    return failures == 0 ? 0 : 1;
}
