#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "domain/Models.hpp"

namespace eod::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

std::size_t parsePositiveSize(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed);
        if (consumed != value.size() || parsed <= 0) {
            throw std::out_of_range("must be >= 1");
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Valor inválido para " + label + ": " + value);
    }
}

int parsePositiveInt(const std::string& value, const std::string& label) {
    const auto parsed = parsePositiveSize(value, label);
    if (parsed > 1'000'000U) {
        throw std::runtime_error("Valor inválido para " + label + ": " + value);
    }
    return static_cast<int>(parsed);
}

double parseSeconds(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed) || parsed < 0.0) {
            throw std::out_of_range("must be a non-negative number");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error("Valor inválido para " + label + ": " + value);
    }
}

bool parseBool(const std::string& value, const std::string& label) {
    const auto normalized = toLower(trim(value));
    if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
        return true;
    }
    if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
        return false;
    }
    throw std::runtime_error("Valor booleano inválido para " + label + ": " + value);
}

std::vector<std::string> parseCsvList(const std::string& value) {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto trimmed = trim(item);
        if (!trimmed.empty()) {
            parts.push_back(std::move(trimmed));
        }
    }
    return parts;
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc && std::string{argv[i + 1]}.rfind("--", 0) != 0) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

bool hasFlag(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (key == argv[i]) {
            return true;
        }
    }
    return false;
}

// Environment first, then the flag; an empty value leaves the current setting.
template <typename Apply>
void applySetting(int argc, char** argv, const char* envKey, const std::string& flag, Apply&& apply) {
    if (envKey != nullptr) {
        if (const char* envValue = std::getenv(envKey)) {
            auto value = trim(envValue);
            if (!value.empty()) {
                apply(value, std::string{envKey});
            }
        }
    }
    if (auto argValue = trim(valueFromArgs(argc, argv, flag)); !argValue.empty()) {
        apply(argValue, flag);
    }
}

}  // namespace

std::chrono::milliseconds Config::toMillis(double seconds) {
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
}

std::vector<std::string> readTickersFile(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("No se pudo abrir el archivo de tickers: " + path);
    }

    std::vector<std::string> tickers;
    std::string line;
    while (std::getline(input, line)) {
        if (const auto hash = line.find('#'); hash != std::string::npos) {
            line.erase(hash);
        }
        for (auto& entry : parseCsvList(line)) {
            tickers.push_back(std::move(entry));
        }
    }
    return tickers;
}

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    applySetting(argc, argv, "LOG_LEVEL", "--log-level", [&](const std::string& value, const std::string&) {
        config.logLevel = eod::log::levelFromString(toLower(value));
    });
    applySetting(argc, argv, "DUCKDB_PATH", "--duckdb", [&](const std::string& value, const std::string&) {
        config.duckdbPath = value;
    });
    applySetting(argc, argv, "YF_MAX_BATCH", "--batch-size", [&](const std::string& value, const std::string& label) {
        config.batchSize = parsePositiveSize(value, label);
    });
    applySetting(argc, argv, "YF_SLEEP_SEC", "--sleep-sec", [&](const std::string& value, const std::string& label) {
        config.sleepSec = parseSeconds(value, label);
    });
    applySetting(argc, argv, "YF_MAX_RETRIES", "--max-retries",
                 [&](const std::string& value, const std::string& label) {
                     config.maxRetries = parsePositiveInt(value, label);
                 });
    applySetting(argc, argv, "YF_BACKOFF_FACTOR", "--backoff-factor",
                 [&](const std::string& value, const std::string& label) {
                     config.backoffFactor = parseSeconds(value, label);
                 });
    applySetting(argc, argv, "YF_MAX_RETRY_AFTER_SEC", "--max-retry-after-sec",
                 [&](const std::string& value, const std::string& label) {
                     config.maxRetryAfterSec = parsePositiveInt(value, label);
                 });
    applySetting(argc, argv, "YF_ADAPTIVE_SLOWSEC", "--adaptive-slow-sec",
                 [&](const std::string& value, const std::string& label) {
                     config.adaptiveSlowSec = parseSeconds(value, label);
                 });
    applySetting(argc, argv, "YF_THROTTLE_COOLDOWN_SEC", "--throttle-cooldown-sec",
                 [&](const std::string& value, const std::string& label) {
                     config.throttleCooldownSec = parseSeconds(value, label);
                 });
    applySetting(argc, argv, "YF_JITTER_SEC", "--jitter-sec", [&](const std::string& value, const std::string& label) {
        config.jitterSec = parseSeconds(value, label);
    });
    applySetting(argc, argv, "YF_THREADS", "--threads", [&](const std::string& value, const std::string& label) {
        config.threads = parseBool(value, label);
    });
    applySetting(argc, argv, "YF_PERIOD_DAYS", "--period-days",
                 [&](const std::string& value, const std::string& label) {
                     config.periodDays = parsePositiveInt(value, label);
                 });
    applySetting(argc, argv, "YF_TIMEOUT_SEC", "--timeout-sec",
                 [&](const std::string& value, const std::string& label) {
                     config.timeoutSec = parsePositiveInt(value, label);
                 });
    applySetting(argc, argv, "YF_HOST", "--yf-host", [&](const std::string& value, const std::string&) {
        config.yfHost = value;
    });
    applySetting(argc, argv, "UPSERT_CHUNK_SIZE", "--chunk-size",
                 [&](const std::string& value, const std::string& label) {
                     config.chunkSize = parsePositiveSize(value, label);
                 });

    std::vector<std::string> rawTickers;
    applySetting(argc, argv, "TICKERS", "--tickers", [&](const std::string& value, const std::string&) {
        rawTickers = parseCsvList(value);
    });
    applySetting(argc, argv, nullptr, "--tickers-file", [&](const std::string& value, const std::string&) {
        config.tickersFile = value;
    });
    if (!config.tickersFile.empty()) {
        auto fromFile = readTickersFile(config.tickersFile);
        rawTickers.insert(rawTickers.end(), fromFile.begin(), fromFile.end());
    }
    config.tickers = domain::normalizeUniverse(rawTickers);

    if (hasFlag(argc, argv, "--threads")) {
        config.threads = true;
    }

    const std::filesystem::path duckPath{config.duckdbPath};
    const auto parentDir = duckPath.parent_path();
    if (!parentDir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parentDir, ec);
        if (ec) {
            throw std::runtime_error("No se pudo crear el directorio para DuckDB (" + parentDir.string() + "): " +
                                     ec.message());
        }
    }

    LOG_INFO("DuckDB path: " << duckPath.string());

    return config;
}

}  // namespace eod::common
