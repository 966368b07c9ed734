#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include "adapters/duckdb/DuckPriceRepo.hpp"
#include "adapters/duckdb/DuckStore.hpp"
#include "adapters/yahoo/YahooChartClient.hpp"
#include "app/IngestionWorker.hpp"
#include "app/RateController.hpp"
#include "common/Clock.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "domain/Ports.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace {

constexpr int kExitConfigError = 1;
constexpr int kExitStoreError = 2;

std::string joinList(const std::vector<std::string>& values) {
    std::string joined;
    for (const auto& value : values) {
        if (joined.empty()) {
            joined = value;
        } else {
            joined.append(",").append(value);
        }
    }
    return joined;
}

}  // namespace

int main(int argc, char** argv) {
    std::set_terminate([] {
        try {
            auto eptr = std::current_exception();
            if (eptr) {
                try {
                    std::rethrow_exception(eptr);
                } catch (const std::exception& ex) {
                    std::fprintf(stderr, "std::terminate: %s\n", ex.what());
                } catch (...) {
                    std::fprintf(stderr, "std::terminate: unknown exception\n");
                }
            } else {
                std::fprintf(stderr, "std::terminate without current_exception\n");
            }
        } catch (...) {
        }
        std::_Exit(1);
    });

    eod::common::Config config;
    try {
        config = eod::common::Config::fromArgs(argc, argv);
    } catch (const std::exception& ex) {
        LOG_ERR("Configuración inválida: " << ex.what());
        return kExitConfigError;
    }
    eod::log::setLevel(config.logLevel);

    LOG_INFO("Configuración cargada");
    LOG_INFO("  Nivel de log: " << eod::log::levelToString(config.logLevel));
    LOG_INFO("  Tickers (" << config.tickers.size() << "): " << joinList(config.tickers));
    LOG_INFO("  batch_size=" << config.batchSize << " sleep=" << config.sleepSec << "s slow="
                             << config.adaptiveSlowSec << "s jitter=" << config.jitterSec << "s cooldown="
                             << config.throttleCooldownSec << "s");
    LOG_INFO("  max_retries=" << config.maxRetries << " backoff=" << config.backoffFactor
                              << " max_retry_after=" << config.maxRetryAfterSec << "s"
                              << " threads=" << (config.threads ? "on" : "off") << " period_days="
                              << config.periodDays << " chunk_size=" << config.chunkSize);

    if (config.tickers.empty()) {
        LOG_WARN("No hay tickers configurados (--tickers, TICKERS o --tickers-file)");
    }

    auto& clock = eod::common::SystemClock::instance();

    try {
        adapters::duckdb::DuckStore store(config.duckdbPath);
        store.migrate();
    } catch (const std::exception& ex) {
        LOG_ERR("No se pudieron aplicar migraciones DuckDB stage=migrate: " << ex.what());
        return kExitStoreError;
    }

    try {
        app::RateController::Options pacing;
        pacing.baseInterval = eod::common::Config::toMillis(config.sleepSec);
        pacing.slowInterval = eod::common::Config::toMillis(config.adaptiveSlowSec);
        pacing.maxJitter = eod::common::Config::toMillis(config.jitterSec);
        app::RateController rateController(clock, pacing);

        adapters::yahoo::YahooChartClient::Options providerOptions;
        providerOptions.host = config.yfHost;
        providerOptions.timeoutSec = config.timeoutSec;
        providerOptions.maxRetries = config.maxRetries;
        providerOptions.backoffFactor = config.backoffFactor;
        providerOptions.parallel = config.threads;
        providerOptions.maxRetryAfter = std::chrono::seconds(config.maxRetryAfterSec);
        adapters::yahoo::YahooChartClient provider(providerOptions, clock,
                                                   infra::http::TlsHttpTransport::instance());

        adapters::duckdb::DuckPriceRepo repo(config.duckdbPath, config.chunkSize);

        app::IngestionWorker::Options workerOptions;
        workerOptions.batchSize = config.batchSize;
        workerOptions.lookbackDays = config.periodDays;
        workerOptions.throttleCooldown = eod::common::Config::toMillis(config.throttleCooldownSec);
        app::IngestionWorker worker(provider, repo, rateController, clock, workerOptions);

        const auto report = worker.run(config.tickers);
        LOG_INFO("Ingesta finalizada: filas=" << report.rowsUpserted << " omitidos=" << report.skipped.size()
                                              << " intentos=" << report.attempts);
    } catch (const domain::contracts::StoreError& ex) {
        const std::string stage = ex.stage().empty() ? "upsert" : ex.stage();
        LOG_ERR("Ingesta abortada stage=" << stage << ": " << ex.what());
        return kExitStoreError;
    } catch (const std::invalid_argument& ex) {
        LOG_ERR("Configuración inválida: " << ex.what());
        return kExitConfigError;
    }

    return EXIT_SUCCESS;
}
