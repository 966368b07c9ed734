#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "adapters/yahoo/ChartDecoder.hpp"
#include "domain/Ports.hpp"

namespace eod::common {
class Clock;
}

namespace infra::http {
class HttpTransport;
}

namespace adapters::yahoo {

// Daily bars from the public chart endpoint, one request per symbol. A batch is served either
// sequentially or on a bounded worker pool and assembled into a single raw response.
class YahooChartClient : public domain::contracts::IMarketDataProvider {
public:
    struct Options {
        std::string host{"query1.finance.yahoo.com"};
        int timeoutSec{30};
        int maxRetries{6};
        double backoffFactor{1.5};
        bool parallel{false};
        std::size_t maxParallel{8};
        // Upper bound for a server-supplied Retry-After wait.
        std::chrono::seconds maxRetryAfter{60};
    };

    // Failures are thrown as domain::contracts::ProviderError carrying the HTTP status.
    YahooChartClient(Options options, eod::common::Clock& clock, infra::http::HttpTransport& transport);
    ~YahooChartClient() override = default;

    domain::RawResponse download(const std::vector<domain::Ticker>& symbols,
                                 const domain::FetchWindow& window) override;

    static std::string chartTarget(const domain::Ticker& symbol, const domain::FetchWindow& window);

    // Retry-After (delta seconds, clamped to maxRetryAfter) when present and numeric, otherwise
    // backoffFactor * 2^(attempt - 1) seconds.
    std::chrono::milliseconds backoffFor(int attempt, const std::string& retryAfter) const;

private:
    ChartSeries fetchSeries(const domain::Ticker& symbol, const domain::FetchWindow& window);

    Options options_;
    eod::common::Clock& clock_;
    infra::http::HttpTransport& transport_;
};

}  // namespace adapters::yahoo
