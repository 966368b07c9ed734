#include "adapters/yahoo/YahooChartClient.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "common/Clock.hpp"
#include "common/Log.hpp"
#include "infra/http/TlsHttpClient.hpp"

namespace adapters::yahoo {

namespace {

std::string urlEncode(const std::string& value) {
    std::string encoded;
    encoded.reserve(value.size());
    for (const unsigned char ch : value) {
        const bool unreserved = (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') ||
                                ch == '-' || ch == '_' || ch == '.' || ch == '~';
        if (unreserved) {
            encoded.push_back(static_cast<char>(ch));
        } else {
            char buffer[4];
            std::snprintf(buffer, sizeof(buffer), "%%%02X", ch);
            encoded.append(buffer);
        }
    }
    return encoded;
}

bool isRetryableStatus(unsigned status) {
    return status == 429U || (status >= 500U && status < 600U);
}

}  // namespace

YahooChartClient::YahooChartClient(Options options, eod::common::Clock& clock, infra::http::HttpTransport& transport)
    : options_(std::move(options)), clock_(clock), transport_(transport) {
    if (options_.host.empty()) {
        throw std::invalid_argument("YahooChartClient host must not be empty");
    }
    if (options_.maxRetries < 1) {
        throw std::invalid_argument("YahooChartClient maxRetries must be >= 1");
    }
    if (options_.backoffFactor < 0.0) {
        throw std::invalid_argument("YahooChartClient backoffFactor must be >= 0");
    }
    if (options_.maxRetryAfter.count() < 0) {
        throw std::invalid_argument("YahooChartClient maxRetryAfter must be >= 0");
    }
    if (options_.maxParallel == 0) {
        options_.maxParallel = 1;
    }
}

std::string YahooChartClient::chartTarget(const domain::Ticker& symbol, const domain::FetchWindow& window) {
    std::ostringstream target;
    target << "/v8/finance/chart/" << urlEncode(symbol) << "?period1=" << window.start.toEpochSeconds()
           << "&period2=" << window.end.toEpochSeconds()
           << "&interval=1d&events=history&includeAdjustedClose=true";
    return target.str();
}

std::chrono::milliseconds YahooChartClient::backoffFor(int attempt, const std::string& retryAfter) const {
    if (!retryAfter.empty()) {
        try {
            std::size_t consumed = 0;
            const long long seconds = std::stoll(retryAfter, &consumed);
            if (consumed == retryAfter.size() && seconds >= 0) {
                const auto bounded = std::min<long long>(seconds, options_.maxRetryAfter.count());
                return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(bounded));
            }
        } catch (const std::exception& ex) {
            LOG_DEBUG("Retry-After no numerico '" << retryAfter << "': " << ex.what());
        }
    }
    const double seconds = options_.backoffFactor * std::pow(2.0, static_cast<double>(attempt - 1));
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
}

ChartSeries YahooChartClient::fetchSeries(const domain::Ticker& symbol, const domain::FetchWindow& window) {
    using domain::contracts::ProviderError;

    const std::string target = chartTarget(symbol, window);
    LOG_DEBUG("Yahoo chart GET " << options_.host << target);

    for (int attempt = 1; attempt <= options_.maxRetries; ++attempt) {
        const bool lastAttempt = attempt == options_.maxRetries;

        infra::http::HttpResponse response;
        try {
            response = transport_.get(options_.host, target, options_.timeoutSec);
        } catch (const std::exception& ex) {
            if (lastAttempt) {
                std::ostringstream oss;
                oss << "Yahoo chart request for " << symbol << " failed after " << options_.maxRetries
                    << " attempts: " << ex.what();
                throw ProviderError(oss.str(), 0U, false);
            }
            const auto backoff = backoffFor(attempt, {});
            LOG_WARN("Yahoo chart network error for " << symbol << " (attempt " << attempt << "): " << ex.what()
                                                      << ", sleeping " << backoff.count() << " ms");
            clock_.sleepFor(backoff);
            continue;
        }

        const unsigned status = response.status;
        if (status == 200U) {
            return decodeChart(response.body, symbol);
        }

        if (isRetryableStatus(status)) {
            if (lastAttempt) {
                std::ostringstream oss;
                oss << "Yahoo chart request for " << symbol << " failed after " << options_.maxRetries
                    << " attempts with HTTP " << status;
                if (status == 429U) {
                    oss << " (Too Many Requests)";
                }
                throw ProviderError(oss.str(), status, status == 429U);
            }
            const auto backoff = backoffFor(attempt, response.retry_after_header);
            LOG_WARN("Yahoo chart backoff attempt " << attempt << " due to HTTP " << status << " for " << symbol
                                                    << ", sleeping " << backoff.count() << " ms");
            clock_.sleepFor(backoff);
            continue;
        }

        // Unknown or delisted symbols come back as 404 with a chart error; they contribute no bars.
        if (status == 404U) {
            LOG_WARN("Yahoo chart sin datos para " << symbol << ": " << describeChartError(response.body));
            ChartSeries empty;
            empty.symbol = symbol;
            return empty;
        }

        std::ostringstream oss;
        oss << "Yahoo chart request for " << symbol << " returned unexpected HTTP " << status;
        const auto detail = describeChartError(response.body);
        if (!detail.empty()) {
            oss << ": " << detail;
        }
        throw ProviderError(oss.str(), status, false);
    }

    throw ProviderError("Yahoo chart request for " + symbol + " failed without success response", 0U, false);
}

domain::RawResponse YahooChartClient::download(const std::vector<domain::Ticker>& symbols,
                                               const domain::FetchWindow& window) {
    if (symbols.empty() || window.empty()) {
        return domain::EmptyResponse{};
    }

    std::vector<ChartSeries> series(symbols.size());

    if (!options_.parallel || symbols.size() == 1) {
        for (std::size_t i = 0; i < symbols.size(); ++i) {
            series[i] = fetchSeries(symbols[i], window);
        }
        return assembleResponse(series, symbols.size());
    }

    std::vector<std::exception_ptr> errors(symbols.size());
    {
        boost::asio::thread_pool pool(std::min(options_.maxParallel, symbols.size()));
        for (std::size_t i = 0; i < symbols.size(); ++i) {
            boost::asio::post(pool, [this, i, &symbols, &window, &series, &errors]() {
                try {
                    series[i] = fetchSeries(symbols[i], window);
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            });
        }
        pool.join();
    }

    for (const auto& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }
    return assembleResponse(series, symbols.size());
}

}  // namespace adapters::yahoo
