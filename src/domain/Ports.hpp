#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "domain/Models.hpp"
#include "domain/RawResponse.hpp"

namespace domain::contracts {

// Failure reported by a provider that knows the transport outcome. httpStatus is 0 when no
// response was received.
class ProviderError : public std::runtime_error {
public:
    ProviderError(const std::string& message, unsigned httpStatus, bool throttled)
        : std::runtime_error(message), httpStatus_(httpStatus), throttled_(throttled) {}

    unsigned httpStatus() const noexcept { return httpStatus_; }
    bool throttled() const noexcept { return throttled_; }

private:
    unsigned httpStatus_;
    bool throttled_;
};

// Upstream daily-bar provider. Failures surface as exceptions carrying the provider's message.
class IMarketDataProvider {
public:
    virtual ~IMarketDataProvider() = default;

    virtual RawResponse download(const std::vector<Ticker>& symbols, const FetchWindow& window) = 0;
};

// stage names the pipeline step that failed ("read", "upsert", "migrate"); empty when unknown.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message, std::string stage = {})
        : std::runtime_error(message), stage_(std::move(stage)) {}

    const std::string& stage() const noexcept { return stage_; }

private:
    std::string stage_;
};

struct UpsertStats {
    std::size_t tickersRegistered{0};
    std::size_t rowsStaged{0};
    std::size_t rowsMerged{0};
    std::size_t chunksCommitted{0};
};

// Sole writer of the persisted price table. Implementations throw StoreError.
class IPriceStore {
public:
    virtual ~IPriceStore() = default;

    virtual std::optional<Date> maxPriceDate() const = 0;
    virtual UpsertStats upsertPrices(const std::vector<PriceRow>& rows) = 0;
};

// Read side consumed by downstream stages.
class IPriceReadRepo {
public:
    virtual ~IPriceReadRepo() = default;

    virtual std::vector<PriceRow> getPrices(const Ticker& ticker,
                                            std::optional<Date> from,
                                            std::optional<Date> to) const = 0;

    virtual std::vector<Ticker> listTickers() const {
        return {};
    }
};

}  // namespace domain::contracts
