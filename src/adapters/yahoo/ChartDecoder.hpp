#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "domain/Models.hpp"
#include "domain/RawResponse.hpp"

namespace adapters::yahoo {

// Daily bars of one symbol as returned by the chart endpoint. Index entries are the start of
// the exchange-local trading day in epoch seconds; fields carry the provider's column labels.
struct ChartSeries {
    domain::Ticker symbol;
    std::vector<std::int64_t> index;
    std::vector<std::pair<std::string, domain::Column>> fields;

    bool empty() const noexcept { return index.empty(); }
};

// Decodes a chart payload. Throws std::runtime_error when the body is not JSON or carries a
// provider error object; the message keeps the provider's wording for failure classification.
ChartSeries decodeChart(std::string_view body, const domain::Ticker& symbol);

// Extracts "code: description" from a chart error payload, or an empty string.
std::string describeChartError(std::string_view body);

// One requested symbol yields a flat single-ticker frame; several yield a (field, ticker)
// two-level frame over the union of their trading days. No bars at all yields an empty response.
domain::RawResponse assembleResponse(const std::vector<ChartSeries>& series, std::size_t requestedCount);

}  // namespace adapters::yahoo
