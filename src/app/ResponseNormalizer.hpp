#pragma once

#include <vector>

#include "domain/Models.hpp"
#include "domain/RawResponse.hpp"

namespace app {

// Reconciles one raw batch response into tidy (ticker, date) rows.
//
// Single-ticker frames take their identity from the first requested ticker; multi-ticker frames
// are reordered to (ticker, field) using the frame's axis tag and produce rows for every ticker
// present in the columns. Field names match case-insensitively. When no close column exists an
// adjusted close is used instead. Rows with neither close nor volume are dropped. Missing cells
// stay empty in the output; index timestamps are floored to calendar days.
//
// Pure: no logging, no throwing on ragged or partially filled frames.
std::vector<domain::PriceRow> normalizeResponse(const domain::RawResponse& response,
                                                const std::vector<domain::Ticker>& requested);

}  // namespace app
