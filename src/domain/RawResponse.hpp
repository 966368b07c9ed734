#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace domain {

using Cell = std::optional<double>;
using Column = std::vector<Cell>;

// Flat-column table for one symbol. values[c][r] is column c at index position r.
// Index entries are epoch seconds already shifted to the exchange's local day.
struct SingleTickerFrame {
    std::vector<std::int64_t> index;
    std::vector<std::string> columns;
    std::vector<Column> values;

    bool empty() const noexcept { return index.empty() || columns.empty(); }
};

enum class AxisOrder {
    TickerField,
    FieldTicker,
};

using ColumnKey = std::pair<std::string, std::string>;

// Two-level column table covering several symbols. The level holding field names is
// given by axisOrder: (ticker, field) or (field, ticker).
struct MultiTickerFrame {
    std::vector<std::int64_t> index;
    std::vector<ColumnKey> columns;
    std::vector<Column> values;
    AxisOrder axisOrder{AxisOrder::TickerField};

    bool empty() const noexcept { return index.empty() || columns.empty(); }
};

struct EmptyResponse {};

using RawResponse = std::variant<EmptyResponse, SingleTickerFrame, MultiTickerFrame>;

bool isEmpty(const RawResponse& response) noexcept;
std::size_t rowCount(const RawResponse& response) noexcept;
const char* shapeName(const RawResponse& response) noexcept;

// True for open, high, low, close, an adjusted-close spelling or volume (case-insensitive).
bool isFieldName(const std::string& name);

// Decides which column level carries field names by probing the first ten columns.
AxisOrder detectAxisOrder(const std::vector<ColumnKey>& columns);

}  // namespace domain
