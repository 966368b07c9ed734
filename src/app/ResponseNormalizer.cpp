#include "app/ResponseNormalizer.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace app {
namespace {

using ColumnRef = std::optional<std::size_t>;

// Column positions of the canonical fields inside one ticker's slice of a frame.
struct FieldColumns {
    ColumnRef open;
    ColumnRef high;
    ColumnRef low;
    ColumnRef close;
    ColumnRef adjClose;
    ColumnRef volume;

    ColumnRef effectiveClose() const { return close ? close : adjClose; }
};

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

void assignField(FieldColumns& fields, const std::string& rawName, std::size_t column) {
    const auto name = toLower(rawName);
    if (name == "open") {
        fields.open = column;
    } else if (name == "high") {
        fields.high = column;
    } else if (name == "low") {
        fields.low = column;
    } else if (name == "close") {
        fields.close = column;
    } else if (name == "adj close" || name == "adj_close" || name == "adjclose" || name == "adjusted close") {
        fields.adjClose = column;
    } else if (name == "volume") {
        fields.volume = column;
    }
}

domain::Cell cellAt(const std::vector<domain::Column>& values, ColumnRef column, std::size_t row) {
    if (!column || *column >= values.size()) {
        return std::nullopt;
    }
    const auto& data = values[*column];
    if (row >= data.size() || !data[row].has_value() || std::isnan(*data[row])) {
        return std::nullopt;
    }
    return data[row];
}

std::optional<domain::PriceRow> buildRow(const domain::Ticker& ticker,
                                         std::int64_t timestamp,
                                         const FieldColumns& fields,
                                         const std::vector<domain::Column>& values,
                                         std::size_t row) {
    const auto close = cellAt(values, fields.effectiveClose(), row);
    const auto volume = cellAt(values, fields.volume, row);
    if (!close && !volume) {
        return std::nullopt;
    }

    domain::PriceRow out;
    out.ticker = ticker;
    out.date = domain::Date::fromEpochSeconds(timestamp);
    out.open = cellAt(values, fields.open, row);
    out.high = cellAt(values, fields.high, row);
    out.low = cellAt(values, fields.low, row);
    out.close = close;
    if (volume) {
        out.volume = static_cast<std::int64_t>(std::llround(*volume));
    }
    return out;
}

std::vector<domain::PriceRow> normalizeSingle(const domain::SingleTickerFrame& frame,
                                              const std::vector<domain::Ticker>& requested) {
    if (frame.empty() || requested.empty()) {
        return {};
    }

    FieldColumns fields;
    for (std::size_t column = 0; column < frame.columns.size(); ++column) {
        assignField(fields, frame.columns[column], column);
    }

    const auto& ticker = requested.front();
    std::vector<domain::PriceRow> rows;
    rows.reserve(frame.index.size());
    for (std::size_t row = 0; row < frame.index.size(); ++row) {
        if (auto built = buildRow(ticker, frame.index[row], fields, frame.values, row)) {
            rows.push_back(std::move(*built));
        }
    }
    return rows;
}

std::vector<domain::PriceRow> normalizeMulti(const domain::MultiTickerFrame& frame) {
    if (frame.empty()) {
        return {};
    }

    std::vector<domain::Ticker> order;
    std::unordered_map<domain::Ticker, FieldColumns> byTicker;
    for (std::size_t column = 0; column < frame.columns.size(); ++column) {
        const auto& key = frame.columns[column];
        const auto& ticker = frame.axisOrder == domain::AxisOrder::TickerField ? key.first : key.second;
        const auto& field = frame.axisOrder == domain::AxisOrder::TickerField ? key.second : key.first;
        if (ticker.empty()) {
            continue;
        }

        auto [it, inserted] = byTicker.try_emplace(ticker);
        if (inserted) {
            order.push_back(ticker);
        }
        assignField(it->second, field, column);
    }

    std::vector<domain::PriceRow> rows;
    rows.reserve(frame.index.size() * order.size());
    for (std::size_t row = 0; row < frame.index.size(); ++row) {
        for (const auto& ticker : order) {
            if (auto built = buildRow(ticker, frame.index[row], byTicker.at(ticker), frame.values, row)) {
                rows.push_back(std::move(*built));
            }
        }
    }
    return rows;
}

}  // namespace

std::vector<domain::PriceRow> normalizeResponse(const domain::RawResponse& response,
                                                const std::vector<domain::Ticker>& requested) {
    if (const auto* single = std::get_if<domain::SingleTickerFrame>(&response)) {
        return normalizeSingle(*single, requested);
    }
    if (const auto* multi = std::get_if<domain::MultiTickerFrame>(&response)) {
        return normalizeMulti(*multi);
    }
    return {};
}

}  // namespace app
