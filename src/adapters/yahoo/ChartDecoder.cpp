#include "adapters/yahoo/ChartDecoder.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>
#include <string>

#include <boost/json.hpp>

namespace adapters::yahoo {
namespace {

constexpr std::int64_t kSecondsPerDay = 86'400;
constexpr std::size_t kBodySnippetLength = 120;

// Provider labels in the order the frame columns are emitted.
constexpr std::array<const char*, 6> kLabelOrder{"Open", "High", "Low", "Close", "Adj Close", "Volume"};

struct QuoteKey {
    const char* json;
    const char* label;
};

constexpr std::array<QuoteKey, 5> kQuoteKeys{{
    {"open", "Open"},
    {"high", "High"},
    {"low", "Low"},
    {"close", "Close"},
    {"volume", "Volume"},
}};

std::string snippet(std::string_view body) {
    std::string text{body.substr(0, std::min(body.size(), kBodySnippetLength))};
    std::replace(text.begin(), text.end(), '\n', ' ');
    return text;
}

std::int64_t json_to_int64(const boost::json::value& value) {
    if (value.is_int64()) {
        return value.as_int64();
    }
    if (value.is_uint64()) {
        return static_cast<std::int64_t>(value.as_uint64());
    }
    if (value.is_double()) {
        return static_cast<std::int64_t>(std::llround(value.as_double()));
    }
    throw std::runtime_error("Unsupported JSON type for integer conversion");
}

domain::Cell json_to_cell(const boost::json::value& value) {
    if (value.is_double()) {
        const double number = value.as_double();
        if (std::isnan(number)) {
            return std::nullopt;
        }
        return number;
    }
    if (value.is_int64()) {
        return static_cast<double>(value.as_int64());
    }
    if (value.is_uint64()) {
        return static_cast<double>(value.as_uint64());
    }
    return std::nullopt;
}

std::int64_t dayStart(std::int64_t localSeconds) {
    auto days = localSeconds / kSecondsPerDay;
    if (localSeconds % kSecondsPerDay != 0 && localSeconds < 0) {
        --days;
    }
    return days * kSecondsPerDay;
}

std::string describeError(const boost::json::value& error) {
    if (!error.is_object()) {
        return boost::json::serialize(error);
    }
    const auto& object = error.as_object();
    std::string code;
    std::string description;
    if (const auto* value = object.if_contains("code"); value && value->is_string()) {
        code = value->as_string().c_str();
    }
    if (const auto* value = object.if_contains("description"); value && value->is_string()) {
        description = value->as_string().c_str();
    }
    if (code.empty()) {
        return description;
    }
    return description.empty() ? code : code + ": " + description;
}

const boost::json::object* firstObject(const boost::json::object& parent, const char* key) {
    const auto* value = parent.if_contains(key);
    if (!value || !value->is_array() || value->as_array().empty()) {
        return nullptr;
    }
    const auto& first = value->as_array().front();
    return first.is_object() ? &first.as_object() : nullptr;
}

domain::Column readColumn(const boost::json::object& source, const char* key, std::size_t length) {
    domain::Column column(length);
    const auto* value = source.if_contains(key);
    if (!value || !value->is_array()) {
        return column;
    }
    const auto& items = value->as_array();
    const auto count = std::min(length, items.size());
    for (std::size_t i = 0; i < count; ++i) {
        column[i] = json_to_cell(items[i]);
    }
    return column;
}

domain::Column alignColumn(const std::vector<std::int64_t>& sourceIndex,
                           const domain::Column& source,
                           const std::vector<std::int64_t>& targetIndex) {
    domain::Column aligned(targetIndex.size());
    for (std::size_t row = 0; row < sourceIndex.size() && row < source.size(); ++row) {
        const auto it = std::lower_bound(targetIndex.begin(), targetIndex.end(), sourceIndex[row]);
        if (it != targetIndex.end() && *it == sourceIndex[row]) {
            aligned[static_cast<std::size_t>(it - targetIndex.begin())] = source[row];
        }
    }
    return aligned;
}

const domain::Column* findField(const ChartSeries& series, const std::string& label) {
    for (const auto& [name, column] : series.fields) {
        if (name == label) {
            return &column;
        }
    }
    return nullptr;
}

}  // namespace

std::string describeChartError(std::string_view body) {
    boost::json::error_code ec;
    const auto json = boost::json::parse(boost::json::string_view(body.data(), body.size()), ec);
    if (ec || !json.is_object()) {
        return {};
    }
    const auto* chart = json.as_object().if_contains("chart");
    if (!chart || !chart->is_object()) {
        return {};
    }
    const auto* error = chart->as_object().if_contains("error");
    if (!error || error->is_null()) {
        return {};
    }
    return describeError(*error);
}

ChartSeries decodeChart(std::string_view body, const domain::Ticker& symbol) {
    boost::json::value json;
    try {
        json = boost::json::parse(boost::json::string_view(body.data(), body.size()));
    } catch (const std::exception& ex) {
        throw std::runtime_error("Failed to parse Yahoo chart response for " + symbol + ": " + ex.what() +
                                 " body='" + snippet(body) + "'");
    }

    if (!json.is_object()) {
        throw std::runtime_error("Unexpected Yahoo chart response type for " + symbol + " (expected object)");
    }
    const auto* chart = json.as_object().if_contains("chart");
    if (!chart || !chart->is_object()) {
        throw std::runtime_error("Unexpected Yahoo chart response for " + symbol + " (missing chart)");
    }
    const auto& chartObject = chart->as_object();
    if (const auto* error = chartObject.if_contains("error"); error && !error->is_null()) {
        throw std::runtime_error("Yahoo chart error for " + symbol + ": " + describeError(*error));
    }

    ChartSeries series;
    series.symbol = symbol;

    const auto* result = firstObject(chartObject, "result");
    if (result == nullptr) {
        return series;
    }

    std::int64_t gmtOffset = 0;
    if (const auto* meta = result->if_contains("meta"); meta && meta->is_object()) {
        if (const auto* offset = meta->as_object().if_contains("gmtoffset"); offset && offset->is_number()) {
            gmtOffset = json_to_int64(*offset);
        }
    }

    const auto* timestamps = result->if_contains("timestamp");
    if (!timestamps || !timestamps->is_array() || timestamps->as_array().empty()) {
        return series;
    }
    const auto& stamps = timestamps->as_array();
    const auto length = stamps.size();

    std::vector<std::pair<std::string, domain::Column>> raw;
    const boost::json::object* indicators = nullptr;
    if (const auto* value = result->if_contains("indicators"); value && value->is_object()) {
        indicators = &value->as_object();
    }
    if (indicators != nullptr) {
        if (const auto* quote = firstObject(*indicators, "quote")) {
            for (const auto& key : kQuoteKeys) {
                if (quote->if_contains(key.json)) {
                    raw.emplace_back(key.label, readColumn(*quote, key.json, length));
                }
            }
        }
        if (const auto* adjusted = firstObject(*indicators, "adjclose")) {
            if (adjusted->if_contains("adjclose")) {
                raw.emplace_back("Adj Close", readColumn(*adjusted, "adjclose", length));
            }
        }
    }

    for (const auto& entry : raw) {
        series.fields.emplace_back(entry.first, domain::Column{});
    }

    // The provider may repeat the current session as an extra intraday stamp; keep the later one.
    for (std::size_t row = 0; row < length; ++row) {
        const auto day = dayStart(json_to_int64(stamps[row]) + gmtOffset);
        const bool sameDay = !series.index.empty() && series.index.back() == day;
        if (!sameDay) {
            series.index.push_back(day);
        }
        for (std::size_t field = 0; field < raw.size(); ++field) {
            auto& column = series.fields[field].second;
            const auto& cell = raw[field].second[row];
            if (!sameDay) {
                column.push_back(cell);
            } else if (cell.has_value()) {
                column.back() = cell;
            }
        }
    }

    return series;
}

domain::RawResponse assembleResponse(const std::vector<ChartSeries>& series, std::size_t requestedCount) {
    std::vector<const ChartSeries*> withData;
    for (const auto& entry : series) {
        if (!entry.empty()) {
            withData.push_back(&entry);
        }
    }
    if (withData.empty()) {
        return domain::EmptyResponse{};
    }

    if (requestedCount == 1) {
        const auto& only = *withData.front();
        domain::SingleTickerFrame frame;
        frame.index = only.index;
        for (const auto& [label, column] : only.fields) {
            frame.columns.push_back(label);
            frame.values.push_back(column);
        }
        return frame;
    }

    domain::MultiTickerFrame frame;
    for (const auto* entry : withData) {
        frame.index.insert(frame.index.end(), entry->index.begin(), entry->index.end());
    }
    std::sort(frame.index.begin(), frame.index.end());
    frame.index.erase(std::unique(frame.index.begin(), frame.index.end()), frame.index.end());

    for (const auto* label : kLabelOrder) {
        for (const auto* entry : withData) {
            const auto* column = findField(*entry, label);
            if (column == nullptr) {
                continue;
            }
            frame.columns.emplace_back(label, entry->symbol);
            frame.values.push_back(alignColumn(entry->index, *column, frame.index));
        }
    }
    frame.axisOrder = domain::detectAxisOrder(frame.columns);
    return frame;
}

}  // namespace adapters::yahoo
