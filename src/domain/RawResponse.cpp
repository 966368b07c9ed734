#include "domain/RawResponse.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>
#include <type_traits>

namespace domain {
namespace {

constexpr std::size_t kAxisSampleColumns = 10;

constexpr std::array<std::string_view, 9> kFieldVocabulary{
    "open", "high", "low", "close", "adj close", "adj_close", "adjclose", "adjusted close", "volume"};

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

}  // namespace

bool isEmpty(const RawResponse& response) noexcept {
    return std::visit(
        [](const auto& frame) -> bool {
            using T = std::decay_t<decltype(frame)>;
            if constexpr (std::is_same_v<T, EmptyResponse>) {
                return true;
            } else {
                return frame.empty();
            }
        },
        response);
}

std::size_t rowCount(const RawResponse& response) noexcept {
    return std::visit(
        [](const auto& frame) -> std::size_t {
            using T = std::decay_t<decltype(frame)>;
            if constexpr (std::is_same_v<T, EmptyResponse>) {
                return 0;
            } else {
                return frame.index.size();
            }
        },
        response);
}

const char* shapeName(const RawResponse& response) noexcept {
    switch (response.index()) {
    case 1:
        return "single";
    case 2:
        return "multi";
    default:
        return "empty";
    }
}

bool isFieldName(const std::string& name) {
    const auto lowered = toLower(name);
    return std::find(kFieldVocabulary.begin(), kFieldVocabulary.end(), lowered) != kFieldVocabulary.end();
}

AxisOrder detectAxisOrder(const std::vector<ColumnKey>& columns) {
    const auto sampled = std::min(columns.size(), kAxisSampleColumns);
    for (std::size_t i = 0; i < sampled; ++i) {
        if (isFieldName(columns[i].first)) {
            return AxisOrder::FieldTicker;
        }
    }
    return AxisOrder::TickerField;
}

}  // namespace domain
