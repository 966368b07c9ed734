#include "domain/Models.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <tuple>
#include <unordered_set>

namespace domain {
namespace {

constexpr std::int64_t kSecondsPerDay = 86'400;

#if defined(_WIN32)
std::time_t timegm_compat(std::tm* tm) {
    return _mkgmtime(tm);
}
#else
std::time_t timegm_compat(std::tm* tm) {
    return timegm(tm);
}
#endif

std::int64_t floorDiv(std::int64_t value, std::int64_t divisor) {
    auto quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

}  // namespace

std::optional<Date> Date::parse(std::string_view iso) {
    if (iso.size() < 10) {
        return std::nullopt;
    }

    std::tm tm{};
    std::istringstream input(std::string{iso.substr(0, 10)});
    input >> std::get_time(&tm, "%Y-%m-%d");
    if (input.fail()) {
        return std::nullopt;
    }

    tm.tm_isdst = 0;
    const auto raw = timegm_compat(&tm);
    return Date::fromEpochSeconds(static_cast<std::int64_t>(raw));
}

Date Date::fromEpochSeconds(std::int64_t seconds) {
    return Date{floorDiv(seconds, kSecondsPerDay)};
}

std::string Date::toString() const {
    const auto raw = static_cast<std::time_t>(toEpochSeconds());
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &raw);
#else
    gmtime_r(&raw, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%d");
    return out.str();
}

bool operator==(const PriceRow& lhs, const PriceRow& rhs) {
    return std::tie(lhs.ticker, lhs.date.days, lhs.open, lhs.high, lhs.low, lhs.close, lhs.volume)
        == std::tie(rhs.ticker, rhs.date.days, rhs.open, rhs.high, rhs.low, rhs.close, rhs.volume);
}

bool keyLess(const PriceRow& lhs, const PriceRow& rhs) {
    return std::tie(lhs.ticker, lhs.date.days) < std::tie(rhs.ticker, rhs.date.days);
}

Ticker normalizeTicker(std::string_view raw) {
    std::size_t begin = 0;
    std::size_t end = raw.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(raw[begin])) != 0) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1])) != 0) {
        --end;
    }

    Ticker ticker;
    ticker.reserve(end - begin);
    for (std::size_t i = begin; i < end; ++i) {
        const auto ch = static_cast<unsigned char>(raw[i]);
        ticker.push_back(ch == '.' ? '-' : static_cast<char>(std::toupper(ch)));
    }
    return ticker;
}

std::vector<Ticker> normalizeUniverse(const std::vector<std::string>& raw) {
    std::vector<Ticker> unique;
    unique.reserve(raw.size());
    std::unordered_set<Ticker> seen;
    seen.reserve(raw.size());

    for (const auto& value : raw) {
        auto ticker = normalizeTicker(value);
        if (ticker.empty()) {
            continue;
        }
        if (seen.insert(ticker).second) {
            unique.push_back(std::move(ticker));
        }
    }
    return unique;
}

}  // namespace domain
