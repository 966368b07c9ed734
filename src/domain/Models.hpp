#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace domain {

using Ticker = std::string;

// Calendar day without time of day, counted from 1970-01-01.
struct Date {
    std::int64_t days{0};

    static std::optional<Date> parse(std::string_view iso);
    static Date fromEpochSeconds(std::int64_t seconds);

    std::string toString() const;
    std::int64_t toEpochSeconds() const noexcept { return days * 86'400; }
    Date plusDays(std::int64_t delta) const noexcept { return Date{days + delta}; }

    friend bool operator==(Date lhs, Date rhs) noexcept { return lhs.days == rhs.days; }
    friend bool operator!=(Date lhs, Date rhs) noexcept { return lhs.days != rhs.days; }
    friend bool operator<(Date lhs, Date rhs) noexcept { return lhs.days < rhs.days; }
    friend bool operator<=(Date lhs, Date rhs) noexcept { return lhs.days <= rhs.days; }
    friend bool operator>(Date lhs, Date rhs) noexcept { return lhs.days > rhs.days; }
    friend bool operator>=(Date lhs, Date rhs) noexcept { return lhs.days >= rhs.days; }
};

// [start, end) in calendar days.
struct FetchWindow {
    Date start{};
    Date end{};

    bool empty() const noexcept { return end <= start; }
};

struct PriceRow {
    Ticker ticker;
    Date date{};
    std::optional<double> open;
    std::optional<double> high;
    std::optional<double> low;
    std::optional<double> close;
    std::optional<std::int64_t> volume;

    bool usable() const noexcept { return !ticker.empty() && close.has_value(); }
};

bool operator==(const PriceRow& lhs, const PriceRow& rhs);
inline bool operator!=(const PriceRow& lhs, const PriceRow& rhs) { return !(lhs == rhs); }

// Orders by (ticker, date).
bool keyLess(const PriceRow& lhs, const PriceRow& rhs);

// Uppercases, trims and rewrites a class-share dot to the provider's dash notation (BRK.B -> BRK-B).
Ticker normalizeTicker(std::string_view raw);

// Normalizes every entry, drops blanks and keeps the first occurrence of duplicates.
std::vector<Ticker> normalizeUniverse(const std::vector<std::string>& raw);

}  // namespace domain
