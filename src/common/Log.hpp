#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <string_view>

namespace eod::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Receives every emitted line after level filtering. An empty sink restores console output.
using Sink = std::function<void(Level, const std::string&)>;

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void setSink(Sink sink);
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

}  // namespace eod::log

#define EOD_LOG_IMPL(level, expr)                                                          \
    do {                                                                                   \
        if (::eod::log::shouldLog(level)) {                                                \
            std::ostringstream eod_log_stream__;                                           \
            eod_log_stream__ << expr;                                                      \
            ::eod::log::log(level, eod_log_stream__.str());                                \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) EOD_LOG_IMPL(::eod::log::Level::Debug, expr)
#define LOG_INFO(expr) EOD_LOG_IMPL(::eod::log::Level::Info, expr)
#define LOG_WARN(expr) EOD_LOG_IMPL(::eod::log::Level::Warn, expr)
#define LOG_ERR(expr) EOD_LOG_IMPL(::eod::log::Level::Error, expr)
