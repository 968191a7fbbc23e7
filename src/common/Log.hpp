#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace lnt::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

// Mirrors every line into the given file (appending). An empty path disables it.
// Throws std::runtime_error if the file cannot be opened.
void setLogFile(const std::string& path);

}  // namespace lnt::log

#define LNT_LOG_IMPL(level, expr)                                                          \
    do {                                                                                   \
        if (::lnt::log::shouldLog(level)) {                                                \
            std::ostringstream lnt_log_stream__;                                           \
            lnt_log_stream__ << expr;                                                      \
            ::lnt::log::log(level, lnt_log_stream__.str());                                \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) LNT_LOG_IMPL(::lnt::log::Level::Debug, expr)
#define LOG_INFO(expr) LNT_LOG_IMPL(::lnt::log::Level::Info, expr)
#define LOG_WARN(expr) LNT_LOG_IMPL(::lnt::log::Level::Warn, expr)
#define LOG_ERR(expr) LNT_LOG_IMPL(::lnt::log::Level::Error, expr)
