// include/morlock/util/log.hpp
// @brief Leveled logging of timestamped "[LEVEL] HH:MM:SS message" lines.
// @invariant Messages below the minimum level (default Info) are discarded.
// @ownership The sink stream is borrowed; level and sink are process-wide state.
#pragma once

#include <optional>
#include <ostream>
#include <string_view>

namespace morlock::util
{

enum class LogLevel
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4,
};

/// @brief Current minimum level.
LogLevel logLevel();

/// @brief Set the minimum level.
void setLogLevel(LogLevel level);

/// @brief Whether a message at @p level would be written.
bool logEnabled(LogLevel level);

/// @brief Redirect output to @p sink; nullptr restores stderr.
void setLogSink(std::ostream *sink);

/// @brief Parse "debug", "info", "warn", "error" or "off" (case-insensitive).
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// @brief Write @p message at @p level.
void log(LogLevel level, std::string_view message);

inline void logDebug(std::string_view message)
{
    log(LogLevel::Debug, message);
}

inline void logInfo(std::string_view message)
{
    log(LogLevel::Info, message);
}

inline void logWarn(std::string_view message)
{
    log(LogLevel::Warn, message);
}

inline void logError(std::string_view message)
{
    log(LogLevel::Error, message);
}

} // namespace morlock::util
