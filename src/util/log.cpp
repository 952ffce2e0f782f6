// src/util/log.cpp
// @brief Leveled logger backing morlock::util::log.
// @invariant Only messages at or above the minimum level reach the sink.
// @ownership The installed sink is borrowed.

#include "morlock/util/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <string>

namespace morlock::util
{
namespace
{
LogLevel g_level = LogLevel::Info;
std::ostream *g_sink = nullptr;

const char *levelName(LogLevel level)
{
    switch (level)
    {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Off:
            break;
    }
    return "OFF";
}

std::tm localTime(std::time_t t)
{
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return tm;
}
} // namespace

LogLevel logLevel()
{
    return g_level;
}

void setLogLevel(LogLevel level)
{
    g_level = level;
}

bool logEnabled(LogLevel level)
{
    return level != LogLevel::Off && level >= g_level;
}

void setLogSink(std::ostream *sink)
{
    g_sink = sink;
}

std::optional<LogLevel> parseLogLevel(std::string_view name)
{
    std::string lower(name);
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warn;
    if (lower == "error")
        return LogLevel::Error;
    if (lower == "off")
        return LogLevel::Off;
    return std::nullopt;
}

void log(LogLevel level, std::string_view message)
{
    if (!logEnabled(level))
    {
        return;
    }
    std::ostream &os = g_sink ? *g_sink : std::cerr;
    const std::tm tm = localTime(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));
    os << '[' << levelName(level) << "] " << std::put_time(&tm, "%H:%M:%S") << ' ' << message
       << '\n';
}

} // namespace morlock::util
