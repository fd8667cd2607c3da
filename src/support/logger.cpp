//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/logger.cpp
// Purpose: Implements the leveled logger and level-name parsing.
//
//===----------------------------------------------------------------------===//

#include "support/logger.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace thymus::support
{

namespace
{
/// @brief Stream that swallows every write.
class NullBuffer : public std::streambuf
{
  protected:
    int overflow(int c) override
    {
        return c;
    }
};

std::string lower(std::string_view text)
{
    std::string out(text);
    for (auto &c : out)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

/// @brief Format the local wall-clock time as HH:MM:SS.
std::string clockStamp()
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    std::ostringstream os;
    os << std::setfill('0') << std::setw(2) << tm.tm_hour << ':' << std::setw(2) << tm.tm_min
       << ':' << std::setw(2) << tm.tm_sec;
    return os.str();
}
} // namespace

std::optional<LogLevel> parseLogLevel(std::string_view name)
{
    const std::string key = lower(name);
    if (key == "debug")
        return LogLevel::Debug;
    if (key == "info")
        return LogLevel::Info;
    if (key == "warn" || key == "warning")
        return LogLevel::Warn;
    if (key == "error")
        return LogLevel::Error;
    if (key == "off" || key == "none")
        return LogLevel::Off;
    return std::nullopt;
}

const char *logLevelTag(LogLevel level)
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
            return "OFF";
    }
    return "";
}

Logger::Logger(std::ostream &sink, LogLevel minLevel) : sink_(&sink), minLevel_(minLevel) {}

Logger &Logger::null()
{
    static NullBuffer buffer;
    static std::ostream stream(&buffer);
    static Logger logger(stream, LogLevel::Off);
    return logger;
}

void Logger::log(LogLevel level, std::string_view component, std::string_view message) const
{
    if (!enabled(level))
        return;

    std::ostringstream line;
    line << '[' << logLevelTag(level) << "] " << clockStamp() << ' ' << component << ": "
         << message << '\n';

    std::lock_guard<std::mutex> lock(mu_);
    *sink_ << line.str();
    sink_->flush();
}

} // namespace thymus::support
