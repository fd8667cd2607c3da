//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/logger.hpp
// Purpose: Leveled logger handed to every analysis component.
//
// Key invariants:
//   - Levels are ordered: Debug < Info < Warn < Error < Off.
//   - Messages below the minimum level are discarded without formatting.
//   - Output format is: [LEVEL] HH:MM:SS component: message
//   - Writes are serialized, so worker threads may share one logger.
//
// Ownership/Lifetime:
//   - The logger borrows its sink stream; the sink must outlive the logger.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace thymus::support
{

enum class LogLevel
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

/// @brief Parse a level name ("debug", "info", "warn", "error", "off").
/// @return Level on success, std::nullopt for unknown names.
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// @brief Upper-case tag printed for @p level.
const char *logLevelTag(LogLevel level);

class Logger
{
  public:
    /// @brief Create a logger writing to @p sink at or above @p minLevel.
    explicit Logger(std::ostream &sink, LogLevel minLevel = LogLevel::Warn);

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;

    /// @brief Logger that discards everything; used by tests and library callers
    ///        that have no sink of their own.
    static Logger &null();

    [[nodiscard]] LogLevel level() const noexcept
    {
        return minLevel_;
    }

    void setLevel(LogLevel level) noexcept
    {
        minLevel_ = level;
    }

    [[nodiscard]] bool enabled(LogLevel level) const noexcept
    {
        return level != LogLevel::Off && level >= minLevel_;
    }

    void log(LogLevel level, std::string_view component, std::string_view message) const;

    void debug(std::string_view component, std::string_view message) const
    {
        log(LogLevel::Debug, component, message);
    }

    void info(std::string_view component, std::string_view message) const
    {
        log(LogLevel::Info, component, message);
    }

    void warn(std::string_view component, std::string_view message) const
    {
        log(LogLevel::Warn, component, message);
    }

    void error(std::string_view component, std::string_view message) const
    {
        log(LogLevel::Error, component, message);
    }

  private:
    std::ostream *sink_;
    LogLevel minLevel_;
    mutable std::mutex mu_;
};

} // namespace thymus::support
