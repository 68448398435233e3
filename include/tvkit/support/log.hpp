//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/support/log.hpp
// Purpose: Leveled diagnostic logging for the toolkit, writing timestamped
//          lines to stderr or to a log file.
// Key invariants:
//   - Levels are ordered: Debug < Info < Warn < Error < Off.
//   - Messages below the current minimum level are discarded.
//   - Output format is: [LEVEL] HH:MM:SS message
//   - The default minimum level is Info, overridable through TVKIT_LOG.
// Ownership/Lifetime:
//   - Log functions do not retain input strings.
//   - The sink and level are process-wide and guarded by a mutex.
// Links: src/support/log.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/support/result.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace tvkit::support
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
LogLevel logLevel() noexcept;

/// @brief Set the minimum level; messages below it are dropped.
void setLogLevel(LogLevel level) noexcept;

/// @brief Parse "debug", "info", "warn", "error" or "off" (case-insensitive).
std::optional<LogLevel> parseLogLevel(std::string_view name);

/// @brief Whether a message at @p level would be written.
bool logEnabled(LogLevel level) noexcept;

/// @brief Redirect output to @p path (appending). An empty path restores stderr.
Status setLogFile(const std::string &path);

/// @brief Redirect output to a caller-owned stream; nullptr restores stderr.
/// @note The stream must outlive every subsequent log call.
void setLogStream(std::ostream *os);

void logMessage(LogLevel level, std::string_view message);

inline void logDebug(std::string_view message)
{
    logMessage(LogLevel::Debug, message);
}

inline void logInfo(std::string_view message)
{
    logMessage(LogLevel::Info, message);
}

inline void logWarn(std::string_view message)
{
    logMessage(LogLevel::Warn, message);
}

inline void logError(std::string_view message)
{
    logMessage(LogLevel::Error, message);
}

} // namespace tvkit::support
