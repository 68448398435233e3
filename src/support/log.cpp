//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/log.cpp
// Purpose: Implement the leveled logger declared in tvkit/support/log.hpp.
// Key invariants: Each message is written as one line under the sink mutex so
//                 lines from the transport thread never interleave with the UI
//                 thread.
// Ownership/Lifetime: The file sink is owned by a function-local static; an
//                     external stream set through setLogStream is borrowed.
// Links: include/tvkit/support/log.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/support/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace tvkit::support
{

namespace
{

struct LogState
{
    std::mutex mu;
    std::ofstream file;
    std::ostream *external = nullptr;
};

LogState &state()
{
    static LogState s;
    return s;
}

LogLevel initialLevel()
{
    if (const char *env = std::getenv("TVKIT_LOG"))
    {
        if (auto lvl = parseLogLevel(env))
        {
            return *lvl;
        }
    }
    return LogLevel::Info;
}

std::atomic<int> &levelCell()
{
    static std::atomic<int> level{static_cast<int>(initialLevel())};
    return level;
}

const char *levelTag(LogLevel level)
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

} // namespace

LogLevel logLevel() noexcept
{
    return static_cast<LogLevel>(levelCell().load(std::memory_order_relaxed));
}

void setLogLevel(LogLevel level) noexcept
{
    levelCell().store(static_cast<int>(level), std::memory_order_relaxed);
}

std::optional<LogLevel> parseLogLevel(std::string_view name)
{
    std::string lower(name);
    std::transform(lower.begin(),
                   lower.end(),
                   lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug")
        return LogLevel::Debug;
    if (lower == "info")
        return LogLevel::Info;
    if (lower == "warn" || lower == "warning")
        return LogLevel::Warn;
    if (lower == "error")
        return LogLevel::Error;
    if (lower == "off" || lower == "none")
        return LogLevel::Off;
    return std::nullopt;
}

bool logEnabled(LogLevel level) noexcept
{
    return level != LogLevel::Off && level >= logLevel();
}

Status setLogFile(const std::string &path)
{
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mu);
    if (s.file.is_open())
    {
        s.file.close();
    }
    if (path.empty())
    {
        return Status::ok();
    }
    s.file.open(path, std::ios::app);
    if (!s.file)
    {
        return Status(errnoError(Errc::Io, "open log file " + path));
    }
    return Status::ok();
}

void setLogStream(std::ostream *os)
{
    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mu);
    s.external = os;
}

void logMessage(LogLevel level, std::string_view message)
{
    if (!logEnabled(level))
    {
        return;
    }

    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char stamp[16];
    std::strftime(stamp, sizeof(stamp), "%H:%M:%S", &tm);

    auto &s = state();
    std::lock_guard<std::mutex> lock(s.mu);
    std::ostream &out = s.external ? *s.external : (s.file.is_open() ? s.file : std::cerr);
    out << '[' << levelTag(level) << "] " << stamp << ' ' << message << '\n';
    out.flush();
}

} // namespace tvkit::support
