//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/config/config.hpp
// Purpose: Runtime configuration loaded from an INI-like file.
// Key invariants:
//   - Recognised sections are [input], [loop], [log] and [keymap.global].
//   - Defaults reproduce the legacy timings: 500 ms double-click and ESC
//     windows, 20 ms main-loop poll, 50 ms modal poll.
//   - escTimeoutMs is clamped to [250, 1500].
// Ownership/Lifetime: Config is a plain value owned by the caller.
// Links: src/config/config.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/core/command.hpp"
#include "tvkit/core/keys.hpp"
#include "tvkit/support/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tvkit::config
{

inline constexpr unsigned kMinEscTimeoutMs = 250;
inline constexpr unsigned kMaxEscTimeoutMs = 1500;

struct InputConfig
{
    unsigned doubleClickMs = 500;
    unsigned escTimeoutMs = 500;
    /// Wait for the rest of a partial escape sequence before flushing it.
    unsigned escapeDelayMs = 25;
    bool mouse = true;
};

struct LoopConfig
{
    unsigned pollIntervalMs = 20;
    unsigned modalPollIntervalMs = 50;
};

struct LogConfig
{
    std::string level = "info";
    std::string file;
};

struct Binding
{
    KeyCode key{kbNone};
    CommandId command{cmNone};
};

struct Config
{
    InputConfig input;
    LoopConfig loop;
    LogConfig log;
    std::vector<Binding> keymapGlobal;
};

/// @brief Parse configuration text into @p out, overriding only keys present.
/// @return Parse error naming the offending line on malformed values.
support::Status loadFromString(std::string_view text, Config &out);

/// @brief Read @p path and parse it with loadFromString.
support::Status loadFromFile(const std::string &path, Config &out);

/// @brief Parse a chord such as "ctrl+q", "alt+x", "esc+x", "f10" or "shift+tab".
std::optional<KeyCode> parseChord(std::string_view text);

/// @brief Resolve a command name ("quit", "ok", ...) or a decimal id.
std::optional<CommandId> commandFromName(std::string_view name);

/// @brief Apply the [log] section to the process logger.
support::Status applyLogConfig(const LogConfig &log);

} // namespace tvkit::config
