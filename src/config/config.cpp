//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/config/config.cpp
// Purpose: INI-like configuration loader.
// Key invariants: Reads sections [input], [loop], [log], and [keymap.global];
//                 keys and section names are case-insensitive.
// Ownership/Lifetime: Loader does not own external resources beyond the file
//                     stream it opens.
// Links: include/tvkit/config/config.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/config/config.hpp"

#include "tvkit/support/log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tvkit::config
{

using support::Errc;
using support::Status;

namespace
{
std::string trim(std::string_view sv)
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
    {
        sv.remove_suffix(1);
    }
    return std::string(sv);
}

std::string lower(std::string_view s)
{
    std::string out(s);
    std::transform(out.begin(),
                   out.end(),
                   out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<unsigned> parse_unsigned(const std::string &s)
{
    if (s.empty() || !std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); }))
    {
        return std::nullopt;
    }
    try
    {
        const unsigned long v = std::stoul(s);
        if (v > 60000UL)
        {
            return std::nullopt;
        }
        return static_cast<unsigned>(v);
    }
    catch (const std::out_of_range &)
    {
        return std::nullopt;
    }
}

std::optional<bool> parse_bool(const std::string &s)
{
    const std::string l = lower(s);
    if (l == "1" || l == "true" || l == "yes" || l == "on")
        return true;
    if (l == "0" || l == "false" || l == "no" || l == "off")
        return false;
    return std::nullopt;
}

std::optional<KeyCode> parse_named_key(const std::string &name)
{
    if (name == "enter")
        return kbEnter;
    if (name == "esc")
        return kbEsc;
    if (name == "tab")
        return kbTab;
    if (name == "backspace")
        return kbBackspace;
    if (name == "up")
        return kbUp;
    if (name == "down")
        return kbDown;
    if (name == "left")
        return kbLeft;
    if (name == "right")
        return kbRight;
    if (name == "home")
        return kbHome;
    if (name == "end")
        return kbEnd;
    if (name == "pageup" || name == "pgup")
        return kbPgUp;
    if (name == "pagedown" || name == "pgdn")
        return kbPgDn;
    if (name == "insert" || name == "ins")
        return kbIns;
    if (name == "delete" || name == "del")
        return kbDel;
    if (name.size() > 1 && name[0] == 'f')
    {
        auto num = parse_unsigned(name.substr(1));
        if (!num || *num < 1 || *num > 12)
        {
            return std::nullopt;
        }
        if (*num <= 10)
        {
            return static_cast<KeyCode>(kbF1 + ((*num - 1) << 8));
        }
        return *num == 11 ? kbF11 : kbF12;
    }
    return std::nullopt;
}

struct NamedCommand
{
    const char *name;
    CommandId id;
};

constexpr NamedCommand kCommandNames[] = {
    {"ok", cmOk},
    {"cancel", cmCancel},
    {"yes", cmYes},
    {"no", cmNo},
    {"default", cmDefault},
    {"quit", cmQuit},
    {"close", cmClose},
    {"zoom", cmZoom},
    {"next", cmNext},
    {"prev", cmPrev},
    {"tile", cmTile},
    {"cascade", cmCascade},
};

Status line_error(int lineNo, const std::string &what)
{
    return Status::error(Errc::Parse, "line " + std::to_string(lineNo) + ": " + what);
}

} // namespace

std::optional<KeyCode> parseChord(std::string_view text)
{
    bool ctrl = false;
    bool alt = false;
    bool shift = false;
    bool esc = false;
    std::string keyPart;

    std::stringstream ss{std::string(text)};
    std::string token;
    while (std::getline(ss, token, '+'))
    {
        const std::string t = lower(trim(token));
        if (t == "ctrl")
            ctrl = true;
        else if (t == "alt")
            alt = true;
        else if (t == "shift")
            shift = true;
        else if (t == "esc" && !esc && keyPart.empty())
            esc = true;
        else
            keyPart = t;
    }

    // A bare "esc" is the Escape key itself.
    if (keyPart.empty() && esc && !ctrl && !alt && !shift)
    {
        return kbEsc;
    }
    if (keyPart.empty())
    {
        return std::nullopt;
    }
    if (keyPart.size() == 1)
    {
        const char c = keyPart[0];
        if (ctrl)
            return ctrlLetterCode(c);
        if (alt)
            return altLetterCode(c);
        if (esc)
            return escLetterCode(c);
        return static_cast<KeyCode>(static_cast<unsigned char>(c));
    }

    auto named = parse_named_key(keyPart);
    if (!named)
    {
        return std::nullopt;
    }
    if (shift && *named == kbTab)
        return kbShiftTab;
    if (shift && *named == kbF12)
        return kbShiftF12;
    if (alt && *named == kbF3)
        return kbAltF3;
    if (esc && *named == kbEsc)
        return kbEscEsc;
    return named;
}

std::optional<CommandId> commandFromName(std::string_view name)
{
    const std::string l = lower(trim(name));
    for (const auto &nc : kCommandNames)
    {
        if (l == nc.name)
        {
            return nc.id;
        }
    }
    if (auto n = parse_unsigned(l); n && *n > 0 && *n <= 0xFFFF)
    {
        return static_cast<CommandId>(*n);
    }
    return std::nullopt;
}

Status loadFromString(std::string_view text, Config &out)
{
    std::istringstream in{std::string(text)};
    std::string line;
    std::string section;
    int lineNo = 0;
    while (std::getline(in, line))
    {
        ++lineNo;
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';')
        {
            continue;
        }
        if (trimmed.front() == '[' && trimmed.back() == ']')
        {
            section = lower(trimmed.substr(1, trimmed.size() - 2));
            continue;
        }
        auto eq = trimmed.find('=');
        if (eq == std::string::npos)
        {
            return line_error(lineNo, "expected key = value");
        }
        const std::string key = lower(trim(trimmed.substr(0, eq)));
        const std::string value = trim(trimmed.substr(eq + 1));

        if (section == "input")
        {
            if (key == "double_click_ms" || key == "esc_timeout_ms" || key == "escape_delay_ms")
            {
                auto v = parse_unsigned(value);
                if (!v)
                {
                    return line_error(lineNo, "invalid number '" + value + "'");
                }
                if (key == "double_click_ms")
                    out.input.doubleClickMs = *v;
                else if (key == "escape_delay_ms")
                    out.input.escapeDelayMs = *v;
                else
                    out.input.escTimeoutMs = std::clamp(*v, kMinEscTimeoutMs, kMaxEscTimeoutMs);
            }
            else if (key == "mouse")
            {
                auto b = parse_bool(value);
                if (!b)
                {
                    return line_error(lineNo, "invalid boolean '" + value + "'");
                }
                out.input.mouse = *b;
            }
        }
        else if (section == "loop")
        {
            if (key == "poll_interval_ms" || key == "modal_poll_interval_ms")
            {
                auto v = parse_unsigned(value);
                if (!v || *v == 0)
                {
                    return line_error(lineNo, "invalid interval '" + value + "'");
                }
                if (key == "poll_interval_ms")
                    out.loop.pollIntervalMs = *v;
                else
                    out.loop.modalPollIntervalMs = *v;
            }
        }
        else if (section == "log")
        {
            if (key == "level")
            {
                if (!support::parseLogLevel(value))
                {
                    return line_error(lineNo, "unknown log level '" + value + "'");
                }
                out.log.level = lower(value);
            }
            else if (key == "file")
            {
                out.log.file = value;
            }
        }
        else if (section == "keymap.global")
        {
            auto chord = parseChord(key);
            if (!chord)
            {
                return line_error(lineNo, "unknown key chord '" + key + "'");
            }
            auto cmd = commandFromName(value);
            if (!cmd)
            {
                return line_error(lineNo, "unknown command '" + value + "'");
            }
            out.keymapGlobal.push_back(Binding{*chord, *cmd});
        }
    }
    return Status::ok();
}

Status loadFromFile(const std::string &path, Config &out)
{
    std::ifstream in(path);
    if (!in)
    {
        return Status(support::errnoError(Errc::Io, "open " + path));
    }
    std::stringstream buf;
    buf << in.rdbuf();
    Status st = loadFromString(buf.str(), out);
    if (!st.isOk())
    {
        return Status::error(st.error().code, path + ": " + st.error().message);
    }
    return st;
}

Status applyLogConfig(const LogConfig &log)
{
    if (auto lvl = support::parseLogLevel(log.level))
    {
        support::setLogLevel(*lvl);
    }
    return support::setLogFile(log.file);
}

} // namespace tvkit::config
