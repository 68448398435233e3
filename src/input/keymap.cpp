//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/input/keymap.cpp
// Purpose: Keymap implementation converting key events into commands.
// Key invariants: handle() only rewrites keyboard events.
// Ownership/Lifetime: Keymap owns its binding table.
// Links: include/tvkit/input/keymap.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/input/keymap.hpp"

namespace tvkit::input
{

Keymap Keymap::withDefaults()
{
    Keymap km;
    km.bind(kbCtrlC, cmQuit);
    km.bind(kbF10, cmQuit);
    km.bind(kbAltX, cmQuit);
    km.bind(kbEscX, cmQuit);
    return km;
}

void Keymap::bind(KeyCode key, CommandId command)
{
    bindings_[key] = command;
}

void Keymap::unbind(KeyCode key)
{
    bindings_.erase(key);
}

std::optional<CommandId> Keymap::lookup(KeyCode key) const
{
    auto it = bindings_.find(key);
    if (it == bindings_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

bool Keymap::handle(Event &ev) const
{
    if (!ev.isKeyboard() || ev.keyCode == kbNone)
    {
        return false;
    }
    auto cmd = lookup(ev.keyCode);
    if (!cmd)
    {
        return false;
    }
    ev = Event::commandEvent(*cmd);
    return true;
}

void Keymap::applyConfig(const config::Config &cfg)
{
    for (const auto &b : cfg.keymapGlobal)
    {
        bind(b.key, b.command);
    }
}

} // namespace tvkit::input
