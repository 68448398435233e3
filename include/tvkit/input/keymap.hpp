//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/input/keymap.hpp
// Purpose: Application-level key bindings that translate otherwise unhandled
//          keystrokes into commands.
// Key invariants: A key maps to at most one command; later bindings replace
//                 earlier ones.
// Ownership/Lifetime: Keymap owns its binding table.
// Links: src/input/keymap.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/config/config.hpp"
#include "tvkit/core/event.hpp"

#include <optional>
#include <unordered_map>

namespace tvkit::input
{

class Keymap
{
  public:
    /// @brief Keymap with the standard quit shortcuts: Ctrl+C, F10, Alt+X, Esc+X.
    static Keymap withDefaults();

    void bind(KeyCode key, CommandId command);
    void unbind(KeyCode key);

    std::optional<CommandId> lookup(KeyCode key) const;

    /// @brief Rewrite a bound keyboard event into its Command event.
    /// @return True when @p ev was rewritten.
    bool handle(Event &ev) const;

    /// @brief Add the [keymap.global] bindings from @p cfg.
    void applyConfig(const config::Config &cfg);

    std::size_t size() const
    {
        return bindings_.size();
    }

  private:
    std::unordered_map<KeyCode, CommandId> bindings_;
};

} // namespace tvkit::input
