//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/ui/label_text.hpp
// Purpose: Helpers for "~X~it"-style labels where the text between tildes
//          is the highlighted shortcut.
// Key invariants: Tildes are never drawn and never counted in widths.
// Ownership/Lifetime: Stateless functions.
// Links: src/ui/label_text.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/core/keys.hpp"
#include "tvkit/render/screen.hpp"

#include <optional>
#include <string_view>

namespace tvkit::term
{
class Terminal;
}

namespace tvkit::ui
{

/// @brief Number of cells @p text occupies once tildes are removed.
int labelWidth(std::string_view text);

/// @brief Alt+letter code for the first highlighted character, if it is a letter.
std::optional<KeyCode> labelHotKey(std::string_view text);

/// @brief Draw @p text at (x, y), switching to @p shortcut between tildes.
/// @return Cells advanced.
int drawLabel(term::Terminal &term,
              int x,
              int y,
              std::string_view text,
              const render::Style &normal,
              const render::Style &shortcut);

} // namespace tvkit::ui
