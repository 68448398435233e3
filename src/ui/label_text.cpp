//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ui/label_text.cpp
// Purpose: Tilde-label measurement, hot keys and drawing.
// Key invariants: See label_text.hpp.
// Ownership/Lifetime: Stateless.
// Links: include/tvkit/ui/label_text.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/ui/label_text.hpp"

#include "tvkit/term/terminal.hpp"

namespace tvkit::ui
{

int labelWidth(std::string_view text)
{
    int width = 0;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        std::size_t len = 1;
        const char32_t ch = render::decodeUtf8(text.substr(pos), len);
        pos += len;
        if (ch != U'~')
        {
            ++width;
        }
    }
    return width;
}

std::optional<KeyCode> labelHotKey(std::string_view text)
{
    const auto tilde = text.find('~');
    if (tilde == std::string_view::npos || tilde + 1 >= text.size())
    {
        return std::nullopt;
    }
    return altLetterCode(text[tilde + 1]);
}

int drawLabel(term::Terminal &term,
              int x,
              int y,
              std::string_view text,
              const render::Style &normal,
              const render::Style &shortcut)
{
    bool highlighted = false;
    int cx = x;
    std::size_t pos = 0;
    while (pos < text.size())
    {
        const auto tilde = text.find('~', pos);
        const std::string_view run =
            text.substr(pos, tilde == std::string_view::npos ? std::string_view::npos : tilde - pos);
        if (!run.empty())
        {
            term.writeText(cx, y, run, highlighted ? shortcut : normal);
            cx += labelWidth(run);
        }
        if (tilde == std::string_view::npos)
        {
            break;
        }
        highlighted = !highlighted;
        pos = tilde + 1;
    }
    return cx - x;
}

} // namespace tvkit::ui
