//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/term/backend.cpp
// Purpose: Default implementations shared by all backends.
// Key invariants: bell() and clearScreen() flush immediately.
// Ownership/Lifetime: Stateless.
// Links: include/tvkit/term/backend.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/term/backend.hpp"

#include <string>

namespace tvkit::term
{

std::string cursorShowSequence(int x, int y)
{
    return "\x1b[" + std::to_string(y + 1) + ";" + std::to_string(x + 1) + "H" + std::string(kShowCursor);
}

support::Status Backend::bell()
{
    auto st = writeRaw(kBell);
    if (!st.isOk())
    {
        return st;
    }
    return flush();
}

support::Status Backend::clearScreen()
{
    auto st = writeRaw(kClearScreen);
    if (!st.isOk())
    {
        return st;
    }
    return flush();
}

} // namespace tvkit::term
