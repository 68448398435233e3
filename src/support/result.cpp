//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/result.cpp
// Purpose: Formatting helpers for tvkit error values.
// Key invariants: errcName never returns null.
// Ownership/Lifetime: Returned names are string literals.
// Links: include/tvkit/support/result.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/support/result.hpp"

#include <cerrno>
#include <cstring>

namespace tvkit::support
{

const char *errcName(Errc code) noexcept
{
    switch (code)
    {
        case Errc::Io:
            return "io";
        case Errc::BrokenPipe:
            return "broken pipe";
        case Errc::TerminalInit:
            return "terminal init";
        case Errc::InvalidInput:
            return "invalid input";
        case Errc::Parse:
            return "parse";
    }
    return "unknown";
}

std::string Error::toString() const
{
    std::string out = errcName(code);
    if (!message.empty())
    {
        out += ": ";
        out += message;
    }
    return out;
}

Error errnoError(Errc code, const std::string &what)
{
    const int err = errno;
    return Error{code, what + ": " + std::strerror(err)};
}

} // namespace tvkit::support
