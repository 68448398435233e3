//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/version.cpp
// Purpose: Provide the stable version query so downstream tooling can assert
//          compatibility.
// Key invariants: Matches the VERSION given to project() in CMakeLists.txt.
// Ownership/Lifetime: Returns a string literal.
// Links: include/tvkit/version.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/version.hpp"

namespace tvkit
{
const char *tvkit_version() noexcept
{
    return "0.1.0";
}
} // namespace tvkit
