//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/version.hpp
// Purpose: Version query for the toolkit.
// Key invariants: The returned pointer is non-null and null-terminated.
// Ownership/Lifetime: The string has static storage duration and must not be
//                     freed.
// Links: src/version.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

namespace tvkit
{
/// @brief Returns the "major.minor.patch" version string.
const char *tvkit_version() noexcept;
} // namespace tvkit
