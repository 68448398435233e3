//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/ui/colors.hpp
// Purpose: Fixed styles shared by the stock views.
// Key invariants: Values mirror the classic blue/grey colour scheme.
// Ownership/Lifetime: Constants only.
// Links: include/tvkit/render/screen.hpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/render/screen.hpp"

namespace tvkit::ui::colors
{

inline constexpr render::RGBA kBlack{0, 0, 0, 255};
inline constexpr render::RGBA kBlue{0, 0, 170, 255};
inline constexpr render::RGBA kGreen{0, 170, 0, 255};
inline constexpr render::RGBA kCyan{0, 170, 170, 255};
inline constexpr render::RGBA kRed{170, 0, 0, 255};
inline constexpr render::RGBA kLightGray{170, 170, 170, 255};
inline constexpr render::RGBA kDarkGray{85, 85, 85, 255};
inline constexpr render::RGBA kYellow{255, 255, 85, 255};
inline constexpr render::RGBA kWhite{255, 255, 255, 255};

inline constexpr render::Style kDesktop{kBlue, kLightGray, 0};
inline constexpr render::Style kWindowFrame{kWhite, kBlue, 0};
inline constexpr render::Style kWindowFrameInactive{kLightGray, kBlue, 0};
inline constexpr render::Style kWindowInterior{kYellow, kBlue, 0};
inline constexpr render::Style kDialogFrame{kWhite, kLightGray, 0};
inline constexpr render::Style kDialogInterior{kBlack, kLightGray, 0};
inline constexpr render::Style kButtonNormal{kBlack, kGreen, 0};
inline constexpr render::Style kButtonDefault{kCyan, kGreen, 0};
inline constexpr render::Style kButtonSelected{kWhite, kGreen, 0};
inline constexpr render::Style kButtonDisabled{kDarkGray, kGreen, 0};
inline constexpr render::Style kButtonShortcut{kYellow, kGreen, 0};
inline constexpr render::Style kShadow{kDarkGray, kBlack, 0};
inline constexpr render::Style kBarNormal{kBlack, kLightGray, 0};
inline constexpr render::Style kBarShortcut{kRed, kLightGray, 0};
inline constexpr render::Style kBarSelected{kBlack, kGreen, 0};
inline constexpr render::Style kBarDisabled{kDarkGray, kLightGray, 0};

} // namespace tvkit::ui::colors
