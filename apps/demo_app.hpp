//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: apps/demo_app.hpp
// Purpose: Demo application shared by tvkit_demo and tvkit_serve: a menu
//          bar, status line, a clock overlay and windows with buttons.
// Key invariants: Quitting asks for confirmation in a modal dialog.
// Ownership/Lifetime: DemoApp owns its views through Application.
// Links: apps/demo_app.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/app.hpp"

namespace tvkit::demo
{

inline constexpr CommandId cmNewWindow = 100;
inline constexpr CommandId cmAbout = 101;
inline constexpr CommandId cmBeep = 102;

class DemoApp : public Application
{
  public:
    using Application::Application;

    /// @brief Install the menu bar, status line, clock and first window.
    void buildUi();

    void openWindow();

  protected:
    void handleCommand(Event &ev) override;

  private:
    bool confirmQuit();
    void showAbout();

    int windowNumber_{0};
};

} // namespace tvkit::demo
