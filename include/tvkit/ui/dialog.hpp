//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/ui/dialog.hpp
// Purpose: Window specialised for modal interaction.
// Key invariants:
//   - Double-Esc becomes cmCancel.
//   - An unhandled Enter becomes the default button's command when that
//     button is enabled and is cleared otherwise.
//   - While modal, any command below the internal range ends the modal loop
//     with that command; internal commands pass through untouched.
// Ownership/Lifetime: Typically owned by the caller of execView().
// Links: src/ui/dialog.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/ui/window.hpp"

namespace tvkit::ui
{

class Dialog : public Window
{
  public:
    Dialog(const Rect &bounds, std::string title);

    void handleEvent(Event &ev) override;

    const char *typeName() const override
    {
        return "Dialog";
    }

  protected:
    render::Style frameStyle() const override;
    render::Style interiorStyle() const override;

  private:
    void activateDefault(Event &ev) const;
};

} // namespace tvkit::ui
