//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: apps/demo_app.cpp
// Purpose: Views and command handling of the demo application.
// Key invariants: See demo_app.hpp.
// Ownership/Lifetime: See demo_app.hpp.
// Links: apps/demo_app.hpp
//
//===----------------------------------------------------------------------===//

#include "demo_app.hpp"

#include "tvkit/support/log.hpp"
#include "tvkit/ui/button.hpp"
#include "tvkit/ui/colors.hpp"
#include "tvkit/ui/dialog.hpp"
#include "tvkit/ui/window.hpp"
#include "tvkit/version.hpp"

#include <ctime>

namespace tvkit::demo
{

namespace
{
/// Top-right HH:MM:SS clock refreshed from idle().
class ClockView : public ui::View
{
  public:
    explicit ClockView(const Rect &bounds) : View(bounds) {}

    void idle() override
    {
        const std::time_t now = std::time(nullptr);
        std::tm tm{};
        localtime_r(&now, &tm);
        char buf[16];
        if (std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm) > 0)
        {
            text_ = buf;
        }
    }

    void draw(term::Terminal &term) override
    {
        term.writeText(bounds_.a.x, bounds_.a.y, text_, ui::colors::kBarNormal);
    }

    const char *typeName() const override
    {
        return "Clock";
    }

  private:
    std::string text_{"--:--:--"};
};
/// Single line of static text.
class TextLine : public ui::View
{
  public:
    TextLine(const Rect &bounds, std::string text) : View(bounds), text_(std::move(text)) {}

    void draw(term::Terminal &term) override
    {
        term.writeText(bounds_.a.x, bounds_.a.y, text_, ui::colors::kDialogInterior);
    }

  private:
    std::string text_;
};
} // namespace

void DemoApp::buildUi()
{
    setMenuBar(std::make_unique<ui::MenuBar>(Rect(0, 0, 80, 1),
                                             std::vector<ui::MenuItem>{{"~N~ew", cmNewWindow},
                                                                       {"~T~ile", cmTile},
                                                                       {"~C~ascade", cmCascade},
                                                                       {"~A~bout", cmAbout},
                                                                       {"~Q~uit", cmQuit}},
                                             commands()));
    setStatusLine(std::make_unique<ui::StatusLine>(Rect(0, 24, 80, 25),
                                                   std::vector<ui::StatusItem>{{"~Alt+X~ Exit", kbAltX, cmQuit},
                                                                               {"~F3~ New", kbF3, cmNewWindow},
                                                                               {"~Alt+F3~ Close", kbAltF3, cmClose},
                                                                               {"~F5~ Zoom", kbF5, cmZoom},
                                                                               {"~F6~ Next", kbF6, cmNext},
                                                                               {"", kbShiftTab, cmPrev}},
                                                   commands()));
    const auto cols = static_cast<int16_t>(terminal().size().cols);
    addOverlay(std::make_unique<ClockView>(Rect(static_cast<int16_t>(cols - 9), 0, cols, 1)));
    openWindow();
}

void DemoApp::openWindow()
{
    ++windowNumber_;
    const auto offset = static_cast<int16_t>((windowNumber_ - 1) % 8);
    auto win = std::make_unique<ui::Window>(Rect::fromSize(static_cast<int16_t>(2 + 2 * offset),
                                                           static_cast<int16_t>(1 + offset), 40, 10),
                                            "Window " + std::to_string(windowNumber_));
    win->add(std::make_unique<ui::Button>(Rect::fromSize(2, 2, 12, 2), "~B~eep", cmBeep, commands()));
    win->add(std::make_unique<ui::Button>(Rect::fromSize(16, 2, 12, 2), "~I~nfo", cmAbout, commands()));
    win->add(std::make_unique<ui::Button>(Rect::fromSize(2, 5, 12, 2), "Close", cmClose, commands()));
    win->setInitialFocus();
    desktop().add(std::move(win));
}

bool DemoApp::confirmQuit()
{
    const auto sz = terminal().size();
    const auto x = static_cast<int16_t>((sz.cols - 34) / 2);
    const auto y = static_cast<int16_t>((sz.rows - 8) / 2);
    ui::Dialog dlg(Rect::fromSize(x, y, 34, 8), "Quit");
    dlg.add(std::make_unique<TextLine>(Rect::fromSize(2, 1, 28, 1), "Really quit the demo?"));
    dlg.add(std::make_unique<ui::Button>(Rect::fromSize(4, 3, 10, 2), "~Y~es", cmYes, commands(), true));
    dlg.add(std::make_unique<ui::Button>(Rect::fromSize(18, 3, 10, 2), "~N~o", cmNo, commands()));
    return execView(dlg) == cmYes;
}

void DemoApp::showAbout()
{
    const auto sz = terminal().size();
    const auto x = static_cast<int16_t>((sz.cols - 40) / 2);
    const auto y = static_cast<int16_t>((sz.rows - 9) / 2);
    ui::Dialog dlg(Rect::fromSize(x, y, 40, 9), "About");
    dlg.add(std::make_unique<TextLine>(Rect::fromSize(2, 1, 34, 1), std::string("tvkit ") + tvkit_version()));
    dlg.add(std::make_unique<ui::Button>(Rect::fromSize(14, 4, 10, 2), "~O~K", cmOk, commands(), true));
    support::logInfo(std::string("about tvkit ") + tvkit_version());
    const CommandId result = execView(dlg);
    support::logDebug("about dialog closed with command " + std::to_string(result));
}

void DemoApp::handleCommand(Event &ev)
{
    switch (ev.command)
    {
        case cmQuit:
            if (!confirmQuit())
            {
                ev.clear();
                return;
            }
            break;
        case cmNewWindow:
            openWindow();
            ev.clear();
            return;
        case cmAbout:
            showAbout();
            ev.clear();
            return;
        case cmBeep:
            if (auto st = terminal().beep(); !st.isOk())
            {
                support::logWarn("bell failed: " + st.error().toString());
            }
            ev.clear();
            return;
        default:
            break;
    }
    Application::handleCommand(ev);
}

} // namespace tvkit::demo
