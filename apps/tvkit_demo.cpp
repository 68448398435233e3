//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: apps/tvkit_demo.cpp
// Purpose: Interactive demo on the local terminal, or a scripted headless
//          run when TVKIT_NO_TTY=1.
// Key invariants: Exits non-zero with a diagnostic when the terminal cannot
//                 be initialised or the configuration is invalid.
// Ownership/Lifetime: The application owns the backend; raw backend pointers
//                     kept here are only used while the application lives.
// Links: apps/demo_app.hpp
//
//===----------------------------------------------------------------------===//

#include "demo_app.hpp"

#include "tvkit/support/log.hpp"
#include "tvkit/term/headless_backend.hpp"
#include "tvkit/version.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>

using namespace tvkit;

namespace
{
// Open a window, cycle focus, tile from the menu bar, then quit and confirm.
void scriptHeadless(term::HeadlessBackend &hb)
{
    hb.pushInput("\x1bOR");
    hb.pushEvent(Event::keyboard(kbF6));
    hb.pushInput("\t");
    hb.pushInput("\x1b[<0;8;1M");
    hb.pushInput("\x1b[<0;8;1m");
    hb.pushInput("\x1bx");
    hb.pushInput("\r");
    hb.closeWhenDrained();
}
} // namespace

int main(int argc, char **argv)
{
    if (argc > 1 && std::strcmp(argv[1], "--version") == 0)
    {
        std::cout << "tvkit_demo " << tvkit_version() << '\n';
        return 0;
    }

    config::Config cfg;
    if (const char *path = std::getenv("TVKIT_CONFIG"))
    {
        auto st = config::loadFromFile(path, cfg);
        if (!st.isOk())
        {
            std::cerr << "tvkit_demo: " << st.error().toString() << '\n';
            return 2;
        }
    }
    if (auto st = config::applyLogConfig(cfg.log); !st.isOk())
    {
        std::cerr << "tvkit_demo: " << st.error().toString() << '\n';
    }

    bool headless = false;
    if (const char *v = std::getenv("TVKIT_NO_TTY"))
    {
        headless = (v[0] == '1');
    }

    std::unique_ptr<term::Backend> backend;
    term::LocalBackend *local = nullptr;
    if (headless)
    {
        auto hb = std::make_unique<term::HeadlessBackend>(term::TermSize{80, 25});
        scriptHeadless(*hb);
        backend = std::move(hb);
    }
    else
    {
        auto lb = std::make_unique<term::LocalBackend>(localBackendOptions(cfg));
        local = lb.get();
        backend = std::move(lb);
    }

    demo::DemoApp app(std::move(backend), cfg);
    if (local)
    {
        local->setScreenDumpCallback([&app] {
            auto st = app.terminal().dumpScreen("tvkit-screen.txt");
            if (st.isOk())
                support::logInfo("screen written to tvkit-screen.txt");
            else
                support::logWarn("screen dump failed: " + st.error().toString());
        });
        local->setViewDumpCallback([&app] {
            std::ostringstream os;
            app.dumpViews(os);
            support::logInfo("view tree:\n" + os.str());
        });
    }

    if (auto st = app.init(); !st.isOk())
    {
        std::cerr << "tvkit_demo: cannot initialise terminal: " << st.error().toString() << '\n';
        return 1;
    }
    app.buildUi();

    auto st = app.run();
    if (headless)
    {
        const auto &screen = app.terminal().screen();
        for (int row = 0; row < screen.rows(); ++row)
        {
            std::cout << screen.rowText(row) << '\n';
        }
    }
    if (!st.isOk())
    {
        std::cerr << "tvkit_demo: " << st.error().toString() << '\n';
        return 1;
    }
    return 0;
}
