//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/app.hpp
// Purpose: Application event router: the draw/poll/route loop, the idle and
//          broadcast pass, and modal sub-loops.
// Key invariants:
//   - Events are routed menu bar -> desktop -> status line -> application,
//     stopping at the first stage that clears the event.
//   - The idle pass runs only on ticks where no event arrived.
//   - Broadcast(cmCommandSetChanged) reaches every top-level view before the
//     registry's changed flag is cleared.
//   - execView() returns the first command below the internal range its view
//     produces; overlays are drawn and idled on every modal frame.
// Ownership/Lifetime: Application owns the Terminal (and through it the
//                     Backend), the registry, the keymap and every top-level
//                     view. Views passed to execView() stay owned by the caller.
// Links: src/app.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/config/config.hpp"
#include "tvkit/core/command_set.hpp"
#include "tvkit/input/keymap.hpp"
#include "tvkit/term/local_backend.hpp"
#include "tvkit/term/terminal.hpp"
#include "tvkit/ui/desktop.hpp"
#include "tvkit/ui/menu_bar.hpp"
#include "tvkit/ui/status_line.hpp"

#include <iosfwd>
#include <memory>
#include <vector>

namespace tvkit
{

class Application
{
  public:
    explicit Application(std::unique_ptr<term::Backend> backend, config::Config cfg = {});
    virtual ~Application();

    Application(const Application &) = delete;
    Application &operator=(const Application &) = delete;

    /// @brief Acquire the terminal and lay out the top-level views.
    support::Status init();

    bool initialized() const
    {
        return initialized_;
    }

    /// @brief Run the main loop until cmQuit or a poll error.
    /// @return The poll error that ended the loop, or ok.
    support::Status run();

    /// @brief Run a modal loop over @p view.
    /// @return The terminating command, or cmCancel when polling fails.
    CommandId execView(ui::View &view);

    void quit()
    {
        running_ = false;
    }

    bool running() const
    {
        return running_;
    }

    support::Status suspend();
    support::Status resume();

    ui::MenuBar *setMenuBar(std::unique_ptr<ui::MenuBar> bar);
    ui::StatusLine *setStatusLine(std::unique_ptr<ui::StatusLine> line);

    /// @brief Register a view drawn above everything and idled every frame.
    ui::View *addOverlay(std::unique_ptr<ui::View> view);

    /// @brief Route one event through the top-level views.
    virtual void handleEvent(Event &ev);

    /// @brief Per-tick housekeeping when no event arrived.
    virtual void idle();

    void draw();

    /// @brief Print the view tree, one view per line.
    void dumpViews(std::ostream &os) const;

    ui::Desktop &desktop()
    {
        return *desktop_;
    }

    ui::MenuBar *menuBar() const
    {
        return menuBar_.get();
    }

    ui::StatusLine *statusLine() const
    {
        return statusLine_.get();
    }

    CommandRegistry &commands()
    {
        return commands_;
    }

    input::Keymap &keymap()
    {
        return keymap_;
    }

    term::Terminal &terminal()
    {
        return terminal_;
    }

    const config::Config &config() const
    {
        return cfg_;
    }

  protected:
    /// @brief Application-level command handling; clear @p ev when handled.
    virtual void handleCommand(Event &ev);

  private:
    void layout();
    void flushFrame();
    void updateCommandStates();
    void broadcastCommandSetChanged(ui::View *modal);

    config::Config cfg_;
    term::Terminal terminal_;
    CommandRegistry commands_;
    input::Keymap keymap_;
    std::unique_ptr<ui::Desktop> desktop_;
    std::unique_ptr<ui::MenuBar> menuBar_;
    std::unique_ptr<ui::StatusLine> statusLine_;
    std::vector<std::unique_ptr<ui::View>> overlays_;
    bool initialized_{false};
    bool running_{false};
};

/// @brief Local backend options taken from the [input] section.
term::LocalBackend::Options localBackendOptions(const config::Config &cfg);

} // namespace tvkit
