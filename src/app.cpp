//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/app.cpp
// Purpose: Implement the application loop that drives the view tree over a
//          terminal backend.
// Key invariants: One frame is drawn and flushed per loop iteration before
//                 polling; a failed flush is logged and the loop continues.
// Ownership/Lifetime: See app.hpp.
// Links: include/tvkit/app.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the tvkit application loop and event dispatch.
/// @details The Application coordinates the desktop, the optional menu bar
///          and status line, the keymap and the command registry. Each loop
///          iteration draws the whole stack into the screen buffer, flushes
///          the diff, and then either routes one polled event or runs the
///          idle pass.

#include "tvkit/app.hpp"

#include "tvkit/support/log.hpp"

#include <ostream>

namespace tvkit
{

/// @brief Construct an application around a backend and configuration.
/// @details The command registry starts with every command enabled except
///          cmClose, which becomes available once a window exists. The keymap
///          carries the stock quit shortcuts plus the configured bindings.
Application::Application(std::unique_ptr<term::Backend> backend, config::Config cfg)
    : cfg_(std::move(cfg)), terminal_(std::move(backend)), keymap_(input::Keymap::withDefaults()),
      desktop_(std::make_unique<ui::Desktop>(Rect()))
{
    commands_.init({cmClose});
    keymap_.applyConfig(cfg_);
}

Application::~Application()
{
    if (!initialized_)
    {
        return;
    }
    auto st = terminal_.cleanup();
    if (!st.isOk())
    {
        support::logWarn("terminal cleanup failed: " + st.error().toString());
    }
}

support::Status Application::init()
{
    if (initialized_)
    {
        return support::Status::ok();
    }
    auto st = terminal_.init();
    if (!st.isOk())
    {
        return st;
    }
    initialized_ = true;
    layout();
    support::logInfo("application started at " + std::to_string(terminal_.size().cols) + "x" +
                     std::to_string(terminal_.size().rows));
    return support::Status::ok();
}

void Application::layout()
{
    const auto sz = terminal_.size();
    const auto cols = static_cast<int16_t>(sz.cols);
    const auto rows = static_cast<int16_t>(sz.rows);
    int16_t top = 0;
    int16_t bottom = rows;
    if (menuBar_)
    {
        menuBar_->setBounds(Rect(0, 0, cols, 1));
        top = 1;
    }
    if (statusLine_)
    {
        statusLine_->setBounds(Rect(0, static_cast<int16_t>(rows - 1), cols, rows));
        bottom = static_cast<int16_t>(rows - 1);
    }
    desktop_->setBounds(Rect(0, top, cols, bottom));
}

ui::MenuBar *Application::setMenuBar(std::unique_ptr<ui::MenuBar> bar)
{
    menuBar_ = std::move(bar);
    layout();
    return menuBar_.get();
}

ui::StatusLine *Application::setStatusLine(std::unique_ptr<ui::StatusLine> line)
{
    statusLine_ = std::move(line);
    layout();
    return statusLine_.get();
}

ui::View *Application::addOverlay(std::unique_ptr<ui::View> view)
{
    overlays_.push_back(std::move(view));
    return overlays_.back().get();
}

void Application::draw()
{
    desktop_->draw(terminal_);
    if (menuBar_)
        menuBar_->draw(terminal_);
    if (statusLine_)
        statusLine_->draw(terminal_);
    for (auto &overlay : overlays_)
        overlay->draw(terminal_);
    terminal_.setCursor(desktop_->cursorPos());
}

void Application::flushFrame()
{
    auto st = terminal_.flush();
    if (!st.isOk())
    {
        support::logWarn("frame flush failed: " + st.error().toString());
    }
}

support::Status Application::run()
{
    auto st = init();
    if (!st.isOk())
    {
        support::logError("terminal initialisation failed: " + st.error().toString());
        return st;
    }

    support::Status result;
    running_ = true;
    while (running_)
    {
        draw();
        flushFrame();

        auto polled = terminal_.pollEvent(std::chrono::milliseconds(cfg_.loop.pollIntervalMs));
        if (!polled.isOk())
        {
            support::logError("event poll failed: " + polled.error().toString());
            result = polled.error();
            break;
        }
        if (polled.value())
        {
            Event ev = *polled.value();
            handleEvent(ev);
        }
        else
        {
            idle();
        }
        desktop_->removeClosedWindows();
    }
    running_ = false;

    st = terminal_.cleanup();
    initialized_ = false;
    if (!st.isOk())
    {
        support::logWarn("terminal cleanup failed: " + st.error().toString());
        if (result.isOk())
        {
            result = st;
        }
    }
    return result;
}

void Application::handleEvent(Event &ev)
{
    if (menuBar_)
    {
        menuBar_->handleEvent(ev);
        if (ev.isNothing())
            return;
    }

    desktop_->handleEvent(ev);
    if (ev.isNothing())
        return;
    const bool seenByDesktop = ev.isCommand();

    if (statusLine_)
    {
        statusLine_->handleEvent(ev);
        if (ev.isNothing())
            return;
    }

    if (ev.isKeyboard())
    {
        keymap_.handle(ev);
    }
    if (!ev.isCommand())
    {
        return;
    }
    handleCommand(ev);
    if (!ev.isNothing() && !seenByDesktop)
    {
        // Commands raised by the status line or keymap still target the focused window.
        desktop_->handleEvent(ev);
    }
}

void Application::handleCommand(Event &ev)
{
    switch (ev.command)
    {
        case cmQuit:
            support::logInfo("quit requested");
            running_ = false;
            ev.clear();
            break;
        case cmTile:
            desktop_->tile();
            ev.clear();
            break;
        case cmCascade:
            desktop_->cascade();
            ev.clear();
            break;
        default:
            break;
    }
}

void Application::updateCommandStates()
{
    const bool tileable = desktop_->hasTileableWindows();
    commands_.setEnabled(cmTile, tileable);
    commands_.setEnabled(cmCascade, tileable);
    commands_.setEnabled(cmClose, desktop_->windowCount() > 0);
}

void Application::broadcastCommandSetChanged(ui::View *modal)
{
    if (!commands_.changed())
    {
        return;
    }
    // Each top-level view gets its own copy so one consumer cannot starve the rest.
    const Event msg = Event::broadcastEvent(cmCommandSetChanged);
    if (menuBar_)
    {
        Event ev = msg;
        menuBar_->handleEvent(ev);
    }
    {
        Event ev = msg;
        desktop_->handleEvent(ev);
    }
    if (statusLine_)
    {
        Event ev = msg;
        statusLine_->handleEvent(ev);
    }
    if (modal)
    {
        Event ev = msg;
        modal->handleEvent(ev);
    }
    commands_.clearChanged();
}

void Application::idle()
{
    if (terminal_.checkResize())
    {
        layout();
    }
    for (auto &overlay : overlays_)
    {
        overlay->idle();
    }
    updateCommandStates();
    broadcastCommandSetChanged(nullptr);
}

CommandId Application::execView(ui::View &view)
{
    auto st = init();
    if (!st.isOk())
    {
        support::logError("terminal initialisation failed: " + st.error().toString());
        return cmCancel;
    }

    const StateFlags saved = view.state();
    view.setEndState(cmNone);
    view.setState(static_cast<StateFlags>(sfModal | sfFocused | sfSelected), true);
    if (auto *group = dynamic_cast<ui::Group *>(&view); group && !group->current())
    {
        group->setInitialFocus();
    }

    CommandId result = cmNone;
    while (result == cmNone)
    {
        draw();
        view.draw(terminal_);
        for (auto &overlay : overlays_)
            overlay->draw(terminal_);
        terminal_.setCursor(view.cursorPos());
        flushFrame();

        auto polled = terminal_.pollEvent(std::chrono::milliseconds(cfg_.loop.modalPollIntervalMs));
        if (!polled.isOk())
        {
            support::logWarn("modal poll failed: " + polled.error().toString());
            result = cmCancel;
            break;
        }
        if (polled.value())
        {
            Event ev = *polled.value();
            view.handleEvent(ev);
            if (view.endState() != cmNone)
                result = view.endState();
            else if (ev.isCommand() && isTerminalCommand(ev.command))
                result = ev.command;
        }
        else
        {
            if (terminal_.checkResize())
                layout();
            broadcastCommandSetChanged(&view);
        }
        for (auto &overlay : overlays_)
        {
            overlay->idle();
        }
    }

    view.setState(static_cast<StateFlags>(sfModal | sfFocused | sfSelected), false);
    view.setState(static_cast<StateFlags>(saved & (sfModal | sfFocused | sfSelected)), true);
    return result;
}

support::Status Application::suspend()
{
    return terminal_.suspend();
}

support::Status Application::resume()
{
    auto st = terminal_.resume();
    if (!st.isOk())
    {
        return st;
    }
    if (terminal_.checkResize())
    {
        layout();
    }
    draw();
    return terminal_.flush();
}

void Application::dumpViews(std::ostream &os) const
{
    if (menuBar_)
        menuBar_->dump(os, 0);
    desktop_->dump(os, 0);
    if (statusLine_)
        statusLine_->dump(os, 0);
    for (const auto &overlay : overlays_)
        overlay->dump(os, 0);
}

term::LocalBackend::Options localBackendOptions(const config::Config &cfg)
{
    term::LocalBackend::Options opts;
    opts.mouse = cfg.input.mouse;
    opts.escTimeout = std::chrono::milliseconds(cfg.input.escTimeoutMs);
    opts.doubleClick = std::chrono::milliseconds(cfg.input.doubleClickMs);
    opts.escapeDelay = std::chrono::milliseconds(cfg.input.escapeDelayMs);
    return opts;
}

} // namespace tvkit
