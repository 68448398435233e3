//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/term/headless_backend.hpp
// Purpose: In-memory backend that replays scripted input and captures output.
//          Used by tests and by headless (TVKIT_NO_TTY) runs.
// Key invariants:
//   - pollEvent() never sleeps; an empty script yields "no event" or, once
//     closeWhenDrained() is set, BrokenPipe.
//   - output() contains only bytes that were flushed.
// Ownership/Lifetime: Owns its script queue and output buffers.
// Links: src/term/headless_backend.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/term/backend.hpp"
#include "tvkit/term/input.hpp"

#include <deque>
#include <functional>
#include <string>
#include <vector>

namespace tvkit::term
{

class HeadlessBackend : public Backend
{
  public:
    explicit HeadlessBackend(TermSize size = TermSize{80, 25});

    support::Status init() override;
    support::Status cleanup() override;
    support::Result<TermSize> size() override;
    support::Result<std::optional<Event>> pollEvent(std::chrono::milliseconds timeout) override;
    support::Status writeRaw(std::string_view bytes) override;
    support::Status flush() override;
    support::Status showCursor(int x, int y) override;
    support::Status hideCursor() override;
    Capabilities capabilities() const override;

    /// @brief Append an event to the input script.
    void pushEvent(const Event &ev)
    {
        script_.push_back(ev);
    }

    /// @brief Decode raw terminal bytes into the input script.
    void pushInput(std::string_view bytes);

    /// @brief Report BrokenPipe once the script is exhausted.
    void closeWhenDrained(bool on = true)
    {
        closeWhenDrained_ = on;
    }

    /// @brief Invoked at the start of every pollEvent() call.
    void setPollHook(std::function<void(HeadlessBackend &)> hook)
    {
        pollHook_ = std::move(hook);
    }

    void setSize(TermSize size)
    {
        size_ = size;
    }

    void setCapabilities(const Capabilities &caps)
    {
        caps_ = caps;
    }

    /// @brief Make init() fail with TerminalInit.
    void failInit(bool on = true)
    {
        failInit_ = on;
    }

    /// @brief Make flush() fail with an I/O error.
    void failFlush(bool on = true)
    {
        failFlush_ = on;
    }

    const std::string &output() const
    {
        return output_;
    }

    void clearOutput()
    {
        output_.clear();
    }

    bool initialized() const
    {
        return initialized_;
    }

    int initCalls() const
    {
        return initCalls_;
    }

    int cleanupCalls() const
    {
        return cleanupCalls_;
    }

    std::size_t pollCalls() const
    {
        return pollCalls_;
    }

    std::size_t pendingEvents() const
    {
        return script_.size();
    }

  private:
    TermSize size_;
    Capabilities caps_;
    std::deque<Event> script_;
    InputDecoder decoder_;
    std::string pending_;
    std::string output_;
    std::function<void(HeadlessBackend &)> pollHook_;
    bool closeWhenDrained_{false};
    bool failInit_{false};
    bool failFlush_{false};
    bool initialized_{false};
    int initCalls_{0};
    int cleanupCalls_{0};
    std::size_t pollCalls_{0};
};

} // namespace tvkit::term
