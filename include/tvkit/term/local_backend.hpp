//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/term/local_backend.hpp
// Purpose: Backend driving a locally attached POSIX terminal through termios.
// Key invariants:
//   - init() saves the termios state and cleanup() restores it verbatim.
//   - pollEvent() waits on the input descriptor for at most the timeout.
//   - F12 and Shift+F12 never reach the caller; they run the dump callbacks.
// Ownership/Lifetime: The backend borrows the input/output descriptors; it
//                     does not close them. The destructor restores the
//                     terminal if the caller did not.
// Links: src/term/local_backend.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/term/backend.hpp"
#include "tvkit/term/click_tracker.hpp"
#include "tvkit/term/esc_tracker.hpp"
#include "tvkit/term/input.hpp"

#include <deque>
#include <functional>
#include <memory>
#include <string>

namespace tvkit::term
{

class LocalBackend : public Backend
{
  public:
    using Clock = std::chrono::steady_clock;

    struct Options
    {
        int inFd = 0;
        int outFd = 1;
        bool mouse = true;
        std::chrono::milliseconds escTimeout{EscSequenceTracker::kDefaultTimeout};
        std::chrono::milliseconds doubleClick{DoubleClickDetector::kDefaultWindow};
        /// How long a partial escape sequence may wait for its next byte.
        std::chrono::milliseconds escapeDelay{25};
    };

    LocalBackend();
    explicit LocalBackend(Options opts);
    ~LocalBackend() override;

    LocalBackend(const LocalBackend &) = delete;
    LocalBackend &operator=(const LocalBackend &) = delete;

    support::Status init() override;
    support::Status cleanup() override;
    support::Result<TermSize> size() override;
    support::Result<std::optional<Event>> pollEvent(std::chrono::milliseconds timeout) override;
    support::Status writeRaw(std::string_view bytes) override;
    support::Status flush() override;
    support::Status showCursor(int x, int y) override;
    support::Status hideCursor() override;
    Capabilities capabilities() const override;
    std::pair<int16_t, int16_t> cellAspectRatio() const override;

    /// @brief Callback run when F12 is pressed.
    void setScreenDumpCallback(std::function<void()> cb)
    {
        onScreenDump_ = std::move(cb);
    }

    /// @brief Callback run when Shift+F12 is pressed.
    void setViewDumpCallback(std::function<void()> cb)
    {
        onViewDump_ = std::move(cb);
    }

    void setEscTimeout(std::chrono::milliseconds timeout)
    {
        escTracker_.setTimeout(timeout);
    }

    /// @brief Returns and clears the SIGWINCH-observed flag.
    bool takeResize() override;

    bool initialized() const
    {
        return initialized_;
    }

  private:
    struct SavedState;

    void queueDecoded(Clock::time_point now);
    std::optional<Event> popReady();

    Options opts_;
    Capabilities caps_;
    InputDecoder decoder_;
    EscSequenceTracker escTracker_;
    DoubleClickDetector clicks_;
    std::deque<Event> ready_;
    std::string out_;
    Clock::time_point lastByte_{};
    std::unique_ptr<SavedState> saved_;
    bool initialized_{false};
    std::function<void()> onScreenDump_;
    std::function<void()> onViewDump_;
};

} // namespace tvkit::term
