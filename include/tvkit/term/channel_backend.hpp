//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/term/channel_backend.hpp
// Purpose: Backend for remote sessions (SSH, TCP) that has no terminal of its
//          own. Output bytes go to a channel, input events come from one, and
//          the terminal size is a cell shared with the transport.
// Key invariants:
//   - init() and cleanup() send the setup and teardown strings in order and
//     in reverse order respectively, at most once per init/cleanup pair.
//   - A disconnected input channel or output sink is a BrokenPipe error.
//   - pollEvent() returns a putEvent() event first, then waits on the channel
//     for no longer than the timeout.
// Ownership/Lifetime: The backend lives on the UI thread; the paired
//                     ChannelSessionHandle lives on the transport thread. They
//                     share only the channels and the SharedSize cell.
// Links: src/term/channel_backend.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/support/channel.hpp"
#include "tvkit/term/backend.hpp"
#include "tvkit/term/click_tracker.hpp"
#include "tvkit/term/input.hpp"

#include <deque>
#include <memory>
#include <mutex>
#include <string>

namespace tvkit::term
{

/// @brief Terminal size updated by the transport and read by the backend.
class SharedSize
{
  public:
    explicit SharedSize(TermSize initial) : size_(initial) {}

    TermSize get() const
    {
        std::lock_guard<std::mutex> lock(mu_);
        return size_;
    }

    void set(TermSize size)
    {
        std::lock_guard<std::mutex> lock(mu_);
        size_ = size;
    }

  private:
    mutable std::mutex mu_;
    TermSize size_;
};

class ChannelBackend : public Backend
{
  public:
    ChannelBackend(support::Sender<std::string> output,
                   support::Receiver<Event> events,
                   std::shared_ptr<SharedSize> size);

    support::Status init() override;
    support::Status cleanup() override;

    /// @brief The remote terminal is not ours to release; no-op.
    support::Status suspend() override
    {
        return support::Status::ok();
    }

    support::Status resume() override
    {
        return support::Status::ok();
    }

    support::Result<TermSize> size() override;
    support::Result<std::optional<Event>> pollEvent(std::chrono::milliseconds timeout) override;
    support::Status writeRaw(std::string_view bytes) override;
    support::Status flush() override;
    support::Status showCursor(int x, int y) override;
    support::Status hideCursor() override;
    Capabilities capabilities() const override;
    support::Status bell() override;
    support::Status clearScreen() override;

    void setCapabilities(const Capabilities &caps)
    {
        caps_ = caps;
    }

    std::shared_ptr<SharedSize> sizeHandle() const
    {
        return size_;
    }

    /// @brief Queue an event ahead of anything arriving on the channel.
    void putEvent(const Event &ev)
    {
        queued_.push_back(ev);
    }

    bool initialized() const
    {
        return initialized_;
    }

  private:
    support::Status sendOutput();

    std::string out_;
    support::Sender<std::string> output_;
    support::Receiver<Event> events_;
    std::deque<Event> queued_;
    std::shared_ptr<SharedSize> size_;
    Capabilities caps_;
    bool initialized_{false};
};

/// @brief Transport-side endpoint of a channel session.
class ChannelSessionHandle
{
  public:
    ChannelSessionHandle(support::Sender<Event> events,
                         support::Receiver<std::string> output,
                         std::shared_ptr<SharedSize> size,
                         std::chrono::milliseconds doubleClick);

    ChannelSessionHandle(ChannelSessionHandle &&) noexcept = default;
    ChannelSessionHandle &operator=(ChannelSessionHandle &&) noexcept = default;

    /// @brief Decode raw client bytes and forward the events to the backend.
    /// @return False when the backend side has gone away.
    bool processInput(std::string_view bytes);

    /// @brief Deliver input held waiting for more bytes (e.g. a lone ESC).
    bool flushPendingInput();

    bool hasPendingInput() const
    {
        return decoder_.pending();
    }

    /// @brief Record a new client size and wake the backend.
    bool resize(int cols, int rows);

    /// @brief Next chunk of output for the client, if any.
    std::optional<std::string> tryRecvOutput();

    /// @brief Wait up to @p timeout for the next output chunk.
    support::RecvResult<std::string> recvOutputFor(std::chrono::milliseconds timeout);

    /// @brief True once the backend has been destroyed.
    bool isDisconnected() const;

    /// @brief Signal client disconnect; the backend's next poll fails.
    void close();

    std::shared_ptr<SharedSize> size() const
    {
        return size_;
    }

  private:
    bool forwardDecoded();

    support::Sender<Event> events_;
    support::Receiver<std::string> output_;
    std::shared_ptr<SharedSize> size_;
    InputDecoder decoder_;
    DoubleClickDetector clicks_;
};

/// @brief Creates a connected ChannelBackend / ChannelSessionHandle pair.
class ChannelSessionBuilder
{
  public:
    struct Session
    {
        std::unique_ptr<ChannelBackend> backend;
        ChannelSessionHandle handle;
    };

    ChannelSessionBuilder &size(int cols, int rows)
    {
        cols_ = cols;
        rows_ = rows;
        return *this;
    }

    ChannelSessionBuilder &doubleClickWindow(std::chrono::milliseconds window)
    {
        doubleClick_ = window;
        return *this;
    }

    ChannelSessionBuilder &capabilities(const Capabilities &caps)
    {
        caps_ = caps;
        return *this;
    }

    Session build() const;

  private:
    int cols_ = 80;
    int rows_ = 24;
    std::chrono::milliseconds doubleClick_{DoubleClickDetector::kDefaultWindow};
    Capabilities caps_{};
};

} // namespace tvkit::term
