//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/term/stream_session.hpp
// Purpose: Transport-side pump that connects a byte stream (socket or pipe
//          pair) to a ChannelSessionHandle on a worker thread.
// Key invariants:
//   - Input bytes reach the handle in arrival order.
//   - Output chunks are written to the stream in the order the backend
//     flushed them.
//   - After the peer hangs up the handle is closed, so the backend's next
//     poll reports BrokenPipe.
// Ownership/Lifetime: The session owns the handle and the worker thread; the
//                     file descriptors stay owned by the caller and must
//                     outlive stop().
// Links: src/term/stream_session.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/term/channel_backend.hpp"

#include <atomic>
#include <chrono>
#include <thread>

namespace tvkit::term
{

class StreamSession
{
  public:
    struct Options
    {
        /// Poll granularity of the worker loop.
        std::chrono::milliseconds tick{10};
        /// Idle time after which a partial escape sequence is delivered as-is.
        std::chrono::milliseconds escapeDelay{25};
    };

    StreamSession(ChannelSessionHandle handle, int inFd, int outFd);
    StreamSession(ChannelSessionHandle handle, int inFd, int outFd, Options opts);
    ~StreamSession();

    StreamSession(const StreamSession &) = delete;
    StreamSession &operator=(const StreamSession &) = delete;

    /// @brief Start the worker thread. Calling twice is a no-op.
    void start();

    /// @brief Ask the worker to stop and join it.
    void stop();

    /// @brief True once the worker loop has exited.
    bool finished() const
    {
        return finished_.load();
    }

  private:
    void pump();
    bool pumpInput(std::chrono::steady_clock::time_point &lastInput);
    bool drainOutput();
    bool writeAll(const std::string &bytes);

    ChannelSessionHandle handle_;
    int inFd_;
    int outFd_;
    Options opts_;
    std::thread worker_;
    std::atomic<bool> stop_{false};
    std::atomic<bool> finished_{false};
};

} // namespace tvkit::term
