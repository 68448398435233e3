//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/term/stream_session.cpp
// Purpose: Worker loop pumping bytes between a file descriptor pair and a
//          channel session.
// Key invariants: Only the worker thread touches the handle once start() has
//                 run.
// Ownership/Lifetime: See stream_session.hpp.
// Links: include/tvkit/term/stream_session.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/term/stream_session.hpp"

#include "tvkit/support/log.hpp"
#include "tvkit/support/result.hpp"

#include <cerrno>
#include <poll.h>
#include <unistd.h>

namespace tvkit::term
{

StreamSession::StreamSession(ChannelSessionHandle handle, int inFd, int outFd)
    : StreamSession(std::move(handle), inFd, outFd, Options{})
{
}

StreamSession::StreamSession(ChannelSessionHandle handle, int inFd, int outFd, Options opts)
    : handle_(std::move(handle)), inFd_(inFd), outFd_(outFd), opts_(opts)
{
}

StreamSession::~StreamSession()
{
    stop();
}

void StreamSession::start()
{
    if (worker_.joinable())
    {
        return;
    }
    stop_.store(false);
    finished_.store(false);
    worker_ = std::thread([this] { pump(); });
}

void StreamSession::stop()
{
    stop_.store(true);
    if (worker_.joinable())
    {
        worker_.join();
    }
}

void StreamSession::pump()
{
    auto lastInput = std::chrono::steady_clock::now();
    while (!stop_.load())
    {
        if (!pumpInput(lastInput))
        {
            break;
        }
        // Sample before draining so the backend's final output is forwarded.
        const bool gone = handle_.isDisconnected();
        if (!drainOutput() || gone)
        {
            break;
        }
    }
    handle_.close();
    finished_.store(true);
    support::logDebug("stream session on fd " + std::to_string(inFd_) + " finished");
}

bool StreamSession::pumpInput(std::chrono::steady_clock::time_point &lastInput)
{
    pollfd pfd{};
    pfd.fd = inFd_;
    pfd.events = POLLIN;
    const int rc = ::poll(&pfd, 1, static_cast<int>(opts_.tick.count()));
    if (rc < 0)
    {
        if (errno == EINTR)
        {
            return true;
        }
        support::logWarn(support::errnoError(support::Errc::Io, "poll").toString());
        return false;
    }
    const auto now = std::chrono::steady_clock::now();
    if (rc == 0 || (pfd.revents & (POLLIN | POLLHUP | POLLERR)) == 0)
    {
        if (handle_.hasPendingInput() && now - lastInput >= opts_.escapeDelay)
        {
            return handle_.flushPendingInput();
        }
        return true;
    }

    char buf[4096];
    const ssize_t n = ::read(inFd_, buf, sizeof(buf));
    if (n < 0)
    {
        if (errno == EINTR || errno == EAGAIN)
        {
            return true;
        }
        support::logWarn(support::errnoError(support::Errc::Io, "read").toString());
        return false;
    }
    if (n == 0)
    {
        support::logInfo("peer closed the stream");
        return false;
    }
    lastInput = now;
    return handle_.processInput(std::string_view(buf, static_cast<std::size_t>(n)));
}

bool StreamSession::drainOutput()
{
    while (auto chunk = handle_.tryRecvOutput())
    {
        if (!writeAll(*chunk))
        {
            return false;
        }
    }
    return true;
}

bool StreamSession::writeAll(const std::string &bytes)
{
    std::size_t off = 0;
    while (off < bytes.size())
    {
        const ssize_t n = ::write(outFd_, bytes.data() + off, bytes.size() - off);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            if (errno == EAGAIN)
            {
                pollfd pfd{};
                pfd.fd = outFd_;
                pfd.events = POLLOUT;
                if (::poll(&pfd, 1, static_cast<int>(opts_.tick.count())) < 0 && errno != EINTR)
                {
                    support::logWarn(support::errnoError(support::Errc::Io, "poll").toString());
                    return false;
                }
                continue;
            }
            support::logWarn(support::errnoError(support::Errc::BrokenPipe, "write").toString());
            return false;
        }
        off += static_cast<std::size_t>(n);
    }
    return true;
}

} // namespace tvkit::term
