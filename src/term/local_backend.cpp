//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/term/local_backend.cpp
// Purpose: termios-based local terminal backend.
// Key invariants:
//   - Input flows decoder -> stale partial flush -> ESC tracker ->
//     double-click detector -> ready queue.
//   - Every poll(2) wait is bounded by the caller deadline, the ESC tracker
//     deadline and the partial-sequence delay, whichever is nearest.
//   - The SIGWINCH handler only sets a flag.
// Ownership/Lifetime: Saved termios and signal disposition live in
//                     SavedState for the duration of one init/cleanup pair.
// Links: include/tvkit/term/local_backend.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/term/local_backend.hpp"

#include "tvkit/support/log.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace tvkit::term
{

using support::Errc;
using support::Result;
using support::Status;

namespace
{
volatile std::sig_atomic_t g_resizePending = 0;

void onSigwinch(int)
{
    g_resizePending = 1;
}

bool detectTrueColor()
{
    const char *ct = std::getenv("COLORTERM");
    if (!ct)
    {
        return false;
    }
    return std::strcmp(ct, "truecolor") == 0 || std::strcmp(ct, "24bit") == 0;
}

std::chrono::milliseconds untilCeil(LocalBackend::Clock::time_point from, LocalBackend::Clock::time_point to)
{
    if (to <= from)
    {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::ceil<std::chrono::milliseconds>(to - from);
}
} // namespace

struct LocalBackend::SavedState
{
    termios original{};
    struct sigaction previousWinch{};
};

LocalBackend::LocalBackend() : LocalBackend(Options{}) {}

LocalBackend::LocalBackend(Options opts)
    : opts_(opts), escTracker_(opts.escTimeout), clicks_(opts.doubleClick)
{
    caps_.mouse = opts_.mouse;
    caps_.trueColor = detectTrueColor();
}

LocalBackend::~LocalBackend()
{
    if (initialized_)
    {
        Status st = cleanup();
        if (!st.isOk())
        {
            support::logError("terminal restore failed: " + st.error().toString());
        }
    }
}

Status LocalBackend::init()
{
    if (initialized_)
    {
        return Status::ok();
    }
    if (!::isatty(opts_.inFd))
    {
        return Status::error(Errc::TerminalInit, "input is not a terminal");
    }

    auto saved = std::make_unique<SavedState>();
    if (::tcgetattr(opts_.inFd, &saved->original) != 0)
    {
        return Status(support::errnoError(Errc::TerminalInit, "tcgetattr"));
    }

    termios raw = saved->original;
    raw.c_iflag &= ~static_cast<tcflag_t>(IGNBRK | BRKINT | PARMRK | ISTRIP | INLCR | IGNCR | ICRNL | IXON);
    raw.c_oflag &= ~static_cast<tcflag_t>(OPOST);
    raw.c_cflag |= CS8;
    raw.c_lflag &= ~static_cast<tcflag_t>(ECHO | ECHONL | ICANON | ISIG | IEXTEN);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (::tcsetattr(opts_.inFd, TCSANOW, &raw) != 0)
    {
        return Status(support::errnoError(Errc::TerminalInit, "tcsetattr"));
    }

    struct sigaction sa{};
    sa.sa_handler = onSigwinch;
    sigemptyset(&sa.sa_mask);
    if (::sigaction(SIGWINCH, &sa, &saved->previousWinch) != 0)
    {
        support::logWarn(support::errnoError(Errc::Io, "sigaction(SIGWINCH)").toString());
    }

    for (auto seq : kInitSequence)
    {
        const bool mouseSeq = seq == kEnableMouse || seq == kEnableSgrMouse || seq == kEnableMouseDrag;
        if (mouseSeq && !opts_.mouse)
        {
            continue;
        }
        out_.append(seq);
    }
    saved_ = std::move(saved);
    initialized_ = true;
    g_resizePending = 1;

    Status st = flush();
    if (!st.isOk())
    {
        Status undo = cleanup();
        if (!undo.isOk())
        {
            support::logWarn("terminal restore after failed init: " + undo.error().toString());
        }
        return Status::error(Errc::TerminalInit, st.error().message);
    }
    support::logDebug("local terminal initialised");
    return Status::ok();
}

Status LocalBackend::cleanup()
{
    if (!initialized_)
    {
        return Status::ok();
    }
    for (auto seq : kCleanupSequence)
    {
        const bool mouseSeq = seq == kDisableMouse || seq == kDisableSgrMouse || seq == kDisableMouseDrag;
        if (mouseSeq && !opts_.mouse)
        {
            continue;
        }
        out_.append(seq);
    }
    Status st = flush();

    initialized_ = false;
    if (saved_)
    {
        if (::sigaction(SIGWINCH, &saved_->previousWinch, nullptr) != 0)
        {
            support::logWarn(support::errnoError(Errc::Io, "sigaction restore").toString());
        }
        if (::tcsetattr(opts_.inFd, TCSANOW, &saved_->original) != 0 && st.isOk())
        {
            st = Status(support::errnoError(Errc::Io, "tcsetattr restore"));
        }
        saved_.reset();
    }
    decoder_.clear();
    escTracker_.reset();
    ready_.clear();
    return st;
}

Result<TermSize> LocalBackend::size()
{
    winsize ws{};
    if (::ioctl(opts_.outFd, TIOCGWINSZ, &ws) != 0 && ::ioctl(opts_.inFd, TIOCGWINSZ, &ws) != 0)
    {
        return Result<TermSize>(support::errnoError(Errc::Io, "TIOCGWINSZ"));
    }
    if (ws.ws_col == 0 || ws.ws_row == 0)
    {
        return Result<TermSize>::error(Errc::Io, "terminal reports zero size");
    }
    return TermSize{ws.ws_col, ws.ws_row};
}

std::pair<int16_t, int16_t> LocalBackend::cellAspectRatio() const
{
    winsize ws{};
    if (::ioctl(opts_.outFd, TIOCGWINSZ, &ws) == 0 && ws.ws_xpixel > 0 && ws.ws_ypixel > 0 && ws.ws_col > 0 &&
        ws.ws_row > 0)
    {
        const double cellW = static_cast<double>(ws.ws_xpixel) / ws.ws_col;
        const double cellH = static_cast<double>(ws.ws_ypixel) / ws.ws_row;
        if (cellW > 0.0)
        {
            const auto ratio = static_cast<int16_t>(cellH / cellW + 0.5);
            return {std::max<int16_t>(ratio, 1), 1};
        }
    }
    return {2, 1};
}

bool LocalBackend::takeResize()
{
    if (g_resizePending)
    {
        g_resizePending = 0;
        return true;
    }
    return false;
}

void LocalBackend::queueDecoded(Clock::time_point now)
{
    for (Event ev : decoder_.drain())
    {
        clicks_.apply(ev, now);
        for (const Event &out : escTracker_.process(ev, now))
        {
            ready_.push_back(out);
        }
    }
}

std::optional<Event> LocalBackend::popReady()
{
    while (!ready_.empty())
    {
        Event ev = ready_.front();
        ready_.pop_front();
        if (ev.isKeyboard() && ev.keyCode == kbF12)
        {
            if (onScreenDump_)
            {
                onScreenDump_();
            }
            return Event{};
        }
        if (ev.isKeyboard() && ev.keyCode == kbShiftF12)
        {
            if (onViewDump_)
            {
                onViewDump_();
            }
            return Event{};
        }
        return ev;
    }
    return std::nullopt;
}

Result<std::optional<Event>> LocalBackend::pollEvent(std::chrono::milliseconds timeout)
{
    using Ret = Result<std::optional<Event>>;
    const auto deadline = Clock::now() + timeout;

    for (;;)
    {
        if (auto ev = popReady())
        {
            // An intercepted hotkey consumes this poll.
            if (ev->isNothing())
            {
                return Ret::success(std::optional<Event>{});
            }
            return Ret::success(std::optional<Event>(*ev));
        }

        auto now = Clock::now();
        auto wake = deadline;
        if (auto escDeadline = escTracker_.deadline())
        {
            wake = std::min(wake, *escDeadline);
        }
        if (decoder_.pending())
        {
            wake = std::min(wake, lastByte_ + opts_.escapeDelay);
        }

        pollfd pfd{};
        pfd.fd = opts_.inFd;
        pfd.events = POLLIN;
        const int waitMs = static_cast<int>(untilCeil(now, wake).count());
        const int rc = ::poll(&pfd, 1, waitMs);
        now = Clock::now();

        if (rc < 0)
        {
            if (errno == EINTR)
            {
                if (now >= deadline)
                {
                    return Ret::success(std::optional<Event>{});
                }
                continue;
            }
            return Ret(support::errnoError(Errc::Io, "poll"));
        }

        if (rc > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)))
        {
            char buf[256];
            const ssize_t n = ::read(opts_.inFd, buf, sizeof(buf));
            if (n == 0)
            {
                return Ret::error(Errc::BrokenPipe, "terminal input closed");
            }
            if (n < 0)
            {
                if (errno != EINTR && errno != EAGAIN)
                {
                    return Ret(support::errnoError(Errc::Io, "read"));
                }
            }
            else
            {
                decoder_.feed(std::string_view(buf, static_cast<std::size_t>(n)));
                lastByte_ = now;
                queueDecoded(now);
                continue;
            }
        }

        if (decoder_.pending() && now - lastByte_ >= opts_.escapeDelay)
        {
            decoder_.flushIncomplete();
            queueDecoded(now);
        }
        if (auto held = escTracker_.expire(now))
        {
            ready_.push_back(*held);
        }
        if (ready_.empty() && now >= deadline)
        {
            return Ret::success(std::optional<Event>{});
        }
    }
}

Status LocalBackend::writeRaw(std::string_view bytes)
{
    out_.append(bytes.data(), bytes.size());
    return Status::ok();
}

Status LocalBackend::flush()
{
    std::size_t off = 0;
    while (off < out_.size())
    {
        const ssize_t n = ::write(opts_.outFd, out_.data() + off, out_.size() - off);
        if (n < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            if (errno == EAGAIN)
            {
                pollfd pfd{};
                pfd.fd = opts_.outFd;
                pfd.events = POLLOUT;
                if (::poll(&pfd, 1, 100) < 0 && errno != EINTR)
                {
                    const Status st(support::errnoError(Errc::Io, "poll(POLLOUT)"));
                    out_.erase(0, off);
                    return st;
                }
                continue;
            }
            const Status st(support::errnoError(errno == EPIPE ? Errc::BrokenPipe : Errc::Io, "write"));
            out_.erase(0, off);
            return st;
        }
        off += static_cast<std::size_t>(n);
    }
    out_.clear();
    return Status::ok();
}

Status LocalBackend::showCursor(int x, int y)
{
    out_ += cursorShowSequence(x, y);
    return Status::ok();
}

Status LocalBackend::hideCursor()
{
    out_.append(kHideCursor);
    return Status::ok();
}

Capabilities LocalBackend::capabilities() const
{
    return caps_;
}

} // namespace tvkit::term
