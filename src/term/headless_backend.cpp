//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/term/headless_backend.cpp
// Purpose: Scripted in-memory backend.
// Key invariants: init/cleanup write the same sequences as the real backends
//                 so captured output can be inspected by tests.
// Ownership/Lifetime: Owns all buffers; nothing touches file descriptors.
// Links: include/tvkit/term/headless_backend.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/term/headless_backend.hpp"

namespace tvkit::term
{

using support::Errc;
using support::Result;
using support::Status;

HeadlessBackend::HeadlessBackend(TermSize size) : size_(size) {}

Status HeadlessBackend::init()
{
    ++initCalls_;
    if (failInit_)
    {
        return Status::error(Errc::TerminalInit, "headless init disabled");
    }
    if (initialized_)
    {
        return Status::ok();
    }
    for (auto seq : kInitSequence)
    {
        pending_.append(seq);
    }
    initialized_ = true;
    return flush();
}

Status HeadlessBackend::cleanup()
{
    ++cleanupCalls_;
    if (!initialized_)
    {
        return Status::ok();
    }
    for (auto seq : kCleanupSequence)
    {
        pending_.append(seq);
    }
    initialized_ = false;
    return flush();
}

Result<TermSize> HeadlessBackend::size()
{
    return size_;
}

void HeadlessBackend::pushInput(std::string_view bytes)
{
    decoder_.feed(bytes);
    decoder_.flushIncomplete();
    for (const Event &ev : decoder_.drain())
    {
        script_.push_back(ev);
    }
}

Result<std::optional<Event>> HeadlessBackend::pollEvent(std::chrono::milliseconds /*timeout*/)
{
    using Ret = Result<std::optional<Event>>;
    ++pollCalls_;
    if (pollHook_)
    {
        pollHook_(*this);
    }
    if (script_.empty())
    {
        if (closeWhenDrained_)
        {
            return Ret::error(Errc::BrokenPipe, "input script exhausted");
        }
        return Ret::success(std::optional<Event>{});
    }
    Event ev = script_.front();
    script_.pop_front();
    return Ret::success(std::optional<Event>(ev));
}

Status HeadlessBackend::writeRaw(std::string_view bytes)
{
    pending_.append(bytes.data(), bytes.size());
    return Status::ok();
}

Status HeadlessBackend::flush()
{
    if (failFlush_)
    {
        return Status::error(Errc::Io, "headless flush disabled");
    }
    output_ += pending_;
    pending_.clear();
    return Status::ok();
}

Status HeadlessBackend::showCursor(int x, int y)
{
    pending_ += cursorShowSequence(x, y);
    return Status::ok();
}

Status HeadlessBackend::hideCursor()
{
    pending_.append(kHideCursor);
    return Status::ok();
}

Capabilities HeadlessBackend::capabilities() const
{
    return caps_;
}

} // namespace tvkit::term
