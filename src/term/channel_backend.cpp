//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/term/channel_backend.cpp
// Purpose: Remote-session backend and its transport-side handle.
// Key invariants:
//   - Output accumulates in a local buffer and is sent as one chunk per
//     flush; an empty buffer sends nothing.
//   - The transport's resize wake-up arrives as a Nothing event and is
//     reported to the caller as "no event".
// Ownership/Lifetime: Backend and handle each own their channel endpoints.
// Links: include/tvkit/term/channel_backend.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/term/channel_backend.hpp"

#include "tvkit/support/log.hpp"

namespace tvkit::term
{

using support::Errc;
using support::RecvStatus;
using support::Result;
using support::Status;

ChannelBackend::ChannelBackend(support::Sender<std::string> output,
                               support::Receiver<Event> events,
                               std::shared_ptr<SharedSize> size)
    : output_(std::move(output)), events_(std::move(events)), size_(std::move(size))
{
    out_.reserve(8192);
}

Status ChannelBackend::sendOutput()
{
    if (out_.empty())
    {
        return Status::ok();
    }
    std::string data;
    data.swap(out_);
    if (!output_.send(std::move(data)))
    {
        return Status::error(Errc::BrokenPipe, "session output channel closed");
    }
    return Status::ok();
}

Status ChannelBackend::init()
{
    if (initialized_)
    {
        return Status::ok();
    }
    for (auto seq : kInitSequence)
    {
        out_.append(seq);
    }
    Status st = sendOutput();
    if (!st.isOk())
    {
        return st;
    }
    initialized_ = true;
    return Status::ok();
}

Status ChannelBackend::cleanup()
{
    if (!initialized_)
    {
        return Status::ok();
    }
    for (auto seq : kCleanupSequence)
    {
        out_.append(seq);
    }
    out_.append(kResetAttributes);
    Status st = sendOutput();
    if (!st.isOk())
    {
        return st;
    }
    initialized_ = false;
    return Status::ok();
}

Result<TermSize> ChannelBackend::size()
{
    return size_->get();
}

Result<std::optional<Event>> ChannelBackend::pollEvent(std::chrono::milliseconds timeout)
{
    using Ret = Result<std::optional<Event>>;
    if (!queued_.empty())
    {
        Event ev = queued_.front();
        queued_.pop_front();
        return Ret::success(std::optional<Event>(ev));
    }

    auto r = events_.recvFor(timeout);
    switch (r.status)
    {
        case RecvStatus::Ok:
            if (r.value->isNothing())
            {
                return Ret::success(std::optional<Event>{});
            }
            return Ret::success(std::optional<Event>(*r.value));
        case RecvStatus::Empty:
            return Ret::success(std::optional<Event>{});
        case RecvStatus::Disconnected:
            break;
    }
    return Ret::error(Errc::BrokenPipe, "session input channel disconnected");
}

Status ChannelBackend::writeRaw(std::string_view bytes)
{
    out_.append(bytes.data(), bytes.size());
    return Status::ok();
}

Status ChannelBackend::flush()
{
    return sendOutput();
}

Status ChannelBackend::showCursor(int x, int y)
{
    out_ += cursorShowSequence(x, y);
    return Status::ok();
}

Status ChannelBackend::hideCursor()
{
    out_.append(kHideCursor);
    return Status::ok();
}

Capabilities ChannelBackend::capabilities() const
{
    return caps_;
}

Status ChannelBackend::bell()
{
    out_.append(kBell);
    return sendOutput();
}

Status ChannelBackend::clearScreen()
{
    out_.append(kClearScreen);
    return sendOutput();
}

ChannelSessionHandle::ChannelSessionHandle(support::Sender<Event> events,
                                           support::Receiver<std::string> output,
                                           std::shared_ptr<SharedSize> size,
                                           std::chrono::milliseconds doubleClick)
    : events_(std::move(events)), output_(std::move(output)), size_(std::move(size)), clicks_(doubleClick)
{
}

bool ChannelSessionHandle::forwardDecoded()
{
    const auto now = DoubleClickDetector::Clock::now();
    bool delivered = true;
    for (Event ev : decoder_.drain())
    {
        clicks_.apply(ev, now);
        if (!events_.send(ev))
        {
            delivered = false;
        }
    }
    return delivered;
}

bool ChannelSessionHandle::processInput(std::string_view bytes)
{
    decoder_.feed(bytes);
    return forwardDecoded();
}

bool ChannelSessionHandle::flushPendingInput()
{
    if (!decoder_.flushIncomplete())
    {
        return true;
    }
    return forwardDecoded();
}

bool ChannelSessionHandle::resize(int cols, int rows)
{
    size_->set(TermSize{cols, rows});
    return events_.send(Event{});
}

std::optional<std::string> ChannelSessionHandle::tryRecvOutput()
{
    auto r = output_.tryRecv();
    if (r.status != RecvStatus::Ok)
    {
        return std::nullopt;
    }
    return std::move(r.value);
}

support::RecvResult<std::string> ChannelSessionHandle::recvOutputFor(std::chrono::milliseconds timeout)
{
    return output_.recvFor(timeout);
}

bool ChannelSessionHandle::isDisconnected() const
{
    return !events_.connected();
}

void ChannelSessionHandle::close()
{
    events_.close();
}

ChannelSessionBuilder::Session ChannelSessionBuilder::build() const
{
    auto [eventTx, eventRx] = support::makeChannel<Event>();
    auto [outputTx, outputRx] = support::makeChannel<std::string>();
    auto size = std::make_shared<SharedSize>(TermSize{cols_, rows_});

    auto backend = std::make_unique<ChannelBackend>(std::move(outputTx), std::move(eventRx), size);
    backend->setCapabilities(caps_);
    support::logDebug("channel session created " + std::to_string(cols_) + "x" + std::to_string(rows_));
    return Session{std::move(backend),
                   ChannelSessionHandle(std::move(eventTx), std::move(outputRx), std::move(size), doubleClick_)};
}

} // namespace tvkit::term
