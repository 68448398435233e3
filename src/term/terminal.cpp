//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/term/terminal.cpp
// Purpose: Terminal session: backend lifecycle, frame flushing, clipping and
//          screen dumps.
// Key invariants: A failed flush invalidates the previous frame so the next
//                 successful flush repaints every cell.
// Ownership/Lifetime: Owns the backend, screen buffer and renderer.
// Links: include/tvkit/term/terminal.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/term/terminal.hpp"

#include "tvkit/support/log.hpp"

#include <fstream>

namespace tvkit::term
{

Terminal::Terminal(std::unique_ptr<Backend> backend)
    : backend_(std::move(backend)), renderer_(*backend_, false)
{
}

support::Status Terminal::init()
{
    auto st = backend_->init();
    if (!st.isOk())
    {
        return st;
    }
    caps_ = backend_->capabilities();
    renderer_.setTruecolor(caps_.trueColor);
    auto sz = backend_->size();
    if (!sz.isOk())
    {
        return sz.error();
    }
    resize(sz.value());
    support::logDebug("terminal initialised at " + std::to_string(size_.cols) + "x" +
                      std::to_string(size_.rows));
    return support::Status::ok();
}

support::Status Terminal::cleanup()
{
    shownCursor_.reset();
    return backend_->cleanup();
}

support::Status Terminal::suspend()
{
    shownCursor_.reset();
    return backend_->suspend();
}

support::Status Terminal::resume()
{
    auto st = backend_->resume();
    if (!st.isOk())
    {
        return st;
    }
    screen_.invalidate();
    renderer_.reset();
    return support::Status::ok();
}

support::Result<std::optional<Event>> Terminal::pollEvent(std::chrono::milliseconds timeout)
{
    if (!pending_.empty())
    {
        Event ev = pending_.front();
        pending_.pop_front();
        return std::optional<Event>(ev);
    }
    return backend_->pollEvent(timeout);
}

bool Terminal::checkResize()
{
    if (!backend_->takeResize())
    {
        return false;
    }
    auto sz = backend_->size();
    if (!sz.isOk())
    {
        support::logWarn("size query failed: " + sz.error().toString());
        return false;
    }
    if (sz.value() == size_)
    {
        return false;
    }
    support::logInfo("terminal resized to " + std::to_string(sz.value().cols) + "x" +
                     std::to_string(sz.value().rows));
    resize(sz.value());
    return true;
}

void Terminal::resize(TermSize size)
{
    size_ = size;
    screen_.resize(size.rows, size.cols);
    renderer_.reset();
    shownCursor_.reset();
}

support::Status Terminal::flush()
{
    auto st = renderer_.draw(screen_);
    if (st.isOk())
    {
        if (cursor_)
        {
            st = backend_->showCursor(cursor_->x, cursor_->y);
            // showCursor moves the hardware cursor behind the renderer's back.
            renderer_.reset();
        }
        else if (shownCursor_)
        {
            st = backend_->hideCursor();
        }
    }
    if (st.isOk())
    {
        st = backend_->flush();
    }
    if (!st.isOk())
    {
        screen_.invalidate();
        renderer_.reset();
        return st;
    }
    shownCursor_ = cursor_;
    screen_.snapshotPrev();
    return support::Status::ok();
}

support::Status Terminal::beep()
{
    return backend_->bell();
}

void Terminal::pushClip(const Rect &r)
{
    clips_.push_back(clip().intersect(r));
}

void Terminal::popClip()
{
    if (!clips_.empty())
    {
        clips_.pop_back();
    }
}

Rect Terminal::clip() const
{
    if (!clips_.empty())
    {
        return clips_.back();
    }
    return Rect(0, 0, static_cast<int16_t>(size_.cols), static_cast<int16_t>(size_.rows));
}

void Terminal::writeText(int x, int y, std::string_view text, const render::Style &style)
{
    const Rect c = clip();
    if (c.isEmpty())
    {
        return;
    }
    screen_.putText(y, x, text, style, c);
}

void Terminal::fill(const Rect &area, char32_t ch, const render::Style &style)
{
    const Rect r = area.intersect(clip());
    if (r.isEmpty())
    {
        return;
    }
    screen_.fill(r, ch, style);
}

support::Status Terminal::dumpScreen(const std::string &path) const
{
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out)
    {
        return support::Status::error(support::Errc::Io, "cannot open '" + path + "' for writing");
    }
    for (int row = 0; row < screen_.rows(); ++row)
    {
        out << screen_.rowText(row) << '\n';
    }
    if (!out)
    {
        return support::Status::error(support::Errc::Io, "write to '" + path + "' failed");
    }
    return support::Status::ok();
}

} // namespace tvkit::term
