//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/term/esc_tracker.cpp
// Purpose: Implement the ESC prefix state machine.
// Key invariants: A follow-up counts as inside the window when strictly less
//                 than the timeout has elapsed since the held ESC.
// Ownership/Lifetime: Stateless apart from the tracker fields.
// Links: include/tvkit/term/esc_tracker.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/term/esc_tracker.hpp"

namespace tvkit::term
{

namespace
{
bool isAsciiLetter(const Event &ev)
{
    if (!ev.isKeyboard() || ev.modifiers != 0)
    {
        return false;
    }
    const KeyCode k = ev.keyCode;
    return (k >= 'a' && k <= 'z') || (k >= 'A' && k <= 'Z');
}
} // namespace

std::vector<Event> EscSequenceTracker::process(const Event &ev, Clock::time_point now)
{
    std::vector<Event> out;
    if (auto stale = expire(now))
    {
        out.push_back(*stale);
    }

    const bool isEsc = ev.isKeyboard() && ev.keyCode == kbEsc;
    if (isEsc)
    {
        if (pending_)
        {
            pending_ = false;
            out.push_back(Event::keyboard(kbEscEsc));
        }
        else
        {
            pending_ = true;
            escTime_ = now;
        }
        return out;
    }

    if (pending_)
    {
        pending_ = false;
        if (isAsciiLetter(ev))
        {
            if (auto code = escLetterCode(static_cast<char>(ev.keyCode)))
            {
                out.push_back(Event::keyboard(*code));
                return out;
            }
        }
        out.push_back(Event::keyboard(kbEsc));
    }
    out.push_back(ev);
    return out;
}

std::optional<Event> EscSequenceTracker::expire(Clock::time_point now)
{
    if (pending_ && now - escTime_ >= timeout_)
    {
        pending_ = false;
        return Event::keyboard(kbEsc);
    }
    return std::nullopt;
}

std::optional<EscSequenceTracker::Clock::time_point> EscSequenceTracker::deadline() const
{
    if (!pending_)
    {
        return std::nullopt;
    }
    return escTime_ + timeout_;
}

} // namespace tvkit::term
