//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/term/esc_tracker.hpp
// Purpose: Time-based ESC prefix state machine for terminals that cannot send
//          a real Alt modifier.
// Key invariants:
//   - A lone ESC is held until the next key or until the window expires.
//   - ESC, ESC inside the window yields kbEscEsc.
//   - ESC, letter inside the window yields the Esc+letter code (kbEscA..kbEscZ).
//   - Any other follow-up releases the held ESC first, then the follow-up.
// Ownership/Lifetime: One tracker per backend instance; it holds no global
//                     state and takes timestamps from the caller.
// Links: src/term/esc_tracker.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/core/event.hpp"

#include <chrono>
#include <optional>
#include <vector>

namespace tvkit::term
{

class EscSequenceTracker
{
  public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds kDefaultTimeout{500};

    explicit EscSequenceTracker(std::chrono::milliseconds timeout = kDefaultTimeout) : timeout_(timeout)
    {
    }

    /// @brief Feed one decoded event observed at @p now.
    /// @return Zero, one, or two events ready for delivery.
    std::vector<Event> process(const Event &ev, Clock::time_point now);

    /// @brief Release a held ESC whose window has elapsed by @p now.
    std::optional<Event> expire(Clock::time_point now);

    /// @brief Whether an ESC is currently held.
    bool pending() const
    {
        return pending_;
    }

    /// @brief Instant at which a held ESC expires.
    std::optional<Clock::time_point> deadline() const;

    std::chrono::milliseconds timeout() const
    {
        return timeout_;
    }

    void setTimeout(std::chrono::milliseconds timeout)
    {
        timeout_ = timeout;
    }

    void reset()
    {
        pending_ = false;
    }

  private:
    std::chrono::milliseconds timeout_;
    bool pending_{false};
    Clock::time_point escTime_{};
};

} // namespace tvkit::term
