//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/term/input.hpp
// Purpose: Incremental decoder turning terminal input bytes (C0 controls,
//          CSI/SS3 keys, X10 and SGR mouse reports, UTF-8 text) into Events.
// Key invariants:
//   - Bytes arrive in arbitrary chunks; an incomplete sequence is kept
//     buffered and never dropped, so split input decodes exactly like
//     contiguous input.
//   - Malformed input resolves to a bare ESC, a key code of 0, or is skipped;
//     it never raises.
// Ownership/Lifetime: InputDecoder owns its byte buffer and event queue.
// Links: src/term/input.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/core/event.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tvkit::term
{

class InputDecoder
{
  public:
    /// @brief Append @p bytes and decode every complete unit now available.
    void feed(std::string_view bytes);

    /// @brief Take the events decoded so far, in arrival order.
    std::vector<Event> drain();

    /// @brief Whether undecoded bytes are buffered.
    bool pending() const
    {
        return !buf_.empty();
    }

    std::size_t bufferedBytes() const
    {
        return buf_.size();
    }

    /// @brief Force out bytes that were held waiting for more input.
    /// @details A held ESC becomes a plain Esc key; other held bytes are
    ///          discarded as unknown keys. Called once the caller knows no
    ///          continuation is coming (read timeout).
    /// @return True when anything was flushed.
    bool flushIncomplete();

    /// @brief Drop buffered bytes and undrained events.
    void clear();

  private:
    void decodeAvailable();

    std::string buf_;
    std::vector<Event> events_;
};

} // namespace tvkit::term
