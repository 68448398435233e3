//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tvkit/core/command_set.hpp
// Purpose: Command enable bitfield and the per-application registry that
//          tracks which commands are currently available.
// Key invariants:
//   - Ids at or above kMaxCommands always read as enabled; writes to them are
//     ignored.
//   - CommandRegistry::changed() turns true only on an actual enable/disable
//     transition and stays true until clearChanged().
// Ownership/Lifetime: The registry is owned by the Application and handed to
//                     views by reference; there is no process-wide instance.
// Links: src/core/command_set.cpp
//
//===----------------------------------------------------------------------===//
#pragma once

#include "tvkit/core/command.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <vector>

namespace tvkit
{

/// @brief Fixed-size command bitfield with 65536 entries.
class CommandSet
{
  public:
    static constexpr uint32_t kMaxCommands = 65536;

    /// @brief Create a set with every command disabled.
    CommandSet();

    static CommandSet withAllEnabled();

    /// @brief Whether @p id is enabled; ids >= kMaxCommands are always enabled.
    bool has(uint32_t id) const;

    void enable(uint32_t id);
    void disable(uint32_t id);

    /// @brief Enable the inclusive range [first, last].
    /// @note No-op when last <= first or last >= kMaxCommands.
    void enableRange(uint32_t first, uint32_t last);

    /// @brief Disable the inclusive range [first, last]; same bounds as enableRange.
    void disableRange(uint32_t first, uint32_t last);

    void enableSet(const CommandSet &other);
    void disableSet(const CommandSet &other);
    void enableAll();

    bool isEmpty() const;

    /// @brief Keep only commands enabled in both sets.
    void intersect(const CommandSet &other);

    /// @brief Enable every command enabled in either set.
    void unite(const CommandSet &other);

    bool operator==(const CommandSet &other) const
    {
        return words_ == other.words_;
    }

    bool operator!=(const CommandSet &other) const
    {
        return !(*this == other);
    }

  private:
    static constexpr std::size_t kWords = kMaxCommands / 32;

    void setRange(uint32_t first, uint32_t last, bool on);

    std::vector<uint32_t> words_;
};

/// @brief Application-owned command availability with a change flag.
class CommandRegistry
{
  public:
    /// @brief Starts with every command enabled and no pending change.
    CommandRegistry();

    bool enabled(uint32_t id) const
    {
        return set_.has(id);
    }

    void enable(uint32_t id);
    void disable(uint32_t id);

    /// @brief Enable or disable according to @p on.
    void setEnabled(uint32_t id, bool on)
    {
        if (on)
            enable(id);
        else
            disable(id);
    }

    bool changed() const
    {
        return changed_;
    }

    void clearChanged()
    {
        changed_ = false;
    }

    /// @brief Reset to all-enabled, disable @p blacklist, clear the change flag.
    void init(std::initializer_list<CommandId> blacklist);

    void init(const std::vector<CommandId> &blacklist);

    const CommandSet &commands() const
    {
        return set_;
    }

  private:
    CommandSet set_;
    bool changed_{false};
};

} // namespace tvkit
