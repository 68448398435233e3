//===----------------------------------------------------------------------===//
//
// Part of the tvkit project, under the MIT License.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/core/command_set.cpp
// Purpose: Bitfield operations for CommandSet and change tracking for the
//          CommandRegistry.
// Key invariants: Bit (id & 31) of word (id >> 5) stores the state of @p id.
// Ownership/Lifetime: CommandSet owns its word storage.
// Links: include/tvkit/core/command_set.hpp
//
//===----------------------------------------------------------------------===//

#include "tvkit/core/command_set.hpp"

#include <algorithm>

namespace tvkit
{

CommandSet::CommandSet() : words_(kWords, 0U) {}

CommandSet CommandSet::withAllEnabled()
{
    CommandSet cs;
    cs.enableAll();
    return cs;
}

bool CommandSet::has(uint32_t id) const
{
    if (id >= kMaxCommands)
    {
        return true;
    }
    return (words_[id >> 5] & (1U << (id & 0x1F))) != 0;
}

void CommandSet::enable(uint32_t id)
{
    if (id < kMaxCommands)
    {
        words_[id >> 5] |= 1U << (id & 0x1F);
    }
}

void CommandSet::disable(uint32_t id)
{
    if (id < kMaxCommands)
    {
        words_[id >> 5] &= ~(1U << (id & 0x1F));
    }
}

void CommandSet::setRange(uint32_t first, uint32_t last, bool on)
{
    if (last >= kMaxCommands || last <= first)
    {
        return;
    }
    const uint32_t wordFirst = first >> 5;
    const uint32_t wordLast = last >> 5;
    for (uint32_t w = wordFirst; w <= wordLast; ++w)
    {
        const uint32_t lo = (w == wordFirst) ? (first & 0x1F) : 0;
        const uint32_t hi = (w == wordLast) ? (last & 0x1F) : 31;
        const uint32_t span = hi - lo + 1;
        const uint32_t mask = (span == 32 ? 0xFFFFFFFFU : ((1U << span) - 1U)) << lo;
        if (on)
            words_[w] |= mask;
        else
            words_[w] &= ~mask;
    }
}

void CommandSet::enableRange(uint32_t first, uint32_t last)
{
    setRange(first, last, true);
}

void CommandSet::disableRange(uint32_t first, uint32_t last)
{
    setRange(first, last, false);
}

void CommandSet::enableSet(const CommandSet &other)
{
    for (std::size_t i = 0; i < kWords; ++i)
    {
        words_[i] |= other.words_[i];
    }
}

void CommandSet::disableSet(const CommandSet &other)
{
    for (std::size_t i = 0; i < kWords; ++i)
    {
        words_[i] &= ~other.words_[i];
    }
}

void CommandSet::enableAll()
{
    std::fill(words_.begin(), words_.end(), 0xFFFFFFFFU);
}

bool CommandSet::isEmpty() const
{
    return std::all_of(words_.begin(), words_.end(), [](uint32_t w) { return w == 0; });
}

void CommandSet::intersect(const CommandSet &other)
{
    for (std::size_t i = 0; i < kWords; ++i)
    {
        words_[i] &= other.words_[i];
    }
}

void CommandSet::unite(const CommandSet &other)
{
    enableSet(other);
}

CommandRegistry::CommandRegistry() : set_(CommandSet::withAllEnabled()) {}

void CommandRegistry::enable(uint32_t id)
{
    if (!set_.has(id))
    {
        set_.enable(id);
        changed_ = true;
    }
}

void CommandRegistry::disable(uint32_t id)
{
    if (id < CommandSet::kMaxCommands && set_.has(id))
    {
        set_.disable(id);
        changed_ = true;
    }
}

void CommandRegistry::init(std::initializer_list<CommandId> blacklist)
{
    init(std::vector<CommandId>(blacklist));
}

void CommandRegistry::init(const std::vector<CommandId> &blacklist)
{
    set_ = CommandSet::withAllEnabled();
    for (CommandId id : blacklist)
    {
        set_.disable(id);
    }
    changed_ = false;
}

} // namespace tvkit
