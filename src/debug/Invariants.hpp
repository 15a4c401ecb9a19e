//
// Invariants.hpp
//

#ifndef SETRUSH_INVARIANTS_HPP
#define SETRUSH_INVARIANTS_HPP

#include "../core/Exception.hpp"
#include "../core/Table.hpp"
#include "Inspector.hpp"
#include <algorithm>
#include <format>
#include <vector>

namespace setrush::core::debug
{
    // A second layer of checks over the whole board. Throws AssertionError on the first
    // broken invariant so tests can run it from any thread at any time.
    inline auto CheckInvariants(Table const& t) -> void
    {
#if SR_ENABLE_TEST_HOOKS == false
        (void)t;
#else
    Inspector::SnapshotAll const s = Inspector::Gather(t);

    // 1) slot <-> card bijection
    for (size_t slot{}; slot < s.slot_to_card.size(); ++slot)
    {
        if (auto const card = s.slot_to_card[slot])
        {
            SR_ASSERT(*card >= 0 && static_cast<size_t>(*card) < s.card_to_slot.size(), "Card id outside deck");
            SR_ASSERT(s.card_to_slot[static_cast<size_t>(*card)] == slot,
                      std::format("slot {} holds card {} but the card maps elsewhere", slot, *card));
        }
    }
    for (size_t card{}; card < s.card_to_slot.size(); ++card)
    {
        if (auto const slot = s.card_to_slot[card])
        {
            SR_ASSERT(*slot < s.slot_to_card.size(), "Slot id outside table");
            SR_ASSERT(s.slot_to_card[*slot] == static_cast<CardIdT>(card),
                      std::format("card {} maps to slot {} which holds something else", card, *slot));
        }
    }

    // 2) tokens only on occupied slots, at most one per player per slot
    for (size_t slot{}; slot < s.slot_tokens.size(); ++slot)
    {
        std::vector<PlyrIdxT> const& occupants = s.slot_tokens[slot];
        SR_ASSERT(occupants.empty() || s.slot_to_card[slot].has_value(),
                  std::format("tokens on empty slot {}", slot));

        std::vector<PlyrIdxT> sorted = occupants;
        std::ranges::sort(sorted);
        SR_ASSERT(std::ranges::adjacent_find(sorted) == sorted.end(),
                  std::format("duplicate token on slot {}", slot));
    }

    // 3) token sets bounded, pointing at the card the slot still holds, mirrored per slot
    for (size_t p{}; p < s.player_tokens.size(); ++p)
    {
        TokenSet const& mine = s.player_tokens[p];
        SR_ASSERT(mine.Size() <= constants::SetSize, "Token set over capacity");
        for (Placement const& pl : mine.Items())
        {
            SR_ASSERT(pl.slot < s.slot_to_card.size(), "Token on a slot outside the table");
            SR_ASSERT(s.slot_to_card[pl.slot] == pl.card,
                      std::format("player {} token on slot {} refers to a card no longer there", p, pl.slot));
            auto const& occupants = s.slot_tokens[pl.slot];
            SR_ASSERT(std::ranges::find(occupants, static_cast<PlyrIdxT>(p)) != occupants.end(),
                      std::format("player {} token on slot {} missing from the slot list", p, pl.slot));
        }
    }

    // 4) and the other direction
    for (size_t slot{}; slot < s.slot_tokens.size(); ++slot)
    {
        for (PlyrIdxT const p : s.slot_tokens[slot])
        {
            SR_ASSERT(p < s.player_tokens.size(), "Token of an unknown player");
            SR_ASSERT(s.player_tokens[p].ContainsSlot(static_cast<SlotIdxT>(slot)),
                      std::format("slot {} lists player {} who holds no token there", slot, p));
        }
    }
#endif // SR_ENABLE_TEST_HOOKS == true
    }
}
#endif //SETRUSH_INVARIANTS_HPP
