//
// Inspector.hpp
//

#ifndef SETRUSH_INSPECTOR_HPP
#define SETRUSH_INSPECTOR_HPP

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "../core/Table.hpp"
#include "../core/TokenSet.hpp"
#include "../core/Types.hpp"

namespace setrush::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            std::vector<std::optional<CardIdT>> slot_to_card;
            std::vector<std::optional<SlotIdxT>> card_to_slot;
            std::vector<std::vector<PlyrIdxT>> slot_tokens;
            std::vector<TokenSet> player_tokens;
            size_t pending_claims{};
        };

        // Consistent copy of every table structure, taken under the exclusive table lock.
        static inline auto Gather(Table const& t) -> SnapshotAll
        {
            std::unique_lock<std::shared_mutex> lock(t.table_mtx_);
            SnapshotAll ret{};
            ret.slot_to_card = t.slot_to_card_;
            ret.card_to_slot = t.card_to_slot_;
            ret.slot_tokens = t.slot_tokens_;
            ret.player_tokens = t.player_tokens_;
            ret.pending_claims = t.claims_.Size();
            return ret;
        }
    };
}

#endif //SETRUSH_INSPECTOR_HPP
