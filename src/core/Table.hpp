//
// Table.hpp
//

#ifndef SETRUSH_TABLE_HPP
#define SETRUSH_TABLE_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string_view>
#include <vector>
#include "BlockingQueue.hpp"
#include "Display.hpp"
#include "Exception.hpp"
#include "TokenSet.hpp"
#include "Types.hpp"

namespace setrush::core::debug {struct Inspector;}
namespace setrush::core
{
    // Shared board: slot <-> card bijection, token occupancy and the claim hand-off queue.
    //
    // Locking: every access takes table_mtx_ first. Card mutations and board-wide operations
    // take it exclusively; token operations take it shared, then the slot mutex, then the
    // player mutex. Display calls are made inside the section that performed the mutation.
    class Table
    {
    public:
        Table() = delete;
        Table(Config const& config, std::shared_ptr<Display> display);

        Table(Table const&) = delete;
        auto operator=(Table const&) -> Table& = delete;

        // Dealer only. Throws ProtocolError if the slot is occupied or the card already placed.
        auto PlaceCard(CardIdT card, SlotIdxT slot) -> void;
        // Dealer only. Also drops every token on the slot. nullopt (no-op) on an empty slot.
        auto RemoveCard(SlotIdxT slot) -> std::optional<CardIdT>;
        // Removes every card and token, returns the removed cards in slot order.
        auto ClearBoard() -> std::vector<CardIdT>;

        // Throw ProtocolError on an empty slot; PlaceToken also on a duplicate or a full set.
        auto PlaceToken(PlyrIdxT player, SlotIdxT slot) -> void;
        auto RemoveToken(PlyrIdxT player, SlotIdxT slot) -> bool;
        // Race-free check-and-act used for key presses: removes the player's token on the slot
        // if present, otherwise places one. Ordinary refusals come back as unexpected.
        auto ToggleToken(PlyrIdxT player, SlotIdxT slot) -> error::KeyResult;
        // returns the players whose token was dropped
        auto ResetAllTokens(SlotIdxT slot) -> std::vector<PlyrIdxT>;
        auto ResetPlayerTokens(PlyrIdxT player) -> size_t;

        // Claim queue. EnqueueClaim is idempotent while the player is queued.
        auto EnqueueClaim(PlyrIdxT player) -> bool;
        auto TakeNextClaim(Clock::time_point deadline) -> std::optional<PlyrIdxT>;
        auto TryTakeClaim() -> std::optional<PlyrIdxT>;
        // true iff a claim is pending on return
        auto WaitForClaim(Clock::time_point deadline) -> bool;
        auto ClearClaims() -> std::vector<PlyrIdxT>;
        auto InterruptClaims() -> void;
        [[nodiscard]]
        auto PendingClaims() const -> size_t { return claims_.Size(); }
        [[nodiscard]]
        auto HasPendingClaim(PlyrIdxT player) const -> bool { return claims_.Contains(player); }

        auto CardAt(SlotIdxT slot) const -> std::optional<CardIdT>;
        auto SlotOf(CardIdT card) const -> std::optional<SlotIdxT>;
        auto CountCards() const -> size_t;
        auto CardsOnTable() const -> std::vector<CardIdT>;
        auto OccupiedSlots() const -> std::vector<SlotIdxT>;
        auto EmptySlots() const -> std::vector<SlotIdxT>;
        auto TokensOf(PlyrIdxT player) const -> TokenSet;
        auto TokenCount(PlyrIdxT player) const -> size_t;
        auto PlayersOn(SlotIdxT slot) const -> std::vector<PlyrIdxT>;

        auto SlotCount() const noexcept -> size_t { return table_size_; }
        auto DeckSize() const noexcept -> size_t { return deck_size_; }
        auto PlayerCount() const noexcept -> size_t { return n_players_; }

        friend struct debug::Inspector;

    private:
        auto CheckSlot(SlotIdxT slot, std::string_view op) const -> void;
        auto CheckPlayer(PlyrIdxT player, std::string_view op) const -> void;
        auto CheckCard(CardIdT card, std::string_view op) const -> void;
        auto Delay(size_t times = 1) const -> void;
        // caller holds table_mtx_ exclusively, or shared plus the slot mutex
        auto DropSlotTokens(SlotIdxT slot, bool take_player_locks) -> std::vector<PlyrIdxT>;

    private:
        size_t table_size_;
        size_t deck_size_;
        size_t n_players_;
        std::chrono::milliseconds delay_;
        std::shared_ptr<Display> display_;

        mutable std::shared_mutex table_mtx_;
        mutable std::vector<std::mutex> slot_mtx_;
        mutable std::vector<std::mutex> player_mtx_;

        std::vector<std::optional<CardIdT>> slot_to_card_;
        std::vector<std::optional<SlotIdxT>> card_to_slot_;
        std::vector<std::vector<PlyrIdxT>> slot_tokens_;   // [slot] occupants in placement order
        std::vector<TokenSet> player_tokens_;              // [player]

        BlockingQueue<PlyrIdxT> claims_;
    };
}
#endif //SETRUSH_TABLE_HPP
