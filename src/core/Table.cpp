//
// Table.cpp
//
#include "Table.hpp"

#include <algorithm>
#include <format>
#include <ranges>
#include <thread>
#include <utility>

namespace setrush::core
{
    Table::Table(Config const& config, std::shared_ptr<Display> display) :
        table_size_{config.table_size},
        deck_size_{config.deck_size},
        n_players_{config.PlayerCount()},
        delay_{config.table_delay},
        display_{std::move(display)},
        slot_mtx_(config.table_size),
        player_mtx_(config.PlayerCount()),
        slot_to_card_(config.table_size),
        card_to_slot_(config.deck_size),
        slot_tokens_(config.table_size),
        player_tokens_(config.PlayerCount())
    {
        SR_ASSERT(display_ != nullptr, "Table requires a display sink");
        SR_ASSERT(table_size_ > 0 && table_size_ <= constants::MaxSlots, "Table size out of range");
        SR_ASSERT(n_players_ <= constants::MaxPlayers, "Too many players for the table");
    }

    auto Table::CheckSlot(SlotIdxT const slot, std::string_view const op) const -> void
    {
        if (slot >= table_size_)
        {
            SR_THROW(error::Code::Protocol, std::format("{}: slot {} outside table of {}", op, slot, table_size_));
        }
    }

    auto Table::CheckPlayer(PlyrIdxT const player, std::string_view const op) const -> void
    {
        if (player >= n_players_)
        {
            SR_THROW(error::Code::Protocol, std::format("{}: unknown player {}", op, player));
        }
    }

    auto Table::CheckCard(CardIdT const card, std::string_view const op) const -> void
    {
        if (card < 0 || static_cast<size_t>(card) >= deck_size_)
        {
            SR_THROW(error::Code::Protocol, std::format("{}: card {} outside deck of {}", op, card, deck_size_));
        }
    }

    auto Table::Delay(size_t const times) const -> void
    {
        if (delay_.count() > 0 && times > 0)
        {
            std::this_thread::sleep_for(delay_ * static_cast<long>(times));
        }
    }

    auto Table::PlaceCard(CardIdT const card, SlotIdxT const slot) -> void
    {
        CheckSlot(slot, "PlaceCard");
        CheckCard(card, "PlaceCard");
        Delay();

        std::unique_lock<std::shared_mutex> lock(table_mtx_);
        if (slot_to_card_[slot])
        {
            SR_THROW(error::Code::Protocol,
                     std::format("PlaceCard: slot {} already holds card {}", slot, *slot_to_card_[slot]));
        }
        if (card_to_slot_[static_cast<size_t>(card)])
        {
            SR_THROW(error::Code::Protocol,
                     std::format("PlaceCard: card {} already on slot {}", card, *card_to_slot_[static_cast<size_t>(card)]));
        }
        slot_to_card_[slot] = card;
        card_to_slot_[static_cast<size_t>(card)] = slot;
        display_->ShowCard(card, slot);
    }

    auto Table::DropSlotTokens(SlotIdxT const slot, bool const take_player_locks) -> std::vector<PlyrIdxT>
    {
        std::vector<PlyrIdxT> dropped = std::move(slot_tokens_[slot]);
        slot_tokens_[slot].clear();
        for (PlyrIdxT const p : dropped)
        {
            if (take_player_locks)
            {
                std::lock_guard<std::mutex> plock(player_mtx_[p]);
                player_tokens_[p].RemoveSlot(slot);
            }
            else
            {
                player_tokens_[p].RemoveSlot(slot);
            }
            display_->HideToken(p, slot);
        }
        return dropped;
    }

    auto Table::RemoveCard(SlotIdxT const slot) -> std::optional<CardIdT>
    {
        CheckSlot(slot, "RemoveCard");
        Delay();

        std::unique_lock<std::shared_mutex> lock(table_mtx_);
        std::optional<CardIdT> const card = slot_to_card_[slot];
        if (!card) return std::nullopt;

        DropSlotTokens(slot, false);
        display_->HideCard(slot);
        card_to_slot_[static_cast<size_t>(*card)].reset();
        slot_to_card_[slot].reset();
        return card;
    }

    auto Table::ClearBoard() -> std::vector<CardIdT>
    {
        Delay(CountCards());

        std::unique_lock<std::shared_mutex> lock(table_mtx_);
        std::vector<CardIdT> removed;
        for (size_t s{}; s < table_size_; ++s)
        {
            auto const slot = static_cast<SlotIdxT>(s);
            DropSlotTokens(slot, false);
            if (std::optional<CardIdT> const card = slot_to_card_[s])
            {
                display_->HideCard(slot);
                card_to_slot_[static_cast<size_t>(*card)].reset();
                slot_to_card_[s].reset();
                removed.push_back(*card);
            }
        }
        for (TokenSet& ts : player_tokens_) ts.Clear();
        return removed;
    }

    auto Table::PlaceToken(PlyrIdxT const player, SlotIdxT const slot) -> void
    {
        CheckSlot(slot, "PlaceToken");
        CheckPlayer(player, "PlaceToken");

        std::shared_lock<std::shared_mutex> lock(table_mtx_);
        std::lock_guard<std::mutex> slock(slot_mtx_[slot]);
        std::lock_guard<std::mutex> plock(player_mtx_[player]);

        if (!slot_to_card_[slot])
        {
            SR_THROW(error::Code::Protocol, std::format("PlaceToken: slot {} holds no card", slot));
        }
        TokenSet& mine = player_tokens_[player];
        if (mine.ContainsSlot(slot))
        {
            SR_THROW(error::Code::Protocol,
                     std::format("PlaceToken: player {} already has a token on slot {}", player, slot));
        }
        if (mine.Full())
        {
            SR_THROW(error::Code::Protocol, std::format("PlaceToken: player {} already holds a full set", player));
        }
        mine.Add(Placement{*slot_to_card_[slot], slot});
        slot_tokens_[slot].push_back(player);
        display_->ShowToken(player, slot);
    }

    auto Table::RemoveToken(PlyrIdxT const player, SlotIdxT const slot) -> bool
    {
        CheckSlot(slot, "RemoveToken");
        CheckPlayer(player, "RemoveToken");

        std::shared_lock<std::shared_mutex> lock(table_mtx_);
        std::lock_guard<std::mutex> slock(slot_mtx_[slot]);
        std::lock_guard<std::mutex> plock(player_mtx_[player]);

        if (!slot_to_card_[slot])
        {
            SR_THROW(error::Code::Protocol, std::format("RemoveToken: slot {} holds no card", slot));
        }
        auto& occupants = slot_tokens_[slot];
        auto const it = std::ranges::find(occupants, player);
        if (it == occupants.end()) return false;

        occupants.erase(it);
        player_tokens_[player].RemoveSlot(slot);
        display_->HideToken(player, slot);
        return true;
    }

    auto Table::ToggleToken(PlyrIdxT const player, SlotIdxT const slot) -> error::KeyResult
    {
        using error::RejectionCode;
        if (slot >= table_size_)
        {
            return error::Reject(error::InputRejection{.code = RejectionCode::Input_SlotOutOfRange}
                                     .with_player(player).with_slot(slot));
        }
        if (player >= n_players_)
        {
            return error::Reject(error::InputRejection{.code = RejectionCode::Input_UnknownPlayer}
                                     .with_player(player));
        }

        std::shared_lock<std::shared_mutex> lock(table_mtx_);
        std::lock_guard<std::mutex> slock(slot_mtx_[slot]);
        std::lock_guard<std::mutex> plock(player_mtx_[player]);

        if (!slot_to_card_[slot])
        {
            return error::Reject(error::InputRejection{.code = RejectionCode::Token_EmptySlot}
                                     .with_player(player).with_slot(slot));
        }

        TokenSet& mine = player_tokens_[player];
        auto& occupants = slot_tokens_[slot];
        if (mine.ContainsSlot(slot))
        {
            mine.RemoveSlot(slot);
            std::erase(occupants, player);
            display_->HideToken(player, slot);
            return TokenToggle{TokenChange::Removed, static_cast<uint8_t>(mine.Size())};
        }
        if (mine.Full())
        {
            return error::Reject(error::InputRejection{.code = RejectionCode::Token_SetFull}
                                     .with_player(player).with_slot(slot)
                                     .with_tokens(static_cast<uint8_t>(mine.Size())));
        }
        mine.Add(Placement{*slot_to_card_[slot], slot});
        occupants.push_back(player);
        display_->ShowToken(player, slot);
        return TokenToggle{TokenChange::Placed, static_cast<uint8_t>(mine.Size())};
    }

    auto Table::ResetAllTokens(SlotIdxT const slot) -> std::vector<PlyrIdxT>
    {
        CheckSlot(slot, "ResetAllTokens");

        std::shared_lock<std::shared_mutex> lock(table_mtx_);
        std::lock_guard<std::mutex> slock(slot_mtx_[slot]);
        return DropSlotTokens(slot, true);
    }

    auto Table::ResetPlayerTokens(PlyrIdxT const player) -> size_t
    {
        CheckPlayer(player, "ResetPlayerTokens");

        std::unique_lock<std::shared_mutex> lock(table_mtx_);
        TokenSet& mine = player_tokens_[player];
        size_t const n = mine.Size();
        for (Placement const& p : mine.Items())
        {
            std::erase(slot_tokens_[p.slot], player);
            display_->HideToken(player, p.slot);
        }
        mine.Clear();
        return n;
    }

    auto Table::EnqueueClaim(PlyrIdxT const player) -> bool
    {
        CheckPlayer(player, "EnqueueClaim");
        return claims_.PushUnique(player);
    }

    auto Table::TakeNextClaim(Clock::time_point const deadline) -> std::optional<PlyrIdxT>
    {
        return claims_.PopUntil(deadline);
    }

    auto Table::TryTakeClaim() -> std::optional<PlyrIdxT>
    {
        return claims_.TryPop();
    }

    auto Table::WaitForClaim(Clock::time_point const deadline) -> bool
    {
        return claims_.WaitUntil(deadline);
    }

    auto Table::ClearClaims() -> std::vector<PlyrIdxT>
    {
        return claims_.Drain();
    }

    auto Table::InterruptClaims() -> void
    {
        claims_.Interrupt();
    }

    auto Table::CardAt(SlotIdxT const slot) const -> std::optional<CardIdT>
    {
        CheckSlot(slot, "CardAt");
        std::shared_lock<std::shared_mutex> lock(table_mtx_);
        return slot_to_card_[slot];
    }

    auto Table::SlotOf(CardIdT const card) const -> std::optional<SlotIdxT>
    {
        CheckCard(card, "SlotOf");
        std::shared_lock<std::shared_mutex> lock(table_mtx_);
        return card_to_slot_[static_cast<size_t>(card)];
    }

    auto Table::CountCards() const -> size_t
    {
        std::shared_lock<std::shared_mutex> lock(table_mtx_);
        return static_cast<size_t>(std::ranges::count_if(slot_to_card_,
                                                         [](auto const& c) { return c.has_value(); }));
    }

    auto Table::CardsOnTable() const -> std::vector<CardIdT>
    {
        std::shared_lock<std::shared_mutex> lock(table_mtx_);
        return std::ranges::to<std::vector<CardIdT>>(
            slot_to_card_
            | std::views::filter([](auto const& c) { return c.has_value(); })
            | std::views::transform([](auto const& c) { return *c; }));
    }

    auto Table::OccupiedSlots() const -> std::vector<SlotIdxT>
    {
        std::shared_lock<std::shared_mutex> lock(table_mtx_);
        std::vector<SlotIdxT> out;
        for (size_t s{}; s < table_size_; ++s)
        {
            if (slot_to_card_[s]) out.push_back(static_cast<SlotIdxT>(s));
        }
        return out;
    }

    auto Table::EmptySlots() const -> std::vector<SlotIdxT>
    {
        std::shared_lock<std::shared_mutex> lock(table_mtx_);
        std::vector<SlotIdxT> out;
        for (size_t s{}; s < table_size_; ++s)
        {
            if (!slot_to_card_[s]) out.push_back(static_cast<SlotIdxT>(s));
        }
        return out;
    }

    auto Table::TokensOf(PlyrIdxT const player) const -> TokenSet
    {
        CheckPlayer(player, "TokensOf");
        std::shared_lock<std::shared_mutex> lock(table_mtx_);
        std::lock_guard<std::mutex> plock(player_mtx_[player]);
        return player_tokens_[player];
    }

    auto Table::TokenCount(PlyrIdxT const player) const -> size_t
    {
        return TokensOf(player).Size();
    }

    auto Table::PlayersOn(SlotIdxT const slot) const -> std::vector<PlyrIdxT>
    {
        CheckSlot(slot, "PlayersOn");
        std::shared_lock<std::shared_mutex> lock(table_mtx_);
        std::lock_guard<std::mutex> slock(slot_mtx_[slot]);
        return slot_tokens_[slot];
    }
}
