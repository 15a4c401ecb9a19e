//
// WsDisplay.cpp
//

#include "net/WsDisplay.hpp"

#include <utility>

#include "net/codec.hpp"

namespace setrush::net
{
    namespace codec = setrush::core::net;

    WsDisplay::WsDisplay(core::TimerMode const mode,
                         std::vector<std::shared_ptr<SeatChannel>> chans,
                         std::shared_ptr<core::Display> local)
        : mode_{mode}
          , chans_{std::move(chans)}
          , local_{std::move(local)}
    {
    }

    auto WsDisplay::Broadcast(flatbuffers::DetachedBuffer const& buf) -> void
    {
        for (std::shared_ptr<SeatChannel> const& chan : chans_)
        {
            if (chan && chan->SendBinary(codec::AsBytes(buf)))
            {
                ++sent_;
            }
        }
    }

    auto WsDisplay::ShowCard(core::CardIdT const card, core::SlotIdxT const slot) -> void
    {
        Broadcast(codec::BuildCardShown(card, slot, NextId()));
        if (local_) local_->ShowCard(card, slot);
    }

    auto WsDisplay::HideCard(core::SlotIdxT const slot) -> void
    {
        Broadcast(codec::BuildCardHidden(slot, NextId()));
        if (local_) local_->HideCard(slot);
    }

    auto WsDisplay::ShowToken(core::PlyrIdxT const player, core::SlotIdxT const slot) -> void
    {
        Broadcast(codec::BuildToken(player, slot, true, NextId()));
        if (local_) local_->ShowToken(player, slot);
    }

    auto WsDisplay::HideToken(core::PlyrIdxT const player, core::SlotIdxT const slot) -> void
    {
        Broadcast(codec::BuildToken(player, slot, false, NextId()));
        if (local_) local_->HideToken(player, slot);
    }

    auto WsDisplay::SetScore(core::PlyrIdxT const player, int const score) -> void
    {
        Broadcast(codec::BuildScore(player, score, NextId()));
        if (local_) local_->SetScore(player, score);
    }

    auto WsDisplay::SetCountdown(std::chrono::milliseconds const remaining, bool const urgent) -> void
    {
        Broadcast(codec::BuildTimer(mode_, remaining, urgent, NextId()));
        if (local_) local_->SetCountdown(remaining, urgent);
    }

    auto WsDisplay::SetElapsed(std::chrono::milliseconds const elapsed) -> void
    {
        Broadcast(codec::BuildTimer(mode_, elapsed, false, NextId()));
        if (local_) local_->SetElapsed(elapsed);
    }

    auto WsDisplay::SetFreeze(core::PlyrIdxT const player, std::chrono::milliseconds const remaining) -> void
    {
        Broadcast(codec::BuildFreeze(player, remaining, NextId()));
        if (local_) local_->SetFreeze(player, remaining);
    }

    auto WsDisplay::AnnounceWinners(std::span<core::PlyrIdxT const> const players) -> void
    {
        Broadcast(codec::BuildWinners(players, NextId()));
        if (local_) local_->AnnounceWinners(players);
    }
}
