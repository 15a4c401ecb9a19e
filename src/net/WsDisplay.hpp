//
// WsDisplay.hpp
//

#ifndef SETRUSH_WSDISPLAY_HPP
#define SETRUSH_WSDISPLAY_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <vector>

#include <flatbuffers/flatbuffers.h>

#include "../core/Display.hpp"
#include "SeatChannel.hpp"

namespace setrush::net
{
    // Turns every display call into a DisplayMsg frame and sends it to all connected seats,
    // forwarding to a local sink as well when one is given.
    class WsDisplay final : public core::Display
    {
    public:
        WsDisplay(core::TimerMode mode,
                  std::vector<std::shared_ptr<SeatChannel>> chans,
                  std::shared_ptr<core::Display> local = nullptr);

        auto ShowCard(core::CardIdT card, core::SlotIdxT slot) -> void override;
        auto HideCard(core::SlotIdxT slot) -> void override;
        auto ShowToken(core::PlyrIdxT player, core::SlotIdxT slot) -> void override;
        auto HideToken(core::PlyrIdxT player, core::SlotIdxT slot) -> void override;
        auto SetScore(core::PlyrIdxT player, int score) -> void override;
        auto SetCountdown(std::chrono::milliseconds remaining, bool urgent) -> void override;
        auto SetElapsed(std::chrono::milliseconds elapsed) -> void override;
        auto SetFreeze(core::PlyrIdxT player, std::chrono::milliseconds remaining) -> void override;
        auto AnnounceWinners(std::span<core::PlyrIdxT const> players) -> void override;

        [[nodiscard]]
        auto Sent() const noexcept -> std::uint64_t { return sent_.load(); }

    private:
        auto NextId() -> std::uint64_t { return msg_id_.fetch_add(1) + 1; }
        auto Broadcast(flatbuffers::DetachedBuffer const& buf) -> void;

        core::TimerMode mode_;
        std::vector<std::shared_ptr<SeatChannel>> chans_;
        std::shared_ptr<core::Display> local_;
        std::atomic<std::uint64_t> msg_id_{0};
        std::atomic<std::uint64_t> sent_{0};
    };
}

#endif //SETRUSH_WSDISPLAY_HPP
