//
// Display.hpp
//

#ifndef SETRUSH_DISPLAY_HPP
#define SETRUSH_DISPLAY_HPP

#include <chrono>
#include <span>
#include "Types.hpp"

namespace setrush::core
{
    // Render sink. Calls arrive from the dealer and player threads concurrently and are
    // fire-and-forget: implementations synchronise themselves and never call back into the core.
    class Display
    {
    public:
        virtual ~Display() = default;

        virtual auto ShowCard(CardIdT card, SlotIdxT slot) -> void = 0;
        virtual auto HideCard(SlotIdxT slot) -> void = 0;
        virtual auto ShowToken(PlyrIdxT player, SlotIdxT slot) -> void = 0;
        virtual auto HideToken(PlyrIdxT player, SlotIdxT slot) -> void = 0;
        virtual auto SetScore(PlyrIdxT player, int score) -> void = 0;
        virtual auto SetCountdown(std::chrono::milliseconds remaining, bool urgent) -> void = 0;
        virtual auto SetElapsed(std::chrono::milliseconds elapsed) -> void = 0;
        // remaining == 0 clears the freeze indicator
        virtual auto SetFreeze(PlyrIdxT player, std::chrono::milliseconds remaining) -> void = 0;
        virtual auto AnnounceWinners(std::span<PlyrIdxT const> players) -> void = 0;
    };
}
#endif //SETRUSH_DISPLAY_HPP
