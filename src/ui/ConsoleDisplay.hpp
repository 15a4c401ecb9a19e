//
// ConsoleDisplay.hpp
//

#ifndef SETRUSH_CONSOLEDISPLAY_HPP
#define SETRUSH_CONSOLEDISPLAY_HPP

#include <cstdio>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include "../core/Display.hpp"
#include "../core/SetOracle.hpp"
#include "../core/Types.hpp"

namespace setrush::ui
{
    // Line-oriented terminal rendering. Keeps its own copy of the board and prints it
    // whenever the timer ticks after a change; scores, freezes and winners print at once.
    class ConsoleDisplay final : public core::Display
    {
    public:
        ConsoleDisplay(core::Config const& cfg, std::shared_ptr<core::SetOracle const> oracle, std::FILE* out = stdout);

        auto ShowCard(core::CardIdT card, core::SlotIdxT slot) -> void override;
        auto HideCard(core::SlotIdxT slot) -> void override;
        auto ShowToken(core::PlyrIdxT player, core::SlotIdxT slot) -> void override;
        auto HideToken(core::PlyrIdxT player, core::SlotIdxT slot) -> void override;
        auto SetScore(core::PlyrIdxT player, int score) -> void override;
        auto SetCountdown(std::chrono::milliseconds remaining, bool urgent) -> void override;
        auto SetElapsed(std::chrono::milliseconds elapsed) -> void override;
        auto SetFreeze(core::PlyrIdxT player, std::chrono::milliseconds remaining) -> void override;
        auto AnnounceWinners(std::span<core::PlyrIdxT const> players) -> void override;

    private:
        auto RenderBoard(std::string const& timer) -> void;
        auto CardLabel(core::CardIdT card) const -> std::string;

        std::shared_ptr<core::SetOracle const> oracle_;
        std::FILE* out_;
        std::mutex m_;
        std::vector<std::optional<core::CardIdT>> cards_;
        std::vector<std::vector<core::PlyrIdxT>> tokens_;
        std::vector<int> scores_;
        std::vector<bool> frozen_;
        bool dirty_{true};
    };
}

#endif //SETRUSH_CONSOLEDISPLAY_HPP
