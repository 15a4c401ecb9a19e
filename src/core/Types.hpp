//
// Types.hpp
//

#ifndef SETRUSH_TYPES_HPP
#define SETRUSH_TYPES_HPP

#define SR_ENABLE_TEST_HOOKS true

#include <algorithm>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <vector>

namespace setrush::core::constants
{
    inline constexpr size_t SetSize = 3;
    // slot and player ids travel as uint8_t on the wire
    inline constexpr size_t MaxSlots = 255;
    inline constexpr size_t MaxPlayers = 255;
    // pending key presses kept per player, one per token
    inline constexpr size_t InputQueueCapacity = SetSize;
}

namespace setrush::core
{
    using CardIdT = int32_t;
    using SlotIdxT = uint8_t;
    using PlyrIdxT = uint8_t;

    using Clock = std::chrono::steady_clock;

    using CardTriple = std::array<CardIdT, constants::SetSize>;

    struct Placement
    {
        CardIdT card{};
        SlotIdxT slot{};
    };

    inline auto operator==(Placement const& a, Placement const& b) -> bool
    {
        return a.card == b.card && a.slot == b.slot;
    }

    enum class TokenChange : uint8_t
    {
        Placed,
        Removed
    };

    struct TokenToggle
    {
        TokenChange change{};
        uint8_t tokens_after{};
    };

    enum class TimerMode : uint8_t
    {
        Countdown, // turn_timeout > 0, reshuffle when the deadline passes
        Elapsed,   // turn_timeout == 0, count up, reshuffle when the board has no set
        NoTimer    // turn_timeout < 0, no display, reshuffle when the board has no set
    };

    enum class PlayerPhase : uint8_t
    {
        Idle,
        Partial,
        Claiming,
        AwaitingResult,
        Frozen
    };

    enum class ClaimOutcome : uint8_t
    {
        Point,
        Penalty,
        Void,       // token set no longer held three cards at resolution time
        Stale,      // released at a reshuffle boundary before resolution
        Interrupted // game terminated while waiting
    };

    struct Config
    {
        uint32_t human_players{0};
        uint32_t computer_players{2};
        // seats inside the human block that a computer plays anyway (left empty by the lobby)
        std::vector<PlyrIdxT> computer_seats{};

        size_t table_size{12};
        size_t deck_size{81};
        uint8_t feature_count{4};
        uint8_t feature_size{3};

        // > 0 countdown, == 0 elapsed, < 0 no timer
        std::chrono::milliseconds turn_timeout{std::chrono::seconds(60)};
        std::chrono::milliseconds turn_timeout_warning{std::chrono::seconds(5)};
        std::chrono::milliseconds penalty_freeze{std::chrono::seconds(3)};
        std::chrono::milliseconds table_delay{0};
        std::chrono::milliseconds tick{std::chrono::seconds(1)};
        std::chrono::milliseconds ai_key_delay{0};

        bool hints{false};
        bool verbose{false};
        uint64_t seed{std::random_device{}()};

        [[nodiscard]]
        auto PlayerCount() const noexcept -> size_t { return human_players + computer_players; }
    };

    inline auto IsHumanSeat(Config const& cfg, size_t const seat) -> bool
    {
        return seat < cfg.human_players
            && std::ranges::find(cfg.computer_seats, static_cast<PlyrIdxT>(seat)) == cfg.computer_seats.end();
    }

    inline auto TimerModeFor(Config const& cfg) noexcept -> TimerMode
    {
        if (cfg.turn_timeout.count() > 0) return TimerMode::Countdown;
        if (cfg.turn_timeout.count() == 0) return TimerMode::Elapsed;
        return TimerMode::NoTimer;
    }
}

#endif //SETRUSH_TYPES_HPP
