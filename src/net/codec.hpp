
#ifndef SETRUSH_CODEC_HPP
#define SETRUSH_CODEC_HPP

#include <chrono>
#include <cstddef>   // std::byte
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <variant>
#include <vector>
#include <flatbuffers/flatbuffers.h>

#include "../core/Display.hpp"
#include "../core/Types.hpp"

#include "generated/flatbuffers/set_net_generated.h"

namespace setrush::core::net
{
    // Lightweight local parse error
    struct ParseError
    {
        std::string message;
    };

    struct DecodedKeyPress
    {
        std::uint64_t msg_id{};
        PlyrIdxT player{};
        SlotIdxT slot{};
    };

    struct SeatInfo
    {
        PlyrIdxT seat{};
        std::uint8_t n_players{};
        std::uint8_t table_size{};
        std::uint8_t feature_count{};
        std::uint8_t feature_size{};
    };

    // Value-side display events, one per Display call
    struct CardShownEv
    {
        CardIdT card{};
        SlotIdxT slot{};
    };

    struct CardHiddenEv
    {
        SlotIdxT slot{};
    };

    struct TokenEv
    {
        PlyrIdxT player{};
        SlotIdxT slot{};
        bool shown{};
    };

    struct ScoreEv
    {
        PlyrIdxT player{};
        int score{};
    };

    struct FreezeEv
    {
        PlyrIdxT player{};
        std::chrono::milliseconds remaining{};
    };

    struct TimerEv
    {
        TimerMode mode{};
        std::chrono::milliseconds millis{};
        bool urgent{};
    };

    struct WinnersEv
    {
        std::vector<PlyrIdxT> players;
    };

    using DisplayEvent = std::variant<CardShownEv, CardHiddenEv, TokenEv, ScoreEv, FreezeEv, TimerEv, WinnersEv>;

    struct DecodedDisplay
    {
        std::uint64_t msg_id{};
        DisplayEvent event{};
    };

    auto ToFbTimer(TimerMode m) noexcept -> setrush::gen::net::TimerKind;
    auto FromFbTimer(setrush::gen::net::TimerKind k) noexcept -> TimerMode;

    // --- Client -> server ---

    auto BuildKeyPress(PlyrIdxT player, SlotIdxT slot, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // --- Server -> client ---

    auto BuildSeatAssigned(SeatInfo const& info)
        -> flatbuffers::DetachedBuffer;

    auto BuildCardShown(CardIdT card, SlotIdxT slot, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildCardHidden(SlotIdxT slot, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildToken(PlyrIdxT player, SlotIdxT slot, bool shown, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildScore(PlyrIdxT player, int score, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildFreeze(PlyrIdxT player, std::chrono::milliseconds remaining, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildTimer(TimerMode mode, std::chrono::milliseconds millis, bool urgent, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    auto BuildWinners(std::span<PlyrIdxT const> players, std::uint64_t msg_id)
        -> flatbuffers::DetachedBuffer;

    // --- Inbound decode, verifier checked ---

    auto DecodeKeyPress(std::span<std::byte const> bytes)
        -> std::expected<DecodedKeyPress, ParseError>;

    auto DecodeSeatAssigned(std::span<std::byte const> bytes)
        -> std::expected<SeatInfo, ParseError>;

    auto DecodeDisplayEvent(std::span<std::byte const> bytes)
        -> std::expected<DecodedDisplay, ParseError>;

    // Replays a decoded event onto a local display sink (client side mirror)
    auto ApplyDisplayEvent(DisplayEvent const& ev, Display& sink) -> void;

    inline auto AsBytes(flatbuffers::DetachedBuffer const& buf) -> std::span<std::byte const>
    {
        return {reinterpret_cast<std::byte const*>(buf.data()), buf.size()};
    }
} // namespace setrush::core::net


#endif //SETRUSH_CODEC_HPP
