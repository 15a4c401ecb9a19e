//
// Exception.hpp
//

#ifndef SETRUSH_EXCEPTION_HPP
#define SETRUSH_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"

namespace setrush::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        Protocol, // table/claim protocol misuse, a synchronisation bug upstream
        State, // engine state misuse (not a player's rejected key press)
        Config, // malformed or inconsistent configuration
        Network, // transport failure
        Serialization, // FlatBuffers verification/build errors
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ProtocolError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct StateError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct NetworkError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct SerializationError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg,
                     std::source_location const& loc = std::source_location::current()) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c, loc);
        case Code::Protocol: throw ProtocolError(std::move(msg), c, loc);
        case Code::State: throw StateError(std::move(msg), c, loc);
        case Code::Config: throw ConfigError(std::move(msg), c, loc);
        case Code::Network: throw NetworkError(std::move(msg), c, loc);
        case Code::Serialization: throw SerializationError(std::move(msg), c, loc);
        case Code::Assertion: throw AssertionError(std::move(msg), c, loc);
        }
        throw std::runtime_error(msg);
    }

#define SR_THROW(code_enum, msg) ::setrush::core::error::fail((code_enum), (msg))
#define SR_ASSERT(cond, msg) do { if(!(cond)) ::setrush::core::error::fail(::setrush::core::error::Code::Assertion, (msg)); } while(0)

    // Ordinary reasons a key press is not applied. These are values, not exceptions.
    enum class RejectionCode : std::uint16_t
    {
        // Input gating
        Input_Frozen,
        Input_AwaitingResult,
        Input_Terminated,
        Input_QueueFull,
        Input_SlotOutOfRange,
        Input_UnknownPlayer,
        Input_NotStarted,

        // Token toggling
        Token_EmptySlot,
        Token_SetFull
    };

    struct InputRejection
    {
        RejectionCode code{};
        std::optional<PlyrIdxT> player{};
        std::optional<SlotIdxT> slot{};
        std::optional<std::uint8_t> tokens{};
        std::optional<std::chrono::milliseconds> frozen_for{};

        auto with_player(PlyrIdxT p) -> InputRejection&
        {
            player = p;
            return *this;
        }

        auto with_slot(SlotIdxT s) -> InputRejection&
        {
            slot = s;
            return *this;
        }

        auto with_tokens(std::uint8_t n) -> InputRejection&
        {
            tokens = n;
            return *this;
        }

        auto with_frozen_for(std::chrono::milliseconds ms) -> InputRejection&
        {
            frozen_for = ms;
            return *this;
        }
    };

    inline auto to_string(RejectionCode c) -> std::string_view
    {
        using E = RejectionCode;
        switch (c)
        {
        case E::Input_Frozen: return "Input: player is frozen";
        case E::Input_AwaitingResult: return "Input: claim awaiting dealer";
        case E::Input_Terminated: return "Input: player terminated";
        case E::Input_QueueFull: return "Input: key queue full";
        case E::Input_SlotOutOfRange: return "Input: slot out of range";
        case E::Input_UnknownPlayer: return "Input: unknown player";
        case E::Input_NotStarted: return "Input: game not started";

        case E::Token_EmptySlot: return "Token: slot holds no card";
        case E::Token_SetFull: return "Token: player already holds a full set";
        }
        return "Unknown";
    }

    inline auto describe(InputRejection const& r) -> std::string
    {
        auto s = std::format("{}", to_string(r.code));
        if (r.player) s += std::format(" | player=P{}", static_cast<int>(*r.player));
        if (r.slot) s += std::format(" | slot={}", static_cast<int>(*r.slot));
        if (r.tokens) s += std::format(" | tokens={}", *r.tokens);
        if (r.frozen_for) s += std::format(" | frozen_for={}ms", r.frozen_for->count());
        return s;
    }

    inline auto Reject(RejectionCode c) -> std::unexpected<InputRejection>
    {
        return std::unexpected(InputRejection{.code = c});
    }

    inline auto Reject(InputRejection r) -> std::unexpected<InputRejection>
    {
        return std::unexpected(std::move(r));
    }

    // result of toggling a token on the table
    using KeyResult = std::expected<TokenToggle, InputRejection>;
    // result of handing a key press to a player's input queue
    using KeyAccept = std::expected<void, InputRejection>;
}

#endif //SETRUSH_EXCEPTION_HPP
