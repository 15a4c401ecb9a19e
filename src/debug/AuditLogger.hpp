//
// AuditLogger.hpp
//

#ifndef SETRUSH_AUDITLOGGER_HPP
#define SETRUSH_AUDITLOGGER_HPP

#include <cstdint>
#include <fstream>
#include <mutex>
#include <span>
#include <string>
#include <string_view>

#include "../core/TokenSet.hpp"
#include "../core/Types.hpp"

namespace setrush::core::debug
{
    // Plain-text game transcript. Every entry point may be called from any thread.
    class AuditLogger
    {
    public:
        explicit AuditLogger(std::string path);
        ~AuditLogger();

        AuditLogger(AuditLogger const&) = delete;
        auto operator=(AuditLogger const&) -> AuditLogger& = delete;

        // Session header (seed, timer mode, sizes, player count)
        auto start(Config const& cfg) -> void;

        // A card dealt from the deck onto a slot
        auto fill(CardIdT card, SlotIdxT slot, size_t deck_left) -> void;

        // A claim filed by a player (logged by the dealer when it is taken off the queue)
        auto claim(PlyrIdxT player, TokenSet const& tokens) -> void;

        // Resolution bracket. begin returns the sequence number end must be called with.
        auto resolve_begin(PlyrIdxT player) -> std::uint64_t;
        auto resolve_end(std::uint64_t seq, PlyrIdxT player, ClaimOutcome outcome) -> void;

        // Reshuffle boundary: cards returned to the deck and players released as stale
        auto reshuffle(size_t returned, size_t deck_size, std::span<PlyrIdxT const> stale) -> void;

        // Game end footer
        auto winners(std::span<PlyrIdxT const> players, std::span<int const> scores) -> void;

        auto flush() -> void;

        [[nodiscard]]
        auto resolutions() const -> std::uint64_t;

    private:
        auto line(std::string const& s) -> void;

        mutable std::mutex m_;
        std::ofstream out_;
        std::uint64_t seq_{0};
        Clock::time_point t0_{Clock::now()};
    };

    auto to_string(ClaimOutcome o) -> std::string_view;
}

#endif //SETRUSH_AUDITLOGGER_HPP
