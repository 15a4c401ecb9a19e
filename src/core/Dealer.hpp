//
// Dealer.hpp
//

#ifndef SETRUSH_DEALER_HPP
#define SETRUSH_DEALER_HPP

#include <atomic>
#include <memory>
#include <optional>
#include <random>
#include <vector>
#include "Display.hpp"
#include "Player.hpp"
#include "SetOracle.hpp"
#include "Table.hpp"
#include "Types.hpp"

namespace setrush::core::debug {class AuditLogger;}
namespace setrush::core
{
    struct Resolution
    {
        PlyrIdxT player{};
        ClaimOutcome outcome{};
        std::optional<CardTriple> cards{};
    };

    // Owns the deck and the players. Run() is the dealer thread: fill the board, resolve claims
    // one at a time in arrival order, reshuffle on timeout or when the board has no set, and stop
    // once no set is left anywhere.
    class Dealer
    {
    public:
        Dealer() = delete;
        Dealer(Config const& config,
               std::shared_ptr<Table> table,
               std::shared_ptr<Display> display,
               std::unique_ptr<SetOracle> oracle,
               std::vector<std::unique_ptr<Player>> players);
        ~Dealer();

        Dealer(Dealer const&) = delete;
        auto operator=(Dealer const&) -> Dealer& = delete;

        auto Run() -> void;
        // Safe from any thread. Wakes the dealer and every blocked player.
        auto Terminate() -> void;

        auto SetAuditLogger(std::shared_ptr<debug::AuditLogger> audit) -> void { audit_ = std::move(audit); }

        auto Terminated() const noexcept -> bool { return terminate_.load(); }
        auto Mode() const noexcept -> TimerMode { return mode_; }
        auto PlayerCount() const noexcept -> size_t { return players_.size(); }
        auto PlayerAt(PlyrIdxT const id) -> Player& { return *players_.at(id); }
        auto PlayerAt(PlyrIdxT const id) const -> Player const& { return *players_.at(id); }
        auto Scores() const -> std::vector<int>;
        // every player holding the highest score
        auto Winners() const -> std::vector<PlyrIdxT>;

        // Dealer-thread steps. Public so tests can drive a round without the loop.
        // Returns the number of cards dealt.
        auto PlaceCardsOnTable() -> size_t;
        // Resolves every queued claim in arrival order.
        auto DrainClaims() -> std::vector<Resolution>;
        // Reshuffle boundary: every card back into the deck, every queued player released as
        // Stale. Returns the number of cards returned. Idempotent.
        auto ReturnAllCards() -> size_t;
        auto ShouldFinish() const -> bool;
        auto NoSetOnBoard() const -> bool;
        auto ResetTimer() -> void;
        auto UpdateTimerDisplay(bool reset) -> void;
        // prints every set on the board with its sorted slots and card features
        auto PrintHints() const -> void;

        auto Deadline() const noexcept -> Clock::time_point { return deadline_; }
        auto Deck() const noexcept -> std::vector<CardIdT> const& { return deck_; }
        auto Rounds() const noexcept -> uint64_t { return rounds_.load(); }

    private:
        auto BuildDeck() -> void;
        auto RoundLoop() -> void;
        auto RoundOver() const -> bool;
        auto ResolveClaim(PlyrIdxT player) -> Resolution;
        auto TakeCard() -> CardIdT;
        auto AnnounceWinners() -> void;
        // rethrows the failure of any player thread
        auto CheckActors() const -> void;
        auto StopPlayers() -> void;

    private:
        Config cfg_;
        TimerMode mode_;
        std::shared_ptr<Table> table_;
        std::shared_ptr<Display> display_;
        std::unique_ptr<SetOracle> oracle_;
        std::vector<std::unique_ptr<Player>> players_;
        std::shared_ptr<debug::AuditLogger> audit_;
        std::mt19937_64 rng_;

        std::vector<CardIdT> deck_; // dealer thread only
        std::atomic<bool> terminate_{false};
        Clock::time_point deadline_{};
        Clock::time_point round_start_{};
        std::atomic<uint64_t> rounds_{0};
    };
}
#endif //SETRUSH_DEALER_HPP
