//
// Dealer.cpp
//
#include "Dealer.hpp"

#include <algorithm>
#include <format>
#include <limits>
#include <numeric>
#include <print>
#include <ranges>
#include <utility>

#include "Util.hpp"
#include "../debug/AuditLogger.hpp"

namespace setrush::core
{
    Dealer::Dealer(Config const& config,
                   std::shared_ptr<Table> table,
                   std::shared_ptr<Display> display,
                   std::unique_ptr<SetOracle> oracle,
                   std::vector<std::unique_ptr<Player>> players) :
        cfg_(config),
        mode_(TimerModeFor(config)),
        table_(std::move(table)),
        display_(std::move(display)),
        oracle_(std::move(oracle)),
        players_(std::move(players)),
        rng_{cfg_.seed}
    {
        SR_ASSERT(table_ != nullptr, "Dealer requires a table");
        SR_ASSERT(display_ != nullptr, "Dealer requires a display sink");
        SR_ASSERT(oracle_ != nullptr, "Dealer requires a set oracle");
        SR_ASSERT(!std::ranges::any_of(players_,
                                       [](std::unique_ptr<Player> const& p) { return !p; }), "Invalid player in dealer");
        for (size_t i{}; i < players_.size(); ++i)
        {
            SR_ASSERT(players_[i]->Id() == i, "Player ids must match their seat");
        }
        BuildDeck();
        ResetTimer();
    }

    Dealer::~Dealer()
    {
        Terminate();
        StopPlayers();
    }

    auto Dealer::BuildDeck() -> void
    {
        deck_.resize(cfg_.deck_size);
        std::iota(deck_.begin(), deck_.end(), CardIdT{0});
    }

    auto Dealer::Run() -> void
    {
        util::Trace(cfg_.verbose, "thread dealer starting.");
        if (audit_) audit_->start(cfg_);

        for (std::unique_ptr<Player> const& p : players_) p->Start();

        try
        {
            while (!ShouldFinish())
            {
                PlaceCardsOnTable();
                ResetTimer();
                if (cfg_.hints) PrintHints();
                RoundLoop();
                UpdateTimerDisplay(true);
                ReturnAllCards();
                ++rounds_;
            }
            AnnounceWinners();
        }
        catch (...)
        {
            util::Trace(cfg_.verbose, "thread dealer failed, stopping players.");
            Terminate();
            StopPlayers();
            throw;
        }
        Terminate();
        StopPlayers();
        if (audit_) audit_->flush();
        util::Trace(cfg_.verbose, "thread dealer terminated.");
    }

    auto Dealer::RoundLoop() -> void
    {
        while (!terminate_)
        {
            Clock::time_point wake = Clock::now() + cfg_.tick;
            if (mode_ == TimerMode::Countdown) wake = std::min(wake, deadline_);

            table_->WaitForClaim(wake);
            UpdateTimerDisplay(false);
            DrainClaims();
            PlaceCardsOnTable();
            CheckActors();
            if (RoundOver()) break;
        }
    }

    auto Dealer::RoundOver() const -> bool
    {
        if (terminate_) return true;
        if (mode_ == TimerMode::Countdown && Clock::now() >= deadline_) return true;
        if (mode_ != TimerMode::Countdown && NoSetOnBoard()) return true;
        return ShouldFinish();
    }

    auto Dealer::Terminate() -> void
    {
        terminate_ = true;
        table_->InterruptClaims();
        for (std::unique_ptr<Player> const& p : players_) p->Terminate();
    }

    auto Dealer::StopPlayers() -> void
    {
        for (std::unique_ptr<Player> const& p : players_) p->Terminate();
        // reverse creation order
        for (auto& p : std::views::reverse(players_)) p->Join();
    }

    auto Dealer::CheckActors() const -> void
    {
        for (std::unique_ptr<Player> const& p : players_)
        {
            if (std::exception_ptr const failure = p->Failure()) std::rethrow_exception(failure);
        }
    }

    auto Dealer::ShouldFinish() const -> bool
    {
        if (terminate_) return true;
        std::vector<CardIdT> all = table_->CardsOnTable();
        all.insert(all.end(), deck_.begin(), deck_.end());
        return oracle_->FindSets(all, 1).empty();
    }

    auto Dealer::NoSetOnBoard() const -> bool
    {
        return oracle_->FindSets(table_->CardsOnTable(), 1).empty();
    }

    auto Dealer::TakeCard() -> CardIdT
    {
        SR_ASSERT(!deck_.empty(), "Took a card from an empty deck");
        CardIdT const c = deck_.back();
        deck_.pop_back();
        return c;
    }

    auto Dealer::PlaceCardsOnTable() -> size_t
    {
        // a fresh board gets a freshly shuffled deck
        if (table_->CountCards() == 0) std::ranges::shuffle(deck_, rng_);

        size_t dealt{};
        for (SlotIdxT const slot : table_->EmptySlots())
        {
            if (deck_.empty() || terminate_) break;
            CardIdT const card = TakeCard();
            table_->PlaceCard(card, slot);
            if (audit_) audit_->fill(card, slot, deck_.size());
            ++dealt;
        }
        return dealt;
    }

    auto Dealer::DrainClaims() -> std::vector<Resolution>
    {
        std::vector<Resolution> resolved;
        while (!terminate_)
        {
            std::optional<PlyrIdxT> const player = table_->TryTakeClaim();
            if (!player) break;
            resolved.push_back(ResolveClaim(*player));
        }
        return resolved;
    }

    auto Dealer::ResolveClaim(PlyrIdxT const player) -> Resolution
    {
        SR_ASSERT(player < players_.size(), std::format("Claim from unknown player {}", player));
        Player& claimant = *players_[player];

        TokenSet const tokens = table_->TokensOf(player);
        if (audit_) audit_->claim(player, tokens);
        std::uint64_t const seq = audit_ ? audit_->resolve_begin(player) : 0;

        Resolution res{.player = player};
        res.cards = tokens.Cards();
        if (!res.cards)
        {
            // the selection changed under a reshuffle since the claim was filed
            res.outcome = ClaimOutcome::Void;
        }
        else if (oracle_->IsValidSet(*res.cards))
        {
            for (Placement const& p : tokens.Items())
            {
                std::optional<CardIdT> const removed = table_->RemoveCard(p.slot);
                SR_ASSERT(removed == p.card, std::format("Slot {} no longer holds claimed card {}", p.slot, p.card));
            }
            UpdateTimerDisplay(true);
            claimant.Point();
            claimant.ResetTokens();
            res.outcome = ClaimOutcome::Point;
        }
        else
        {
            claimant.Penalty();
            claimant.ResetTokens();
            res.outcome = ClaimOutcome::Penalty;
        }

        if (audit_) audit_->resolve_end(seq, player, res.outcome);
        claimant.Release(res.outcome);
        return res;
    }

    auto Dealer::ReturnAllCards() -> size_t
    {
        std::vector<CardIdT> const returned = table_->ClearBoard();
        deck_.insert(deck_.end(), returned.begin(), returned.end());

        std::vector<PlyrIdxT> const stale = table_->ClearClaims();
        for (PlyrIdxT const p : stale)
        {
            players_.at(p)->Release(ClaimOutcome::Stale);
        }
        if (audit_ && (!returned.empty() || !stale.empty()))
        {
            audit_->reshuffle(returned.size(), deck_.size(), stale);
        }
        return returned.size();
    }

    auto Dealer::ResetTimer() -> void
    {
        round_start_ = Clock::now();
        deadline_ = mode_ == TimerMode::Countdown ? round_start_ + cfg_.turn_timeout : Clock::time_point::max();
    }

    auto Dealer::UpdateTimerDisplay(bool const reset) -> void
    {
        if (reset) ResetTimer();
        switch (mode_)
        {
        case TimerMode::Countdown:
            {
                std::chrono::milliseconds const remaining = util::RemainingUntil(deadline_);
                display_->SetCountdown(remaining, remaining <= cfg_.turn_timeout_warning);
                break;
            }
        case TimerMode::Elapsed:
            display_->SetElapsed(std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - round_start_));
            break;
        case TimerMode::NoTimer:
            break;
        }
    }

    auto Dealer::Scores() const -> std::vector<int>
    {
        return std::ranges::to<std::vector<int>>(
            players_ | std::views::transform([](std::unique_ptr<Player> const& p) { return p->Score(); }));
    }

    auto Dealer::Winners() const -> std::vector<PlyrIdxT>
    {
        std::vector<PlyrIdxT> winners;
        int best = std::numeric_limits<int>::min();
        for (std::unique_ptr<Player> const& p : players_)
        {
            int const score = p->Score();
            if (score > best)
            {
                winners.clear();
                best = score;
            }
            if (score == best) winners.push_back(p->Id());
        }
        return winners;
    }

    auto Dealer::AnnounceWinners() -> void
    {
        std::vector<PlyrIdxT> const winners = Winners();
        display_->AnnounceWinners(winners);
        if (audit_)
        {
            std::vector<int> const scores = Scores();
            audit_->winners(winners, scores);
        }
    }

    auto Dealer::PrintHints() const -> void
    {
        std::vector<CardIdT> const cards = table_->CardsOnTable();
        for (CardTriple const& set : oracle_->FindSets(cards, std::numeric_limits<size_t>::max()))
        {
            std::vector<int> slots;
            std::vector<std::vector<int>> features;
            for (CardIdT const c : set)
            {
                if (std::optional<SlotIdxT> const s = table_->SlotOf(c)) slots.push_back(*s);
                features.push_back(oracle_->CardToFeatures(c));
            }
            std::ranges::sort(slots);
            std::print("[setrush] hint: slots {} features {}\n", slots, features);
        }
    }
}
