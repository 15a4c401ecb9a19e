//
// TestSupport.hpp
//

#ifndef SETRUSH_TESTSUPPORT_HPP
#define SETRUSH_TESTSUPPORT_HPP

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "../core/Dealer.hpp"
#include "../core/Exception.hpp"
#include "../core/FeatureOracle.hpp"
#include "../core/Player.hpp"
#include "../core/SetOracle.hpp"
#include "../core/Table.hpp"
#include "../core/Types.hpp"
#include "../debug/RecordingDisplay.hpp"

namespace setrush::test
{
    using namespace setrush::core;
    using namespace std::chrono_literals;

    // polls pred until it holds or the timeout runs out
    template <typename Pred>
    auto WaitUntil(Pred&& pred, std::chrono::milliseconds const timeout = 2s) -> bool
    {
        Clock::time_point const until = Clock::now() + timeout;
        while (!pred())
        {
            if (Clock::now() >= until) return false;
            std::this_thread::sleep_for(1ms);
        }
        return true;
    }

    // small, fast config: 12 slots over the classic 81 card deck, short waits
    inline auto FastConfig(uint32_t humans, uint32_t computers = 0) -> Config
    {
        Config cfg{};
        cfg.human_players = humans;
        cfg.computer_players = computers;
        cfg.table_size = 12;
        cfg.deck_size = 81;
        cfg.turn_timeout = 5s;
        cfg.turn_timeout_warning = 1s;
        cfg.penalty_freeze = 300ms;
        cfg.tick = 10ms;
        cfg.seed = 4242;
        return cfg;
    }

    // claims nothing is ever a set
    class NoSetOracle final : public SetOracle
    {
    public:
        auto FindSets(std::span<CardIdT const>, size_t) const -> std::vector<CardTriple> override { return {}; }
        auto IsValidSet(CardTriple const&) const -> bool override { return false; }
        auto CardToFeatures(CardIdT const card) const -> std::vector<int> override { return {card}; }
    };

    // Feature rules, but FindSets can be switched off from the test thread
    class SwitchableOracle final : public SetOracle
    {
    public:
        explicit SwitchableOracle(Config const& cfg, std::shared_ptr<std::atomic<bool>> sets_exist)
            : inner_{cfg}
              , sets_exist_{std::move(sets_exist)}
        {
        }

        auto FindSets(std::span<CardIdT const> cards, size_t limit) const -> std::vector<CardTriple> override
        {
            if (!sets_exist_->load()) return {};
            return inner_.FindSets(cards, limit);
        }

        auto IsValidSet(CardTriple const& cards) const -> bool override { return inner_.IsValidSet(cards); }
        auto CardToFeatures(CardIdT card) const -> std::vector<int> override { return inner_.CardToFeatures(card); }

    private:
        FeatureOracle inner_;
        std::shared_ptr<std::atomic<bool>> sets_exist_;
    };

    // Feature rules with a slow validation step that records every validation interval
    class SlowOracle final : public SetOracle
    {
    public:
        struct Interval
        {
            Clock::time_point begin;
            Clock::time_point end;
        };

        SlowOracle(Config const& cfg, std::chrono::milliseconds delay)
            : inner_{cfg}
              , delay_{delay}
        {
        }

        auto FindSets(std::span<CardIdT const> cards, size_t limit) const -> std::vector<CardTriple> override
        {
            return inner_.FindSets(cards, limit);
        }

        auto IsValidSet(CardTriple const& cards) const -> bool override
        {
            Clock::time_point const begin = Clock::now();
            int const now_in = ++in_flight_;
            int seen = max_in_flight_.load();
            while (now_in > seen && !max_in_flight_.compare_exchange_weak(seen, now_in)) {}

            std::this_thread::sleep_for(delay_);
            bool const ok = inner_.IsValidSet(cards);

            --in_flight_;
            std::lock_guard<std::mutex> lock(m_);
            intervals_.push_back(Interval{begin, Clock::now()});
            return ok;
        }

        auto CardToFeatures(CardIdT card) const -> std::vector<int> override { return inner_.CardToFeatures(card); }

        auto MaxInFlight() const -> int { return max_in_flight_.load(); }

        auto Intervals() const -> std::vector<Interval>
        {
            std::lock_guard<std::mutex> lock(m_);
            return intervals_;
        }

    private:
        FeatureOracle inner_;
        std::chrono::milliseconds delay_;
        mutable std::atomic<int> in_flight_{0};
        mutable std::atomic<int> max_in_flight_{0};
        mutable std::mutex m_;
        mutable std::vector<Interval> intervals_;
    };

    // Dealer plus human players, driven step by step from the test thread
    struct DealerRig
    {
        Config cfg;
        std::shared_ptr<debug::RecordingDisplay> display;
        std::shared_ptr<Table> table;
        SetOracle const* oracle{nullptr};
        std::unique_ptr<Dealer> dealer;

        auto P(PlyrIdxT const id) -> Player& { return dealer->PlayerAt(id); }

        // slots of the cards in `cards`, as currently on the board
        auto SlotsOf(CardTriple const& cards) const -> std::vector<SlotIdxT>
        {
            std::vector<SlotIdxT> slots;
            for (CardIdT const c : cards)
            {
                if (std::optional<SlotIdxT> const s = table->SlotOf(c)) slots.push_back(*s);
            }
            return slots;
        }

        // a valid set among the board cards
        auto BoardSet() const -> std::optional<CardTriple>
        {
            std::vector<CardTriple> const sets = oracle->FindSets(table->CardsOnTable(), 1);
            if (sets.empty()) return std::nullopt;
            return sets.front();
        }

        // reshuffles until the dealt board holds a set, as a timed-out round would
        auto DealBoardWithSet() -> CardTriple
        {
            dealer->PlaceCardsOnTable();
            for (int attempt = 0; attempt < 100; ++attempt)
            {
                if (std::optional<CardTriple> const set = BoardSet()) return *set;
                dealer->ReturnAllCards();
                dealer->PlaceCardsOnTable();
            }
            SR_THROW(error::Code::State, "no board with a set after 100 deals");
        }

        // `count` disjoint board triples that are not sets
        auto BoardNonSets(size_t const count) const -> std::vector<CardTriple>
        {
            std::vector<CardIdT> cards = table->CardsOnTable();
            std::vector<CardTriple> out;
            for (size_t i{}; i < cards.size() && out.size() < count; ++i)
            {
                for (size_t j{i + 1}; j < cards.size() && out.size() < count; ++j)
                {
                    for (size_t k{j + 1}; k < cards.size() && out.size() < count; ++k)
                    {
                        CardTriple const t{cards[i], cards[j], cards[k]};
                        if (oracle->IsValidSet(t)) continue;
                        bool const overlaps = std::ranges::any_of(out, [&t](CardTriple const& o)
                        {
                            return std::ranges::any_of(t, [&o](CardIdT c) { return std::ranges::find(o, c) != o.end(); });
                        });
                        if (!overlaps) out.push_back(t);
                    }
                }
            }
            return out;
        }

        // places the player's tokens directly and files the claim, as the player thread would
        auto FileClaim(PlyrIdxT const player, std::vector<SlotIdxT> const& slots) -> void
        {
            for (SlotIdxT const s : slots) table->PlaceToken(player, s);
            table->EnqueueClaim(player);
        }
    };

    // players are human (no AI); start_players runs their threads without starting the dealer loop
    inline auto MakeDealerRig(Config const& cfg, std::unique_ptr<SetOracle> oracle = nullptr,
                              bool const start_players = false) -> std::unique_ptr<DealerRig>
    {
        auto rig = std::make_unique<DealerRig>();
        rig->cfg = cfg;
        rig->display = std::make_shared<debug::RecordingDisplay>();
        rig->table = std::make_shared<Table>(cfg, rig->display);
        if (!oracle) oracle = std::make_unique<FeatureOracle>(cfg);
        rig->oracle = oracle.get();

        std::vector<std::unique_ptr<Player>> players;
        for (size_t i{}; i < cfg.PlayerCount(); ++i)
        {
            players.push_back(std::make_unique<Player>(cfg, static_cast<PlyrIdxT>(i), true, rig->table, rig->display));
            if (start_players) players.back()->Start();
        }
        rig->dealer = std::make_unique<Dealer>(cfg, rig->table, rig->display, std::move(oracle), std::move(players));
        return rig;
    }
}

#endif //SETRUSH_TESTSUPPORT_HPP
