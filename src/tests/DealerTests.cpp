#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "TestSupport.hpp"
#include "../core/Dealer.hpp"
#include "../core/Game.hpp"
#include "../core/Util.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/RecordingDisplay.hpp"

using namespace setrush::core;
using namespace setrush::test;
using Kind = setrush::core::debug::RecordingDisplay::Kind;

TEST(Dealer, FillsTheBoardFromAShuffledDeck)
{
    auto rig = MakeDealerRig(FastConfig(2));
    EXPECT_EQ(rig->dealer->Deck().size(), 81u);

    EXPECT_EQ(rig->dealer->PlaceCardsOnTable(), 12u);
    EXPECT_EQ(rig->table->CountCards(), 12u);
    EXPECT_EQ(rig->dealer->Deck().size(), 69u);
    EXPECT_EQ(rig->display->Count(Kind::ShowCard), 12u);

    // nothing left to top up
    EXPECT_EQ(rig->dealer->PlaceCardsOnTable(), 0u);

    std::vector<CardIdT> all = rig->table->CardsOnTable();
    all.insert(all.end(), rig->dealer->Deck().begin(), rig->dealer->Deck().end());
    EXPECT_EQ(all.size(), 81u);
    EXPECT_FALSE(util::ContainsDuplicate(all, 81));
    debug::CheckInvariants(*rig->table);
}

// a valid set claimed by player 0
TEST(Dealer, ValidClaimScoresAndClearsTheCards)
{
    auto rig = MakeDealerRig(FastConfig(2), nullptr, true);
    CardTriple const set = rig->DealBoardWithSet();
    std::vector<SlotIdxT> const slots = rig->SlotsOf(set);

    // a token of the other player on one of the claimed cards goes with the card
    ASSERT_TRUE(rig->P(1).KeyPressed(slots[0]).has_value());
    ASSERT_TRUE(WaitUntil([&] { return rig->table->TokenCount(1) == 1; }));

    for (SlotIdxT const s : slots) ASSERT_TRUE(rig->P(0).KeyPressedUntil(s, Clock::now() + 1s).has_value());
    ASSERT_TRUE(WaitUntil([&] { return rig->table->HasPendingClaim(0); }));

    Clock::time_point const before = rig->dealer->Deadline();
    std::this_thread::sleep_for(5ms);
    std::vector<Resolution> const res = rig->dealer->DrainClaims();

    ASSERT_EQ(res.size(), 1u);
    EXPECT_EQ(res[0].player, 0);
    EXPECT_EQ(res[0].outcome, ClaimOutcome::Point);
    EXPECT_EQ(rig->P(0).Score(), 1);
    EXPECT_EQ(rig->display->Count(Kind::Score), 1u);
    for (SlotIdxT const s : slots) EXPECT_FALSE(rig->table->CardAt(s).has_value());
    EXPECT_EQ(rig->table->CountCards(), 9u);
    EXPECT_EQ(rig->table->TokenCount(0), 0u);
    EXPECT_EQ(rig->table->TokenCount(1), 0u);
    EXPECT_GT(rig->dealer->Deadline(), before);

    ASSERT_TRUE(rig->P(0).WaitUntilAccepting(Clock::now() + 1s));
    EXPECT_EQ(rig->P(0).FrozenFor().count(), 0);
    EXPECT_EQ(rig->P(0).Phase(), PlayerPhase::Idle);

    // the next top-up refills the emptied slots
    EXPECT_EQ(rig->dealer->PlaceCardsOnTable(), 3u);
    debug::CheckInvariants(*rig->table);
}

// an invalid set claimed by player 1
TEST(Dealer, InvalidClaimFreezesAndKeepsTheCards)
{
    Config cfg = FastConfig(2);
    cfg.penalty_freeze = 400ms;
    auto rig = MakeDealerRig(cfg, nullptr, true);
    rig->dealer->PlaceCardsOnTable();
    std::vector<CardTriple> const bad = rig->BoardNonSets(1);
    ASSERT_EQ(bad.size(), 1u);
    std::vector<SlotIdxT> const slots = rig->SlotsOf(bad[0]);

    for (SlotIdxT const s : slots) ASSERT_TRUE(rig->P(1).KeyPressedUntil(s, Clock::now() + 1s).has_value());
    ASSERT_TRUE(WaitUntil([&] { return rig->table->HasPendingClaim(1); }));

    std::vector<Resolution> const res = rig->dealer->DrainClaims();
    ASSERT_EQ(res.size(), 1u);
    EXPECT_EQ(res[0].outcome, ClaimOutcome::Penalty);
    EXPECT_EQ(res[0].cards, bad[0]);

    EXPECT_EQ(rig->P(1).Score(), 0);
    EXPECT_EQ(rig->table->CountCards(), 12u);
    for (size_t i{}; i < slots.size(); ++i) EXPECT_EQ(rig->table->CardAt(slots[i]), bad[0][i]);
    EXPECT_EQ(rig->table->TokenCount(1), 0u);

    ASSERT_TRUE(WaitUntil([&] { return rig->P(1).Phase() == PlayerPhase::Frozen; }));
    EXPECT_GT(rig->P(1).FrozenFor(), 200ms);
    error::KeyAccept const key = rig->P(1).KeyPressed(slots[0]);
    ASSERT_FALSE(key.has_value());
    EXPECT_EQ(key.error().code, error::RejectionCode::Input_Frozen);
    EXPECT_EQ(rig->display->Count(Kind::Score), 0u);

    // player 0 is not frozen
    EXPECT_TRUE(rig->P(0).AcceptingInput());
}

// deck and board hold no set at all
TEST(Dealer, GameWithoutAnySetEndsWithoutDealing)
{
    Config cfg = FastConfig(0, 2);
    auto display = std::make_shared<debug::RecordingDisplay>();
    Game game(cfg, display, std::make_unique<NoSetOracle>());

    game.Start();
    game.Wait();

    EXPECT_TRUE(game.Finished());
    EXPECT_EQ(display->Count(Kind::ShowCard), 0u);
    ASSERT_EQ(display->Count(Kind::Winners), 1u);
    std::vector<debug::RecordingDisplay::Event> const events = display->Events();
    EXPECT_EQ(events.back().kind, Kind::Winners);
    // everyone tied at zero
    EXPECT_EQ(events.back().winners, (std::vector<PlyrIdxT>{0, 1}));
    EXPECT_EQ(game.GetDealer().Rounds(), 0u);
}

TEST(Dealer, RoundEndsWithoutFurtherFillsOnceNoSetRemains)
{
    Config cfg = FastConfig(1);
    cfg.turn_timeout = std::chrono::milliseconds{0};
    auto sets_exist = std::make_shared<std::atomic<bool>>(true);
    auto display = std::make_shared<debug::RecordingDisplay>();
    Game game(cfg, display, std::make_unique<SwitchableOracle>(cfg, sets_exist));

    game.Start();
    ASSERT_TRUE(WaitUntil([&] { return display->Count(Kind::ShowCard) >= cfg.table_size; }));
    sets_exist->store(false);
    game.Wait();

    // every round dealt one full board and nothing after it
    size_t const shown = display->Count(Kind::ShowCard);
    EXPECT_EQ(shown % cfg.table_size, 0u);
    EXPECT_EQ(game.GetDealer().Rounds(), shown / cfg.table_size);
    EXPECT_EQ(display->Count(Kind::HideCard), shown);
    EXPECT_EQ(display->Count(Kind::Winners), 1u);
    EXPECT_GE(display->Count(Kind::Elapsed), 1u);
    EXPECT_EQ(display->Count(Kind::Countdown), 0u);
    EXPECT_EQ(game.GetTable().CountCards(), 0u);
    EXPECT_EQ(display->Events().back().kind, Kind::Winners);
}

// two claims enqueued back to back
TEST(Dealer, BackToBackClaimsResolveInEnqueueOrder)
{
    auto rig = MakeDealerRig(FastConfig(2));
    rig->dealer->PlaceCardsOnTable();
    std::vector<CardTriple> const bad = rig->BoardNonSets(2);
    ASSERT_EQ(bad.size(), 2u);

    rig->FileClaim(1, rig->SlotsOf(bad[0]));
    rig->FileClaim(0, rig->SlotsOf(bad[1]));
    EXPECT_FALSE(rig->table->EnqueueClaim(1));

    std::vector<Resolution> const res = rig->dealer->DrainClaims();
    ASSERT_EQ(res.size(), 2u);
    EXPECT_EQ(res[0].player, 1);
    EXPECT_EQ(res[1].player, 0);
    EXPECT_EQ(res[0].outcome, ClaimOutcome::Penalty);
    EXPECT_EQ(res[1].outcome, ClaimOutcome::Penalty);
    EXPECT_EQ(rig->table->PendingClaims(), 0u);
    EXPECT_TRUE(rig->dealer->DrainClaims().empty());
}

TEST(Dealer, FirstThirdTokenIsResolvedFirst)
{
    auto rig = MakeDealerRig(FastConfig(3), nullptr, true);
    rig->dealer->PlaceCardsOnTable();
    std::vector<CardTriple> const bad = rig->BoardNonSets(3);
    ASSERT_EQ(bad.size(), 3u);

    // players complete their selections strictly one after the other
    std::vector<PlyrIdxT> const order{2, 0, 1};
    for (size_t i{}; i < order.size(); ++i)
    {
        PlyrIdxT const p = order[i];
        for (SlotIdxT const s : rig->SlotsOf(bad[i]))
        {
            ASSERT_TRUE(rig->P(p).KeyPressedUntil(s, Clock::now() + 1s).has_value());
        }
        ASSERT_TRUE(WaitUntil([&] { return rig->table->HasPendingClaim(p); }));
    }

    std::vector<Resolution> const res = rig->dealer->DrainClaims();
    ASSERT_EQ(res.size(), 3u);
    for (size_t i{}; i < order.size(); ++i) EXPECT_EQ(res[i].player, order[i]);
}

TEST(Dealer, ResolutionsNeverOverlap)
{
    Config cfg = FastConfig(4);
    auto slow = std::make_unique<SlowOracle>(cfg, std::chrono::milliseconds{15});
    SlowOracle const& oracle = *slow;
    auto rig = MakeDealerRig(cfg, std::move(slow), true);
    rig->dealer->PlaceCardsOnTable();

    // every player presses its own three slots at the same time
    std::vector<std::thread> presses;
    for (PlyrIdxT p = 0; p < 4; ++p)
    {
        presses.emplace_back([&rig, p]
        {
            for (int k = 0; k < 3; ++k)
            {
                auto const slot = static_cast<SlotIdxT>(p * 3 + k);
                EXPECT_TRUE(rig->P(p).KeyPressedUntil(slot, Clock::now() + 1s).has_value());
            }
        });
    }
    for (std::thread& t : presses) t.join();
    ASSERT_TRUE(WaitUntil([&] { return rig->table->PendingClaims() == 4; }));

    // resolve on a dealer thread while a fifth party keeps poking the table
    std::vector<Resolution> res;
    std::thread dealer([&] { res = rig->dealer->DrainClaims(); });
    for (int i = 0; i < 50; ++i)
    {
        debug::CheckInvariants(*rig->table);
        std::this_thread::sleep_for(1ms);
    }
    dealer.join();

    ASSERT_EQ(res.size(), 4u);
    std::vector<PlyrIdxT> who;
    for (Resolution const& r : res) who.push_back(r.player);
    std::ranges::sort(who);
    EXPECT_EQ(who, (std::vector<PlyrIdxT>{0, 1, 2, 3}));

    EXPECT_EQ(oracle.MaxInFlight(), 1);
    std::vector<SlowOracle::Interval> const spans = oracle.Intervals();
    ASSERT_EQ(spans.size(), 4u);
    for (size_t i = 1; i < spans.size(); ++i) EXPECT_LE(spans[i - 1].end, spans[i].begin);
    debug::CheckInvariants(*rig->table);
}

TEST(Dealer, ClaimWhoseCardsMovedIsVoid)
{
    auto rig = MakeDealerRig(FastConfig(2));
    rig->dealer->PlaceCardsOnTable();
    std::vector<CardTriple> const bad = rig->BoardNonSets(1);
    ASSERT_EQ(bad.size(), 1u);
    std::vector<SlotIdxT> const slots = rig->SlotsOf(bad[0]);
    rig->FileClaim(0, slots);

    // another resolution took one of the cards first
    rig->table->RemoveCard(slots[1]);

    std::vector<Resolution> const res = rig->dealer->DrainClaims();
    ASSERT_EQ(res.size(), 1u);
    EXPECT_EQ(res[0].outcome, ClaimOutcome::Void);
    EXPECT_FALSE(res[0].cards.has_value());
    EXPECT_EQ(rig->table->TokenCount(0), 2u);
    EXPECT_EQ(rig->P(0).Score(), 0);
    EXPECT_EQ(rig->P(0).FrozenFor().count(), 0);
}

TEST(Dealer, ReshuffleReleasesQueuedPlayersAsStale)
{
    auto rig = MakeDealerRig(FastConfig(2), nullptr, true);
    rig->dealer->PlaceCardsOnTable();
    std::vector<CardTriple> const bad = rig->BoardNonSets(1);
    ASSERT_EQ(bad.size(), 1u);

    for (SlotIdxT const s : rig->SlotsOf(bad[0])) ASSERT_TRUE(rig->P(0).KeyPressedUntil(s, Clock::now() + 1s).has_value());
    ASSERT_TRUE(WaitUntil([&] { return rig->P(0).Phase() == PlayerPhase::AwaitingResult; }));
    ASSERT_TRUE(rig->P(1).KeyPressedUntil(0, Clock::now() + 1s).has_value());
    ASSERT_TRUE(WaitUntil([&] { return rig->table->TokenCount(1) == 1; }));

    EXPECT_EQ(rig->dealer->ReturnAllCards(), 12u);
    EXPECT_EQ(rig->dealer->Deck().size(), 81u);
    EXPECT_EQ(rig->table->PendingClaims(), 0u);
    EXPECT_EQ(rig->table->TokenCount(0), 0u);
    EXPECT_EQ(rig->table->TokenCount(1), 0u);

    ASSERT_TRUE(rig->P(0).WaitUntilAccepting(Clock::now() + 1s));
    EXPECT_EQ(rig->P(0).Score(), 0);
    EXPECT_EQ(rig->P(0).FrozenFor().count(), 0);
    EXPECT_EQ(rig->P(0).Phase(), PlayerPhase::Idle);
}

TEST(Dealer, ReshuffleCleanupIsIdempotent)
{
    auto rig = MakeDealerRig(FastConfig(2));

    // on an empty board
    EXPECT_EQ(rig->dealer->ReturnAllCards(), 0u);
    EXPECT_EQ(rig->dealer->Deck().size(), 81u);

    rig->dealer->PlaceCardsOnTable();
    rig->table->PlaceToken(1, rig->table->OccupiedSlots().front());
    EXPECT_EQ(rig->dealer->ReturnAllCards(), 12u);

    debug::Inspector::SnapshotAll const first = debug::Inspector::Gather(*rig->table);
    EXPECT_EQ(rig->dealer->ReturnAllCards(), 0u);
    debug::Inspector::SnapshotAll const second = debug::Inspector::Gather(*rig->table);

    EXPECT_EQ(first.slot_to_card, second.slot_to_card);
    EXPECT_EQ(first.slot_tokens, second.slot_tokens);
    for (auto const& c : second.slot_to_card) EXPECT_FALSE(c.has_value());
    for (TokenSet const& t : second.player_tokens) EXPECT_TRUE(t.Empty());
    EXPECT_EQ(second.pending_claims, 0u);
    EXPECT_EQ(rig->dealer->Deck().size(), 81u);
    EXPECT_FALSE(util::ContainsDuplicate(rig->dealer->Deck(), 81));
}

TEST(Dealer, TimerDisplayFollowsTheMode)
{
    Config cfg = FastConfig(1);
    cfg.turn_timeout = std::chrono::milliseconds{2000};
    cfg.turn_timeout_warning = std::chrono::milliseconds{500};
    {
        auto rig = MakeDealerRig(cfg);
        EXPECT_EQ(rig->dealer->Mode(), TimerMode::Countdown);
        rig->dealer->UpdateTimerDisplay(true);
        std::vector<debug::RecordingDisplay::Event> const ev = rig->display->Events();
        ASSERT_EQ(ev.size(), 1u);
        EXPECT_EQ(ev[0].kind, Kind::Countdown);
        EXPECT_FALSE(ev[0].urgent);
        EXPECT_GT(ev[0].millis, std::chrono::milliseconds{1500});
    }
    {
        cfg.turn_timeout_warning = std::chrono::milliseconds{5000};
        auto rig = MakeDealerRig(cfg);
        rig->dealer->UpdateTimerDisplay(false);
        EXPECT_TRUE(rig->display->Events().at(0).urgent);
    }
    {
        cfg.turn_timeout = std::chrono::milliseconds{0};
        auto rig = MakeDealerRig(cfg);
        EXPECT_EQ(rig->dealer->Mode(), TimerMode::Elapsed);
        EXPECT_EQ(rig->dealer->Deadline(), Clock::time_point::max());
        rig->dealer->UpdateTimerDisplay(false);
        EXPECT_EQ(rig->display->Count(Kind::Elapsed), 1u);
    }
    {
        cfg.turn_timeout = std::chrono::milliseconds{-1};
        auto rig = MakeDealerRig(cfg);
        EXPECT_EQ(rig->dealer->Mode(), TimerMode::NoTimer);
        rig->dealer->UpdateTimerDisplay(true);
        EXPECT_TRUE(rig->display->Events().empty());
    }
}

TEST(Dealer, WinnersIncludeTies)
{
    auto rig = MakeDealerRig(FastConfig(3));
    rig->P(0).Point();
    rig->P(2).Point();
    EXPECT_EQ(rig->dealer->Winners(), (std::vector<PlyrIdxT>{0, 2}));
    EXPECT_EQ(rig->dealer->Scores(), (std::vector<int>{1, 0, 1}));
    rig->P(2).Point();
    EXPECT_EQ(rig->dealer->Winners(), (std::vector<PlyrIdxT>{2}));
}

TEST(Dealer, CountdownExpiryReshuffles)
{
    Config cfg = FastConfig(0, 1);
    cfg.turn_timeout = std::chrono::milliseconds{60};
    cfg.ai_key_delay = std::chrono::milliseconds{1000};
    auto display = std::make_shared<debug::RecordingDisplay>();
    Game game(cfg, display);

    game.Start();
    EXPECT_TRUE(WaitUntil([&] { return game.GetDealer().Rounds() >= 2; }, 3s));
    game.Stop();
    game.Wait();

    EXPECT_GE(display->Count(Kind::Countdown), 2u);
    EXPECT_GE(display->Count(Kind::ShowCard), 2 * cfg.table_size);
    EXPECT_EQ(display->Count(Kind::Winners), 1u);
}

TEST(Dealer, StopWakesEveryActorPromptly)
{
    Config cfg = FastConfig(2, 3);
    cfg.tick = std::chrono::milliseconds{200};
    auto display = std::make_shared<debug::RecordingDisplay>();
    Game game(cfg, display);
    game.Start();
    ASSERT_TRUE(WaitUntil([&] { return display->Count(Kind::ShowCard) >= cfg.table_size; }));

    Clock::time_point const t0 = Clock::now();
    game.Stop();
    game.Wait();
    EXPECT_LT(Clock::now() - t0, 2s);
    EXPECT_TRUE(game.GetDealer().Terminated());
    for (PlyrIdxT p = 0; p < cfg.PlayerCount(); ++p) EXPECT_TRUE(game.GetDealer().PlayerAt(p).Terminated());

    error::KeyAccept const res = game.KeyPressed(0, 0);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, error::RejectionCode::Input_Terminated);
    EXPECT_EQ(game.KeyPressed(9, 0).error().code, error::RejectionCode::Input_UnknownPlayer);
}

TEST(Dealer, HintsListEverySetOnTheBoard)
{
    Config cfg = FastConfig(1);
    cfg.hints = true;
    auto rig = MakeDealerRig(cfg);

    // {0, 1, 2} is the only set among these four cards
    rig->table->PlaceCard(0, 3);
    rig->table->PlaceCard(1, 1);
    rig->table->PlaceCard(2, 0);
    rig->table->PlaceCard(4, 2);

    testing::internal::CaptureStdout();
    rig->dealer->PrintHints();
    std::string const out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(out, "[setrush] hint: slots [0, 1, 3] features [[0, 0, 0, 0], [0, 0, 0, 1], [0, 0, 0, 2]]\n");

    rig->table->RemoveCard(0);
    testing::internal::CaptureStdout();
    rig->dealer->PrintHints();
    EXPECT_TRUE(testing::internal::GetCapturedStdout().empty());
}
