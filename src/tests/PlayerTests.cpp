#include <gtest/gtest.h>

#include <memory>
#include <thread>
#include <vector>

#include "TestSupport.hpp"
#include "../core/Player.hpp"
#include "../core/Table.hpp"
#include "../debug/Invariants.hpp"
#include "../debug/RecordingDisplay.hpp"

using namespace setrush::core;
using namespace setrush::test;
using Kind = setrush::core::debug::RecordingDisplay::Kind;

namespace
{
    // one table, human players whose threads run, no dealer
    struct PlayerRig
    {
        Config cfg;
        std::shared_ptr<debug::RecordingDisplay> display = std::make_shared<debug::RecordingDisplay>();
        std::shared_ptr<Table> table;
        std::vector<std::unique_ptr<Player>> players;

        explicit PlayerRig(Config const& c = FastConfig(2)) : cfg(c), table(std::make_shared<Table>(c, display))
        {
            for (SlotIdxT s = 0; s < cfg.table_size; ++s) table->PlaceCard(s, s);
            for (size_t i{}; i < cfg.PlayerCount(); ++i)
            {
                players.push_back(std::make_unique<Player>(cfg, static_cast<PlyrIdxT>(i), true, table, display));
                players.back()->Start();
            }
        }

        ~PlayerRig()
        {
            for (auto& p : players) p->Terminate();
            for (auto& p : players) p->Join();
        }

        auto Press(PlyrIdxT const id, std::initializer_list<SlotIdxT> slots) -> void
        {
            for (SlotIdxT const s : slots)
            {
                ASSERT_TRUE(players[id]->KeyPressedUntil(s, Clock::now() + 1s).has_value());
            }
        }
    };
}

TEST(Player, KeyPressesToggleTokens)
{
    PlayerRig rig;
    Player& p = *rig.players[0];
    EXPECT_EQ(p.Phase(), PlayerPhase::Idle);

    rig.Press(0, {4, 5});
    ASSERT_TRUE(WaitUntil([&] { return rig.table->TokenCount(0) == 2; }));
    EXPECT_EQ(p.Phase(), PlayerPhase::Partial);

    rig.Press(0, {4});
    ASSERT_TRUE(WaitUntil([&] { return rig.table->TokenCount(0) == 1; }));
    EXPECT_EQ(rig.table->PlayersOn(5), (std::vector<PlyrIdxT>{0}));
    EXPECT_EQ(rig.display->Count(Kind::ShowToken), 2u);
    EXPECT_EQ(rig.display->Count(Kind::HideToken), 1u);
    debug::CheckInvariants(*rig.table);
}

TEST(Player, OutOfRangeAndEmptySlots)
{
    PlayerRig rig;
    Player& p = *rig.players[1];

    error::KeyAccept const res = p.KeyPressed(200);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, error::RejectionCode::Input_SlotOutOfRange);

    // an empty slot is accepted as a key press but places nothing
    rig.table->RemoveCard(3);
    rig.Press(1, {3, 6});
    ASSERT_TRUE(WaitUntil([&] { return rig.table->TokenCount(1) == 1; }));
    EXPECT_EQ(rig.table->TokensOf(1).Items().front().slot, 6);
}

TEST(Player, ThirdTokenFilesOneClaimAndBlocksInput)
{
    PlayerRig rig;
    Player& p = *rig.players[0];

    rig.Press(0, {0, 1, 2});
    ASSERT_TRUE(WaitUntil([&] { return p.Phase() == PlayerPhase::AwaitingResult; }));
    EXPECT_TRUE(rig.table->HasPendingClaim(0));
    EXPECT_EQ(rig.table->PendingClaims(), 1u);
    EXPECT_EQ(p.Claims(), 1u);
    EXPECT_FALSE(p.AcceptingInput());

    error::KeyAccept const res = p.KeyPressed(5);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, error::RejectionCode::Input_AwaitingResult);
    EXPECT_FALSE(p.WaitUntilAccepting(Clock::now() + 20ms));

    // the other player is unaffected
    rig.Press(1, {0});
    ASSERT_TRUE(WaitUntil([&] { return rig.table->TokenCount(1) == 1; }));

    // a void claim keeps the tokens and reopens input
    ASSERT_EQ(rig.table->TryTakeClaim(), PlyrIdxT{0});
    p.Release(ClaimOutcome::Void);
    ASSERT_TRUE(p.WaitUntilAccepting(Clock::now() + 1s));
    EXPECT_EQ(rig.table->TokenCount(0), 3u);
    EXPECT_EQ(p.Phase(), PlayerPhase::Partial);
    EXPECT_EQ(p.Score(), 0);
}

TEST(Player, PointAddsToTheScoreWithoutFreezing)
{
    PlayerRig rig;
    Player& p = *rig.players[0];
    p.Point();
    p.Point();
    EXPECT_EQ(p.Score(), 2);
    EXPECT_EQ(p.FrozenFor().count(), 0);
    EXPECT_TRUE(p.AcceptingInput());

    std::vector<debug::RecordingDisplay::Event> const events = rig.display->Events();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().kind, Kind::Score);
    EXPECT_EQ(events.back().score, 2);
}

TEST(Player, PenaltyFreezesThenThaws)
{
    Config cfg = FastConfig(1);
    cfg.penalty_freeze = 150ms;
    PlayerRig rig(cfg);
    Player& p = *rig.players[0];

    p.Penalty();
    EXPECT_EQ(p.Phase(), PlayerPhase::Frozen);
    EXPECT_GT(p.FrozenFor().count(), 0);

    error::KeyAccept const res = p.KeyPressed(1);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, error::RejectionCode::Input_Frozen);
    ASSERT_TRUE(res.error().frozen_for.has_value());
    EXPECT_LE(*res.error().frozen_for, 150ms);

    Clock::time_point const t0 = Clock::now();
    ASSERT_TRUE(p.WaitUntilAccepting(t0 + 2s));
    EXPECT_GE(Clock::now() - t0, 100ms);
    EXPECT_EQ(p.Phase(), PlayerPhase::Idle);

    // the freeze indicator counted down and was cleared
    ASSERT_TRUE(WaitUntil([&]
    {
        std::vector<debug::RecordingDisplay::Event> const ev = rig.display->Events();
        return !ev.empty() && ev.back().kind == Kind::Freeze && ev.back().millis.count() == 0;
    }));
    EXPECT_GE(rig.display->Count(Kind::Freeze), 2u);
    EXPECT_EQ(p.Score(), 0);
}

TEST(Player, InputQueueIsBounded)
{
    Config cfg = FastConfig(1);
    cfg.penalty_freeze = 500ms;
    auto display = std::make_shared<debug::RecordingDisplay>();
    auto table = std::make_shared<Table>(cfg, display);
    // never started: nothing drains the queue
    Player p(cfg, 0, true, table, display);

    for (SlotIdxT s = 0; s < constants::InputQueueCapacity; ++s) EXPECT_TRUE(p.KeyPressed(s).has_value());
    error::KeyAccept const res = p.KeyPressed(5);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, error::RejectionCode::Input_QueueFull);
    EXPECT_FALSE(p.KeyPressedUntil(5, Clock::now() + 10ms).has_value());
}

TEST(Player, PressesBlockedBehindAClaimAreNeverQueued)
{
    Config cfg = FastConfig(1);
    auto display = std::make_shared<debug::RecordingDisplay>();
    auto table = std::make_shared<Table>(cfg, display);
    for (SlotIdxT s = 0; s < cfg.table_size; ++s) table->PlaceCard(s, s);
    Player p(cfg, 0, true, table, display);

    // the queue is full with a complete selection before the thread runs
    for (SlotIdxT s = 0; s < constants::SetSize; ++s) ASSERT_TRUE(p.KeyPressed(s).has_value());

    // producers blocked on the full queue while the claim is filed
    constexpr int producers = 4;
    std::vector<error::KeyAccept> results(producers);
    std::vector<std::thread> pushers;
    for (int i = 0; i < producers; ++i)
    {
        pushers.emplace_back([&, i]
        {
            results[i] = p.KeyPressedUntil(static_cast<SlotIdxT>(5 + i), Clock::now() + 2s);
        });
    }
    std::this_thread::sleep_for(30ms);
    p.Start();

    ASSERT_TRUE(WaitUntil([&] { return p.Phase() == PlayerPhase::AwaitingResult; }));
    for (std::thread& t : pushers) t.join();

    // at most one press per freed slot got in ahead of the claim, the rest were refused
    int refused = 0;
    for (error::KeyAccept const& r : results)
    {
        if (r) continue;
        EXPECT_EQ(r.error().code, error::RejectionCode::Input_AwaitingResult);
        ++refused;
    }
    EXPECT_GE(refused, producers - static_cast<int>(constants::SetSize));

    // a scoring release clears the selection; nothing stale may land afterwards
    p.Point();
    p.ResetTokens();
    p.Release(ClaimOutcome::Point);
    ASSERT_TRUE(p.WaitUntilAccepting(Clock::now() + 1s));
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(table->TokenCount(0), 0u);
    EXPECT_EQ(p.Phase(), PlayerPhase::Idle);
    EXPECT_EQ(p.Claims(), 1u);

    p.Terminate();
    p.Join();
}

TEST(Player, TerminateWakesABlockedClaim)
{
    PlayerRig rig;
    Player& p = *rig.players[0];
    rig.Press(0, {7, 8, 9});
    ASSERT_TRUE(WaitUntil([&] { return p.Phase() == PlayerPhase::AwaitingResult; }));

    Clock::time_point const t0 = Clock::now();
    p.Terminate();
    p.Join();
    EXPECT_LT(Clock::now() - t0, 1s);
    EXPECT_TRUE(p.Terminated());
    EXPECT_EQ(p.Failure(), nullptr);

    error::KeyAccept const res = p.KeyPressed(1);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, error::RejectionCode::Input_Terminated);
    EXPECT_FALSE(p.WaitUntilAccepting(Clock::now() + 1s));
}

TEST(Player, ComputerPlayerPressesOnItsOwn)
{
    Config cfg = FastConfig(0, 1);
    cfg.penalty_freeze = 5ms;
    auto display = std::make_shared<debug::RecordingDisplay>();
    auto table = std::make_shared<Table>(cfg, display);
    for (SlotIdxT s = 0; s < cfg.table_size; ++s) table->PlaceCard(s, s);

    Player p(cfg, 0, false, table, display);
    EXPECT_FALSE(p.Human());
    p.Start();

    // nobody resolves claims here, so the AI gets as far as filing one
    ASSERT_TRUE(WaitUntil([&] { return p.Phase() == PlayerPhase::AwaitingResult; }, 5s));
    EXPECT_EQ(p.Claims(), 1u);
    EXPECT_EQ(table->TokenCount(0), 3u);
    debug::CheckInvariants(*table);

    p.Terminate();
    p.Join();
}
