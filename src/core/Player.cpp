//
// Player.cpp
//
#include "Player.hpp"

#include <algorithm>
#include <utility>
#include "RandomAi.hpp"
#include "Util.hpp"

namespace setrush::core
{
    Player::Player(Config const& config,
                   PlyrIdxT const id,
                   bool const human,
                   std::shared_ptr<Table> table,
                   std::shared_ptr<Display> display) :
        id_{id},
        human_{human},
        verbose_{config.verbose},
        tick_{config.tick},
        penalty_freeze_{config.penalty_freeze},
        table_{std::move(table)},
        display_{std::move(display)},
        input_{constants::InputQueueCapacity}
    {
        SR_ASSERT(table_ != nullptr, "Player requires a table");
        SR_ASSERT(display_ != nullptr, "Player requires a display sink");
        if (!human_)
        {
            ai_ = std::make_unique<RandomAI>(*this, table_, config.seed + static_cast<uint64_t>(id_ * 1337u), config);
        }
    }

    Player::~Player()
    {
        Terminate();
        Join();
    }

    auto Player::Start() -> void
    {
        SR_ASSERT(!thread_.joinable(), "Player thread started twice");
        thread_ = std::thread([this] { Run(); });
    }

    auto Player::Terminate() -> void
    {
        terminate_ = true;
        input_.Interrupt();
        wait_.Interrupt();
        if (ai_) ai_->Terminate();
        {
            std::lock_guard<std::mutex> lock(state_m_);
        }
        state_cv_.notify_all();
    }

    auto Player::Join() -> void
    {
        if (thread_.joinable()) thread_.join();
        // a player that was never started still owns an idle AI
        if (ai_) ai_->Join();
    }

    auto Player::Run() -> void
    {
        util::Trace(verbose_, "thread player-{} starting.", id_);
        try
        {
            if (ai_) ai_->Start();

            while (!terminate_)
            {
                Clock::time_point until = Clock::now() + tick_;
                if (FrozenFor().count() > 0)
                {
                    until = std::min(until, freeze_until_.load());
                }
                RefreshFreezeDisplay();

                std::optional<SlotIdxT> const key = input_.PopUntil(until);
                if (!key) continue;
                HandleKey(*key);
            }
        }
        catch (...)
        {
            {
                std::lock_guard<std::mutex> lock(state_m_);
                failure_ = std::current_exception();
            }
            util::Trace(verbose_, "thread player-{} failed.", id_);
            Terminate();
        }
        if (ai_) ai_->Join();
        util::Trace(verbose_, "thread player-{} terminated.", id_);
    }

    auto Player::RefreshFreezeDisplay() -> void
    {
        std::chrono::milliseconds const left = FrozenFor();
        if (left.count() > 0)
        {
            display_->SetFreeze(id_, left);
            freeze_shown_ = true;
        }
        else if (freeze_shown_)
        {
            display_->SetFreeze(id_, std::chrono::milliseconds{0});
            freeze_shown_ = false;
            SetGate(gate_.load());
        }
    }

    auto Player::HandleKey(SlotIdxT const slot) -> void
    {
        // presses queued before a penalty are stale
        if (FrozenFor().count() > 0) return;

        error::KeyResult const res = table_->ToggleToken(id_, slot);
        if (!res)
        {
            util::Trace(verbose_, "player-{} key ignored: {}", id_, error::describe(res.error()));
            return;
        }
        if (res->change == TokenChange::Placed && res->tokens_after == constants::SetSize)
        {
            ClaimOutcome const outcome = Claim();
            util::Trace(verbose_, "player-{} claim resolved ({})", id_, static_cast<int>(outcome));
        }
    }

    auto Player::Claim() -> ClaimOutcome
    {
        SetGate(Gate::Claiming);
        // presses queued behind the third token belong to the old selection; the drain also
        // wakes producers blocked on a full queue, which now see the closed gate and give up
        input_.Drain();
        wait_.Arm();
        if (!table_->EnqueueClaim(id_))
        {
            // the queue only refuses once the game is shutting down
            SR_ASSERT(!table_->HasPendingClaim(id_), "Player filed a second claim while one is pending");
            SetGate(Gate::Open);
            return ClaimOutcome::Interrupted;
        }
        ++claims_;
        SetGate(Gate::AwaitingResult);

        ClaimOutcome const outcome = wait_.Wait();
        SetGate(Gate::Open);
        return outcome;
    }

    auto Player::SetGate(Gate const g) -> void
    {
        {
            std::lock_guard<std::mutex> lock(state_m_);
            gate_ = g;
        }
        state_cv_.notify_all();
    }

    auto Player::Gated() const -> std::optional<error::InputRejection>
    {
        using error::RejectionCode;
        if (terminate_)
        {
            return error::InputRejection{.code = RejectionCode::Input_Terminated}.with_player(id_);
        }
        if (gate_ != Gate::Open)
        {
            return error::InputRejection{.code = RejectionCode::Input_AwaitingResult}.with_player(id_);
        }
        if (std::chrono::milliseconds const left = FrozenFor(); left.count() > 0)
        {
            return error::InputRejection{.code = RejectionCode::Input_Frozen}.with_player(id_).with_frozen_for(left);
        }
        return std::nullopt;
    }

    auto Player::Admits() const -> bool
    {
        return !terminate_ && gate_ == Gate::Open && FrozenFor().count() <= 0;
    }

    auto Player::KeyPressed(SlotIdxT const slot) -> error::KeyAccept
    {
        using error::RejectionCode;
        if (slot >= table_->SlotCount())
        {
            return error::Reject(error::InputRejection{.code = RejectionCode::Input_SlotOutOfRange}
                                     .with_player(id_).with_slot(slot));
        }
        if (auto const gated = Gated()) return error::Reject(*gated);
        if (!input_.TryPushIf(slot, [this] { return Admits(); }))
        {
            if (auto const gated = Gated()) return error::Reject(*gated);
            return error::Reject(error::InputRejection{.code = RejectionCode::Input_QueueFull}
                                     .with_player(id_).with_slot(slot));
        }
        return {};
    }

    auto Player::KeyPressedUntil(SlotIdxT const slot, Clock::time_point const deadline) -> error::KeyAccept
    {
        using error::RejectionCode;
        if (slot >= table_->SlotCount())
        {
            return error::Reject(error::InputRejection{.code = RejectionCode::Input_SlotOutOfRange}
                                     .with_player(id_).with_slot(slot));
        }
        if (auto const gated = Gated()) return error::Reject(*gated);
        if (!input_.PushUntilIf(slot, deadline, [this] { return Admits(); }))
        {
            if (auto const gated = Gated()) return error::Reject(*gated);
            return error::Reject(error::InputRejection{.code = RejectionCode::Input_QueueFull}
                                     .with_player(id_).with_slot(slot));
        }
        return {};
    }

    auto Player::WaitUntilAccepting(Clock::time_point const deadline) -> bool
    {
        std::unique_lock<std::mutex> lock(state_m_);
        while (!terminate_)
        {
            Clock::time_point const now = Clock::now();
            Clock::time_point const frozen_until = freeze_until_.load();
            bool const open = gate_ == Gate::Open;
            if (open && frozen_until <= now) return true;
            if (now >= deadline) return false;

            Clock::time_point const wake = open ? std::min(deadline, frozen_until) : deadline;
            state_cv_.wait_until(lock, wake);
        }
        return false;
    }

    auto Player::Point() -> void
    {
        int const score = ++score_;
        display_->SetScore(id_, score);
    }

    auto Player::Penalty() -> void
    {
        freeze_until_ = Clock::now() + penalty_freeze_;
        display_->SetFreeze(id_, penalty_freeze_);
    }

    auto Player::ResetTokens() -> void
    {
        table_->ResetPlayerTokens(id_);
    }

    auto Player::Release(ClaimOutcome const outcome) -> void
    {
        wait_.Release(outcome);
    }

    auto Player::FrozenFor() const -> std::chrono::milliseconds
    {
        return util::RemainingUntil(freeze_until_.load());
    }

    auto Player::AcceptingInput() const -> bool
    {
        return !Gated().has_value();
    }

    auto Player::Phase() const -> PlayerPhase
    {
        switch (gate_.load())
        {
        case Gate::Claiming: return PlayerPhase::Claiming;
        case Gate::AwaitingResult: return PlayerPhase::AwaitingResult;
        case Gate::Open: break;
        }
        if (FrozenFor().count() > 0) return PlayerPhase::Frozen;
        return table_->TokenCount(id_) == 0 ? PlayerPhase::Idle : PlayerPhase::Partial;
    }

    auto Player::Failure() const -> std::exception_ptr
    {
        std::lock_guard<std::mutex> lock(state_m_);
        return failure_;
    }
}
