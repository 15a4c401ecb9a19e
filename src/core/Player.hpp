//
// Player.hpp
//

#ifndef SETRUSH_PLAYER_HPP
#define SETRUSH_PLAYER_HPP

#include <atomic>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>
#include "BlockingQueue.hpp"
#include "Display.hpp"
#include "Exception.hpp"
#include "Table.hpp"
#include "Types.hpp"
#include "WaitHandle.hpp"

namespace setrush::core
{
    class RandomAI;

    // One player actor. Key presses from any thread land in a small input queue; the player's
    // own thread turns them into token toggles on the table and, on the third token, files a
    // claim and blocks until the dealer releases it.
    class Player
    {
    public:
        Player(Config const& config,
               PlyrIdxT id,
               bool human,
               std::shared_ptr<Table> table,
               std::shared_ptr<Display> display);
        ~Player();

        Player(Player const&) = delete;
        auto operator=(Player const&) -> Player& = delete;

        auto Start() -> void;
        auto Terminate() -> void;
        auto Join() -> void;

        // Input entry point for humans, the network and RandomAI alike. Refused while frozen
        // or awaiting a claim result; refused presses are dropped, not queued.
        auto KeyPressed(SlotIdxT slot) -> error::KeyAccept;
        // same, but waits until the deadline for room in the input queue
        auto KeyPressedUntil(SlotIdxT slot, Clock::time_point deadline) -> error::KeyAccept;
        // blocks until input would be accepted; false on deadline or termination
        auto WaitUntilAccepting(Clock::time_point deadline) -> bool;

        // Dealer side. Called only while the player is awaiting a result or idle.
        auto Point() -> void;
        auto Penalty() -> void;
        auto ResetTokens() -> void;
        auto Release(ClaimOutcome outcome) -> void;

        auto Id() const noexcept -> PlyrIdxT { return id_; }
        auto Human() const noexcept -> bool { return human_; }
        auto Score() const noexcept -> int { return score_.load(); }
        auto Phase() const -> PlayerPhase;
        auto FrozenFor() const -> std::chrono::milliseconds;
        auto AcceptingInput() const -> bool;
        auto Terminated() const noexcept -> bool { return terminate_.load(); }
        // number of claims this player has filed
        auto Claims() const noexcept -> uint64_t { return claims_.load(); }
        // set when the player thread died on an exception; the dealer rethrows it
        auto Failure() const -> std::exception_ptr;

    private:
        enum class Gate : uint8_t
        {
            Open,
            Claiming,
            AwaitingResult
        };

        auto Run() -> void;
        auto HandleKey(SlotIdxT slot) -> void;
        auto Claim() -> ClaimOutcome;
        auto RefreshFreezeDisplay() -> void;
        auto SetGate(Gate g) -> void;
        auto Gated() const -> std::optional<error::InputRejection>;
        // checked again under the input queue lock, so nothing is queued once a claim closed the gate
        auto Admits() const -> bool;

    private:
        PlyrIdxT id_;
        bool human_;
        bool verbose_;
        std::chrono::milliseconds tick_;
        std::chrono::milliseconds penalty_freeze_;
        std::shared_ptr<Table> table_;
        std::shared_ptr<Display> display_;

        BlockingQueue<SlotIdxT> input_;
        WaitHandle wait_;

        std::atomic<bool> terminate_{false};
        std::atomic<Gate> gate_{Gate::Open};
        std::atomic<Clock::time_point> freeze_until_{Clock::time_point{}};
        std::atomic<int> score_{0};
        std::atomic<uint64_t> claims_{0};
        bool freeze_shown_{false}; // player thread only

        mutable std::mutex state_m_;
        std::condition_variable state_cv_;
        std::exception_ptr failure_;

        std::unique_ptr<RandomAI> ai_;
        std::thread thread_;
    };
}
#endif //SETRUSH_PLAYER_HPP
