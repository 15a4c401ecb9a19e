//
// RandomAi.hpp
//

#ifndef SETRUSH_RANDOMAI_HPP
#define SETRUSH_RANDOMAI_HPP

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <random>
#include <thread>
#include "Types.hpp"

namespace setrush::core
{
    class Player;
    class Table;

    // Key-press synthesizer for a computer player. Runs on its own thread and only ever goes
    // through Player::KeyPressed, so freezes and pending claims gate it like real input.
    class RandomAI
    {
    public:
        RandomAI(Player& player, std::shared_ptr<Table const> table, uint64_t rng_seed, Config const& config);
        ~RandomAI();

        RandomAI(RandomAI const&) = delete;
        auto operator=(RandomAI const&) -> RandomAI& = delete;

        auto Start() -> void;
        auto Terminate() -> void;
        auto Join() -> void;

        [[nodiscard]]
        auto Presses() const noexcept -> uint64_t { return presses_.load(); }

    private:
        template <class Vec>
        auto pick(Vec const& v) -> size_t
        {
            return std::uniform_int_distribution<size_t>{0, v.size() - 1}(rng_);
        }

        auto Run() -> void;
        // interruptible sleep; false once terminated
        auto Pause(std::chrono::milliseconds d) -> bool;

    private:
        Player& player_;
        std::shared_ptr<Table const> table_;
        std::mt19937 rng_;
        std::chrono::milliseconds tick_;
        std::chrono::milliseconds key_delay_;
        bool verbose_;

        std::atomic<bool> terminate_{false};
        std::atomic<uint64_t> presses_{0};
        std::mutex m_;
        std::condition_variable cv_;
        std::thread thread_;
    };
}

#endif //SETRUSH_RANDOMAI_HPP
