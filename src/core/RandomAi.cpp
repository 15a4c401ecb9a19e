//
// RandomAi.cpp
//

#include "RandomAi.hpp"

#include <utility>
#include "Player.hpp"
#include "Table.hpp"
#include "Util.hpp"

namespace setrush::core
{
    RandomAI::RandomAI(Player& player, std::shared_ptr<Table const> table, uint64_t const rng_seed,
                       Config const& config):
        player_{player},
        table_{std::move(table)},
        rng_(static_cast<std::mt19937::result_type>(rng_seed)),
        tick_{config.tick},
        key_delay_{config.ai_key_delay},
        verbose_{config.verbose}
    {
    }

    RandomAI::~RandomAI()
    {
        Terminate();
        Join();
    }

    auto RandomAI::Start() -> void
    {
        SR_ASSERT(!thread_.joinable(), "RandomAI thread started twice");
        thread_ = std::thread([this] { Run(); });
    }

    auto RandomAI::Terminate() -> void
    {
        {
            std::lock_guard<std::mutex> lock(m_);
            terminate_ = true;
        }
        cv_.notify_all();
    }

    auto RandomAI::Join() -> void
    {
        if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) thread_.join();
    }

    auto RandomAI::Pause(std::chrono::milliseconds const d) -> bool
    {
        std::unique_lock<std::mutex> lock(m_);
        cv_.wait_for(lock, d, [this] { return terminate_.load(); });
        return !terminate_;
    }

    auto RandomAI::Run() -> void
    {
        util::Trace(verbose_, "thread computer-{} starting.", player_.Id());
        while (!terminate_)
        {
            // blocks while frozen or awaiting a result instead of spinning on rejections
            if (!player_.WaitUntilAccepting(Clock::now() + tick_)) continue;

            std::vector<SlotIdxT> const occupied = table_->OccupiedSlots();
            if (occupied.empty())
            {
                Pause(tick_);
                continue;
            }

            SlotIdxT const slot = occupied[pick(occupied)];
            if (error::KeyAccept const res = player_.KeyPressedUntil(slot, Clock::now() + tick_); res)
            {
                ++presses_;
            }
            else
            {
                util::Trace(verbose_, "computer-{} press dropped: {}", player_.Id(), error::describe(res.error()));
            }

            if (key_delay_.count() > 0) Pause(key_delay_);
        }
        util::Trace(verbose_, "thread computer-{} terminated.", player_.Id());
    }
}
