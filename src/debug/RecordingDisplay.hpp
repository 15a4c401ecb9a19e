//
// RecordingDisplay.hpp
//

#ifndef SETRUSH_RECORDINGDISPLAY_HPP
#define SETRUSH_RECORDINGDISPLAY_HPP

#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <span>
#include <utility>
#include <vector>

#include "../core/Display.hpp"

namespace setrush::core::debug
{
    // Display sink that keeps every call in order, optionally forwarding to another sink.
    class RecordingDisplay final : public Display
    {
    public:
        enum class Kind : uint8_t
        {
            ShowCard,
            HideCard,
            ShowToken,
            HideToken,
            Score,
            Countdown,
            Elapsed,
            Freeze,
            Winners
        };

        struct Event
        {
            Kind kind{};
            Clock::time_point at{};
            CardIdT card{-1};
            SlotIdxT slot{};
            PlyrIdxT player{};
            int score{};
            std::chrono::milliseconds millis{};
            bool urgent{false};
            std::vector<PlyrIdxT> winners{};
        };

        explicit RecordingDisplay(std::shared_ptr<Display> inner = nullptr)
            : inner_{std::move(inner)}
        {
        }

        auto ShowCard(CardIdT card, SlotIdxT slot) -> void override
        {
            Record(Event{.kind = Kind::ShowCard, .card = card, .slot = slot});
            if (inner_) inner_->ShowCard(card, slot);
        }

        auto HideCard(SlotIdxT slot) -> void override
        {
            Record(Event{.kind = Kind::HideCard, .slot = slot});
            if (inner_) inner_->HideCard(slot);
        }

        auto ShowToken(PlyrIdxT player, SlotIdxT slot) -> void override
        {
            Record(Event{.kind = Kind::ShowToken, .slot = slot, .player = player});
            if (inner_) inner_->ShowToken(player, slot);
        }

        auto HideToken(PlyrIdxT player, SlotIdxT slot) -> void override
        {
            Record(Event{.kind = Kind::HideToken, .slot = slot, .player = player});
            if (inner_) inner_->HideToken(player, slot);
        }

        auto SetScore(PlyrIdxT player, int score) -> void override
        {
            Record(Event{.kind = Kind::Score, .player = player, .score = score});
            if (inner_) inner_->SetScore(player, score);
        }

        auto SetCountdown(std::chrono::milliseconds remaining, bool urgent) -> void override
        {
            Record(Event{.kind = Kind::Countdown, .millis = remaining, .urgent = urgent});
            if (inner_) inner_->SetCountdown(remaining, urgent);
        }

        auto SetElapsed(std::chrono::milliseconds elapsed) -> void override
        {
            Record(Event{.kind = Kind::Elapsed, .millis = elapsed});
            if (inner_) inner_->SetElapsed(elapsed);
        }

        auto SetFreeze(PlyrIdxT player, std::chrono::milliseconds remaining) -> void override
        {
            Record(Event{.kind = Kind::Freeze, .player = player, .millis = remaining});
            if (inner_) inner_->SetFreeze(player, remaining);
        }

        auto AnnounceWinners(std::span<PlyrIdxT const> players) -> void override
        {
            Record(Event{.kind = Kind::Winners, .winners = std::vector<PlyrIdxT>(players.begin(), players.end())});
            if (inner_) inner_->AnnounceWinners(players);
        }

        auto Events() const -> std::vector<Event>
        {
            std::lock_guard<std::mutex> lock(m_);
            return events_;
        }

        auto Count(Kind const k) const -> size_t
        {
            std::lock_guard<std::mutex> lock(m_);
            return static_cast<size_t>(std::ranges::count(events_, k, &Event::kind));
        }

        auto Clear() -> void
        {
            std::lock_guard<std::mutex> lock(m_);
            events_.clear();
        }

    private:
        auto Record(Event e) -> void
        {
            e.at = Clock::now();
            std::lock_guard<std::mutex> lock(m_);
            events_.push_back(std::move(e));
        }

        std::shared_ptr<Display> inner_;
        mutable std::mutex m_;
        std::vector<Event> events_;
    };
}

#endif //SETRUSH_RECORDINGDISPLAY_HPP
