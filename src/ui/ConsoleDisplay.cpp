//
// ConsoleDisplay.cpp
//
#include "ConsoleDisplay.hpp"

#include <algorithm>
#include <format>
#include <print>
#include <utility>

namespace setrush::ui
{
    using namespace setrush::core;

    ConsoleDisplay::ConsoleDisplay(Config const& cfg, std::shared_ptr<SetOracle const> oracle, std::FILE* out) :
        oracle_(std::move(oracle)),
        out_(out),
        cards_(cfg.table_size),
        tokens_(cfg.table_size),
        scores_(cfg.PlayerCount(), 0),
        frozen_(cfg.PlayerCount(), false)
    {
    }

    auto ConsoleDisplay::CardLabel(CardIdT const card) const -> std::string
    {
        if (!oracle_) return std::format("{:>3}", card);
        std::string label;
        for (int const f : oracle_->CardToFeatures(card)) label += static_cast<char>('0' + f % 10);
        return label;
    }

    auto ConsoleDisplay::RenderBoard(std::string const& timer) -> void
    {
        std::string body;
        for (size_t s{}; s < cards_.size(); ++s)
        {
            body += std::format("  [{:>2}] ", s);
            if (!cards_[s])
            {
                body += "----";
            }
            else
            {
                body += CardLabel(*cards_[s]);
            }
            for (PlyrIdxT const p : tokens_[s]) body += std::format(" P{}", p);
            body += '\n';
        }

        std::string score_line;
        for (size_t p{}; p < scores_.size(); ++p)
        {
            score_line += std::format(" P{}={}{}", p, scores_[p], frozen_[p] ? "*" : "");
        }
        std::print(out_, "[setrush] {}\n{}[setrush] scores:{}\n", timer, body, score_line);
        std::fflush(out_);
        dirty_ = false;
    }

    auto ConsoleDisplay::ShowCard(CardIdT const card, SlotIdxT const slot) -> void
    {
        std::lock_guard<std::mutex> lock(m_);
        if (slot < cards_.size()) cards_[slot] = card;
        dirty_ = true;
    }

    auto ConsoleDisplay::HideCard(SlotIdxT const slot) -> void
    {
        std::lock_guard<std::mutex> lock(m_);
        if (slot < cards_.size()) cards_[slot].reset();
        dirty_ = true;
    }

    auto ConsoleDisplay::ShowToken(PlyrIdxT const player, SlotIdxT const slot) -> void
    {
        std::lock_guard<std::mutex> lock(m_);
        if (slot < tokens_.size()) tokens_[slot].push_back(player);
        dirty_ = true;
    }

    auto ConsoleDisplay::HideToken(PlyrIdxT const player, SlotIdxT const slot) -> void
    {
        std::lock_guard<std::mutex> lock(m_);
        if (slot < tokens_.size()) std::erase(tokens_[slot], player);
        dirty_ = true;
    }

    auto ConsoleDisplay::SetScore(PlyrIdxT const player, int const score) -> void
    {
        std::lock_guard<std::mutex> lock(m_);
        if (player < scores_.size()) scores_[player] = score;
        std::print(out_, "[setrush] P{} scores, now {}\n", player, score);
        dirty_ = true;
    }

    auto ConsoleDisplay::SetCountdown(std::chrono::milliseconds const remaining, bool const urgent) -> void
    {
        std::lock_guard<std::mutex> lock(m_);
        if (!dirty_ && !urgent) return;
        std::string const timer = urgent
                                      ? std::format("{:.1f}s left!", static_cast<double>(remaining.count()) / 1000.0)
                                      : std::format("{}s left", (remaining.count() + 999) / 1000);
        RenderBoard(timer);
    }

    auto ConsoleDisplay::SetElapsed(std::chrono::milliseconds const elapsed) -> void
    {
        std::lock_guard<std::mutex> lock(m_);
        if (!dirty_) return;
        RenderBoard(std::format("{}s elapsed", elapsed.count() / 1000));
    }

    auto ConsoleDisplay::SetFreeze(PlyrIdxT const player, std::chrono::milliseconds const remaining) -> void
    {
        std::lock_guard<std::mutex> lock(m_);
        if (player >= frozen_.size()) return;
        bool const now_frozen = remaining.count() > 0;
        if (now_frozen != frozen_[player])
        {
            std::print(out_, "[setrush] P{} {}\n", player,
                       now_frozen ? std::format("frozen for {}ms", remaining.count()) : std::string("unfrozen"));
            frozen_[player] = now_frozen;
        }
    }

    auto ConsoleDisplay::AnnounceWinners(std::span<PlyrIdxT const> const players) -> void
    {
        std::lock_guard<std::mutex> lock(m_);
        std::string names;
        for (PlyrIdxT const p : players) names += std::format(" P{}", p);
        if (players.size() == 1)
        {
            std::print(out_, "[setrush] winner:{}\n", names);
        }
        else
        {
            std::print(out_, "[setrush] it's a tie:{}\n", names);
        }
        std::fflush(out_);
    }
}
