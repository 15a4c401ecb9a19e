#include "AuditLogger.hpp"

#include <chrono>
#include <format>
#include <string_view>
#include <utility>

using namespace setrush::core;

namespace
{

auto s_mode(TimerMode const m) -> std::string_view
{
    switch (m)
    {
        case TimerMode::Countdown: return "countdown";
        case TimerMode::Elapsed:   return "elapsed";
        case TimerMode::NoTimer:   return "none";
    }
    return "?";
}

auto s_tokens(TokenSet const& t) -> std::string
{
    std::string body;
    bool first = true;
    for (Placement const& p : t.Items())
    {
        body += (first ? "" : ",");
        first = false;
        body += std::format("{}@{}", p.card, static_cast<int>(p.slot));
    }
    return body;
}

template <typename T>
auto s_list(std::span<T const> xs) -> std::string
{
    std::string body;
    for (size_t i{}; i < xs.size(); ++i)
    {
        body += (i ? "," : "");
        body += std::format("{}", static_cast<int>(xs[i]));
    }
    return body;
}

} // anonymous namespace

namespace setrush::core::debug
{

auto to_string(ClaimOutcome const o) -> std::string_view
{
    switch (o)
    {
        case ClaimOutcome::Point:       return "Point";
        case ClaimOutcome::Penalty:     return "Penalty";
        case ClaimOutcome::Void:        return "Void";
        case ClaimOutcome::Stale:       return "Stale";
        case ClaimOutcome::Interrupted: return "Interrupted";
    }
    return "?";
}

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::line(std::string const& s) -> void
{
    auto const ms = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - t0_).count();
    out_ << std::format("[{:>8}] {}\n", ms, s);
}

auto AuditLogger::start(Config const& cfg) -> void
{
    std::lock_guard<std::mutex> lock(m_);
    t0_ = Clock::now();
    out_ << std::format("Seed={}\n", cfg.seed);
    out_ << std::format("Timer={} timeout={}ms\n", s_mode(TimerModeFor(cfg)), cfg.turn_timeout.count());
    out_ << std::format("Table={} Deck={} Features={}x{}\n",
                        cfg.table_size, cfg.deck_size,
                        static_cast<int>(cfg.feature_count), static_cast<int>(cfg.feature_size));
    out_ << std::format("Players={} (human={}, computer={})\n",
                        cfg.PlayerCount(), cfg.human_players, cfg.computer_players);
    out_.flush();
}

auto AuditLogger::fill(CardIdT const card, SlotIdxT const slot, size_t const deck_left) -> void
{
    std::lock_guard<std::mutex> lock(m_);
    line(std::format("Fill card={} slot={} deck={}", card, static_cast<int>(slot), deck_left));
}

auto AuditLogger::claim(PlyrIdxT const player, TokenSet const& tokens) -> void
{
    std::lock_guard<std::mutex> lock(m_);
    line(std::format("Claim P{} tokens=[{}]", static_cast<int>(player), s_tokens(tokens)));
}

auto AuditLogger::resolve_begin(PlyrIdxT const player) -> std::uint64_t
{
    std::lock_guard<std::mutex> lock(m_);
    std::uint64_t const seq = ++seq_;
    line(std::format("Resolve#{} begin P{}", seq, static_cast<int>(player)));
    return seq;
}

auto AuditLogger::resolve_end(std::uint64_t const seq, PlyrIdxT const player, ClaimOutcome const outcome) -> void
{
    std::lock_guard<std::mutex> lock(m_);
    line(std::format("Resolve#{} end P{} outcome={}", seq, static_cast<int>(player), to_string(outcome)));
}

auto AuditLogger::reshuffle(size_t const returned, size_t const deck_size, std::span<PlyrIdxT const> stale) -> void
{
    std::lock_guard<std::mutex> lock(m_);
    line(std::format("Reshuffle returned={} deck={} stale=[{}]", returned, deck_size, s_list(stale)));
}

auto AuditLogger::winners(std::span<PlyrIdxT const> players, std::span<int const> scores) -> void
{
    std::lock_guard<std::mutex> lock(m_);
    out_ << std::format("Scores=[{}]\n", s_list(scores));
    out_ << std::format("Winners=[{}]\n", s_list(players));
    out_.flush();
}

auto AuditLogger::flush() -> void
{
    std::lock_guard<std::mutex> lock(m_);
    out_.flush();
}

auto AuditLogger::resolutions() const -> std::uint64_t
{
    std::lock_guard<std::mutex> lock(m_);
    return seq_;
}

} // namespace setrush::core::debug
