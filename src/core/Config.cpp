//
// Config.cpp
//
#include "Config.hpp"

#include <charconv>
#include <format>
#include <limits>
#include <system_error>
#include <vector>
#include "Exception.hpp"

namespace setrush::core
{
    namespace
    {
        template <typename T>
        auto ParseNumber(std::string_view const flag, std::string_view const text) -> T
        {
            T out{};
            auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
            if (ec != std::errc{} || ptr != text.data() + text.size())
            {
                SR_THROW(error::Code::Config, std::format("{}: '{}' is not a valid number", flag, text));
            }
            return out;
        }

        template <typename T>
        auto ParseBounded(std::string_view const flag, std::string_view const text) -> T
        {
            auto const v = ParseNumber<std::uint64_t>(flag, text);
            if (v > std::numeric_limits<T>::max())
            {
                SR_THROW(error::Code::Config, std::format("{}: {} is out of range", flag, v));
            }
            return static_cast<T>(v);
        }

        auto Millis(std::string_view const flag, std::string_view const text) -> std::chrono::milliseconds
        {
            return std::chrono::milliseconds{ParseNumber<std::int64_t>(flag, text)};
        }
    }

    auto Usage() -> std::string_view
    {
        return "options:\n"
            "  --humans N          players driven by external input (0)\n"
            "  --computers N       players driven by the random AI (2)\n"
            "  --table N           slots on the board (12)\n"
            "  --deck N            cards in the deck (81)\n"
            "  --features N        features per card (4)\n"
            "  --feature-size N    values per feature (3)\n"
            "  --timeout_ms N      >0 countdown, 0 elapsed, <0 no timer (60000)\n"
            "  --warning_ms N      countdown urgent threshold (5000)\n"
            "  --penalty_ms N      freeze after an invalid claim (3000)\n"
            "  --delay_ms N        sleep before each card mutation (0)\n"
            "  --tick_ms N         dealer and player wait granularity (1000)\n"
            "  --ai_delay_ms N     pause between computer key presses (0)\n"
            "  --seed N            deck shuffle and AI seed (random)\n"
            "  --hints             print the sets on the board every round\n"
            "  --verbose           trace actor threads\n"
            "  --audit PATH        write a game transcript\n"
            "  --port N            server port (9002)\n"
            "  --seat_wait_ms N    server: how long to wait for human seats (30000)\n";
    }

    auto ParseArgs(std::span<std::string_view const> const args) -> LaunchOptions
    {
        LaunchOptions opt{};
        Config& cfg = opt.game;

        for (size_t i{}; i < args.size(); ++i)
        {
            std::string_view const arg = args[i];

            if (arg == "--hints")
            {
                cfg.hints = true;
                continue;
            }
            if (arg == "--verbose")
            {
                cfg.verbose = true;
                continue;
            }

            if (i + 1 >= args.size())
            {
                SR_THROW(error::Code::Config, std::format("{}: missing value", arg));
            }
            std::string_view const val = args[++i];

            if (arg == "--humans") cfg.human_players = ParseBounded<std::uint32_t>(arg, val);
            else if (arg == "--computers") cfg.computer_players = ParseBounded<std::uint32_t>(arg, val);
            else if (arg == "--table") cfg.table_size = ParseBounded<size_t>(arg, val);
            else if (arg == "--deck") cfg.deck_size = ParseBounded<size_t>(arg, val);
            else if (arg == "--features") cfg.feature_count = ParseBounded<std::uint8_t>(arg, val);
            else if (arg == "--feature-size") cfg.feature_size = ParseBounded<std::uint8_t>(arg, val);
            else if (arg == "--timeout_ms") cfg.turn_timeout = Millis(arg, val);
            else if (arg == "--warning_ms") cfg.turn_timeout_warning = Millis(arg, val);
            else if (arg == "--penalty_ms") cfg.penalty_freeze = Millis(arg, val);
            else if (arg == "--delay_ms") cfg.table_delay = Millis(arg, val);
            else if (arg == "--tick_ms") cfg.tick = Millis(arg, val);
            else if (arg == "--ai_delay_ms") cfg.ai_key_delay = Millis(arg, val);
            else if (arg == "--seed") cfg.seed = ParseNumber<std::uint64_t>(arg, val);
            else if (arg == "--audit") opt.audit_path = std::string(val);
            else if (arg == "--port") opt.port = ParseBounded<std::uint16_t>(arg, val);
            else if (arg == "--seat_wait_ms") opt.seat_wait = Millis(arg, val);
            else
            {
                SR_THROW(error::Code::Config, std::format("unknown option '{}'", arg));
            }
        }

        Validate(cfg);
        return opt;
    }

    auto ParseArgs(int const argc, char** argv) -> LaunchOptions
    {
        std::vector<std::string_view> args;
        for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
        return ParseArgs(std::span<std::string_view const>{args});
    }

    auto Validate(Config const& cfg) -> void
    {
        using std::chrono::milliseconds;

        if (cfg.PlayerCount() == 0)
        {
            SR_THROW(error::Code::Config, "at least one player is required");
        }
        if (cfg.PlayerCount() > constants::MaxPlayers)
        {
            SR_THROW(error::Code::Config, std::format("{} players exceed the limit of {}",
                                                      cfg.PlayerCount(), constants::MaxPlayers));
        }
        for (PlyrIdxT const seat : cfg.computer_seats)
        {
            if (seat >= cfg.human_players)
            {
                SR_THROW(error::Code::Config, std::format("computer seat {} is not a human seat (humans: {})",
                                                          seat, cfg.human_players));
            }
        }
        if (cfg.table_size == 0 || cfg.table_size > constants::MaxSlots)
        {
            SR_THROW(error::Code::Config, std::format("table size {} outside [1, {}]",
                                                      cfg.table_size, constants::MaxSlots));
        }
        if (cfg.table_size > cfg.deck_size)
        {
            SR_THROW(error::Code::Config, std::format("table of {} cannot be filled from a deck of {}",
                                                      cfg.table_size, cfg.deck_size));
        }
        if (cfg.feature_count == 0 || cfg.feature_size < constants::SetSize)
        {
            SR_THROW(error::Code::Config, std::format("feature encoding {}x{} cannot express a set",
                                                      cfg.feature_count, cfg.feature_size));
        }

        size_t space = 1;
        for (uint8_t i{}; i < cfg.feature_count && space <= cfg.deck_size; ++i) space *= cfg.feature_size;
        if (cfg.deck_size > space)
        {
            SR_THROW(error::Code::Config, std::format("deck of {} exceeds the {} distinct cards of {}x{} features",
                                                      cfg.deck_size, space, cfg.feature_count, cfg.feature_size));
        }

        if (cfg.tick <= milliseconds::zero())
        {
            SR_THROW(error::Code::Config, "tick must be positive");
        }
        if (cfg.turn_timeout_warning < milliseconds::zero() || cfg.penalty_freeze < milliseconds::zero()
            || cfg.table_delay < milliseconds::zero() || cfg.ai_key_delay < milliseconds::zero())
        {
            SR_THROW(error::Code::Config, "durations other than the turn timeout must not be negative");
        }
    }
}
