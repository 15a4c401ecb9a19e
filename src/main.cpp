//
// main.cpp: local game: console display, stdin key input for human seats
//

#include <charconv>
#include <cstdio>
#include <iostream>
#include <memory>
#include <print>
#include <string>
#include <string_view>

#include "core/Config.hpp"
#include "core/Exception.hpp"
#include "core/FeatureOracle.hpp"
#include "core/Game.hpp"
#include "debug/AuditLogger.hpp"
#include "ui/ConsoleDisplay.hpp"

namespace
{
    // "<player> <slot>"
    auto ParseKeyLine(std::string_view const line, unsigned& player, unsigned& slot) -> bool
    {
        char const* const end = line.data() + line.size();
        auto const p = std::from_chars(line.data(), end, player);
        if (p.ec != std::errc{} || p.ptr == end || *p.ptr != ' ') return false;
        auto const s = std::from_chars(p.ptr + 1, end, slot);
        return s.ec == std::errc{} && s.ptr == end;
    }

    auto ReadKeys(setrush::core::Game& game) -> void
    {
        using namespace setrush::core;

        std::string line;
        while (!game.Finished() && std::getline(std::cin, line))
        {
            if (line == "quit" || line == "q")
            {
                game.Stop();
                break;
            }

            unsigned player{};
            unsigned slot{};
            if (!ParseKeyLine(line, player, slot) || player > constants::MaxPlayers || slot > constants::MaxSlots)
            {
                std::print("[setrush] expected \"<player> <slot>\" or \"quit\"\n");
                continue;
            }
            if (player >= game.Configuration().human_players)
            {
                std::print("[setrush] P{} is not a human seat\n", player);
                continue;
            }

            error::KeyAccept const res = game.KeyPressed(static_cast<PlyrIdxT>(player), static_cast<SlotIdxT>(slot));
            if (!res)
            {
                std::print("[setrush] {}\n", error::describe(res.error()));
            }
        }
    }
}

int main(int argc, char** argv)
{
    using namespace setrush;
    using namespace setrush::core;

    LaunchOptions opt{};
    try
    {
        opt = ParseArgs(argc, argv);
    }
    catch (error::ConfigError const& e)
    {
        std::print(stderr, "[setrush] {}\n{}", e.what(), Usage());
        return 2;
    }

    Config const& cfg = opt.game;
    std::print("[setrush] {} human / {} computer player(s), table {}, deck {}, seed {}\n",
               cfg.human_players, cfg.computer_players, cfg.table_size, cfg.deck_size, cfg.seed);

    try
    {
        auto const labels = std::make_shared<FeatureOracle>(cfg);
        auto const display = std::make_shared<ui::ConsoleDisplay>(cfg, labels);

        Game game(cfg, display);
        if (!opt.audit_path.empty())
        {
            game.SetAuditLogger(std::make_shared<debug::AuditLogger>(opt.audit_path));
        }

        game.Start();
        if (cfg.human_players > 0)
        {
            ReadKeys(game);
        }
        game.Wait();
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print(stderr, "[setrush] fatal: {}\n{}", e.what(), e.to_str());
        return 1;
    }
    catch (std::exception const& e)
    {
        std::print(stderr, "[setrush] fatal: {}\n", e.what());
        return 1;
    }

    std::print("[setrush] game over\n");
    return 0;
}
