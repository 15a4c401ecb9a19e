// File: src/SetServerMain.cpp
//
// Allman style. Explicit types. No K&R.
//
// Authoritative match server using WebSocket++ (no TLS) + standalone Asio.
// Waits up to --seat_wait_ms for the human seats to connect, hands the seats nobody took
// to the random AI, then runs the game to completion. Every display call is broadcast to
// all seats; each seat may only press keys for its own player.

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <mutex>
#include <print>
#include <span>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "core/Config.hpp"
#include "core/Exception.hpp"
#include "core/Game.hpp"
#include "debug/AuditLogger.hpp"
#include "net/GameSlot.hpp"
#include "net/RemoteInput.hpp"
#include "net/SeatChannel.hpp"
#include "net/WsDisplay.hpp"
#include "net/codec.hpp"

namespace
{
    using setrush::net::WsServer;
    using setrush::net::Hdl;

    // Seat bookkeeping shared between the websocket thread and main.
    struct Lobby
    {
        std::mutex                 mtx;
        std::condition_variable    cv;
        std::unordered_map<void*, std::size_t> hdl_to_seat;
        std::size_t                connected{0};
        bool                       open{true};
    };
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
        std::print(stderr, "[setrushd] {}\n{}", e.what(), Usage());
        return 2;
    }
    Config cfg = opt.game;

    std::print("[setrushd] starting on port {} with {} human seat(s), {} computer player(s)\n",
               opt.port, cfg.human_players, cfg.computer_players);

    auto ep = std::make_shared<WsServer>();
    ep->clear_access_channels(websocketpp::log::alevel::all);
    ep->clear_error_channels(websocketpp::log::elevel::all);

    ep->init_asio();
    ep->set_reuse_addr(true);

    std::vector<std::shared_ptr<net::SeatChannel>> chans(cfg.human_players);
    std::vector<std::unique_ptr<net::RemoteInput>> inputs(cfg.human_players);
    net::GameSlot live_game;

    for (std::size_t i = 0; i < chans.size(); ++i)
    {
        chans[i] = std::make_shared<net::SeatChannel>();
        chans[i]->ep = ep;
        chans[i]->seat = static_cast<PlyrIdxT>(i);
        inputs[i] = std::make_unique<net::RemoteInput>(static_cast<PlyrIdxT>(i),
            [&live_game](PlyrIdxT const player, SlotIdxT const slot) -> error::KeyAccept
            {
                return live_game.KeyPressed(player, slot);
            });
    }

    Lobby lobby;

    ep->set_open_handler([&](Hdl hdl)
    {
        auto con = ep->get_con_from_hdl(hdl);
        void* key = con.get();

        std::size_t seat = static_cast<std::size_t>(-1);
        {
            std::lock_guard<std::mutex> lock(lobby.mtx);
            if (lobby.open)
            {
                for (std::size_t i = 0; i < chans.size(); ++i)
                {
                    if (!chans[i]->Connected())
                    {
                        seat = i;
                        break;
                    }
                }
            }
            if (seat != static_cast<std::size_t>(-1))
            {
                lobby.hdl_to_seat[key] = seat;
                chans[seat]->Connect(hdl);
                ++lobby.connected;
            }
        }
        if (seat == static_cast<std::size_t>(-1))
        {
            ep->close(hdl, websocketpp::close::status::try_again_later, "All seats occupied");
            return;
        }
        lobby.cv.notify_all();

        std::print("[setrushd] client connected -> seat {}\n", seat);

        auto const hello = core::net::BuildSeatAssigned(core::net::SeatInfo{
            .seat = static_cast<PlyrIdxT>(seat),
            .n_players = static_cast<std::uint8_t>(opt.game.PlayerCount()),
            .table_size = static_cast<std::uint8_t>(opt.game.table_size),
            .feature_count = opt.game.feature_count,
            .feature_size = opt.game.feature_size
        });
        chans[seat]->SendBinary(core::net::AsBytes(hello));
    });

    ep->set_close_handler([&](Hdl hdl)
    {
        auto con = ep->get_con_from_hdl(hdl);
        void* key = con.get();

        std::lock_guard<std::mutex> lock(lobby.mtx);
        auto it = lobby.hdl_to_seat.find(key);
        if (it != lobby.hdl_to_seat.end())
        {
            std::size_t seat = it->second;
            lobby.hdl_to_seat.erase(it);

            if (seat < chans.size())
            {
                chans[seat]->Disconnect();
                --lobby.connected;
                std::print("[setrushd] seat {} disconnected\n", seat);
            }
        }
    });

    ep->set_message_handler([&](Hdl hdl, WsServer::message_ptr msg)
    {
        auto con = ep->get_con_from_hdl(hdl);
        void* key = con.get();

        std::size_t seat{};
        {
            std::lock_guard<std::mutex> lock(lobby.mtx);
            auto it = lobby.hdl_to_seat.find(key);
            if (it == lobby.hdl_to_seat.end())
            {
                return;
            }
            seat = it->second;
        }

        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            return;
        }

        auto const& payload = msg->get_payload();
        std::span<std::byte const> bytes{
            reinterpret_cast<std::byte const*>(payload.data()), payload.size()
        };

        auto const res = inputs[seat]->OnFrame(bytes);
        if (!res.has_value() && opt.game.verbose)
        {
            std::print("[Seat {}] key dropped: {}\n", seat, res.error());
        }
    });

    ep->listen(opt.port);
    ep->start_accept();
    std::thread net_thr([ep]
    {
        ep->run();
    });

    // Lobby: wait for the human seats, then close it.
    // Empty seats keep the number already sent to their client and are played by the computer.
    {
        std::unique_lock<std::mutex> lock(lobby.mtx);
        lobby.cv.wait_for(lock, opt.seat_wait, [&] { return lobby.connected >= chans.size(); });
        lobby.open = false;

        for (std::size_t i = 0; i < chans.size(); ++i)
        {
            if (!chans[i]->Connected()) cfg.computer_seats.push_back(static_cast<PlyrIdxT>(i));
        }
    }
    std::print("[setrushd] lobby closed: {} connected seat(s), {} computer player(s)\n",
               cfg.human_players - cfg.computer_seats.size(),
               cfg.computer_players + cfg.computer_seats.size());

    int rc = 0;
    try
    {
        Validate(cfg);
        auto const display = std::make_shared<net::WsDisplay>(TimerModeFor(cfg), chans);
        Game game(cfg, display);
        if (!opt.audit_path.empty())
        {
            game.SetAuditLogger(std::make_shared<debug::AuditLogger>(opt.audit_path));
        }

        {
            // unbinds before the game is destroyed, on the exception path too
            net::GameSlot::Scoped const bound(live_game, game);
            game.Start();
            game.Wait();
        }

        std::vector<int> const scores = game.Scores();
        std::vector<PlyrIdxT> const winners = game.Winners();
        for (std::size_t i = 0; i < scores.size(); ++i)
        {
            bool const won = std::ranges::find(winners, static_cast<PlyrIdxT>(i)) != winners.end();
            std::print("[setrushd] P{} score {}{}\n", i, scores[i], won ? " (winner)" : "");
        }
        std::print("[setrushd] game over, {} frame(s) sent\n", display->Sent());
    }
    catch (OmegaException<error::Code> const& e)
    {
        std::print(stderr, "[setrushd] fatal: {}\n{}", e.what(), e.to_str());
        rc = 1;
    }
    catch (std::exception const& e)
    {
        std::print(stderr, "[setrushd] fatal: {}\n", e.what());
        rc = 1;
    }

    ep->stop_listening();
    ep->stop();
    if (net_thr.joinable())
    {
        net_thr.join();
    }

    return rc;
}
