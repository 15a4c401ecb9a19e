// File: src/SetClientMain.cpp
//
// Allman braces. Explicit types.
//
// Remote seat for setrushd. Connects, waits for its seat assignment, mirrors every display
// frame onto a local console board and sends KeyPress frames for its own seat, typed on
// stdin ("<slot>") or picked at random with --auto.
//

#include <atomic>
#include <charconv>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <print>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <variant>
#include <vector>

#include <websocketpp/config/asio_no_tls_client.hpp>
#include <websocketpp/client.hpp>

#include "core/Exception.hpp"
#include "core/FeatureOracle.hpp"
#include "core/Types.hpp"
#include "net/codec.hpp"
#include "ui/ConsoleDisplay.hpp"

namespace
{
    using WsClient = websocketpp::client<websocketpp::config::asio_client>;

    struct CmdLine
    {
        std::string url{"ws://127.0.0.1:9002"};
        std::uint64_t seed{424242ULL};
        std::chrono::milliseconds delay{250};
        bool autoplay{false};
        bool quiet{false};
    };

    auto ParseUnsigned(std::string_view const text, std::uint64_t& out) -> bool
    {
        auto const r = std::from_chars(text.data(), text.data() + text.size(), out);
        return r.ec == std::errc{} && r.ptr == text.data() + text.size();
    }

    auto ParseCmdLine(int argc, char** argv) -> std::optional<CmdLine>
    {
        CmdLine c{};
        for (int i = 1; i < argc; ++i)
        {
            std::string_view const k = argv[i];
            std::uint64_t n{};
            if (k == "--auto")
            {
                c.autoplay = true;
            }
            else if (k == "--quiet")
            {
                c.quiet = true;
            }
            else if (k == "--url" && i + 1 < argc)
            {
                c.url = argv[++i];
            }
            else if (k == "--seed" && i + 1 < argc && ParseUnsigned(argv[++i], n))
            {
                c.seed = n;
            }
            else if (k == "--delay_ms" && i + 1 < argc && ParseUnsigned(argv[++i], n))
            {
                c.delay = std::chrono::milliseconds(n);
            }
            else
            {
                std::print(stderr, "[setrush-client] bad argument: {}\n", k);
                return std::nullopt;
            }
        }
        return c;
    }

    // Everything the websocket thread learns, read by the key thread
    struct Session
    {
        std::mutex m;
        std::condition_variable cv;
        std::optional<setrush::core::net::SeatInfo> seat;
        std::vector<bool> occupied;
        std::shared_ptr<setrush::ui::ConsoleDisplay> view;
        bool over{false};
    };

    auto MirrorConfig(setrush::core::net::SeatInfo const& info) -> setrush::core::Config
    {
        setrush::core::Config cfg{};
        cfg.human_players = info.n_players;
        cfg.computer_players = 0;
        cfg.table_size = info.table_size;
        cfg.feature_count = info.feature_count;
        cfg.feature_size = info.feature_size;
        return cfg;
    }
} // anon

int main(int argc, char** argv)
{
    using namespace setrush;
    using namespace setrush::core;

    std::optional<CmdLine> const parsed = ParseCmdLine(argc, argv);
    if (!parsed)
    {
        std::print(stderr, "usage: setrush-client [--url ws://host:port] [--seed n] [--auto] [--delay_ms n] [--quiet]\n");
        return 2;
    }
    CmdLine const cfg = *parsed;
    std::print("[setrush-client] connecting to {} | seed={}\n", cfg.url, cfg.seed);

    WsClient c;
    c.clear_access_channels(websocketpp::log::alevel::all);
    c.clear_error_channels(websocketpp::log::elevel::all);
    c.init_asio();

    websocketpp::connection_hdl hdl;
    Session session;
    std::atomic<std::uint64_t> next_msg_id{1};

    c.set_message_handler([&](websocketpp::connection_hdl, WsClient::message_ptr msg)
    {
        if (msg->get_opcode() != websocketpp::frame::opcode::binary)
        {
            return;
        }

        std::string const& pl = msg->get_payload();
        std::span<std::byte const> const bytes{reinterpret_cast<std::byte const*>(pl.data()), pl.size()};

        if (auto const info = core::net::DecodeSeatAssigned(bytes); info.has_value())
        {
            Config const mirror = MirrorConfig(*info);
            std::lock_guard<std::mutex> lock(session.m);
            session.seat = *info;
            session.occupied.assign(info->table_size, false);
            if (!cfg.quiet)
            {
                session.view = std::make_shared<ui::ConsoleDisplay>(mirror, std::make_shared<FeatureOracle>(mirror));
            }
            session.cv.notify_all();
            std::print("[setrush-client] seat {} of {}, table {}\n", info->seat, info->n_players, info->table_size);
            return;
        }

        auto const decoded = core::net::DecodeDisplayEvent(bytes);
        if (!decoded.has_value())
        {
            std::print("[setrush-client] dropped frame: {}\n", decoded.error().message);
            return;
        }

        std::shared_ptr<ui::ConsoleDisplay> view;
        {
            std::lock_guard<std::mutex> lock(session.m);
            if (auto const* shown = std::get_if<core::net::CardShownEv>(&decoded->event))
            {
                if (shown->slot < session.occupied.size()) session.occupied[shown->slot] = true;
            }
            else if (auto const* hidden = std::get_if<core::net::CardHiddenEv>(&decoded->event))
            {
                if (hidden->slot < session.occupied.size()) session.occupied[hidden->slot] = false;
            }
            else if (std::holds_alternative<core::net::WinnersEv>(decoded->event))
            {
                session.over = true;
                session.cv.notify_all();
            }
            view = session.view;
        }

        if (view)
        {
            try
            {
                core::net::ApplyDisplayEvent(decoded->event, *view);
            }
            catch (OmegaException<error::Code> const& e)
            {
                std::print("[setrush-client] cannot render frame #{}: {}\n", decoded->msg_id, e.what());
            }
        }
    });

    c.set_open_handler([&](websocketpp::connection_hdl h)
    {
        hdl = h;
        std::print("[setrush-client] connected\n");
    });

    c.set_close_handler([&](websocketpp::connection_hdl)
    {
        std::print("[setrush-client] closed by server\n");
        std::lock_guard<std::mutex> lock(session.m);
        session.over = true;
        session.cv.notify_all();
    });

    c.set_fail_handler([&](websocketpp::connection_hdl)
    {
        std::print(stderr, "[setrush-client] connection failed\n");
        std::lock_guard<std::mutex> lock(session.m);
        session.over = true;
        session.cv.notify_all();
    });

    websocketpp::lib::error_code ec;
    WsClient::connection_ptr con = c.get_connection(cfg.url, ec);
    if (ec)
    {
        std::print(stderr, "[setrush-client] get_connection error: {}\n", ec.message());
        return 2;
    }
    c.connect(con);

    std::thread net_thr([&c]
    {
        c.run();
    });

    auto const send_key = [&](PlyrIdxT const seat, SlotIdxT const slot) -> bool
    {
        auto const buf = core::net::BuildKeyPress(seat, slot, next_msg_id++);
        websocketpp::lib::error_code send_ec;
        c.send(hdl, buf.data(), buf.size(), websocketpp::frame::opcode::binary, send_ec);
        if (send_ec)
        {
            std::print(stderr, "[setrush-client] send failed: {}\n", send_ec.message());
            return false;
        }
        return true;
    };

    PlyrIdxT seat{};
    {
        std::unique_lock<std::mutex> lock(session.m);
        session.cv.wait(lock, [&] { return session.seat.has_value() || session.over; });
        if (session.seat) seat = session.seat->seat;
    }

    if (cfg.autoplay)
    {
        std::mt19937 rng(static_cast<std::uint32_t>(cfg.seed));
        while (true)
        {
            std::optional<SlotIdxT> pick;
            {
                std::unique_lock<std::mutex> lock(session.m);
                if (session.cv.wait_for(lock, cfg.delay, [&] { return session.over; })) break;

                std::vector<SlotIdxT> slots;
                for (std::size_t s = 0; s < session.occupied.size(); ++s)
                {
                    if (session.occupied[s]) slots.push_back(static_cast<SlotIdxT>(s));
                }
                if (!slots.empty())
                {
                    std::uniform_int_distribution<std::size_t> dist(0, slots.size() - 1);
                    pick = slots[dist(rng)];
                }
            }
            if (pick && !send_key(seat, *pick)) break;
        }
    }
    else
    {
        std::string line;
        while (std::getline(std::cin, line))
        {
            {
                std::lock_guard<std::mutex> lock(session.m);
                if (session.over) break;
            }
            if (line == "quit" || line == "q") break;

            std::uint64_t slot{};
            if (!ParseUnsigned(line, slot) || slot > constants::MaxSlots)
            {
                std::print("[setrush-client] expected \"<slot>\" or \"quit\"\n");
                continue;
            }
            if (!send_key(seat, static_cast<SlotIdxT>(slot))) break;
        }
    }

    {
        websocketpp::lib::error_code close_ec;
        c.close(hdl, websocketpp::close::status::normal, "bye", close_ec);
    }
    c.stop();
    if (net_thr.joinable())
    {
        net_thr.join();
    }
    return 0;
}
