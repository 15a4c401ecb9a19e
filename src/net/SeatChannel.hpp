//
// SeatChannel.hpp
//

#ifndef SETRUSH_SEATCHANNEL_HPP
#define SETRUSH_SEATCHANNEL_HPP

#include <cstddef>
#include <memory>
#include <mutex>
#include <span>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "../core/Types.hpp"

namespace setrush::net
{
    using WsServer = websocketpp::server<websocketpp::config::asio>;
    using Hdl      = websocketpp::connection_hdl;

    // One seat's connection. Sends are serialised so display calls from several game
    // threads never interleave frames.
    struct SeatChannel
    {
        std::weak_ptr<WsServer>          ep;
        Hdl                              hdl;
        core::PlyrIdxT                   seat{};

        std::mutex                       mtx;
        bool                             connected{false};

        void Connect(Hdl h)
        {
            std::lock_guard<std::mutex> lock(mtx);
            hdl = std::move(h);
            connected = true;
        }

        void Disconnect()
        {
            std::lock_guard<std::mutex> lock(mtx);
            connected = false;
        }

        bool Connected()
        {
            std::lock_guard<std::mutex> lock(mtx);
            return connected;
        }

        bool SendBinary(std::span<const std::byte> bytes)
        {
            std::lock_guard<std::mutex> lock(mtx);
            auto ep_sp = ep.lock();
            if (!ep_sp || !connected)
            {
                return false;
            }

            websocketpp::lib::error_code ec;
            ep_sp->send(hdl,
                        reinterpret_cast<const void*>(bytes.data()),
                        bytes.size(),
                        websocketpp::frame::opcode::binary,
                        ec);
            return !ec;
        }
    };
}

#endif // SETRUSH_SEATCHANNEL_HPP
