//
// RemoteInput.hpp: server-side key input adapter for one remote seat
//

#ifndef SETRUSH_REMOTEINPUT_HPP
#define SETRUSH_REMOTEINPUT_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <span>
#include <string>

#include "core/Exception.hpp"
#include "core/Types.hpp"

namespace setrush::net
{
    // Decodes KeyPress frames arriving on one seat's connection and forwards them to the game.
    // A frame naming another player than the seat is dropped.
    class RemoteInput
    {
    public:
        using KeySink = std::function<core::error::KeyAccept(core::PlyrIdxT, core::SlotIdxT)>;

        RemoteInput(core::PlyrIdxT seat, KeySink sink);

        // the accepted slot, or why the frame was dropped
        auto OnFrame(std::span<std::byte const> bytes) -> std::expected<core::SlotIdxT, std::string>;

        core::PlyrIdxT Seat() const noexcept
        {
            return seat_;
        }

        std::uint64_t Accepted() const noexcept
        {
            return accepted_.load();
        }

        std::uint64_t Dropped() const noexcept
        {
            return dropped_.load();
        }

    private:
        core::PlyrIdxT                  seat_{};
        KeySink                         sink_;
        std::atomic<std::uint64_t>      accepted_{0};
        std::atomic<std::uint64_t>      dropped_{0};
    };
}

#endif // SETRUSH_REMOTEINPUT_HPP
