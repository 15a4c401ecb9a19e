//
// RemoteInput.cpp
//

#include "net/RemoteInput.hpp"

#include <format>
#include <utility>

#include "net/codec.hpp"

namespace setrush::net
{
    RemoteInput::RemoteInput(core::PlyrIdxT seat, KeySink sink)
        : seat_{seat}
          , sink_{std::move(sink)}
    {
        SR_ASSERT(static_cast<bool>(sink_), "RemoteInput requires a key sink");
    }

    auto RemoteInput::OnFrame(std::span<std::byte const> bytes) -> std::expected<core::SlotIdxT, std::string>
    {
        auto const parsed = core::net::DecodeKeyPress(bytes);
        if (!parsed.has_value())
        {
            ++dropped_;
            return std::unexpected(parsed.error().message);
        }

        core::net::DecodedKeyPress const& kp = parsed.value();

        // Seat spoofing guard
        if (kp.player != seat_)
        {
            ++dropped_;
            return std::unexpected(std::format("seat {} sent a key press for player {}", seat_, kp.player));
        }

        core::error::KeyAccept const res = sink_(seat_, kp.slot);
        if (!res.has_value())
        {
            ++dropped_;
            return std::unexpected(core::error::describe(res.error()));
        }

        ++accepted_;
        return kp.slot;
    }
}
