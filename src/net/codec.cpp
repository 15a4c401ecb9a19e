//
// Codec.cpp
//
#include "codec.hpp"

#include <type_traits>
#include <utility>
#include <vector>

namespace fbn = setrush::gen::net;

namespace
{
    // Verify enum layouts (one value per enum is sufficient to catch drift)
    static_assert(static_cast<int>(setrush::core::TimerMode::Countdown) == static_cast<int>(fbn::TimerKind::Countdown));
    static_assert(static_cast<int>(setrush::core::TimerMode::NoTimer) == static_cast<int>(fbn::TimerKind::NoTimer));

    auto FinishEnvelope(flatbuffers::FlatBufferBuilder& fbb, fbn::Message type, flatbuffers::Offset<void> body)
        -> flatbuffers::DetachedBuffer
    {
        auto const env = fbn::CreateEnvelope(fbb, type, body);
        fbb.Finish(env);
        return fbb.Release();
    }

    template <typename EvT>
    auto FinishDisplay(flatbuffers::FlatBufferBuilder& fbb, std::uint64_t msg_id, fbn::DisplayEvent type,
                       flatbuffers::Offset<EvT> ev) -> flatbuffers::DetachedBuffer
    {
        auto const dm = fbn::CreateDisplayMsg(fbb, msg_id, type, ev.Union());
        return FinishEnvelope(fbb, fbn::Message::DisplayMsg, dm.Union());
    }

    // Verifier pass, then the root
    auto OpenEnvelope(std::span<std::byte const> bytes)
        -> std::expected<fbn::Envelope const*, setrush::core::net::ParseError>
    {
        using setrush::core::net::ParseError;
        if (bytes.size() < sizeof(flatbuffers::uoffset_t))
            return std::unexpected(ParseError{"buffer too small"});

        auto const* raw = reinterpret_cast<uint8_t const*>(bytes.data());
        flatbuffers::Verifier verifier(raw, bytes.size());
        if (!fbn::VerifyEnvelopeBuffer(verifier))
            return std::unexpected(ParseError{"envelope failed verification"});

        auto const* env = fbn::GetEnvelope(raw);
        if (!env || !env->message())
            return std::unexpected(ParseError{"bad root"});
        return env;
    }
} // anonymous

namespace setrush::core::net
{
    auto ToFbTimer(TimerMode const m) noexcept -> fbn::TimerKind
    {
        switch (m)
        {
        case TimerMode::Countdown: return fbn::TimerKind::Countdown;
        case TimerMode::Elapsed: return fbn::TimerKind::Elapsed;
        case TimerMode::NoTimer: return fbn::TimerKind::NoTimer;
        }
        return fbn::TimerKind::Countdown;
    }

    auto FromFbTimer(fbn::TimerKind const k) noexcept -> TimerMode
    {
        switch (k)
        {
        case fbn::TimerKind::Countdown: return TimerMode::Countdown;
        case fbn::TimerKind::Elapsed: return TimerMode::Elapsed;
        case fbn::TimerKind::NoTimer: return TimerMode::NoTimer;
        }
        return TimerMode::Countdown;
    }

    // ---------- Builders (client → server) ----------

    auto BuildKeyPress(PlyrIdxT const player, SlotIdxT const slot, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const kp = fbn::CreateKeyPress(fbb, msg_id, player, slot);
        return FinishEnvelope(fbb, fbn::Message::KeyPress, kp.Union());
    }

    // ---------- Builders (server → client) ----------

    auto BuildSeatAssigned(SeatInfo const& info) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const sa = fbn::CreateSeatAssigned(fbb, info.seat, info.n_players, info.table_size,
                                                info.feature_count, info.feature_size);
        return FinishEnvelope(fbb, fbn::Message::SeatAssigned, sa.Union());
    }

    auto BuildCardShown(CardIdT const card, SlotIdxT const slot, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        return FinishDisplay(fbb, msg_id, fbn::DisplayEvent::CardShown, fbn::CreateCardShown(fbb, card, slot));
    }

    auto BuildCardHidden(SlotIdxT const slot, std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        return FinishDisplay(fbb, msg_id, fbn::DisplayEvent::CardHidden, fbn::CreateCardHidden(fbb, slot));
    }

    auto BuildToken(PlyrIdxT const player, SlotIdxT const slot, bool const shown, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        if (shown)
        {
            return FinishDisplay(fbb, msg_id, fbn::DisplayEvent::TokenShown, fbn::CreateTokenShown(fbb, player, slot));
        }
        return FinishDisplay(fbb, msg_id, fbn::DisplayEvent::TokenHidden, fbn::CreateTokenHidden(fbb, player, slot));
    }

    auto BuildScore(PlyrIdxT const player, int const score, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        return FinishDisplay(fbb, msg_id, fbn::DisplayEvent::ScoreChanged,
                             fbn::CreateScoreChanged(fbb, player, score));
    }

    auto BuildFreeze(PlyrIdxT const player, std::chrono::milliseconds const remaining, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        return FinishDisplay(fbb, msg_id, fbn::DisplayEvent::FreezeChanged,
                             fbn::CreateFreezeChanged(fbb, player, remaining.count()));
    }

    auto BuildTimer(TimerMode const mode, std::chrono::milliseconds const millis, bool const urgent,
                    std::uint64_t const msg_id) -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        return FinishDisplay(fbb, msg_id, fbn::DisplayEvent::TimerTick,
                             fbn::CreateTimerTick(fbb, ToFbTimer(mode), millis.count(), urgent));
    }

    auto BuildWinners(std::span<PlyrIdxT const> const players, std::uint64_t const msg_id)
        -> flatbuffers::DetachedBuffer
    {
        flatbuffers::FlatBufferBuilder fbb;
        auto const vec = fbb.CreateVector(players.data(), players.size());
        return FinishDisplay(fbb, msg_id, fbn::DisplayEvent::Winners, fbn::CreateWinners(fbb, vec));
    }

    // ---------- Decode ----------

    auto DecodeKeyPress(std::span<std::byte const> const bytes)
        -> std::expected<DecodedKeyPress, ParseError>
    {
        auto const env = OpenEnvelope(bytes);
        if (!env) return std::unexpected(env.error());

        if ((*env)->message_type() != fbn::Message::KeyPress)
            return std::unexpected(ParseError{"not a KeyPress"});

        auto const* kp = (*env)->message_as_KeyPress();
        return DecodedKeyPress{.msg_id = kp->msg_id(), .player = kp->player(), .slot = kp->slot()};
    }

    auto DecodeSeatAssigned(std::span<std::byte const> const bytes)
        -> std::expected<SeatInfo, ParseError>
    {
        auto const env = OpenEnvelope(bytes);
        if (!env) return std::unexpected(env.error());

        if ((*env)->message_type() != fbn::Message::SeatAssigned)
            return std::unexpected(ParseError{"not a SeatAssigned"});

        auto const* sa = (*env)->message_as_SeatAssigned();
        return SeatInfo{
            .seat = sa->seat(),
            .n_players = sa->n_players(),
            .table_size = sa->table_size(),
            .feature_count = sa->feature_count(),
            .feature_size = sa->feature_size()
        };
    }

    auto DecodeDisplayEvent(std::span<std::byte const> const bytes)
        -> std::expected<DecodedDisplay, ParseError>
    {
        auto const env = OpenEnvelope(bytes);
        if (!env) return std::unexpected(env.error());

        if ((*env)->message_type() != fbn::Message::DisplayMsg)
            return std::unexpected(ParseError{"not a DisplayMsg"});

        auto const* dm = (*env)->message_as_DisplayMsg();
        if (!dm->event())
            return std::unexpected(ParseError{"DisplayMsg without an event"});
        DecodedDisplay out{.msg_id = dm->msg_id()};

        switch (dm->event_type())
        {
        case fbn::DisplayEvent::CardShown:
        {
            auto const* e = dm->event_as_CardShown();
            out.event = CardShownEv{.card = e->card(), .slot = e->slot()};
            return out;
        }
        case fbn::DisplayEvent::CardHidden:
        {
            out.event = CardHiddenEv{.slot = dm->event_as_CardHidden()->slot()};
            return out;
        }
        case fbn::DisplayEvent::TokenShown:
        {
            auto const* e = dm->event_as_TokenShown();
            out.event = TokenEv{.player = e->player(), .slot = e->slot(), .shown = true};
            return out;
        }
        case fbn::DisplayEvent::TokenHidden:
        {
            auto const* e = dm->event_as_TokenHidden();
            out.event = TokenEv{.player = e->player(), .slot = e->slot(), .shown = false};
            return out;
        }
        case fbn::DisplayEvent::ScoreChanged:
        {
            auto const* e = dm->event_as_ScoreChanged();
            out.event = ScoreEv{.player = e->player(), .score = e->score()};
            return out;
        }
        case fbn::DisplayEvent::FreezeChanged:
        {
            auto const* e = dm->event_as_FreezeChanged();
            out.event = FreezeEv{.player = e->player(), .remaining = std::chrono::milliseconds{e->remaining_ms()}};
            return out;
        }
        case fbn::DisplayEvent::TimerTick:
        {
            auto const* e = dm->event_as_TimerTick();
            out.event = TimerEv{
                .mode = FromFbTimer(e->kind()),
                .millis = std::chrono::milliseconds{e->millis()},
                .urgent = e->urgent()
            };
            return out;
        }
        case fbn::DisplayEvent::Winners:
        {
            WinnersEv w;
            if (auto const* v = dm->event_as_Winners()->players())
            {
                w.players.assign(v->begin(), v->end());
            }
            out.event = std::move(w);
            return out;
        }
        default:
            return std::unexpected(ParseError{"unknown display event"});
        }
    }

    auto ApplyDisplayEvent(DisplayEvent const& ev, Display& sink) -> void
    {
        std::visit([&sink]<typename T0>(T0 const& e)
        {
            using T = std::decay_t<T0>;

            if constexpr (std::is_same_v<T, CardShownEv>)
            {
                sink.ShowCard(e.card, e.slot);
            }
            else if constexpr (std::is_same_v<T, CardHiddenEv>)
            {
                sink.HideCard(e.slot);
            }
            else if constexpr (std::is_same_v<T, TokenEv>)
            {
                if (e.shown) sink.ShowToken(e.player, e.slot);
                else sink.HideToken(e.player, e.slot);
            }
            else if constexpr (std::is_same_v<T, ScoreEv>)
            {
                sink.SetScore(e.player, e.score);
            }
            else if constexpr (std::is_same_v<T, FreezeEv>)
            {
                sink.SetFreeze(e.player, e.remaining);
            }
            else if constexpr (std::is_same_v<T, TimerEv>)
            {
                if (e.mode == TimerMode::Elapsed) sink.SetElapsed(e.millis);
                else sink.SetCountdown(e.millis, e.urgent);
            }
            else
            {
                sink.AnnounceWinners(e.players);
            }
        }, ev);
    }
} // namespace setrush::core::net
