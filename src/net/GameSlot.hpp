//
// GameSlot.hpp
//

#ifndef SETRUSH_GAMESLOT_HPP
#define SETRUSH_GAMESLOT_HPP

#include <mutex>

#include "core/Exception.hpp"
#include "core/Game.hpp"
#include "core/Types.hpp"

namespace setrush::net
{
    // The game the network thread forwards key presses to. The pointer is only dereferenced
    // under the lock, and unbinding waits for an in-flight press, so the game may be destroyed
    // as soon as Unbind returns.
    class GameSlot
    {
    public:
        // Binds for the lifetime of the scope. Declare after the game so it unbinds first.
        class Scoped
        {
        public:
            Scoped(GameSlot& slot, core::Game& game) : slot_{slot} { slot_.Bind(game); }
            ~Scoped() { slot_.Unbind(); }

            Scoped(Scoped const&) = delete;
            auto operator=(Scoped const&) -> Scoped& = delete;

        private:
            GameSlot& slot_;
        };

        auto Bind(core::Game& game) -> void
        {
            std::lock_guard<std::mutex> lock(m_);
            game_ = &game;
        }

        auto Unbind() -> void
        {
            std::lock_guard<std::mutex> lock(m_);
            game_ = nullptr;
        }

        // Game::KeyPressed never blocks, so holding the lock across it is cheap
        auto KeyPressed(core::PlyrIdxT const player, core::SlotIdxT const slot) -> core::error::KeyAccept
        {
            std::lock_guard<std::mutex> lock(m_);
            if (!game_) return core::error::Reject(core::error::RejectionCode::Input_NotStarted);
            return game_->KeyPressed(player, slot);
        }

        [[nodiscard]]
        auto Bound() const -> bool
        {
            std::lock_guard<std::mutex> lock(m_);
            return game_ != nullptr;
        }

    private:
        mutable std::mutex m_;
        core::Game* game_{nullptr};
    };
}

#endif // SETRUSH_GAMESLOT_HPP
