//
// WaitHandle.hpp
//

#ifndef SETRUSH_WAITHANDLE_HPP
#define SETRUSH_WAITHANDLE_HPP

#include <condition_variable>
#include <mutex>
#include <optional>
#include "Types.hpp"

namespace setrush::core
{
    // Binary rendezvous between the dealer and one player. The outcome is latched, so a
    // Release() that lands before the player reaches Wait() is not lost.
    class WaitHandle
    {
    public:
        WaitHandle() = default;

        WaitHandle(WaitHandle const&) = delete;
        auto operator=(WaitHandle const&) -> WaitHandle& = delete;

        // must be called before the claim becomes visible to the dealer
        auto Arm() -> void;
        auto Release(ClaimOutcome outcome) -> void;

        // blocks until released; Interrupted once Interrupt() was called
        auto Wait() -> ClaimOutcome;
        auto WaitUntil(Clock::time_point deadline) -> std::optional<ClaimOutcome>;

        auto Interrupt() -> void;

        [[nodiscard]]
        auto Armed() const -> bool;

    private:
        mutable std::mutex m_;
        std::condition_variable cv_;
        std::optional<ClaimOutcome> outcome_;
        bool armed_{false};
        bool interrupted_{false};
    };
}

#endif //SETRUSH_WAITHANDLE_HPP
