//
// WaitHandle.cpp
//
#include "WaitHandle.hpp"

namespace setrush::core
{
    auto WaitHandle::Arm() -> void
    {
        std::lock_guard<std::mutex> lock(m_);
        outcome_.reset();
        armed_ = true;
    }

    auto WaitHandle::Release(ClaimOutcome const outcome) -> void
    {
        {
            std::lock_guard<std::mutex> lock(m_);
            outcome_ = outcome;
        }
        cv_.notify_all();
    }

    auto WaitHandle::Wait() -> ClaimOutcome
    {
        std::unique_lock<std::mutex> lock(m_);
        cv_.wait(lock, [&] { return interrupted_ || outcome_.has_value(); });
        armed_ = false;
        if (!outcome_) return ClaimOutcome::Interrupted;
        ClaimOutcome const out = *outcome_;
        outcome_.reset();
        return out;
    }

    auto WaitHandle::WaitUntil(Clock::time_point const deadline) -> std::optional<ClaimOutcome>
    {
        std::unique_lock<std::mutex> lock(m_);
        if (!cv_.wait_until(lock, deadline, [&] { return interrupted_ || outcome_.has_value(); }))
        {
            return std::nullopt;
        }
        armed_ = false;
        if (!outcome_) return ClaimOutcome::Interrupted;
        ClaimOutcome const out = *outcome_;
        outcome_.reset();
        return out;
    }

    auto WaitHandle::Interrupt() -> void
    {
        {
            std::lock_guard<std::mutex> lock(m_);
            interrupted_ = true;
        }
        cv_.notify_all();
    }

    auto WaitHandle::Armed() const -> bool
    {
        std::lock_guard<std::mutex> lock(m_);
        return armed_;
    }
}
