//
// BlockingQueue.hpp
//

#ifndef SETRUSH_BLOCKINGQUEUE_HPP
#define SETRUSH_BLOCKINGQUEUE_HPP

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <vector>
#include "Types.hpp"

namespace setrush::core
{
    // FIFO hand-off between threads. Every wait is bounded by a deadline and returns early
    // once Interrupt() is called; the interrupt is sticky until Reset().
    template <typename T>
    class BlockingQueue
    {
    public:
        // capacity 0 means unbounded
        explicit BlockingQueue(size_t capacity = 0) : capacity_{capacity} {}

        BlockingQueue(BlockingQueue const&) = delete;
        auto operator=(BlockingQueue const&) -> BlockingQueue& = delete;

        auto TryPush(T value) -> bool
        {
            return TryPushIf(std::move(value), [] { return true; });
        }

        // admit is evaluated under the queue lock, so a producer cannot slip an element in
        // after a consumer changed the admission state and drained the queue
        template <typename Admit>
        auto TryPushIf(T value, Admit&& admit) -> bool
        {
            {
                std::lock_guard<std::mutex> lock(m_);
                if (interrupted_ || IsFull() || !admit()) return false;
                q_.push_back(std::move(value));
            }
            cv_.notify_all();
            return true;
        }

        // no-op (returns false) when an equal element is already queued
        auto PushUnique(T value) -> bool
        {
            {
                std::lock_guard<std::mutex> lock(m_);
                if (interrupted_ || IsFull()) return false;
                if (std::ranges::find(q_, value) != q_.end()) return false;
                q_.push_back(std::move(value));
            }
            cv_.notify_all();
            return true;
        }

        // waits for free capacity until the deadline
        auto PushUntil(T value, Clock::time_point deadline) -> bool
        {
            return PushUntilIf(std::move(value), deadline, [] { return true; });
        }

        // gives up as soon as admit turns false; whoever flips it must notify through the
        // queue (Drain, Interrupt) for a blocked producer to notice
        template <typename Admit>
        auto PushUntilIf(T value, Clock::time_point deadline, Admit&& admit) -> bool
        {
            {
                std::unique_lock<std::mutex> lock(m_);
                cv_.wait_until(lock, deadline, [&] { return interrupted_ || !IsFull() || !admit(); });
                if (interrupted_ || IsFull() || !admit()) return false;
                q_.push_back(std::move(value));
            }
            cv_.notify_all();
            return true;
        }

        auto PopUntil(Clock::time_point deadline) -> std::optional<T>
        {
            std::optional<T> out;
            {
                std::unique_lock<std::mutex> lock(m_);
                cv_.wait_until(lock, deadline, [&] { return interrupted_ || !q_.empty(); });
                if (interrupted_ || q_.empty()) return std::nullopt;
                out = std::move(q_.front());
                q_.pop_front();
            }
            cv_.notify_all();
            return out;
        }

        auto TryPop() -> std::optional<T>
        {
            std::optional<T> out;
            {
                std::lock_guard<std::mutex> lock(m_);
                if (q_.empty()) return std::nullopt;
                out = std::move(q_.front());
                q_.pop_front();
            }
            cv_.notify_all();
            return out;
        }

        // true iff the queue is non-empty on return
        auto WaitUntil(Clock::time_point deadline) -> bool
        {
            std::unique_lock<std::mutex> lock(m_);
            cv_.wait_until(lock, deadline, [&] { return interrupted_ || !q_.empty(); });
            return !interrupted_ && !q_.empty();
        }

        // removes and returns every queued element in FIFO order
        auto Drain() -> std::vector<T>
        {
            std::vector<T> out;
            {
                std::lock_guard<std::mutex> lock(m_);
                out.reserve(q_.size());
                std::ranges::move(q_, std::back_inserter(out));
                q_.clear();
            }
            cv_.notify_all();
            return out;
        }

        auto Interrupt() -> void
        {
            {
                std::lock_guard<std::mutex> lock(m_);
                interrupted_ = true;
            }
            cv_.notify_all();
        }

        auto Reset() -> void
        {
            std::lock_guard<std::mutex> lock(m_);
            interrupted_ = false;
        }

        [[nodiscard]]
        auto Interrupted() const -> bool
        {
            std::lock_guard<std::mutex> lock(m_);
            return interrupted_;
        }

        [[nodiscard]]
        auto Contains(T const& value) const -> bool
        {
            std::lock_guard<std::mutex> lock(m_);
            return std::ranges::find(q_, value) != q_.end();
        }

        [[nodiscard]]
        auto Size() const -> size_t
        {
            std::lock_guard<std::mutex> lock(m_);
            return q_.size();
        }

        [[nodiscard]]
        auto Empty() const -> bool
        {
            std::lock_guard<std::mutex> lock(m_);
            return q_.empty();
        }

    private:
        auto IsFull() const -> bool { return capacity_ != 0 && q_.size() >= capacity_; }

        mutable std::mutex m_;
        std::condition_variable cv_;
        std::deque<T> q_;
        size_t const capacity_;
        bool interrupted_{false};
    };
}

#endif //SETRUSH_BLOCKINGQUEUE_HPP
