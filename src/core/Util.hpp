//
// Util.hpp
//

#ifndef SETRUSH_UTIL_HPP
#define SETRUSH_UTIL_HPP

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <format>
#include <print>
#include <span>
#include <thread>
#include <vector>
#include "Types.hpp"

namespace setrush::core::util
{
    // Flags card ids seen twice. Ids outside [0, deck_size) count as duplicates.
    class CardUniqueChecker
    {
    public:
        explicit CardUniqueChecker(size_t deck_size):
            seen_(deck_size, false), contains_dup_(false) {}

        auto Add(CardIdT const c) -> void
        {
            if (c < 0 || static_cast<size_t>(c) >= seen_.size())
            {
                contains_dup_ = true;
                return;
            }
            contains_dup_ |= static_cast<bool>(seen_[static_cast<size_t>(c)]);
            seen_[static_cast<size_t>(c)] = true;
        }

        [[nodiscard]]
        auto ContainsDup() const -> bool
        {
            return contains_dup_;
        }

    private:
        std::vector<bool> seen_;
        bool contains_dup_;
    };

    inline auto ContainsDuplicate(std::span<CardIdT const> cards, size_t deck_size) -> bool
    {
        CardUniqueChecker checker{deck_size};
        for (CardIdT const c : cards) checker.Add(c);
        return checker.ContainsDup();
    }

    inline auto RemainingUntil(Clock::time_point deadline) -> std::chrono::milliseconds
    {
        auto const left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        return std::max(left, std::chrono::milliseconds{0});
    }

    // lifecycle tracing for actor threads, silent unless enabled
    template <typename... Args>
    inline auto Trace(bool enabled, std::format_string<Args...> fmt, Args&&... args) -> void
    {
        if (!enabled) return;
        std::print(stderr, "[trace] {}\n", std::format(fmt, std::forward<Args>(args)...));
    }
}

#endif //SETRUSH_UTIL_HPP
