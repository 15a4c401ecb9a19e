//
// TokenSet.hpp
//

#ifndef SETRUSH_TOKENSET_HPP
#define SETRUSH_TOKENSET_HPP

#include <algorithm>
#include <array>
#include <optional>
#include <span>
#include "Types.hpp"

namespace setrush::core
{
    // Up to three placements of one player, kept in placement order.
    class TokenSet
    {
    public:
        TokenSet() = default;

        [[nodiscard]]
        auto Size() const noexcept -> size_t { return size_; }
        [[nodiscard]]
        auto Empty() const noexcept -> bool { return size_ == 0; }
        [[nodiscard]]
        auto Full() const noexcept -> bool { return size_ == constants::SetSize; }

        auto Add(Placement const p) -> bool
        {
            if (Full() || ContainsSlot(p.slot)) return false;
            items_[size_++] = p;
            return true;
        }

        auto RemoveSlot(SlotIdxT const slot) -> bool
        {
            auto const first = items_.begin();
            auto const last = items_.begin() + static_cast<std::ptrdiff_t>(size_);
            auto const it = std::ranges::find(first, last, slot, &Placement::slot);
            if (it == last) return false;
            // keep placement order
            std::move(it + 1, last, it);
            --size_;
            return true;
        }

        auto Clear() noexcept -> void { size_ = 0; }

        [[nodiscard]]
        auto ContainsSlot(SlotIdxT const slot) const -> bool
        {
            return std::ranges::any_of(Items(), [slot](Placement const& p) { return p.slot == slot; });
        }

        [[nodiscard]]
        auto Items() const -> std::span<Placement const>
        {
            return {items_.data(), size_};
        }

        // the three cards of a full set, nullopt otherwise
        [[nodiscard]]
        auto Cards() const -> std::optional<CardTriple>
        {
            if (!Full()) return std::nullopt;
            return CardTriple{items_[0].card, items_[1].card, items_[2].card};
        }

    private:
        std::array<Placement, constants::SetSize> items_{};
        size_t size_{0};
    };
}

#endif //SETRUSH_TOKENSET_HPP
