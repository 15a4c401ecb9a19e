//
// FeatureOracle.hpp
//

#ifndef SETRUSH_FEATUREORACLE_HPP
#define SETRUSH_FEATUREORACLE_HPP

#include "SetOracle.hpp"
#include "Types.hpp"

namespace setrush::core
{
    // Classic rule: a card id encodes `feature_count` features as base-`feature_size` digits,
    // and three cards form a set iff every feature is all-equal or all-distinct across them.
    class FeatureOracle final : public SetOracle
    {
    public:
        FeatureOracle(uint8_t feature_count, uint8_t feature_size);
        explicit FeatureOracle(Config const& cfg);

        auto FindSets(std::span<CardIdT const> cards, size_t limit) const -> std::vector<CardTriple> override;
        auto IsValidSet(CardTriple const& cards) const -> bool override;
        auto CardToFeatures(CardIdT card) const -> std::vector<int> override;

        // number of distinct card ids the encoding can express
        [[nodiscard]]
        auto FeatureSpace() const noexcept -> size_t { return space_; }

    private:
        auto FeaturesMatch(std::span<int const> a, std::span<int const> b, std::span<int const> c) const -> bool;

    private:
        uint8_t feature_count_;
        uint8_t feature_size_;
        size_t space_;
    };
}

#endif //SETRUSH_FEATUREORACLE_HPP
