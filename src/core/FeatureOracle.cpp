//
// FeatureOracle.cpp
//
#include "FeatureOracle.hpp"

#include <algorithm>
#include <ranges>
#include "Exception.hpp"

namespace setrush::core
{
    FeatureOracle::FeatureOracle(uint8_t const feature_count, uint8_t const feature_size) :
        feature_count_{feature_count},
        feature_size_{feature_size},
        space_{1}
    {
        if (feature_count_ == 0 || feature_size_ < constants::SetSize)
        {
            SR_THROW(error::Code::Config,
                     std::format("Feature encoding {}x{} cannot express a set", feature_count_, feature_size_));
        }
        for (uint8_t i{}; i < feature_count_; ++i)
        {
            space_ *= feature_size_;
        }
    }

    FeatureOracle::FeatureOracle(Config const& cfg) :
        FeatureOracle(cfg.feature_count, cfg.feature_size)
    {
    }

    auto FeatureOracle::CardToFeatures(CardIdT const card) const -> std::vector<int>
    {
        if (card < 0 || static_cast<size_t>(card) >= space_)
        {
            SR_THROW(error::Code::State, std::format("Card {} outside feature space {}", card, space_));
        }
        std::vector<int> features(feature_count_);
        auto rest = static_cast<int>(card);
        // most significant digit first
        for (int i = feature_count_ - 1; i >= 0; --i)
        {
            features[static_cast<size_t>(i)] = rest % feature_size_;
            rest /= feature_size_;
        }
        return features;
    }

    auto FeatureOracle::FeaturesMatch(std::span<int const> a, std::span<int const> b, std::span<int const> c) const
        -> bool
    {
        for (size_t i{}; i < feature_count_; ++i)
        {
            bool const all_same = a[i] == b[i] && b[i] == c[i];
            bool const all_diff = a[i] != b[i] && b[i] != c[i] && a[i] != c[i];
            if (!all_same && !all_diff) return false;
        }
        return true;
    }

    auto FeatureOracle::IsValidSet(CardTriple const& cards) const -> bool
    {
        for (CardIdT const c : cards)
        {
            if (c < 0 || static_cast<size_t>(c) >= space_) return false;
        }
        if (cards[0] == cards[1] || cards[1] == cards[2] || cards[0] == cards[2]) return false;

        auto const fa = CardToFeatures(cards[0]);
        auto const fb = CardToFeatures(cards[1]);
        auto const fc = CardToFeatures(cards[2]);
        return FeaturesMatch(fa, fb, fc);
    }

    auto FeatureOracle::FindSets(std::span<CardIdT const> cards, size_t const limit) const -> std::vector<CardTriple>
    {
        std::vector<CardTriple> found;
        if (limit == 0) return found;

        auto in_space = [this](CardIdT const c) { return c >= 0 && static_cast<size_t>(c) < space_; };
        std::vector<CardIdT> sorted = std::ranges::to<std::vector<CardIdT>>(cards | std::views::filter(in_space));
        std::ranges::sort(sorted);
        auto const dup = std::ranges::unique(sorted);
        sorted.erase(dup.begin(), dup.end());

        size_t const n = sorted.size();
        std::vector<std::vector<int>> features;
        features.reserve(n);
        for (CardIdT const c : sorted) features.push_back(CardToFeatures(c));

        for (size_t i{}; i < n; ++i)
        {
            for (size_t j{i + 1}; j < n; ++j)
            {
                for (size_t k{j + 1}; k < n; ++k)
                {
                    if (!FeaturesMatch(features[i], features[j], features[k])) continue;
                    found.push_back(CardTriple{sorted[i], sorted[j], sorted[k]});
                    if (found.size() >= limit) return found;
                }
            }
        }
        return found;
    }
}
