//
// SetOracle.hpp
//

#ifndef SETRUSH_SETORACLE_HPP
#define SETRUSH_SETORACLE_HPP

#include <span>
#include <vector>
#include "Types.hpp"

namespace setrush::core
{
    // Authoritative, side-effect free judge of which card triples form a set.
    class SetOracle
    {
    public:
        virtual ~SetOracle() = default;

        // at most `limit` sets among `cards`, each triple in ascending card order
        virtual auto FindSets(std::span<CardIdT const> cards, size_t limit) const -> std::vector<CardTriple> = 0;
        virtual auto IsValidSet(CardTriple const& cards) const -> bool = 0;
        virtual auto CardToFeatures(CardIdT card) const -> std::vector<int> = 0;
    };
}

#endif //SETRUSH_SETORACLE_HPP
