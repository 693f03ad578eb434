#pragma once

#include "deltacode/delta/types.hpp"

#include <string>
#include <vector>

namespace deltacode::delta {

/**
 * @brief Total order over deltas
 *
 * 1. score, descending
 * 2. canonical factor key, ascending
 * 3. primary path (new side, else old side), ascending
 * 4. old path, then new path (an absent side orders first)
 *
 * Applied once with a single comparator; no two distinct deltas of one
 * report compare equal.
 */
class Ranker {
public:
    /**
     * "name=value;" per factor in name order, values with six decimals
     *
     * EXAMPLE:
     * {"path_delta": 1, "size_delta": 0} -> "path_delta=1.000000;size_delta=0.000000;"
     */
    static std::string canonical_key(const FactorMap& factors);

    static bool ranks_before(const Delta& lhs, const Delta& rhs);

    static void rank(std::vector<Delta>& deltas);
};

} // namespace deltacode::delta
