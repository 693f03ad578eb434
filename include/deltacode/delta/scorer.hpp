#pragma once

#include "deltacode/delta/types.hpp"

#include <map>
#include <string>
#include <vector>

namespace deltacode::delta {

/**
 * @brief Weight table turning factors into a score
 *
 * DEFAULTS (ScoringWeights::defaults()):
 *   size_delta          0.001  per byte
 *   path_delta          1.0    per segment edit
 *   license_changed     30.0
 *   copyright_changed   20.0
 *   other *_changed     10.0   (default_attribute_weight)
 *
 * A weight naming a factor that no delta carries is simply never used, so
 * configuration may mention attributes this run does not track.
 */
struct ScoringWeights {
    std::map<std::string, double> weights;
    double default_attribute_weight = 10.0;

    static ScoringWeights defaults();

    /**
     * Weight for a factor: explicit entry, else default_attribute_weight for
     * "*_changed" factors, else 0
     */
    [[nodiscard]] double weight_for(const std::string& factor) const;
};

class Scorer {
public:
    explicit Scorer(ScoringWeights weights) : weights_(std::move(weights)) {}

    /**
     * Weighted sum of the delta's factors, summed in factor-name order
     */
    [[nodiscard]] double score(const Delta& delta) const;

    void apply(std::vector<Delta>& deltas) const;

private:
    ScoringWeights weights_;
};

} // namespace deltacode::delta
