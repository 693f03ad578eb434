#include "deltacode/delta/scorer.hpp"

namespace deltacode::delta {
namespace {

bool ends_with(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

ScoringWeights ScoringWeights::defaults() {
    ScoringWeights table;
    table.weights = {
        {factors::kSizeDelta, 0.001},
        {factors::kPathDelta, 1.0},
        {factors::attribute_changed("license"), 30.0},
        {factors::attribute_changed("copyright"), 20.0},
    };
    table.default_attribute_weight = 10.0;
    return table;
}

double ScoringWeights::weight_for(const std::string& factor) const {
    auto it = weights.find(factor);
    if (it != weights.end()) {
        return it->second;
    }
    if (ends_with(factor, factors::kChangedSuffix)) {
        return default_attribute_weight;
    }
    return 0.0;
}

double Scorer::score(const Delta& delta) const {
    double total = 0.0;
    for (const auto& [name, value] : delta.factors) {
        total += weights_.weight_for(name) * value;
    }
    return total;
}

void Scorer::apply(std::vector<Delta>& deltas) const {
    for (auto& delta : deltas) {
        delta.score = score(delta);
    }
}

} // namespace deltacode::delta
