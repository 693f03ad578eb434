#include "deltacode/delta/classifier.hpp"

namespace deltacode::delta {

Delta DeltaClassifier::classify(const MatchedPair& pair) const {
    Delta delta;
    delta.kind = pair.kind;
    delta.old_record = pair.old_record;
    delta.new_record = pair.new_record;

    const auto* o = pair.old_record;
    const auto* n = pair.new_record;

    double size_delta = 0.0;
    if (o != nullptr && n != nullptr) {
        size_delta = o->size > n->size ? static_cast<double>(o->size - n->size)
                                       : static_cast<double>(n->size - o->size);
    } else {
        size_delta = static_cast<double>(o != nullptr ? o->size : n->size);
    }
    delta.factors[factors::kSizeDelta] = size_delta;

    double path_delta = 0.0;
    if (pair.kind == DeltaKind::Moved) {
        path_delta = static_cast<double>(inventory::PathUtils::edit_distance(o->path, n->path));
    }
    delta.factors[factors::kPathDelta] = path_delta;

    for (const auto& attribute : tracked_attributes_) {
        delta.factors[factors::attribute_changed(attribute)] = attribute_changed(o, n, attribute);
    }

    return delta;
}

std::vector<Delta> DeltaClassifier::classify_all(const std::vector<MatchedPair>& pairs) const {
    std::vector<Delta> deltas;
    deltas.reserve(pairs.size());
    for (const auto& pair : pairs) {
        deltas.push_back(classify(pair));
    }
    return deltas;
}

double DeltaClassifier::attribute_changed(const FileRecord* old_record,
                                          const FileRecord* new_record,
                                          const std::string& attribute) {
    const std::string* old_value = old_record != nullptr ? old_record->attribute(attribute) : nullptr;
    const std::string* new_value = new_record != nullptr ? new_record->attribute(attribute) : nullptr;

    if (old_value == nullptr && new_value == nullptr) {
        return 0.0;
    }
    if (old_value == nullptr || new_value == nullptr) {
        return 1.0;
    }
    return *old_value == *new_value ? 0.0 : 1.0;
}

} // namespace deltacode::delta
