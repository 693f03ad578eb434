#pragma once

#include "deltacode/delta/matcher.hpp"
#include "deltacode/delta/types.hpp"

#include <string>
#include <vector>

namespace deltacode::delta {

/**
 * @brief Turns matched pairs into Deltas with per-factor differences
 *
 * Factors:
 * - size_delta:      |new.size - old.size|, or the full size for Added/Removed
 * - path_delta:      segment edit distance, non-zero only for Moved
 * - <attr>_changed:  1 when the tracked attribute differs or is missing on
 *                    one side, else 0
 *
 * Scores are left at zero; the Scorer fills them in.
 */
class DeltaClassifier {
public:
    explicit DeltaClassifier(std::vector<std::string> tracked_attributes)
        : tracked_attributes_(std::move(tracked_attributes)) {}

    [[nodiscard]] Delta classify(const MatchedPair& pair) const;

    [[nodiscard]] std::vector<Delta> classify_all(const std::vector<MatchedPair>& pairs) const;

private:
    static double attribute_changed(const FileRecord* old_record,
                                    const FileRecord* new_record,
                                    const std::string& attribute);

    std::vector<std::string> tracked_attributes_;
};

} // namespace deltacode::delta
