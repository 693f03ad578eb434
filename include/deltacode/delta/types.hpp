#pragma once

/**
 * @file types.hpp
 * @brief Classified changes between two snapshots
 *
 * OWNERSHIP:
 * A Report owns its Deltas. A Delta only points at FileRecords; the two
 * Snapshots it was computed from must outlive the Report.
 */

#include "deltacode/inventory/types.hpp"

#include <array>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace deltacode::delta {

using inventory::FileRecord;

enum class DeltaKind {
    Added,
    Removed,
    Modified,
    Moved,
    Unmodified
};

constexpr std::size_t kDeltaKindCount = 5;

class DeltaKindUtils {
public:
    static const char* to_string(DeltaKind kind) {
        switch (kind) {
            case DeltaKind::Added: return "added";
            case DeltaKind::Removed: return "removed";
            case DeltaKind::Modified: return "modified";
            case DeltaKind::Moved: return "moved";
            case DeltaKind::Unmodified: return "unmodified";
            default: return "unknown";
        }
    }

    static std::size_t index(DeltaKind kind) {
        return static_cast<std::size_t>(kind);
    }
};

// Factor names produced by the classifier
namespace factors {
inline constexpr const char* kSizeDelta = "size_delta";
inline constexpr const char* kPathDelta = "path_delta";
inline constexpr const char* kChangedSuffix = "_changed";

inline std::string attribute_changed(const std::string& attribute) {
    return attribute + kChangedSuffix;
}
} // namespace factors

using FactorMap = std::map<std::string, double>;

struct Delta {
    DeltaKind kind = DeltaKind::Unmodified;
    const FileRecord* old_record = nullptr;
    const FileRecord* new_record = nullptr;
    FactorMap factors;
    double score = 0.0;

    /**
     * Path used for display and the ranker's final tie-break:
     * the new side when present, otherwise the old side
     */
    const FileRecord& primary() const {
        return new_record != nullptr ? *new_record : *old_record;
    }

    double factor(const std::string& name) const {
        auto it = factors.find(name);
        return it == factors.end() ? 0.0 : it->second;
    }
};

/**
 * @brief Per-kind totals of a report
 */
struct DeltaStats {
    std::array<std::size_t, kDeltaKindCount> counts{};

    std::size_t count(DeltaKind kind) const { return counts[DeltaKindUtils::index(kind)]; }

    std::size_t total() const {
        std::size_t sum = 0;
        for (auto c : counts) {
            sum += c;
        }
        return sum;
    }
};

struct Report {
    std::vector<Delta> deltas;

    DeltaStats stats() const {
        DeltaStats result;
        for (const auto& d : deltas) {
            result.counts[DeltaKindUtils::index(d.kind)]++;
        }
        return result;
    }

    std::size_t size() const noexcept { return deltas.size(); }
    bool empty() const noexcept { return deltas.empty(); }
};

} // namespace deltacode::delta
