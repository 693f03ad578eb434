#pragma once

#include "deltacode/core/result.hpp"
#include "deltacode/inventory/types.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace deltacode::delta {

/**
 * @brief Read-only lookups over one Snapshot
 *
 * fingerprint -> records with that content (several files may share one)
 * path        -> the single record at that path
 *
 * build() is where a snapshot is validated: a record without path or
 * fingerprint is a MalformedRecord error, a repeated path a DuplicatePath
 * error. The index points into the snapshot, which must outlive it.
 */
class FingerprintIndex {
public:
    using Bucket = std::vector<const inventory::FileRecord*>;

    static Result<FingerprintIndex> build(const inventory::Snapshot& snapshot);

    [[nodiscard]] const Bucket& by_fingerprint(const std::string& fingerprint) const;

    [[nodiscard]] const inventory::FileRecord* by_path(const std::string& path) const;

    [[nodiscard]] const inventory::FileRecord* by_path(const inventory::PathSegments& path) const;

    /**
     * Fingerprints in ascending order (the matcher's bucket order)
     */
    [[nodiscard]] const std::map<std::string, Bucket>& buckets() const noexcept { return by_fingerprint_; }

    [[nodiscard]] const inventory::Snapshot& snapshot() const noexcept { return *snapshot_; }

    [[nodiscard]] std::size_t size() const noexcept { return by_path_.size(); }

private:
    explicit FingerprintIndex(const inventory::Snapshot& snapshot) : snapshot_(&snapshot) {}

    const inventory::Snapshot* snapshot_;
    std::map<std::string, Bucket> by_fingerprint_;
    std::unordered_map<std::string, const inventory::FileRecord*> by_path_;
};

} // namespace deltacode::delta
