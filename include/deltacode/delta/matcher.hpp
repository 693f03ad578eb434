#pragma once

#include "deltacode/delta/fingerprint_index.hpp"
#include "deltacode/delta/types.hpp"

#include <cstddef>
#include <vector>

namespace deltacode::delta {

/**
 * @brief One pairing decision; at least one side is set
 *
 * kind is the category the pair was matched under:
 * Unmodified (same path + content), Moved (same content), Modified
 * (same path), Removed (old only), Added (new only).
 */
struct MatchedPair {
    DeltaKind kind = DeltaKind::Unmodified;
    const FileRecord* old_record = nullptr;
    const FileRecord* new_record = nullptr;
};

struct MatcherOptions {
    std::size_t worker_threads = 1;  ///< >1 pairs fingerprint buckets on a thread pool
};

/**
 * @brief Pairs the records of two indexed snapshots
 *
 * Priority:
 * 1. same fingerprint and same path  -> Unmodified
 * 2. same fingerprint, other path    -> Moved (greedy by path edit distance)
 * 3. same path, other fingerprint    -> Modified
 * 4. leftovers                       -> Removed / Added
 *
 * Every record of both snapshots ends up in exactly one pair. The result is
 * the same for any worker count.
 */
class Matcher {
public:
    explicit Matcher(MatcherOptions options = {}) : options_(options) {}

    [[nodiscard]] std::vector<MatchedPair> match(const FingerprintIndex& old_index,
                                                 const FingerprintIndex& new_index) const;

    /**
     * Greedy pairing inside one fingerprint bucket
     *
     * Pairs are taken in (edit distance, old path, new path) order while
     * both sides are still free. The cross product is never built: memory
     * stays linear in the bucket size. Records left unpaired are not
     * returned.
     */
    static std::vector<MatchedPair> pair_bucket(const FingerprintIndex::Bucket& olds,
                                                const FingerprintIndex::Bucket& news);

private:
    MatcherOptions options_;
};

} // namespace deltacode::delta
