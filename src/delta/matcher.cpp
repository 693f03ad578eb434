#include "deltacode/delta/matcher.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace deltacode::delta {
namespace {

using inventory::PathUtils;

struct BucketWork {
    FingerprintIndex::Bucket olds;
    FingerprintIndex::Bucket news;
};

using RecordSet = std::unordered_set<const FileRecord*>;

bool by_path(const FileRecord* lhs, const FileRecord* rhs) {
    return lhs->path < rhs->path;
}

// Positions into the path-sorted new records, ascending; cursor skips the
// prefix already taken
struct KeyedPositions {
    std::vector<std::size_t> positions;
    std::size_t cursor = 0;
};

enum class Side { Old, New };

/**
 * Keys shared by two paths whenever their segment distance is at most
 * `distance` (0 or 1):
 * - "=path"              identical paths
 * - "S<len>:<i>:path"    same length, segment i blanked (substitution)
 * - "L..."               old path one segment longer: old minus a segment == new
 * - "R..."               new path one segment longer: new minus a segment == old
 */
std::vector<std::string> neighbourhood_keys(const inventory::PathSegments& path,
                                            std::size_t distance,
                                            Side side) {
    std::vector<std::string> keys;
    keys.push_back("=" + PathUtils::join(path));
    if (distance == 0) {
        return keys;
    }

    const char* longer_prefix = side == Side::Old ? "L" : "R";
    const char* shorter_prefix = side == Side::Old ? "R" : "L";
    keys.push_back(shorter_prefix + PathUtils::join(path));

    for (std::size_t i = 0; i < path.size(); ++i) {
        inventory::PathSegments blanked = path;
        blanked[i].clear();
        keys.push_back("S" + std::to_string(path.size()) + ":" + std::to_string(i) + ":" +
                       PathUtils::join(blanked));

        inventory::PathSegments shortened = path;
        shortened.erase(shortened.begin() + static_cast<std::ptrdiff_t>(i));
        keys.push_back(longer_prefix + PathUtils::join(shortened));
    }
    return keys;
}

FingerprintIndex::Bucket remaining(const FingerprintIndex::Bucket& bucket, const RecordSet& used) {
    FingerprintIndex::Bucket left;
    for (const auto* record : bucket) {
        if (used.count(record) == 0) {
            left.push_back(record);
        }
    }
    return left;
}

} // namespace

std::vector<MatchedPair> Matcher::pair_bucket(const FingerprintIndex::Bucket& olds,
                                              const FingerprintIndex::Bucket& news) {
    // Greedy over (distance, old path, new path) without materializing the
    // cross product: distances are visited in increasing order, and at each
    // distance every free old record, in path order, takes the first free new
    // record (in path order) at exactly that distance.
    FingerprintIndex::Bucket old_order = olds;
    FingerprintIndex::Bucket new_order = news;
    std::stable_sort(old_order.begin(), old_order.end(), by_path);
    std::stable_sort(new_order.begin(), new_order.end(), by_path);

    std::vector<bool> old_taken(old_order.size(), false);
    std::vector<bool> new_taken(new_order.size(), false);
    std::size_t free_olds = old_order.size();
    std::size_t free_news = new_order.size();
    std::vector<std::size_t> rows;
    std::vector<MatchedPair> pairs;

    auto take = [&](std::size_t i, std::size_t j) {
        old_taken[i] = true;
        new_taken[j] = true;
        --free_olds;
        --free_news;
        pairs.push_back({DeltaKind::Moved, old_order[i], new_order[j]});
    };

    // Distances 0 and 1 through hashed neighbourhoods; keys only narrow the
    // search, every candidate is verified
    for (std::size_t distance = 0; distance <= 1 && free_olds > 0 && free_news > 0; ++distance) {
        std::unordered_map<std::string, KeyedPositions> keyed;
        for (std::size_t j = 0; j < new_order.size(); ++j) {
            if (new_taken[j]) {
                continue;
            }
            for (auto& key : neighbourhood_keys(new_order[j]->path, distance, Side::New)) {
                keyed[std::move(key)].positions.push_back(j);
            }
        }

        for (std::size_t i = 0; i < old_order.size() && free_news > 0; ++i) {
            if (old_taken[i]) {
                continue;
            }
            const auto& old_path = old_order[i]->path;
            std::size_t best = new_order.size();
            for (const auto& key : neighbourhood_keys(old_path, distance, Side::Old)) {
                auto it = keyed.find(key);
                if (it == keyed.end()) {
                    continue;
                }
                auto& entry = it->second;
                while (entry.cursor < entry.positions.size() && new_taken[entry.positions[entry.cursor]]) {
                    ++entry.cursor;
                }
                for (std::size_t k = entry.cursor; k < entry.positions.size(); ++k) {
                    const std::size_t j = entry.positions[k];
                    if (j >= best) {
                        break;
                    }
                    if (!new_taken[j] &&
                        PathUtils::bounded_edit_distance(old_path, new_order[j]->path, distance, rows) == distance) {
                        best = j;
                        break;
                    }
                }
            }
            if (best < new_order.size()) {
                take(i, best);
            }
        }
    }

    // Larger distances are rare; scan the free records with a capped distance.
    // Any free pair left at this point is at least `distance` apart.
    for (std::size_t distance = 2; free_olds > 0 && free_news > 0; ++distance) {
        for (std::size_t i = 0; i < old_order.size() && free_news > 0; ++i) {
            if (old_taken[i]) {
                continue;
            }
            const auto& old_path = old_order[i]->path;
            for (std::size_t j = 0; j < new_order.size(); ++j) {
                if (new_taken[j]) {
                    continue;
                }
                if (PathUtils::bounded_edit_distance(old_path, new_order[j]->path, distance, rows) <= distance) {
                    take(i, j);
                    break;
                }
            }
        }
    }

    return pairs;
}

std::vector<MatchedPair> Matcher::match(const FingerprintIndex& old_index,
                                        const FingerprintIndex& new_index) const {
    const auto& old_records = old_index.snapshot().records;
    const auto& new_records = new_index.snapshot().records;

    std::vector<MatchedPair> pairs;
    pairs.reserve(old_records.size() + new_records.size());
    RecordSet used_old;
    RecordSet used_new;

    // 1. Same path and same content
    for (const auto& record : old_records) {
        const auto* counterpart = new_index.by_path(record.path_string());
        if (counterpart != nullptr && counterpart->fingerprint == record.fingerprint) {
            pairs.push_back({DeltaKind::Unmodified, &record, counterpart});
            used_old.insert(&record);
            used_new.insert(counterpart);
        }
    }
    const std::size_t unmodified = pairs.size();

    // 2. Same content elsewhere; buckets are independent of each other
    std::vector<BucketWork> work;
    for (const auto& [fingerprint, olds] : old_index.buckets()) {
        const auto& news = new_index.by_fingerprint(fingerprint);
        if (news.empty()) {
            continue;
        }
        BucketWork item{remaining(olds, used_old), remaining(news, used_new)};
        if (!item.olds.empty() && !item.news.empty()) {
            work.push_back(std::move(item));
        }
    }

    std::vector<std::vector<MatchedPair>> bucket_pairs(work.size());
    if (options_.worker_threads > 1 && work.size() > 1) {
        boost::asio::thread_pool pool(std::min(options_.worker_threads, work.size()));
        for (std::size_t i = 0; i < work.size(); ++i) {
            boost::asio::post(pool, [&work, &bucket_pairs, i]() {
                bucket_pairs[i] = pair_bucket(work[i].olds, work[i].news);
            });
        }
        pool.join();
    } else {
        for (std::size_t i = 0; i < work.size(); ++i) {
            bucket_pairs[i] = pair_bucket(work[i].olds, work[i].news);
        }
    }

    // Merge in fingerprint order so the result does not depend on scheduling
    for (const auto& bucket : bucket_pairs) {
        for (const auto& pair : bucket) {
            used_old.insert(pair.old_record);
            used_new.insert(pair.new_record);
            pairs.push_back(pair);
        }
    }
    const std::size_t moved = pairs.size() - unmodified;

    // 3. Same path, different content
    for (const auto& record : old_records) {
        if (used_old.count(&record) > 0) {
            continue;
        }
        const auto* counterpart = new_index.by_path(record.path_string());
        if (counterpart != nullptr && used_new.count(counterpart) == 0) {
            pairs.push_back({DeltaKind::Modified, &record, counterpart});
            used_old.insert(&record);
            used_new.insert(counterpart);
        }
    }
    const std::size_t modified = pairs.size() - unmodified - moved;

    // 4. Leftovers
    std::size_t removed = 0;
    for (const auto& record : old_records) {
        if (used_old.count(&record) == 0) {
            pairs.push_back({DeltaKind::Removed, &record, nullptr});
            ++removed;
        }
    }
    std::size_t added = 0;
    for (const auto& record : new_records) {
        if (used_new.count(&record) == 0) {
            pairs.push_back({DeltaKind::Added, nullptr, &record});
            ++added;
        }
    }

    spdlog::debug("Matched {} -> {}: unmodified={} moved={} modified={} removed={} added={} "
                  "(buckets={}, workers={})",
                  old_index.snapshot().label, new_index.snapshot().label,
                  unmodified, moved, modified, removed, added,
                  work.size(), options_.worker_threads);
    return pairs;
}

} // namespace deltacode::delta
