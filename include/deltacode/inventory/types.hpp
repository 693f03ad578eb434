#pragma once

/**
 * @file types.hpp
 * @brief File inventory types compared by the delta engine
 *
 * WHY THIS FILE EXISTS:
 * A scan of a codebase is a list of files with a content fingerprint and
 * some metadata (license, copyright) detected upstream. To find what changed
 * between two scans we never look at file contents again; we compare these
 * records.
 *
 * HOW IT INTEGRATES:
 * - InventoryLoader (inventory/loader.hpp) builds Snapshots from JSON scans
 * - FingerprintIndex (delta/fingerprint_index.hpp) indexes a Snapshot
 * - Deltas (delta/types.hpp) point back into Snapshot records
 *
 * DESIGN DECISIONS:
 * - Path is a vector of segments: edit distance and ordering work per segment
 * - std::map for attributes: deterministic iteration and serialization order
 * - Records are plain structs; a Snapshot is treated as immutable once built
 */

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace deltacode::inventory {

using PathSegments = std::vector<std::string>;
using AttributeMap = std::map<std::string, std::string>;

/**
 * @brief One file of a scan
 *
 * EXAMPLE (plain inventory JSON):
 * {"path": "src/main.c", "size": 1024, "fingerprint": "3b1f...",
 *  "attributes": {"license": "apache-2.0", "copyright": "(c) nexB"}}
 */
struct FileRecord {
    PathSegments path;          // e.g. {"src", "main.c"}
    std::uint64_t size = 0;     // Bytes
    std::string fingerprint;    // Content hash (sha1 hex for ScanCode input)
    AttributeMap attributes;    // Named scan findings, e.g. "license"

    FileRecord() = default;

    FileRecord(PathSegments p, std::uint64_t s, std::string fp, AttributeMap attrs = {})
        : path(std::move(p)), size(s), fingerprint(std::move(fp)), attributes(std::move(attrs)) {}

    /**
     * Path joined with '/'
     * WHY: Logging, JSON output and the ranker's path tie-break
     */
    std::string path_string() const;

    /**
     * Attribute value or nullptr when the record does not carry it
     */
    const std::string* attribute(const std::string& name) const {
        auto it = attributes.find(name);
        return it == attributes.end() ? nullptr : &it->second;
    }
};

/**
 * @brief One full inventory at a point in time
 *
 * Records keep the order they were loaded in. Paths are unique within a
 * snapshot; FingerprintIndex::build() rejects a snapshot that violates this.
 */
struct Snapshot {
    std::string label;                // Where it came from, e.g. "old.json"
    std::vector<FileRecord> records;

    Snapshot() = default;
    Snapshot(std::string l, std::vector<FileRecord> r)
        : label(std::move(l)), records(std::move(r)) {}

    std::size_t size() const noexcept { return records.size(); }
    bool empty() const noexcept { return records.empty(); }
};

/**
 * @brief Path helpers shared by the loader, matcher and ranker
 */
class PathUtils {
public:
    /**
     * Split "a/b/c.txt" into {"a", "b", "c.txt"}
     * Empty and "." segments are dropped, so "./a//b" -> {"a", "b"}.
     */
    static PathSegments split(const std::string& path);

    static std::string join(const PathSegments& segments);

    /**
     * Levenshtein distance over segments (insert, delete, substitute = 1)
     *
     * EXAMPLE:
     * distance({"a", "b.txt"}, {"a", "c.txt"}) == 1
     * distance({"a", "b.txt"}, {"x", "y", "b.txt"}) == 2
     */
    static std::size_t edit_distance(const PathSegments& lhs, const PathSegments& rhs);

    /**
     * edit_distance capped at limit: returns limit + 1 as soon as the
     * distance is known to exceed it
     *
     * rows is scratch space; pass the same vector to repeated calls so the
     * table is not reallocated.
     */
    static std::size_t bounded_edit_distance(const PathSegments& lhs,
                                             const PathSegments& rhs,
                                             std::size_t limit,
                                             std::vector<std::size_t>& rows);
};

} // namespace deltacode::inventory
