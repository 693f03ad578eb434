#pragma once

/**
 * @file json_report.hpp
 * @brief JSON form of a delta Report, and normalization for comparing reports
 *
 * OUTPUT LAYOUT (include_headers = true):
 * {
 *   "deltacode_notice": "...",
 *   "deltacode_version": "1.0.0",
 *   "deltacode_options": {"--new": "new.json", ...},
 *   "deltacode_errors": [],
 *   "deltas_count": 2,
 *   "delta_stats": {"added": 1, "removed": 0, "modified": 0, "moved": 1, "unmodified": 3},
 *   "deltas": [
 *     {"kind": "moved",
 *      "old": {"path": "a/b.txt", "size": 10, "fingerprint": "X", "attributes": {}},
 *      "new": {"path": "a/c.txt", "size": 10, "fingerprint": "X", "attributes": {}},
 *      "factors": {"copyright_changed": 0.0, "license_changed": 0.0,
 *                  "path_delta": 1.0, "size_delta": 0.0},
 *      "score": 1.0},
 *     ...
 *   ]
 * }
 *
 * Reports produced by different runs or versions differ in volatile headers
 * (version, options) and in the wording of long error traces. streamline()
 * strips those so two reports can be compared with ==.
 */

#include "deltacode/core/result.hpp"
#include "deltacode/delta/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace deltacode::report {

using json = nlohmann::ordered_json;

struct SerializeOptions {
    bool include_headers = true;
    bool all_delta_types = true;          ///< false drops Unmodified deltas from "deltas"
    json command_options = json::object(); ///< Written as "deltacode_options"
    std::vector<std::string> errors;       ///< Written as "deltacode_errors"
};

json record_to_json(const inventory::FileRecord& record);

json delta_to_json(const delta::Delta& d);

json to_json(const delta::Report& report, const SerializeOptions& options = {});

Result<void> write_file(const json& document, const std::filesystem::path& location);

/**
 * Normalize a report document in place
 *
 * - drops "deltacode_version" and "deltacode_options"
 * - keeps only the first and last line of multi-line "deltacode_errors"
 *   (lines end at "\n", "\r\n" or "\r")
 * - re-sorts "deltas" by (score desc, canonical factors asc, path asc)
 */
void streamline(json& document);

/**
 * Keep the first and last line of each multi-line error message
 */
void streamline_errors(json& errors);

Result<json> load_streamlined(const std::filesystem::path& location);

/**
 * True when both documents are equal after streamline(), regardless of the
 * order of object keys; with ignore_headers only "deltas" is compared
 */
bool equivalent(json lhs, json rhs, bool ignore_headers = false);

} // namespace deltacode::report
