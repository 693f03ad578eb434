#pragma once

/**
 * @file loader.hpp
 * @brief Builds Snapshots from JSON scan results
 *
 * Two layouts are accepted, both with a top-level "files" array:
 *
 * Plain inventory:
 *   {"files": [{"path": "a/b.txt", "size": 10, "fingerprint": "X",
 *               "attributes": {"license": "mit"}}]}
 *
 * ScanCode scan:
 *   {"files": [{"path": "a/b.txt", "type": "file", "size": 10, "sha1": "...",
 *               "licenses": [{"key": "mit"}],
 *               "copyrights": [{"value": "Copyright (c) nexB"}]}]}
 *
 * Directory entries are skipped. "licenses" and "copyrights" are folded into
 * the "license" and "copyright" attributes so both layouts compare alike.
 */

#include "deltacode/core/result.hpp"
#include "deltacode/inventory/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace deltacode::inventory {

class InventoryLoader {
public:
    /**
     * Read and parse a JSON scan file; the snapshot label is the file path
     */
    static Result<Snapshot> load_file(const std::filesystem::path& location);

    static Result<Snapshot> parse_string(const std::string& text, const std::string& label);

    static Result<Snapshot> parse(const nlohmann::json& document, const std::string& label);

private:
    static Result<FileRecord> parse_record(const nlohmann::json& entry,
                                           const std::string& label,
                                           std::size_t index);

    static std::string fold_licenses(const nlohmann::json& licenses);
    static std::string fold_copyrights(const nlohmann::json& copyrights);
};

} // namespace deltacode::inventory
