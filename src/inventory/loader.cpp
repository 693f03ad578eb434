#include "deltacode/inventory/loader.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <set>
#include <sstream>

namespace deltacode::inventory {
namespace {

using json = nlohmann::json;

std::string entry_context(const std::string& label, std::size_t index) {
    std::ostringstream oss;
    oss << label << ": files[" << index << "]";
    return oss.str();
}

std::string join_set(const std::set<std::string>& values, const char* separator) {
    std::string joined;
    for (const auto& value : values) {
        if (!joined.empty()) {
            joined += separator;
        }
        joined += value;
    }
    return joined;
}

} // namespace

Result<Snapshot> InventoryLoader::load_file(const std::filesystem::path& location) {
    std::ifstream input(location, std::ios::binary);
    if (!input) {
        return Err<Snapshot>(ErrorCode::Io, "Cannot open inventory file: " + location.string());
    }

    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        return Err<Snapshot>(ErrorCode::Io, "Failed reading inventory file: " + location.string());
    }

    return parse_string(buffer.str(), location.generic_string());
}

Result<Snapshot> InventoryLoader::parse_string(const std::string& text, const std::string& label) {
    json document;
    try {
        document = json::parse(text);
    } catch (const json::parse_error& e) {
        return Err<Snapshot>(ErrorCode::Parse, label + ": invalid JSON: " + e.what());
    }
    return parse(document, label);
}

Result<Snapshot> InventoryLoader::parse(const json& document, const std::string& label) {
    if (!document.is_object()) {
        return Err<Snapshot>(ErrorCode::Parse, label + ": top-level value must be an object");
    }

    auto files_it = document.find("files");
    if (files_it == document.end() || !files_it->is_array()) {
        return Err<Snapshot>(ErrorCode::Parse, label + ": missing \"files\" array");
    }

    Snapshot snapshot;
    snapshot.label = label;
    snapshot.records.reserve(files_it->size());

    std::size_t skipped = 0;
    for (std::size_t i = 0; i < files_it->size(); ++i) {
        const auto& entry = (*files_it)[i];
        if (!entry.is_object()) {
            return Err<Snapshot>(ErrorCode::MalformedRecord,
                                 entry_context(label, i) + ": entry must be an object");
        }

        auto type_it = entry.find("type");
        if (type_it != entry.end() && type_it->is_string() && type_it->get<std::string>() == "directory") {
            ++skipped;
            continue;
        }

        auto record = parse_record(entry, label, i);
        if (record.is_error()) {
            spdlog::warn("Rejected inventory {}: {}", label, record.error().message);
            return Err<Snapshot>(record.error());
        }
        snapshot.records.push_back(record.take());
    }

    spdlog::debug("Loaded {} file records from {} ({} directories skipped)",
                  snapshot.records.size(), label, skipped);
    return Ok(std::move(snapshot));
}

Result<FileRecord> InventoryLoader::parse_record(const json& entry,
                                                 const std::string& label,
                                                 std::size_t index) {
    const auto context = entry_context(label, index);
    FileRecord record;

    auto path_it = entry.find("path");
    if (path_it == entry.end() || !path_it->is_string()) {
        return Err<FileRecord>(ErrorCode::MalformedRecord, context + ": missing \"path\"");
    }
    record.path = PathUtils::split(path_it->get<std::string>());
    if (record.path.empty()) {
        return Err<FileRecord>(ErrorCode::MalformedRecord, context + ": empty \"path\"");
    }

    auto size_it = entry.find("size");
    if (size_it != entry.end() && !size_it->is_null()) {
        if (!size_it->is_number_unsigned()) {
            return Err<FileRecord>(ErrorCode::MalformedRecord,
                                   context + ": \"size\" must be a non-negative integer");
        }
        record.size = size_it->get<std::uint64_t>();
    }

    for (const char* key : {"fingerprint", "sha1", "md5"}) {
        auto fp_it = entry.find(key);
        if (fp_it != entry.end() && fp_it->is_string() && !fp_it->get<std::string>().empty()) {
            record.fingerprint = fp_it->get<std::string>();
            break;
        }
    }
    if (record.fingerprint.empty()) {
        return Err<FileRecord>(ErrorCode::MalformedRecord,
                               context + ": missing fingerprint for " + record.path_string());
    }

    auto attrs_it = entry.find("attributes");
    if (attrs_it != entry.end() && !attrs_it->is_null()) {
        if (!attrs_it->is_object()) {
            return Err<FileRecord>(ErrorCode::MalformedRecord,
                                   context + ": \"attributes\" must be an object");
        }
        for (const auto& [name, value] : attrs_it->items()) {
            if (!value.is_string()) {
                return Err<FileRecord>(ErrorCode::MalformedRecord,
                                       context + ": attribute \"" + name + "\" must be a string");
            }
            record.attributes[name] = value.get<std::string>();
        }
    }

    auto licenses_it = entry.find("licenses");
    if (licenses_it != entry.end() && licenses_it->is_array() && !licenses_it->empty()) {
        record.attributes["license"] = fold_licenses(*licenses_it);
    }

    auto copyrights_it = entry.find("copyrights");
    if (copyrights_it != entry.end() && copyrights_it->is_array() && !copyrights_it->empty()) {
        record.attributes["copyright"] = fold_copyrights(*copyrights_it);
    }

    return Ok(std::move(record));
}

std::string InventoryLoader::fold_licenses(const json& licenses) {
    std::set<std::string> keys;
    for (const auto& license : licenses) {
        if (license.is_string()) {
            keys.insert(license.get<std::string>());
        } else if (license.is_object()) {
            auto key_it = license.find("key");
            if (key_it != license.end() && key_it->is_string()) {
                keys.insert(key_it->get<std::string>());
            }
        }
    }
    return join_set(keys, ",");
}

std::string InventoryLoader::fold_copyrights(const json& copyrights) {
    std::set<std::string> statements;
    for (const auto& copyright : copyrights) {
        if (copyright.is_string()) {
            statements.insert(copyright.get<std::string>());
            continue;
        }
        if (!copyright.is_object()) {
            continue;
        }
        auto value_it = copyright.find("value");
        if (value_it != copyright.end() && value_it->is_string()) {
            statements.insert(value_it->get<std::string>());
        }
        // Older ScanCode output lists statements per detection
        auto statements_it = copyright.find("statements");
        if (statements_it != copyright.end() && statements_it->is_array()) {
            for (const auto& statement : *statements_it) {
                if (statement.is_string()) {
                    statements.insert(statement.get<std::string>());
                }
            }
        }
    }
    return join_set(statements, "\n");
}

} // namespace deltacode::inventory
