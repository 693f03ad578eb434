#include "deltacode/report/json_report.hpp"

#include "deltacode/core/version.hpp"
#include "deltacode/delta/ranker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace deltacode::report {
namespace {

constexpr const char* kNotice =
    "Generated with deltacode and provided on an \"AS IS\" BASIS, WITHOUT WARRANTIES "
    "OR CONDITIONS OF ANY KIND, either express or implied.";

// Sort key of one serialized delta; mirrors Ranker::ranks_before
struct DeltaSortKey {
    double score = 0.0;
    std::string factors;
    inventory::PathSegments primary;
    bool has_old = false;
    inventory::PathSegments old_path;
    bool has_new = false;
    inventory::PathSegments new_path;
};

bool read_side(const json& entry, const char* side, inventory::PathSegments& path) {
    auto it = entry.find(side);
    if (it == entry.end() || !it->is_object()) {
        return false;
    }
    auto path_it = it->find("path");
    if (path_it != it->end() && path_it->is_string()) {
        path = inventory::PathUtils::split(path_it->get<std::string>());
    }
    return true;
}

DeltaSortKey sort_key(const json& entry) {
    DeltaSortKey key;
    auto score_it = entry.find("score");
    if (score_it != entry.end() && score_it->is_number()) {
        key.score = score_it->get<double>();
    }

    delta::FactorMap factors;
    auto factors_it = entry.find("factors");
    if (factors_it != entry.end() && factors_it->is_object()) {
        for (const auto& [name, value] : factors_it->items()) {
            if (value.is_number()) {
                factors[name] = value.get<double>();
            }
        }
    }
    key.factors = delta::Ranker::canonical_key(factors);

    key.has_old = read_side(entry, "old", key.old_path);
    key.has_new = read_side(entry, "new", key.new_path);
    key.primary = key.has_new ? key.new_path : key.old_path;
    return key;
}

bool key_before(const DeltaSortKey& lhs, const DeltaSortKey& rhs) {
    if (lhs.score != rhs.score) {
        return lhs.score > rhs.score;
    }
    if (lhs.factors != rhs.factors) {
        return lhs.factors < rhs.factors;
    }
    if (lhs.primary != rhs.primary) {
        return lhs.primary < rhs.primary;
    }
    if (lhs.has_old != rhs.has_old) {
        return !lhs.has_old;
    }
    if (lhs.old_path != rhs.old_path) {
        return lhs.old_path < rhs.old_path;
    }
    if (lhs.has_new != rhs.has_new) {
        return !lhs.has_new;
    }
    return lhs.new_path < rhs.new_path;
}

} // namespace

json record_to_json(const inventory::FileRecord& record) {
    json attributes = json::object();
    for (const auto& [name, value] : record.attributes) {
        attributes[name] = value;
    }
    return json{
        {"path", record.path_string()},
        {"size", record.size},
        {"fingerprint", record.fingerprint},
        {"attributes", attributes},
    };
}

json delta_to_json(const delta::Delta& d) {
    json factors = json::object();
    for (const auto& [name, value] : d.factors) {
        factors[name] = value;
    }
    return json{
        {"kind", delta::DeltaKindUtils::to_string(d.kind)},
        {"old", d.old_record != nullptr ? record_to_json(*d.old_record) : json(nullptr)},
        {"new", d.new_record != nullptr ? record_to_json(*d.new_record) : json(nullptr)},
        {"factors", factors},
        {"score", d.score},
    };
}

json to_json(const delta::Report& report, const SerializeOptions& options) {
    json deltas = json::array();
    for (const auto& d : report.deltas) {
        if (!options.all_delta_types && d.kind == delta::DeltaKind::Unmodified) {
            continue;
        }
        deltas.push_back(delta_to_json(d));
    }

    if (!options.include_headers) {
        return json{{"deltas", std::move(deltas)}};
    }

    const auto stats = report.stats();
    json delta_stats = json::object();
    for (auto kind : {delta::DeltaKind::Added, delta::DeltaKind::Removed, delta::DeltaKind::Modified,
                      delta::DeltaKind::Moved, delta::DeltaKind::Unmodified}) {
        delta_stats[delta::DeltaKindUtils::to_string(kind)] = stats.count(kind);
    }

    json document = json::object();
    document["deltacode_notice"] = kNotice;
    document["deltacode_version"] = deltacode::version();
    document["deltacode_options"] = options.command_options;
    document["deltacode_errors"] = options.errors;
    document["deltas_count"] = deltas.size();
    document["delta_stats"] = delta_stats;
    document["deltas"] = std::move(deltas);
    return document;
}

Result<void> write_file(const json& document, const std::filesystem::path& location) {
    std::ofstream output(location, std::ios::binary | std::ios::trunc);
    if (!output) {
        return Err<void>(ErrorCode::Io, "Cannot open report file for writing: " + location.string());
    }
    output << document.dump(2) << '\n';
    if (!output) {
        return Err<void>(ErrorCode::Io, "Failed writing report file: " + location.string());
    }
    spdlog::debug("Wrote report to {}", location.string());
    return Ok();
}

void streamline_errors(json& errors) {
    if (!errors.is_array()) {
        return;
    }
    for (auto& error : errors) {
        if (!error.is_string()) {
            continue;
        }
        // Split keeping line endings; "\r\n", "\r" and "\n" all end a line
        const auto text = error.get<std::string>();
        std::vector<std::string> lines;
        std::size_t start = 0;
        while (start < text.size()) {
            auto end = text.find_first_of("\r\n", start);
            if (end == std::string::npos) {
                lines.push_back(text.substr(start));
                break;
            }
            if (text[end] == '\r' && end + 1 < text.size() && text[end + 1] == '\n') {
                ++end;
            }
            lines.push_back(text.substr(start, end - start + 1));
            start = end + 1;
        }
        if (lines.size() <= 1) {
            continue;
        }
        error = lines.front() + lines.back();
    }
}

void streamline(json& document) {
    if (!document.is_object()) {
        return;
    }
    document.erase("deltacode_version");
    document.erase("deltacode_options");

    auto errors_it = document.find("deltacode_errors");
    if (errors_it != document.end()) {
        streamline_errors(*errors_it);
    }

    auto deltas_it = document.find("deltas");
    if (deltas_it == document.end() || !deltas_it->is_array()) {
        return;
    }

    std::vector<std::pair<DeltaSortKey, json>> keyed;
    keyed.reserve(deltas_it->size());
    for (auto& d : *deltas_it) {
        keyed.emplace_back(sort_key(d), std::move(d));
    }
    std::stable_sort(keyed.begin(), keyed.end(), [](const auto& lhs, const auto& rhs) {
        return key_before(lhs.first, rhs.first);
    });

    json sorted = json::array();
    for (auto& [key, d] : keyed) {
        sorted.push_back(std::move(d));
    }
    *deltas_it = std::move(sorted);
}

Result<json> load_streamlined(const std::filesystem::path& location) {
    std::ifstream input(location, std::ios::binary);
    if (!input) {
        return Err<json>(ErrorCode::Io, "Cannot open report file: " + location.string());
    }

    json document;
    try {
        input >> document;
    } catch (const json::parse_error& e) {
        return Err<json>(ErrorCode::Parse, location.string() + ": invalid JSON: " + e.what());
    }

    streamline(document);
    return Ok(std::move(document));
}

bool equivalent(json lhs, json rhs, bool ignore_headers) {
    streamline(lhs);
    streamline(rhs);

    // Compare with sorted object keys; key order is not significant
    auto unordered = [ignore_headers](const json& document) {
        if (!ignore_headers) {
            return nlohmann::json::parse(document.dump());
        }
        nlohmann::json stripped = nlohmann::json::object();
        if (document.is_object() && document.contains("deltas")) {
            stripped["deltas"] = nlohmann::json::parse(document.at("deltas").dump());
        }
        return stripped;
    };
    return unordered(lhs) == unordered(rhs);
}

} // namespace deltacode::report
