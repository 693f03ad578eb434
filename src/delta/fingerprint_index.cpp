#include "deltacode/delta/fingerprint_index.hpp"

#include <spdlog/spdlog.h>

namespace deltacode::delta {
namespace {

using inventory::FileRecord;

std::string describe(const inventory::Snapshot& snapshot, std::size_t index) {
    return snapshot.label + ": record " + std::to_string(index);
}

Result<void> validate(const FileRecord& record, const inventory::Snapshot& snapshot, std::size_t index) {
    if (record.path.empty()) {
        return Err<void>(ErrorCode::MalformedRecord, describe(snapshot, index) + " has no path");
    }
    for (const auto& segment : record.path) {
        if (segment.empty() || segment.find('/') != std::string::npos) {
            return Err<void>(ErrorCode::MalformedRecord,
                             describe(snapshot, index) + " has an invalid path segment in '" +
                             record.path_string() + "'");
        }
    }
    if (record.fingerprint.empty()) {
        return Err<void>(ErrorCode::MalformedRecord,
                         describe(snapshot, index) + " (" + record.path_string() + ") has no fingerprint");
    }
    return Ok();
}

} // namespace

Result<FingerprintIndex> FingerprintIndex::build(const inventory::Snapshot& snapshot) {
    FingerprintIndex index(snapshot);
    index.by_path_.reserve(snapshot.records.size());

    for (std::size_t i = 0; i < snapshot.records.size(); ++i) {
        const auto& record = snapshot.records[i];

        auto valid = validate(record, snapshot, i);
        if (valid.is_error()) {
            return Err<FingerprintIndex>(valid.error());
        }

        auto path = record.path_string();
        auto [it, inserted] = index.by_path_.emplace(path, &record);
        if (!inserted) {
            return Err<FingerprintIndex>(ErrorCode::DuplicatePath,
                                         snapshot.label + ": duplicate path '" + path + "'");
        }
        index.by_fingerprint_[record.fingerprint].push_back(&record);
    }

    spdlog::debug("Indexed {}: {} records, {} distinct fingerprints",
                  snapshot.label, index.by_path_.size(), index.by_fingerprint_.size());
    return Ok(std::move(index));
}

const FingerprintIndex::Bucket& FingerprintIndex::by_fingerprint(const std::string& fingerprint) const {
    static const Bucket empty;
    auto it = by_fingerprint_.find(fingerprint);
    return it == by_fingerprint_.end() ? empty : it->second;
}

const FileRecord* FingerprintIndex::by_path(const std::string& path) const {
    auto it = by_path_.find(path);
    return it == by_path_.end() ? nullptr : it->second;
}

const FileRecord* FingerprintIndex::by_path(const inventory::PathSegments& path) const {
    return by_path(inventory::PathUtils::join(path));
}

} // namespace deltacode::delta
