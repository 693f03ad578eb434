#include "deltacode/delta/engine.hpp"

#include "deltacode/delta/classifier.hpp"
#include "deltacode/delta/fingerprint_index.hpp"
#include "deltacode/delta/matcher.hpp"
#include "deltacode/delta/ranker.hpp"
#include "deltacode/delta/scorer.hpp"
#include "deltacode/events/events.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace deltacode::delta {

DeltaEngine::DeltaEngine(config::EngineConfig config, events::EventBus* bus)
    : config_(std::move(config)), bus_(bus) {}

Result<Report> DeltaEngine::compare(const inventory::Snapshot& old_snapshot,
                                    const inventory::Snapshot& new_snapshot) const {
    const auto started = std::chrono::steady_clock::now();
    emit(events::ComparisonStartedEvent{old_snapshot.label, new_snapshot.label,
                                        old_snapshot.size(), new_snapshot.size()});

    auto old_index = FingerprintIndex::build(old_snapshot);
    if (old_index.is_error()) {
        emit(events::SnapshotRejectedEvent{old_snapshot.label, old_index.error()});
        return Err<Report>(old_index.error());
    }
    auto new_index = FingerprintIndex::build(new_snapshot);
    if (new_index.is_error()) {
        emit(events::SnapshotRejectedEvent{new_snapshot.label, new_index.error()});
        return Err<Report>(new_index.error());
    }

    Matcher matcher(MatcherOptions{config_.worker_threads});
    const auto pairs = matcher.match(old_index.value(), new_index.value());

    DeltaClassifier classifier(config_.tracked_attributes);
    Report report;
    report.deltas = classifier.classify_all(pairs);

    Scorer scorer(config_.weights);
    scorer.apply(report.deltas);
    Ranker::rank(report.deltas);

    if (bus_ != nullptr) {
        for (const auto& d : report.deltas) {
            emit(events::DeltaClassifiedEvent{
                d.kind,
                d.primary().path_string(),
                d.old_record != nullptr ? d.old_record->path_string() : std::string(),
                d.score});
        }
    }

    const auto stats = report.stats();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    spdlog::debug("Compared {} -> {}: {} deltas, {} changed, in {}ms",
                  old_snapshot.label, new_snapshot.label, stats.total(),
                  stats.total() - stats.count(DeltaKind::Unmodified), elapsed.count());
    emit(events::ComparisonCompletedEvent{old_snapshot.label, new_snapshot.label, stats, elapsed});

    return Ok(std::move(report));
}

} // namespace deltacode::delta
