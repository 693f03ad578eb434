/**
 * @file components.hpp
 * @brief Ready-made subscribers for comparison events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * StatsComponent stats(bus);
 * DeltaEngine engine(config, &bus);
 * // Components react to every comparison the engine runs
 */

#pragma once

#include "deltacode/events/event_bus.hpp"
#include "deltacode/events/events.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <cstdint>

namespace deltacode::events {

/**
 * @brief Logs comparison events with spdlog
 *
 * Per-delta lines are debug level; start/finish summaries are info.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ComparisonStartedEvent>([this](const ComparisonStartedEvent& e) {
            on_comparison_started(e);
        });

        bus_.subscribe<SnapshotRejectedEvent>([this](const SnapshotRejectedEvent& e) {
            on_snapshot_rejected(e);
        });

        bus_.subscribe<DeltaClassifiedEvent>([this](const DeltaClassifiedEvent& e) {
            on_delta_classified(e);
        });

        bus_.subscribe<ComparisonCompletedEvent>([this](const ComparisonCompletedEvent& e) {
            on_comparison_completed(e);
        });
    }

private:
    void on_comparison_started(const ComparisonStartedEvent& e) {
        spdlog::info("[ComparisonStarted] old={} ({} files) new={} ({} files)",
                     e.old_label, e.old_count, e.new_label, e.new_count);
    }

    void on_snapshot_rejected(const SnapshotRejectedEvent& e) {
        spdlog::warn("[SnapshotRejected] snapshot={} error={}", e.label, e.error.to_string());
    }

    void on_delta_classified(const DeltaClassifiedEvent& e) {
        if (e.kind == delta::DeltaKind::Moved) {
            spdlog::debug("[DeltaClassified] kind={} path={} from={} score={}",
                          delta::DeltaKindUtils::to_string(e.kind), e.path, e.old_path, e.score);
            return;
        }
        spdlog::debug("[DeltaClassified] kind={} path={} score={}",
                      delta::DeltaKindUtils::to_string(e.kind), e.path, e.score);
    }

    void on_comparison_completed(const ComparisonCompletedEvent& e) {
        spdlog::info("[ComparisonCompleted] old={} new={} added={} removed={} modified={} "
                     "moved={} unmodified={} duration={}ms",
                     e.old_label, e.new_label,
                     e.stats.count(delta::DeltaKind::Added),
                     e.stats.count(delta::DeltaKind::Removed),
                     e.stats.count(delta::DeltaKind::Modified),
                     e.stats.count(delta::DeltaKind::Moved),
                     e.stats.count(delta::DeltaKind::Unmodified),
                     e.duration.count());
    }

    EventBus& bus_;
};

/**
 * @brief Counts deltas per kind across every comparison on the bus
 *
 * USAGE:
 * StatsComponent stats(bus);
 * // ... run comparisons ...
 * stats.get_stats().deltas_by_kind[DeltaKindUtils::index(DeltaKind::Moved)].load();
 */
class StatsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> comparisons_started{0};
        std::atomic<uint64_t> comparisons_completed{0};
        std::atomic<uint64_t> snapshots_rejected{0};
        std::array<std::atomic<uint64_t>, delta::kDeltaKindCount> deltas_by_kind{};
        std::atomic<uint64_t> changed_deltas{0};   ///< Everything but Unmodified
    };

    explicit StatsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ComparisonStartedEvent>([this](const ComparisonStartedEvent&) {
            stats_.comparisons_started++;
        });

        bus_.subscribe<SnapshotRejectedEvent>([this](const SnapshotRejectedEvent&) {
            stats_.snapshots_rejected++;
        });

        bus_.subscribe<DeltaClassifiedEvent>([this](const DeltaClassifiedEvent& e) {
            on_delta_classified(e);
        });

        bus_.subscribe<ComparisonCompletedEvent>([this](const ComparisonCompletedEvent&) {
            stats_.comparisons_completed++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    uint64_t count(delta::DeltaKind kind) const {
        return stats_.deltas_by_kind[delta::DeltaKindUtils::index(kind)].load();
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Delta Statistics:");
        spdlog::info("  Comparisons:     {}", stats_.comparisons_completed.load());
        spdlog::info("  Rejected inputs: {}", stats_.snapshots_rejected.load());
        spdlog::info("  Added:           {}", count(delta::DeltaKind::Added));
        spdlog::info("  Removed:         {}", count(delta::DeltaKind::Removed));
        spdlog::info("  Modified:        {}", count(delta::DeltaKind::Modified));
        spdlog::info("  Moved:           {}", count(delta::DeltaKind::Moved));
        spdlog::info("  Unmodified:      {}", count(delta::DeltaKind::Unmodified));
        spdlog::info("  Changed:         {}", stats_.changed_deltas.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_delta_classified(const DeltaClassifiedEvent& e) {
        stats_.deltas_by_kind[delta::DeltaKindUtils::index(e.kind)]++;
        if (e.kind != delta::DeltaKind::Unmodified) {
            stats_.changed_deltas++;
        }
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace deltacode::events
