/**
 * @file events.hpp
 * @brief Events emitted while comparing two snapshots
 *
 * NAMING CONVENTION:
 * Events are past-tense: ComparisonStartedEvent, DeltaClassifiedEvent
 */

#pragma once

#include "deltacode/core/error.hpp"
#include "deltacode/delta/types.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <string>

namespace deltacode::events {

/**
 * @brief Both snapshots are loaded; indexing is about to start
 */
struct ComparisonStartedEvent {
    std::string old_label;
    std::string new_label;
    std::size_t old_count = 0;
    std::size_t new_count = 0;
};

/**
 * @brief A snapshot failed validation; the comparison is aborted
 *
 * WHO SUBSCRIBES:
 * - LoggerComponent (warn with the reason)
 * - StatsComponent (count rejected snapshots)
 */
struct SnapshotRejectedEvent {
    std::string label;
    Error error;
};

/**
 * @brief One delta was classified and scored
 */
struct DeltaClassifiedEvent {
    delta::DeltaKind kind = delta::DeltaKind::Unmodified;
    std::string path;       ///< Primary path (new side, else old side)
    std::string old_path;   ///< Empty for Added
    double score = 0.0;
};

/**
 * @brief The report is ranked and ready
 */
struct ComparisonCompletedEvent {
    std::string old_label;
    std::string new_label;
    delta::DeltaStats stats;
    std::chrono::milliseconds duration{0};
};

} // namespace deltacode::events
