#pragma once

#include "deltacode/config/engine_config.hpp"
#include "deltacode/core/result.hpp"
#include "deltacode/delta/types.hpp"
#include "deltacode/events/event_bus.hpp"
#include "deltacode/inventory/types.hpp"

namespace deltacode::delta {

/**
 * @brief Compares two snapshots into a ranked Report
 *
 * Pipeline: FingerprintIndex (both sides) -> Matcher -> DeltaClassifier ->
 * Scorer -> Ranker.
 *
 * Index validation errors (DuplicatePath, MalformedRecord) abort before any
 * matching. The engine holds no mutable state, so one instance may compare
 * several independent snapshot pairs concurrently. The returned Report
 * points into both snapshots.
 */
class DeltaEngine {
public:
    explicit DeltaEngine(config::EngineConfig config = config::EngineConfig::defaults(),
                         events::EventBus* bus = nullptr);

    [[nodiscard]] Result<Report> compare(const inventory::Snapshot& old_snapshot,
                                         const inventory::Snapshot& new_snapshot) const;

    const config::EngineConfig& config() const noexcept { return config_; }

private:
    template<typename EventType>
    void emit(const EventType& event) const {
        if (bus_ != nullptr) {
            bus_->emit(event);
        }
    }

    config::EngineConfig config_;
    events::EventBus* bus_;
};

} // namespace deltacode::delta
