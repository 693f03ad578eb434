#pragma once

/**
 * @file engine_config.hpp
 * @brief Per-invocation settings for the delta engine
 *
 * EXAMPLE (config JSON; every key optional, overlaid on the defaults):
 * {
 *   "weights": {"license_changed": 50, "size_delta": 0.0005},
 *   "default_attribute_weight": 5,
 *   "tracked_attributes": ["license", "copyright", "holder"],
 *   "worker_threads": 4
 * }
 */

#include "deltacode/core/result.hpp"
#include "deltacode/delta/scorer.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace deltacode::config {

struct EngineConfig {
    delta::ScoringWeights weights;
    std::vector<std::string> tracked_attributes;
    std::size_t worker_threads = 1;

    /**
     * Default weight table, tracked attributes {"license", "copyright"},
     * sequential matcher
     */
    static EngineConfig defaults();

    nlohmann::json to_json() const;
};

/**
 * Overlay a JSON object on EngineConfig::defaults()
 *
 * Wrong types, negative weights or an empty attribute name are
 * InvalidConfig errors.
 */
Result<EngineConfig> from_json(const nlohmann::json& document);

Result<EngineConfig> load_file(const std::filesystem::path& location);

} // namespace deltacode::config
