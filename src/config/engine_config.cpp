#include "deltacode/config/engine_config.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace deltacode::config {
namespace {

using json = nlohmann::json;

Result<double> read_weight(const json& value, const std::string& name) {
    if (!value.is_number()) {
        return Err<double>(ErrorCode::InvalidConfig, "weight '" + name + "' must be a number");
    }
    const double weight = value.get<double>();
    if (weight < 0.0) {
        return Err<double>(ErrorCode::InvalidConfig, "weight '" + name + "' must not be negative");
    }
    return Ok(weight);
}

} // namespace

EngineConfig EngineConfig::defaults() {
    EngineConfig config;
    config.weights = delta::ScoringWeights::defaults();
    config.tracked_attributes = {"license", "copyright"};
    config.worker_threads = 1;
    return config;
}

json EngineConfig::to_json() const {
    json weights_json = json::object();
    for (const auto& [name, weight] : weights.weights) {
        weights_json[name] = weight;
    }
    return json{
        {"weights", weights_json},
        {"default_attribute_weight", weights.default_attribute_weight},
        {"tracked_attributes", tracked_attributes},
        {"worker_threads", worker_threads},
    };
}

Result<EngineConfig> from_json(const json& document) {
    if (!document.is_object()) {
        return Err<EngineConfig>(ErrorCode::InvalidConfig, "configuration must be a JSON object");
    }

    EngineConfig config = EngineConfig::defaults();

    auto weights_it = document.find("weights");
    if (weights_it != document.end()) {
        if (!weights_it->is_object()) {
            return Err<EngineConfig>(ErrorCode::InvalidConfig, "\"weights\" must be an object");
        }
        for (const auto& [name, value] : weights_it->items()) {
            auto weight = read_weight(value, name);
            if (weight.is_error()) {
                return Err<EngineConfig>(weight.error());
            }
            config.weights.weights[name] = weight.value();
        }
    }

    auto default_it = document.find("default_attribute_weight");
    if (default_it != document.end()) {
        auto weight = read_weight(*default_it, "default_attribute_weight");
        if (weight.is_error()) {
            return Err<EngineConfig>(weight.error());
        }
        config.weights.default_attribute_weight = weight.value();
    }

    auto tracked_it = document.find("tracked_attributes");
    if (tracked_it != document.end()) {
        if (!tracked_it->is_array()) {
            return Err<EngineConfig>(ErrorCode::InvalidConfig, "\"tracked_attributes\" must be an array");
        }
        config.tracked_attributes.clear();
        for (const auto& name : *tracked_it) {
            if (!name.is_string() || name.get<std::string>().empty()) {
                return Err<EngineConfig>(ErrorCode::InvalidConfig,
                                         "\"tracked_attributes\" entries must be non-empty strings");
            }
            config.tracked_attributes.push_back(name.get<std::string>());
        }
    }

    auto workers_it = document.find("worker_threads");
    if (workers_it != document.end()) {
        if (!workers_it->is_number_unsigned()) {
            return Err<EngineConfig>(ErrorCode::InvalidConfig,
                                     "\"worker_threads\" must be a non-negative integer");
        }
        config.worker_threads = workers_it->get<std::size_t>();
    }

    return Ok(std::move(config));
}

Result<EngineConfig> load_file(const std::filesystem::path& location) {
    std::ifstream input(location);
    if (!input) {
        return Err<EngineConfig>(ErrorCode::Io, "Cannot open config file: " + location.string());
    }

    json document;
    try {
        input >> document;
    } catch (const json::parse_error& e) {
        return Err<EngineConfig>(ErrorCode::Parse, location.string() + ": invalid JSON: " + e.what());
    }

    auto config = from_json(document);
    if (config.is_error()) {
        spdlog::error("Rejected config {}: {}", location.string(), config.error().message);
    }
    return config;
}

} // namespace deltacode::config
