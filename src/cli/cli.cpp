#include "deltacode/cli/cli.hpp"

#include "deltacode/config/engine_config.hpp"
#include "deltacode/core/version.hpp"
#include "deltacode/delta/engine.hpp"
#include "deltacode/events/components.hpp"
#include "deltacode/events/event_bus.hpp"
#include "deltacode/inventory/loader.hpp"
#include "deltacode/report/json_report.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace deltacode::cli {
namespace {

using config::EngineConfig;
using delta::DeltaEngine;
using events::EventBus;
using events::LoggerComponent;
using events::StatsComponent;
using inventory::InventoryLoader;

struct CliOptions {
    std::string new_path;
    std::string old_path;
    std::string output_path;
    std::string config_path;
    std::optional<std::size_t> workers;
    bool all_delta_types = false;
    bool verbose = false;
    bool help = false;
};

void print_usage(const char* program) {
    std::cerr << "deltacode " << deltacode::version() << "\n"
              << "Usage: " << program << " -n NEW.json -o OLD.json [options]\n"
              << "\n"
              << "  -n, --new FILE         scan of the new codebase (required)\n"
              << "  -o, --old FILE         scan of the old codebase (required)\n"
              << "  -j, --json-file FILE   write the report here instead of stdout\n"
              << "  -c, --config FILE      weights and tracked attributes (JSON)\n"
              << "  -a, --all-delta-types  include unmodified files in the report\n"
              << "  -w, --workers N        match fingerprint buckets on N threads\n"
              << "  -v, --verbose          debug logging\n"
              << "  -h, --help             show this help\n";
}

// Returns nullopt on a usage error (already reported)
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto next_value = [&](const std::string& flag) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                spdlog::error("Option {} requires a value", flag);
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "-n" || arg == "--new") {
            auto value = next_value(arg);
            if (!value) return std::nullopt;
            options.new_path = *value;
        } else if (arg == "-o" || arg == "--old") {
            auto value = next_value(arg);
            if (!value) return std::nullopt;
            options.old_path = *value;
        } else if (arg == "-j" || arg == "--json-file") {
            auto value = next_value(arg);
            if (!value) return std::nullopt;
            options.output_path = *value;
        } else if (arg == "-c" || arg == "--config") {
            auto value = next_value(arg);
            if (!value) return std::nullopt;
            options.config_path = *value;
        } else if (arg == "-w" || arg == "--workers") {
            auto value = next_value(arg);
            if (!value) return std::nullopt;
            char* end = nullptr;
            const unsigned long workers = std::strtoul(value->c_str(), &end, 10);
            if (value->empty() || end == nullptr || *end != '\0') {
                spdlog::error("Invalid worker count: {}", *value);
                return std::nullopt;
            }
            options.workers = static_cast<std::size_t>(workers);
        } else if (arg == "-a" || arg == "--all-delta-types") {
            options.all_delta_types = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            options.help = true;
            return options;
        } else {
            spdlog::error("Unknown option: {}", arg);
            return std::nullopt;
        }
    }

    if (options.new_path.empty() || options.old_path.empty()) {
        spdlog::error("Both --new and --old are required");
        return std::nullopt;
    }
    return options;
}

report::json command_options(const CliOptions& options) {
    report::json json_options = report::json::object();
    json_options["--new"] = options.new_path;
    json_options["--old"] = options.old_path;
    if (!options.output_path.empty()) {
        json_options["--json-file"] = options.output_path;
    }
    if (!options.config_path.empty()) {
        json_options["--config"] = options.config_path;
    }
    if (options.workers) {
        json_options["--workers"] = *options.workers;
    }
    json_options["--all-delta-types"] = options.all_delta_types;
    return json_options;
}

} // namespace

int run(int argc, char* argv[], std::ostream& out) {
    const char* program = argc > 0 ? argv[0] : "deltacode_cli";

    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        print_usage(program);
        return kExitUsage;
    }
    const auto& options = *parsed;
    if (options.help) {
        print_usage(program);
        return kExitOk;
    }
    if (options.verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    EngineConfig config = EngineConfig::defaults();
    if (!options.config_path.empty()) {
        auto loaded = config::load_file(options.config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error().to_string());
            return kExitInputError;
        }
        config = loaded.take();
    }
    if (options.workers) {
        config.worker_threads = *options.workers;
    }

    auto old_snapshot = InventoryLoader::load_file(options.old_path);
    if (old_snapshot.is_error()) {
        spdlog::error("{}", old_snapshot.error().to_string());
        return kExitInputError;
    }
    auto new_snapshot = InventoryLoader::load_file(options.new_path);
    if (new_snapshot.is_error()) {
        spdlog::error("{}", new_snapshot.error().to_string());
        return kExitInputError;
    }

    EventBus bus;
    LoggerComponent logger(bus);
    StatsComponent stats(bus);

    DeltaEngine engine(config, &bus);
    auto report = engine.compare(old_snapshot.value(), new_snapshot.value());
    if (report.is_error()) {
        spdlog::error("{}", report.error().to_string());
        return kExitInputError;
    }

    report::SerializeOptions serialize_options;
    serialize_options.all_delta_types = options.all_delta_types;
    serialize_options.command_options = command_options(options);
    const auto document = report::to_json(report.value(), serialize_options);

    if (options.output_path.empty()) {
        out << document.dump(2) << std::endl;
    } else {
        auto written = report::write_file(document, options.output_path);
        if (written.is_error()) {
            spdlog::error("{}", written.error().to_string());
            return kExitInputError;
        }
        spdlog::info("Report written to {}", options.output_path);
    }

    stats.print_stats();
    return kExitOk;
}

} // namespace deltacode::cli
