/**
 * @file deltacode_cli.cpp
 * @brief Compare two JSON scans and print a ranked delta report
 *
 * See deltacode/cli/cli.hpp for options and exit codes.
 */

#include "deltacode/cli/cli.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>

int main(int argc, char* argv[]) {
    // Logs go to stderr so the report can be piped from stdout
    spdlog::set_default_logger(spdlog::stderr_color_mt("deltacode"));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    return deltacode::cli::run(argc, argv, std::cout);
}
