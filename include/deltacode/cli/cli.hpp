#pragma once

/**
 * @file cli.hpp
 * @brief Command-line front end: compare two JSON scans and write a report
 *
 * USAGE:
 *   deltacode_cli -n new.json -o old.json [-j report.json] [--config cfg.json]
 *                 [--all-delta-types] [--workers N] [--verbose]
 *
 * EXIT CODES:
 *   0 success (or --help), 1 input or configuration error, 2 usage error
 *
 * Logging goes through the default spdlog logger; the caller sets it up.
 */

#include <iosfwd>

namespace deltacode::cli {

constexpr int kExitOk = 0;
constexpr int kExitInputError = 1;
constexpr int kExitUsage = 2;

/**
 * Run one comparison as the command line describes it
 *
 * PARAMETERS:
 * - argc, argv: as passed to main(); argv[0] names the program in usage text
 * - out: receives the report when no --json-file is given
 *
 * EXAMPLE:
 * const char* args[] = {"deltacode_cli", "-o", "old.json", "-n", "new.json"};
 * int code = deltacode::cli::run(5, const_cast<char**>(args), std::cout);
 */
int run(int argc, char* argv[], std::ostream& out);

} // namespace deltacode::cli
