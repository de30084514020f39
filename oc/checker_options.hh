#pragma once

#include "logger.hh"
#include <cstddef>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace opcheck::driver {

/// Checker options (driver configuration only)
struct CheckerOptions {
    // ========================================================================
    // Input
    // ========================================================================

    std::vector<std::filesystem::path> input_files;  // Snapshot files

    // ========================================================================
    // Rule Selection
    // ========================================================================

    bool warnings_as_errors = false;                 // -Werror
    bool suppress_all_warnings = false;              // -w
    std::set<std::string> disabled_rules;            // -Wno-CA2216
    std::set<std::string> enabled_rules;             // -Wenable=CA2216

    // ========================================================================
    // Execution
    // ========================================================================

    std::size_t jobs = 1;                            // -j N

    // ========================================================================
    // Diagnostic Options
    // ========================================================================

    bool verbose = false;                            // -v, --verbose
    bool quiet = false;                              // -q, --quiet
    ColorMode color = ColorMode::Auto;               // --color=auto|always|never
};

/// Parse command-line arguments
/// Throws std::runtime_error on invalid arguments
CheckerOptions parse_command_line(int argc, char** argv);

/// Print help message
void print_help(const char* program_name);

/// Print version information
void print_version();

/// Print the builtin rules and their default state
void print_rules();

}  // namespace opcheck::driver
