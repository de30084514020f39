#include "checker_options.hh"
#include <opcheck/rules.hh>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace opcheck::driver {

// ============================================================================
// Helper Functions
// ============================================================================

static bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

static std::string get_option_value(const char* arg, const char* prefix) {
    return arg + std::strlen(prefix);
}

static ColorMode parse_color_mode(const std::string& value) {
    if (value == "auto") return ColorMode::Auto;
    if (value == "always") return ColorMode::Always;
    if (value == "never") return ColorMode::Never;

    throw std::runtime_error("Invalid color mode: " + value + " (expected: auto, always, never)");
}

static std::size_t parse_jobs(const std::string& value) {
    std::size_t jobs = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), jobs);
    if (ec != std::errc{} || ptr != value.data() + value.size() || jobs == 0) {
        throw std::runtime_error("Invalid job count: " + value);
    }
    return jobs;
}

// ============================================================================
// Main Parser
// ============================================================================

CheckerOptions parse_command_line(int argc, char** argv) {
    CheckerOptions opts;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Help options
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            std::exit(0);
        }

        // Version
        if (std::strcmp(arg, "--version") == 0) {
            print_version();
            std::exit(0);
        }

        // List rules
        if (std::strcmp(arg, "--list-rules") == 0) {
            print_rules();
            std::exit(0);
        }

        // Verbosity
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
            continue;
        }

        if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
            opts.quiet = true;
            continue;
        }

        if (starts_with(arg, "--color=")) {
            opts.color = parse_color_mode(get_option_value(arg, "--color="));
            continue;
        }

        // Parallelism
        if (starts_with(arg, "-j")) {
            std::string value = get_option_value(arg, "-j");
            if (value.empty() && i + 1 < argc) {
                value = argv[++i];
            }
            if (value.empty()) {
                throw std::runtime_error("Option -j requires argument");
            }
            opts.jobs = parse_jobs(value);
            continue;
        }

        // Rule options
        if (std::strcmp(arg, "-Werror") == 0) {
            opts.warnings_as_errors = true;
            continue;
        }

        if (std::strcmp(arg, "-w") == 0) {
            opts.suppress_all_warnings = true;
            continue;
        }

        if (starts_with(arg, "-Wno-")) {
            opts.disabled_rules.insert(get_option_value(arg, "-Wno-"));
            continue;
        }

        if (starts_with(arg, "-Wenable=")) {
            opts.enabled_rules.insert(get_option_value(arg, "-Wenable="));
            continue;
        }

        // Unknown option starting with dash
        if (arg[0] == '-') {
            throw std::runtime_error(std::string("Unknown option: ") + arg);
        }

        // Input file
        opts.input_files.push_back(arg);
    }

    // Validation
    if (opts.input_files.empty()) {
        throw std::runtime_error("No input files specified");
    }

    if (opts.quiet && opts.verbose) {
        throw std::runtime_error("Cannot specify both -q/--quiet and -v/--verbose");
    }

    return opts;
}

// ============================================================================
// Help and Info Functions
// ============================================================================

void print_help(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <snapshot-files>\n\n";

    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  --version               Show version information\n";
    std::cout << "  --list-rules            List builtin rules\n";
    std::cout << "\n";

    std::cout << "Rules:\n";
    std::cout << "  -w                      Suppress all warnings\n";
    std::cout << "  -Werror                 Treat all warnings as errors\n";
    std::cout << "  -Wno-<id>               Disable a rule\n";
    std::cout << "  -Wenable=<id>           Enable a rule that is off by default\n";
    std::cout << "\n";

    std::cout << "Execution:\n";
    std::cout << "  -j <n>                  Analyze compilation units on <n> threads\n";
    std::cout << "\n";

    std::cout << "Diagnostics:\n";
    std::cout << "  -v, --verbose           Verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (errors only)\n";
    std::cout << "  --color=<mode>          auto, always or never\n";
    std::cout << "\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " app.snapshot\n";
    std::cout << "  " << program_name << " -Werror -Wno-CA2216 app.snapshot\n";
    std::cout << "  " << program_name << " -j 4 lib.snapshot app.snapshot\n";
}

void print_version() {
    std::cout << "opcheck v0.1.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

void print_rules() {
    std::cout << "Builtin rules:\n\n";

    for (const auto& rule : builtin_analyzers()) {
        const rule_descriptor& d = rule->descriptor();

        std::cout << "  " << d.id() << "  " << d.title() << "\n";
        std::cout << "    Category: " << d.category() << "\n";
        std::cout << "    Default: " << (d.enabled_by_default() ? "enabled" : "disabled")
                  << ", " << level_name(d.default_level()) << "\n";
        if (!d.help_link().empty()) {
            std::cout << "    Help: " << d.help_link() << "\n";
        }
        std::cout << "\n";
    }
}

}  // namespace opcheck::driver
