#pragma once

#include "checker_options.hh"
#include "logger.hh"
#include <opcheck/compilation.hh>
#include <opcheck/engine.hh>

namespace opcheck::driver {

/// Totals over every input of one run
struct CheckSummary {
    std::size_t errors = 0;
    std::size_t warnings = 0;
    std::size_t failed_files = 0;  // Unreadable or malformed snapshots
};

/// Main checker driver
class Checker {
public:
    explicit Checker(const CheckerOptions& options, Logger& logger);

    /// Analyze every input snapshot
    /// A file that cannot be read is reported and skipped
    /// Returns 0 when no errors were reported and every file was checked
    int run();

    const CheckSummary& summary() const { return summary_; }

private:
    /// Check one snapshot; false when it could not be read
    bool check_file(const std::filesystem::path& file);

    /// Stage 1: Read a snapshot file into a compilation
    compilation load_snapshot(const std::filesystem::path& file);

    /// Stage 2: Run the enabled rules
    analysis_result run_analysis(const compilation& comp);

    /// Print diagnostic messages
    void print_diagnostics(const analysis_result& result);

    analysis_options make_analysis_options() const;

    const CheckerOptions& options_;
    Logger& logger_;
    CheckSummary summary_;
};

}  // namespace opcheck::driver
