//
// Analysis engine
//
// Runs a set of analyzers over one compilation:
//   1. on_compilation_start() for every enabled analyzer; analyzers that
//      return nullptr are inert for this compilation
//   2. every root tree of every unit is walked in pre-order and each node is
//      handed to the analyzers interested in its kind
//   3. diagnostics are filtered (disabled rules, min_level), optionally
//      promoted (warnings_as_errors) and sorted by position
//
// USAGE EXAMPLE:
//   compilation comp = read_snapshot_file("app.snapshot");
//
//   analysis_options opts;
//   opts.disabled_rules = {"CA2216"};
//
//   auto result = analyze(comp, opts);
//   if (result.has_errors()) {
//       result.print_diagnostics(std::cerr);
//   }
//

#pragma once

#include "analyzer.hh"
#include "compilation.hh"
#include "diagnostic.hh"
#include <atomic>
#include <cstddef>
#include <iosfwd>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace opcheck {

/// Cooperative cancellation flag shared between the host and a running analysis.
class cancellation_token {
public:
    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    [[nodiscard]] bool is_cancelled() const { return cancelled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancelled_{false};
};

class analysis_cancelled : public std::runtime_error {
public:
    analysis_cancelled()
        : std::runtime_error("analysis cancelled") {
    }
};

struct analysis_options {
    /// Report every warning as an error.
    bool warnings_as_errors = false;

    /// Rule ids never run (e.g., {"CA2216"}).
    std::set<std::string> disabled_rules;

    /// Rule ids run even if their descriptor is not enabled by default.
    std::set<std::string> enabled_rules;

    /// Minimum diagnostic level to report.
    /// - error: Only show errors
    /// - warning: Show errors and warnings (default)
    /// - note / hint: Show everything up to that level
    diagnostic_level min_level = diagnostic_level::warning;

    /// Number of worker threads evaluating compilation units. 0 and 1 both
    /// mean the calling thread does all the work.
    std::size_t max_parallelism = 1;

    /// Checked before every node evaluation. May be null.
    const cancellation_token* cancellation = nullptr;
};

struct analysis_result {
    /// Diagnostics of all active rules, sorted by position then rule id.
    std::vector<diagnostic> diagnostics;

    /// Rules that ran.
    std::vector<std::string> active_rules;

    /// Rules that were enabled but found a required type missing.
    std::vector<std::string> inert_rules;

    bool has_errors() const;
    bool has_warnings() const;
    size_t error_count() const;
    size_t warning_count() const;

    /// Print every diagnostic followed by a summary line.
    void print_diagnostics(std::ostream& os) const;

    std::vector<diagnostic> get_errors() const;
    std::vector<diagnostic> get_warnings() const;

    /// Diagnostics with the given rule id.
    std::vector<diagnostic> get_by_code(const std::string& code) const;
};

/// Analyze `comp` with the given analyzers.
/// @throws analysis_cancelled if the cancellation token fires; no partial result is returned
analysis_result analyze(const compilation& comp,
                        const std::vector<const analyzer*>& analyzers,
                        const analysis_options& opts = {});

/// Analyze `comp` with every builtin rule.
analysis_result analyze(const compilation& comp, const analysis_options& opts = {});

/// Whether `a` runs under `opts`: not disabled, and enabled by default or explicitly enabled.
bool is_rule_enabled(const analyzer& a, const analysis_options& opts);

} // namespace opcheck
