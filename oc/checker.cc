#include "checker.hh"
#include <opcheck/snapshot.hh>
#include <string>

namespace opcheck::driver {

namespace {
    std::string join(const std::vector<std::string>& items) {
        std::string out;
        for (const auto& item : items) {
            if (!out.empty()) out += ", ";
            out += item;
        }
        return out;
    }
}

Checker::Checker(const CheckerOptions& options, Logger& logger)
    : options_(options)
    , logger_(logger)
{
}

int Checker::run() {
    summary_ = {};

    for (const auto& input_file : options_.input_files) {
        if (!check_file(input_file)) {
            ++summary_.failed_files;
        }
    }

    if (summary_.errors > 0) {
        logger_.error("Total errors: " + std::to_string(summary_.errors));
    }
    if (summary_.warnings > 0 && !options_.suppress_all_warnings) {
        logger_.warning("Total warnings: " + std::to_string(summary_.warnings));
    }
    if (summary_.failed_files > 0) {
        logger_.error("Files that could not be checked: " + std::to_string(summary_.failed_files));
    }
    if (summary_.errors > 0 || summary_.failed_files > 0) {
        return 1;
    }

    logger_.success("No errors found");
    return 0;
}

bool Checker::check_file(const std::filesystem::path& file) {
    logger_.verbose("Checking: " + file.string());

    try {
        compilation comp = load_snapshot(file);
        analysis_result result = run_analysis(comp);

        print_diagnostics(result);
        summary_.errors += result.error_count();
        summary_.warnings += result.warning_count();
        return true;

    } catch (const snapshot_error& e) {
        source_pos pos(e.file(), static_cast<std::size_t>(e.line()), static_cast<std::size_t>(e.column()));
        logger_.report_at(pos, diagnostic_level::error, e.what());
    } catch (const std::exception& e) {
        logger_.error(file.string() + ": " + e.what());
    }
    return false;
}

// ============================================================================
// Pipeline Stages
// ============================================================================

compilation Checker::load_snapshot(const std::filesystem::path& file) {
    logger_.verbose("Loading: " + file.string());

    compilation comp = read_snapshot_file(file);

    logger_.debug(std::to_string(comp.units().size()) + " unit(s), " +
                  std::to_string(comp.types().size()) + " type(s), " +
                  std::to_string(comp.methods().size()) + " method(s)");
    return comp;
}

analysis_options Checker::make_analysis_options() const {
    analysis_options opts;
    opts.warnings_as_errors = options_.warnings_as_errors;
    opts.disabled_rules = options_.disabled_rules;
    opts.enabled_rules = options_.enabled_rules;
    opts.max_parallelism = options_.jobs;

    if (options_.suppress_all_warnings) {
        opts.min_level = diagnostic_level::error;
    }
    return opts;
}

analysis_result Checker::run_analysis(const compilation& comp) {
    logger_.verbose("Running analysis...");

    analysis_result result = analyze(comp, make_analysis_options());

    if (!result.active_rules.empty()) {
        logger_.verbose("Active rules: " + join(result.active_rules));
    }
    for (const auto& rule : result.inert_rules) {
        logger_.verbose("Rule " + rule + " is inert: a required type is missing from the compilation");
    }

    return result;
}

// ============================================================================
// Utility Methods
// ============================================================================

void Checker::print_diagnostics(const analysis_result& result) {
    for (const auto& diag : result.diagnostics) {
        logger_.report(diag);
    }
}

}  // namespace opcheck::driver
