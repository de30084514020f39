//
// Analysis result queries and printing
//

#include <opcheck/engine.hh>
#include <algorithm>
#include <iterator>
#include <ostream>

namespace opcheck {

bool analysis_result::has_errors() const {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
        [](const auto& d) { return d.level == diagnostic_level::error; });
}

bool analysis_result::has_warnings() const {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
        [](const auto& d) { return d.level == diagnostic_level::warning; });
}

size_t analysis_result::error_count() const {
    return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
        [](const auto& d) { return d.level == diagnostic_level::error; }));
}

size_t analysis_result::warning_count() const {
    return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
        [](const auto& d) { return d.level == diagnostic_level::warning; }));
}

void analysis_result::print_diagnostics(std::ostream& os) const {
    for (const auto& diag : diagnostics) {
        os << diag.format();
    }

    // Summary
    if (!diagnostics.empty()) {
        size_t errors = error_count();
        size_t warnings = warning_count();

        os << "\n";
        if (errors > 0) {
            os << errors << " error" << (errors != 1 ? "s" : "");
        }
        if (warnings > 0) {
            if (errors > 0) os << ", ";
            os << warnings << " warning" << (warnings != 1 ? "s" : "");
        }
        if (errors == 0 && warnings == 0) {
            os << diagnostics.size() << " note" << (diagnostics.size() != 1 ? "s" : "");
        }
        os << " generated.\n";
    }
}

std::vector<diagnostic> analysis_result::get_errors() const {
    std::vector<diagnostic> result;
    std::copy_if(diagnostics.begin(), diagnostics.end(),
                 std::back_inserter(result),
                 [](const auto& d) { return d.level == diagnostic_level::error; });
    return result;
}

std::vector<diagnostic> analysis_result::get_warnings() const {
    std::vector<diagnostic> result;
    std::copy_if(diagnostics.begin(), diagnostics.end(),
                 std::back_inserter(result),
                 [](const auto& d) { return d.level == diagnostic_level::warning; });
    return result;
}

std::vector<diagnostic> analysis_result::get_by_code(const std::string& code) const {
    std::vector<diagnostic> result;
    std::copy_if(diagnostics.begin(), diagnostics.end(),
                 std::back_inserter(result),
                 [&code](const auto& d) { return d.code == code; });
    return result;
}

} // namespace opcheck
