//
// Rule descriptors and diagnostics
//

#pragma once

#include "source.hh"
#include <string>
#include <vector>

namespace opcheck {

/// Severity level for diagnostic messages.
/// Ordered from most to least severe; filtering keeps levels <= min_level.
enum class diagnostic_level {
    error,      ///< Fails the analysis run
    warning,    ///< Default severity of every builtin rule
    note,       ///< Informational
    hint        ///< Hidden unless explicitly requested
};

/// Stable rule identifiers. These are a compatibility surface shared with
/// existing tooling and must never be renumbered.
namespace rule_ids {
    constexpr const char* CA5359_DO_NOT_DISABLE_CERTIFICATE_VALIDATION = "CA5359";
    constexpr const char* CA2216_DISPOSABLE_TYPES_SHOULD_DECLARE_FINALIZER = "CA2216";
    constexpr const char* AD0001_ANALYZER_EXCEPTION = "AD0001";  ///< A rule threw while evaluating a node
}

namespace rule_categories {
    constexpr const char* SECURITY = "Security";
    constexpr const char* USAGE = "Usage";
    constexpr const char* RELIABILITY = "Reliability";
}

namespace rule_tags {
    constexpr const char* TELEMETRY = "Telemetry";
    constexpr const char* PORTED_FXCOP_RULE = "PortedFxCopRule";
}

/// Immutable identity of one rule.
///
/// Built once by the rule that owns it and handed by reference to whoever
/// creates diagnostics. `message_format` may contain positional
/// placeholders `{0}`, `{1}`, ... filled in by make_diagnostic().
class rule_descriptor {
public:
    rule_descriptor(std::string id,
                    std::string title,
                    std::string message_format,
                    std::string category,
                    diagnostic_level default_level,
                    bool enabled_by_default,
                    std::string description = {},
                    std::string help_link = {},
                    std::vector<std::string> custom_tags = {});

    [[nodiscard]] const std::string& id() const { return id_; }
    [[nodiscard]] const std::string& title() const { return title_; }
    [[nodiscard]] const std::string& message_format() const { return message_format_; }
    [[nodiscard]] const std::string& category() const { return category_; }
    [[nodiscard]] diagnostic_level default_level() const { return default_level_; }
    [[nodiscard]] bool enabled_by_default() const { return enabled_by_default_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] const std::string& help_link() const { return help_link_; }
    [[nodiscard]] const std::vector<std::string>& custom_tags() const { return custom_tags_; }

private:
    const std::string id_;
    const std::string title_;
    const std::string message_format_;
    const std::string category_;
    const diagnostic_level default_level_;
    const bool enabled_by_default_;
    const std::string description_;
    const std::string help_link_;
    const std::vector<std::string> custom_tags_;
};

/// A confirmed rule violation.
///
/// Example diagnostic output:
///   Client.cs:14:45: warning: Do not disable certificate validation [CA5359]
struct diagnostic {
    diagnostic_level level;                  ///< Severity
    std::string code;                        ///< Rule id (e.g., "CA5359")
    std::string category;                    ///< Rule category (e.g., "Security")
    std::string message;                     ///< Formatted message
    source_span span;                        ///< Primary location
    std::vector<source_span> additional_spans;  ///< Further locations (e.g., other partial declarations)

    /// Format as "file:line:column: level: message [code]" followed by one
    /// note line per additional location.
    [[nodiscard]] std::string format() const;
};

/// Create the diagnostic for `descriptor` at `span`.
/// @param args Values for the `{n}` placeholders of the message format
diagnostic make_diagnostic(const rule_descriptor& descriptor,
                           const source_span& span,
                           const std::vector<std::string>& args = {},
                           std::vector<source_span> additional_spans = {});

/// Replace `{0}`, `{1}`, ... in `format` with `args`. Unknown or malformed
/// placeholders are left as written.
std::string format_message(const std::string& format, const std::vector<std::string>& args);

const char* level_name(diagnostic_level level);

/// Deterministic ordering used for reporting: file, line, column, code, message.
bool diagnostic_less(const diagnostic& a, const diagnostic& b);

} // namespace opcheck
