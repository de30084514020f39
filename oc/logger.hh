#pragma once

#include <opcheck/diagnostic.hh>
#include <opcheck/source.hh>
#include <iosfwd>
#include <string>

namespace opcheck::driver {

enum class LogLevel {
    Quiet,   // Errors and rule errors only
    Normal,  // + warnings, summaries
    Verbose, // + pipeline progress
    Debug    // + compilation statistics
};

enum class ColorMode {
    Auto,    // Let termcolor decide per stream
    Always,
    Never
};

/**
 * Console output of the checker (termcolor).
 *
 * Rule diagnostics and failures go to stderr, everything else to stdout.
 * A located line reads "file:line:column: level: message", the same layout
 * opcheck::diagnostic::format() produces.
 */
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Normal,
                    ColorMode color = ColorMode::Auto);

    void error(const std::string& message);
    void warning(const std::string& message);
    void success(const std::string& message);
    void verbose(const std::string& message);
    void debug(const std::string& message);

    /// Print a rule diagnostic and one note per additional location.
    void report(const diagnostic& diag);

    /// Print a message prefixed with `pos`.
    void report_at(const source_pos& pos, diagnostic_level level, const std::string& message);

private:
    LogLevel level_;

    bool enabled(LogLevel required) const;
    static void write_level(std::ostream& os, diagnostic_level level);
};

} // namespace opcheck::driver
