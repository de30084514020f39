//
// Diagnostic creation and formatting
//

#include <opcheck/diagnostic.hh>
#include <cctype>
#include <sstream>
#include <tuple>
#include <utility>

namespace opcheck {

// ============================================================================
// Rule Descriptor
// ============================================================================

rule_descriptor::rule_descriptor(std::string id,
                                 std::string title,
                                 std::string message_format,
                                 std::string category,
                                 diagnostic_level default_level,
                                 bool enabled_by_default,
                                 std::string description,
                                 std::string help_link,
                                 std::vector<std::string> custom_tags)
    : id_(std::move(id)),
      title_(std::move(title)),
      message_format_(std::move(message_format)),
      category_(std::move(category)),
      default_level_(default_level),
      enabled_by_default_(enabled_by_default),
      description_(std::move(description)),
      help_link_(std::move(help_link)),
      custom_tags_(std::move(custom_tags)) {
}

// ============================================================================
// Diagnostic Formatting
// ============================================================================

namespace {
    void write_position(std::ostringstream& oss, const source_pos& pos) {
        oss << (pos.file.empty() ? "<unknown>" : pos.file) << ":"
            << pos.line << ":"
            << pos.column << ": ";
    }
}

const char* level_name(diagnostic_level level) {
    switch (level) {
        case diagnostic_level::error: return "error";
        case diagnostic_level::warning: return "warning";
        case diagnostic_level::note: return "note";
        case diagnostic_level::hint: return "hint";
    }
    return "unknown";
}

std::string diagnostic::format() const {
    std::ostringstream oss;

    // Format: file:line:column: level: message [code]
    write_position(oss, span.start);
    oss << level_name(level) << ": " << message;

    if (!code.empty()) {
        oss << " [" << code << "]";
    }

    oss << "\n";

    for (const auto& extra : additional_spans) {
        write_position(oss, extra.start);
        oss << "note: related location\n";
    }

    return oss.str();
}

std::string format_message(const std::string& format, const std::vector<std::string>& args) {
    std::string out;
    out.reserve(format.size());

    for (size_t i = 0; i < format.size(); ++i) {
        if (format[i] != '{') {
            out += format[i];
            continue;
        }

        size_t close = format.find('}', i + 1);
        if (close == std::string::npos || close == i + 1) {
            out += format[i];
            continue;
        }

        bool all_digits = true;
        size_t index = 0;
        for (size_t j = i + 1; j < close; ++j) {
            if (!std::isdigit(static_cast<unsigned char>(format[j]))) {
                all_digits = false;
                break;
            }
            index = index * 10 + static_cast<size_t>(format[j] - '0');
        }

        if (!all_digits || index >= args.size()) {
            out += format[i];
            continue;
        }

        out += args[index];
        i = close;
    }

    return out;
}

diagnostic make_diagnostic(const rule_descriptor& descriptor,
                           const source_span& span,
                           const std::vector<std::string>& args,
                           std::vector<source_span> additional_spans) {
    return diagnostic{
        descriptor.default_level(),
        descriptor.id(),
        descriptor.category(),
        format_message(descriptor.message_format(), args),
        span,
        std::move(additional_spans)
    };
}

bool diagnostic_less(const diagnostic& a, const diagnostic& b) {
    const auto& pa = a.span.start;
    const auto& pb = b.span.start;
    return std::tie(pa.file, pa.line, pa.column, a.code, a.message) <
           std::tie(pb.file, pb.line, pb.column, b.code, b.message);
}

} // namespace opcheck
