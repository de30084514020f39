#include "logger.hh"
#include <iostream>
#include <termcolor/termcolor.hpp>

namespace opcheck::driver {

Logger::Logger(LogLevel level, ColorMode color)
    : level_(level)
{
    if (color == ColorMode::Always) {
        std::cout << termcolor::colorize;
        std::cerr << termcolor::colorize;
    } else if (color == ColorMode::Never) {
        std::cout << termcolor::nocolorize;
        std::cerr << termcolor::nocolorize;
    }
}

bool Logger::enabled(LogLevel required) const {
    return static_cast<int>(level_) >= static_cast<int>(required);
}

void Logger::write_level(std::ostream& os, diagnostic_level level) {
    switch (level) {
        case diagnostic_level::error:
            os << termcolor::red;
            break;
        case diagnostic_level::warning:
            os << termcolor::yellow;
            break;
        case diagnostic_level::note:
        case diagnostic_level::hint:
            os << termcolor::cyan;
            break;
    }
    os << level_name(level) << ": " << termcolor::reset;
}

void Logger::error(const std::string& message) {
    std::cerr << termcolor::bold;
    write_level(std::cerr, diagnostic_level::error);
    std::cerr << message << "\n";
}

void Logger::warning(const std::string& message) {
    if (!enabled(LogLevel::Normal)) return;

    std::cerr << termcolor::bold;
    write_level(std::cerr, diagnostic_level::warning);
    std::cerr << message << "\n";
}

void Logger::success(const std::string& message) {
    if (!enabled(LogLevel::Normal)) return;

    std::cout << termcolor::bold << termcolor::green << "✓ " << termcolor::reset
              << message << "\n";
}

void Logger::verbose(const std::string& message) {
    if (!enabled(LogLevel::Verbose)) return;

    std::cout << termcolor::cyan << message << termcolor::reset << "\n";
}

void Logger::debug(const std::string& message) {
    if (!enabled(LogLevel::Debug)) return;

    std::cout << termcolor::magenta << "[debug] " << termcolor::reset << message << "\n";
}

void Logger::report_at(const source_pos& pos, diagnostic_level level, const std::string& message) {
    if (level != diagnostic_level::error && !enabled(LogLevel::Normal)) return;

    std::cerr << termcolor::bold
              << (pos.file.empty() ? std::string("<unknown>") : pos.file) << ":"
              << pos.line << ":" << pos.column << ": ";
    write_level(std::cerr, level);
    std::cerr << message << "\n";
}

void Logger::report(const diagnostic& diag) {
    report_at(diag.span.start, diag.level, diag.message + " [" + diag.code + "]");

    for (const auto& span : diag.additional_spans) {
        report_at(span.start, diagnostic_level::note, "related location");
    }
}

} // namespace opcheck::driver
