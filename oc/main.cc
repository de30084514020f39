#include <iostream>
#include <string>

#include "checker.hh"
#include "checker_options.hh"
#include "logger.hh"

int main(int argc, char* argv[]) {
    using namespace opcheck::driver;

    try {
        // Handles --help, --version and --list-rules itself
        CheckerOptions opts = parse_command_line(argc, argv);

        LogLevel log_level = LogLevel::Normal;
        if (opts.quiet) log_level = LogLevel::Quiet;
        if (opts.verbose) log_level = LogLevel::Verbose;

        Logger logger(log_level, opts.color);

        Checker checker(opts, logger);
        return checker.run();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
