//
// Tests for the checker driver
//

#include <doctest/doctest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include "checker.hh"
#include "test_snapshots.hh"

using namespace opcheck;
using namespace opcheck::driver;

namespace {
    std::filesystem::path write_file(const std::string& name, const std::string& text) {
        auto path = std::filesystem::temp_directory_path() / name;
        std::ofstream out(path);
        out << text;
        return path;
    }

    std::string insecure_client() {
        return std::string(test::FRAMEWORK_TYPES) + R"(
            (unit "Client.cs")
            (type Client class)
            (method Client Configure (body
              (block (expr )" + test::callback_lambda("@14:45", "(block (return (literal true)))") + R"())))
        )";
    }
}

TEST_SUITE("Driver - checker") {
    TEST_CASE("A malformed file does not stop later files") {
        auto bad = write_file("opcheck_checker_bad.snapshot", "(unit \"Bad.cs\"\n");
        auto good = write_file("opcheck_checker_good.snapshot", insecure_client());

        CheckerOptions options;
        options.input_files = {bad, good};
        Logger logger(LogLevel::Quiet, ColorMode::Never);

        Checker checker(options, logger);
        int status = checker.run();

        std::filesystem::remove(bad);
        std::filesystem::remove(good);

        CHECK(status == 1);
        CHECK(checker.summary().failed_files == 1);
        CHECK(checker.summary().warnings == 1);
        CHECK(checker.summary().errors == 0);
    }

    TEST_CASE("Missing files are counted as failures") {
        auto good = write_file("opcheck_checker_only.snapshot", insecure_client());

        CheckerOptions options;
        options.input_files = {"/nonexistent/opcheck.snapshot", good};
        Logger logger(LogLevel::Quiet, ColorMode::Never);

        Checker checker(options, logger);
        int status = checker.run();
        std::filesystem::remove(good);

        CHECK(status == 1);
        CHECK(checker.summary().failed_files == 1);
        CHECK(checker.summary().warnings == 1);
    }

    TEST_CASE("Clean inputs succeed") {
        auto clean = write_file("opcheck_checker_clean.snapshot",
                                std::string(test::FRAMEWORK_TYPES) + "(unit \"Empty.cs\")\n(type Empty class)\n");

        CheckerOptions options;
        options.input_files = {clean};
        Logger logger(LogLevel::Quiet, ColorMode::Never);

        Checker checker(options, logger);
        int status = checker.run();
        std::filesystem::remove(clean);

        CHECK(status == 0);
        CHECK(checker.summary().failed_files == 0);
        CHECK(checker.summary().warnings == 0);
    }
}
