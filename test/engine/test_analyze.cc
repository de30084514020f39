//
// Tests for the analysis engine: scheduling, options, isolation
//

#include <doctest/doctest.h>
#include <opcheck/engine.hh>
#include <opcheck/rules.hh>
#include "test_snapshots.hh"
#include <algorithm>
#include <sstream>
#include <stdexcept>

using namespace opcheck;
using namespace opcheck::test;

namespace {
    // Reports every literal node
    class literal_reporter final : public analyzer {
        public:
            literal_reporter(const char* id, bool enabled_by_default, bool concurrent = true,
                             std::size_t* counter = nullptr)
                : descriptor_(id, "Literal", "Literal found", "Testing",
                              diagnostic_level::warning, enabled_by_default),
                  concurrent_(concurrent),
                  counter_(counter) {
            }

            const rule_descriptor& descriptor() const override { return descriptor_; }
            std::set<operation_kind> interested_kinds() const override { return {operation_kind::literal}; }
            bool supports_concurrent_execution() const override { return concurrent_; }

            std::unique_ptr<compilation_analyzer> on_compilation_start(const semantic_model&) const override {
                return std::make_unique<checker>(descriptor_, counter_);
            }

        private:
            class checker final : public compilation_analyzer {
                public:
                    checker(const rule_descriptor& descriptor, std::size_t* counter)
                        : descriptor_(descriptor),
                          counter_(counter) {
                    }

                    std::optional<diagnostic> evaluate(const operation& op,
                                                       const analysis_context&) const override {
                        if (counter_) {
                            ++*counter_;
                        }
                        return make_diagnostic(descriptor_, op.span);
                    }

                private:
                    const rule_descriptor& descriptor_;
                    std::size_t* counter_;
            };

            const rule_descriptor descriptor_;
            const bool concurrent_;
            std::size_t* counter_;
    };

    class throwing_analyzer final : public analyzer {
        public:
            throwing_analyzer()
                : descriptor_("TEST900", "Throws", "unused", "Testing", diagnostic_level::warning, true) {
            }

            const rule_descriptor& descriptor() const override { return descriptor_; }
            std::set<operation_kind> interested_kinds() const override { return {operation_kind::literal}; }

            std::unique_ptr<compilation_analyzer> on_compilation_start(const semantic_model&) const override {
                return std::make_unique<checker>();
            }

        private:
            class checker final : public compilation_analyzer {
                public:
                    std::optional<diagnostic> evaluate(const operation&, const analysis_context&) const override {
                        throw std::runtime_error("lookup failed");
                    }
            };

            const rule_descriptor descriptor_;
    };

    const char* const TWO_LITERALS = R"(
        (unit "A.cs")
        (type A class)
        (method A Run (body
          (block
            (expr (literal @3:9 1))
            (expr (literal @4:9 2)))))
    )";

    // One unit per file, each with one CA5359 and one CA2216 finding
    std::string many_units(int count) {
        std::string out = R"(
            (type Native.Handle class (implements System.IDisposable))
            (field Native.Handle value System.IntPtr)
            (method Native.Handle Open static (returns System.IntPtr) (dllimport "native"))
        )";

        for (int i = count; i > 0; --i) {
            std::string file = "File" + std::to_string(i) + ".cs";
            std::string type = "T" + std::to_string(i);
            out += "(unit \"" + file + "\")\n";
            out += "(type " + type + " class @1:14 (implements System.IDisposable))\n";
            out += "(field " + type + " handle System.IntPtr)\n";
            out += "(method " + type + " Run (body (block\n";
            out += "  (expr (assign (field_ref " + type + " handle (this)) (call Native.Handle Open)))\n";
            out += "  (expr " + callback_lambda("@9:5", "(block (return (literal true)))") + "))))\n";
        }
        return out;
    }

    analysis_result run_with(const compilation& comp,
                             const std::vector<const analyzer*>& analyzers,
                             const analysis_options& opts = {}) {
        return analyze(comp, analyzers, opts);
    }

    std::vector<std::string> formatted(const analysis_result& result) {
        std::vector<std::string> out;
        for (const auto& d : result.diagnostics) {
            out.push_back(d.format());
        }
        return out;
    }
}

TEST_SUITE("Engine - analyze") {
    TEST_CASE("Builtin rules are active when the framework types exist") {
        auto comp = make_compilation("");
        auto result = analyze(comp);

        CHECK(result.inert_rules.empty());
        REQUIRE(result.active_rules.size() == 2);
        CHECK(result.active_rules[0] == "CA5359");
        CHECK(result.active_rules[1] == "CA2216");
        CHECK(result.diagnostics.empty());
    }

    TEST_CASE("Missing framework types make every builtin rule inert") {
        auto comp = read_snapshot(TWO_LITERALS);
        auto result = analyze(comp);

        CHECK(result.active_rules.empty());
        CHECK(result.inert_rules.size() == 2);
        CHECK(result.diagnostics.empty());
    }

    TEST_CASE("Analysis is deterministic and idempotent") {
        auto comp = make_compilation(many_units(3));

        auto first = analyze(comp);
        auto second = analyze(comp);

        CHECK(first.diagnostics.size() == 6);
        CHECK(formatted(first) == formatted(second));
    }

    TEST_CASE("Diagnostics are ordered by file and position") {
        auto comp = make_compilation(many_units(3));
        auto result = analyze(comp);

        REQUIRE(result.diagnostics.size() == 6);
        CHECK(result.diagnostics[0].span.start.file == "File1.cs");
        CHECK(result.diagnostics[0].code == "CA2216");
        CHECK(result.diagnostics[1].span.start.file == "File1.cs");
        CHECK(result.diagnostics[1].code == "CA5359");
        CHECK(result.diagnostics[5].span.start.file == "File3.cs");
        CHECK(std::is_sorted(result.diagnostics.begin(), result.diagnostics.end(), diagnostic_less));
    }

    TEST_CASE("Parallel evaluation matches sequential evaluation") {
        auto comp = make_compilation(many_units(8));

        analysis_options sequential;
        analysis_options parallel;
        parallel.max_parallelism = 4;

        auto a = analyze(comp, sequential);
        auto b = analyze(comp, parallel);

        CHECK(a.diagnostics.size() == 16);
        CHECK(formatted(a) == formatted(b));
    }

    TEST_CASE("Rules without concurrent support run on the calling thread") {
        std::size_t evaluated = 0;
        literal_reporter reporter("TEST100", true, false, &evaluated);

        auto comp = make_compilation(many_units(6));
        analysis_options opts;
        opts.max_parallelism = 4;

        auto result = run_with(comp, {&reporter}, opts);

        CHECK(evaluated == 6);
        CHECK(result.get_by_code("TEST100").size() == 6);
    }

    TEST_CASE("Disabled rules do not run") {
        auto comp = make_compilation(many_units(1));

        analysis_options opts;
        opts.disabled_rules = {"CA5359"};
        auto result = analyze(comp, opts);

        CHECK(result.get_by_code("CA5359").empty());
        CHECK(result.get_by_code("CA2216").size() == 1);
        CHECK(std::find(result.active_rules.begin(), result.active_rules.end(), "CA5359") ==
              result.active_rules.end());
    }

    TEST_CASE("Rules off by default run only when enabled") {
        literal_reporter reporter("TEST200", false);
        auto comp = read_snapshot(TWO_LITERALS);

        CHECK(run_with(comp, {&reporter}).diagnostics.empty());

        analysis_options opts;
        opts.enabled_rules = {"TEST200"};
        CHECK(run_with(comp, {&reporter}, opts).diagnostics.size() == 2);

        opts.disabled_rules = {"TEST200"};
        CHECK(run_with(comp, {&reporter}, opts).diagnostics.empty());
    }

    TEST_CASE("Warnings as errors") {
        auto comp = make_compilation(many_units(1));

        analysis_options opts;
        opts.warnings_as_errors = true;
        auto result = analyze(comp, opts);

        CHECK(result.has_errors());
        CHECK_FALSE(result.has_warnings());
        CHECK(result.error_count() == 2);
        CHECK(result.get_errors().size() == 2);
    }

    TEST_CASE("Minimum level filters warnings") {
        auto comp = make_compilation(many_units(1));

        analysis_options opts;
        opts.min_level = diagnostic_level::error;
        auto result = analyze(comp, opts);

        CHECK(result.diagnostics.empty());
        CHECK(result.active_rules.size() == 2);
    }

    TEST_CASE("A throwing rule becomes an AD0001 diagnostic") {
        throwing_analyzer thrower;
        literal_reporter reporter("TEST300", true);
        auto comp = read_snapshot(TWO_LITERALS);

        auto result = run_with(comp, {&thrower, &reporter});

        auto failures = result.get_by_code("AD0001");
        REQUIRE(failures.size() == 2);
        CHECK(failures[0].level == diagnostic_level::warning);
        CHECK(failures[0].message ==
              "Analyzer 'TEST900' threw an exception while evaluating a literal node: lookup failed");
        CHECK(failures[0].span.start.line == 3);

        // The other rule still saw every node
        CHECK(result.get_by_code("TEST300").size() == 2);
    }

    TEST_CASE("Cancellation stops the analysis") {
        auto comp = make_compilation(many_units(2));

        cancellation_token token;
        token.cancel();

        analysis_options opts;
        opts.cancellation = &token;

        CHECK_THROWS_AS(analyze(comp, opts), analysis_cancelled);

        opts.max_parallelism = 2;
        CHECK_THROWS_AS(analyze(comp, opts), analysis_cancelled);
    }

    TEST_CASE("An uncancelled token does not interfere") {
        auto comp = make_compilation(many_units(2));

        cancellation_token token;
        analysis_options opts;
        opts.cancellation = &token;

        CHECK(analyze(comp, opts).diagnostics.size() == 4);
    }
}

TEST_SUITE("Engine - analysis_result") {
    TEST_CASE("Print diagnostics with summary") {
        auto comp = make_compilation(many_units(1));
        auto result = analyze(comp);

        std::ostringstream oss;
        result.print_diagnostics(oss);

        std::string output = oss.str();
        CHECK(output.find("File1.cs:1:14: warning: Disposable type 'T1' should declare a finalizer [CA2216]") !=
              std::string::npos);
        CHECK(output.find("File1.cs:9:5: warning: The certificate validation callback always returns true [CA5359]") !=
              std::string::npos);
        CHECK(output.find("2 warnings generated.") != std::string::npos);
    }

    TEST_CASE("Nothing printed without diagnostics") {
        auto comp = make_compilation("");
        std::ostringstream oss;
        analyze(comp).print_diagnostics(oss);

        CHECK(oss.str().empty());
    }

    TEST_CASE("Rule enablement") {
        literal_reporter on("TEST400", true);
        literal_reporter off("TEST401", false);

        analysis_options opts;
        CHECK(is_rule_enabled(on, opts));
        CHECK_FALSE(is_rule_enabled(off, opts));

        opts.enabled_rules = {"TEST401"};
        opts.disabled_rules = {"TEST400"};
        CHECK_FALSE(is_rule_enabled(on, opts));
        CHECK(is_rule_enabled(off, opts));
    }
}
