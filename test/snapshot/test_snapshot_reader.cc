//
// Tests for the snapshot reader
//

#include <doctest/doctest.h>
#include <opcheck/snapshot.hh>
#include <opcheck/traversal.hh>
#include <filesystem>
#include <fstream>
#include <string>

using namespace opcheck;

namespace {
    const type_symbol& type_of(const compilation& comp, const char* name) {
        const type_symbol* t = comp.find_type(name);
        REQUIRE(t != nullptr);
        return *t;
    }

    const method_symbol* find_method(const compilation& comp, const std::string& name) {
        for (const auto& m : comp.methods()) {
            if (m.name == name) {
                return &m;
            }
        }
        return nullptr;
    }

    void check_error(const std::string& text, int line, int column, const std::string& fragment) {
        try {
            (void) read_snapshot(text, "bad.snapshot");
            FAIL("expected snapshot_error");
        } catch (const snapshot_error& e) {
            CHECK(e.file() == "bad.snapshot");
            CHECK(e.line() == line);
            CHECK(e.column() == column);
            CHECK(std::string(e.what()).find(fragment) != std::string::npos);
        }
    }
}

TEST_SUITE("Snapshot - reading") {
    TEST_CASE("Types, fields and methods") {
        auto comp = read_snapshot(R"(
            ; framework
            (type System.Object class (special object))
            (type System.Boolean struct (special boolean))
            (type System.IDisposable interface)
            (type System.IntPtr struct (special intptr))

            (unit "R.cs")
            (type Native.Base class @2:14)
            (type Native.R class @3:14 (base Native.Base) (implements System.IDisposable) finalizer)
            (field Native.R handle System.IntPtr static @5:20)
            (method Native.R Open static @7:17 (params (System.Boolean force)) (returns System.IntPtr)
                    (dllimport "libnative.so" "native_open"))
            (method Native.R Close (dllimport "libnative.so"))
        )");

        const auto& r = type_of(comp, "Native.R");
        CHECK(r.kind == type_kind::class_type);
        CHECK(r.base_type == &type_of(comp, "Native.Base"));
        REQUIRE(r.interfaces.size() == 1);
        CHECK(r.interfaces[0] == &type_of(comp, "System.IDisposable"));
        CHECK(r.declares_finalizer);
        REQUIRE(r.locations.size() == 1);
        CHECK(r.locations[0].start.file == "R.cs");
        CHECK(r.locations[0].start.line == 3);
        CHECK(r.locations[0].start.column == 14);

        CHECK(type_of(comp, "System.IntPtr").special == special_type::system_intptr);
        CHECK(type_of(comp, "System.IntPtr").is_value_type());

        REQUIRE(comp.fields().size() == 1);
        const auto& handle = comp.fields()[0];
        CHECK(handle.name == "handle");
        CHECK(handle.is_static);
        CHECK(handle.containing_type == &r);
        CHECK(handle.type == &type_of(comp, "System.IntPtr"));

        const auto* open = find_method(comp, "Open");
        REQUIRE(open != nullptr);
        CHECK(open->is_static);
        CHECK(open->return_type == &type_of(comp, "System.IntPtr"));
        REQUIRE(open->parameters.size() == 1);
        CHECK(open->parameters[0].name == "force");
        REQUIRE(open->dll_import.has_value());
        CHECK(open->dll_import->module_name == "libnative.so");
        CHECK(open->dll_import->entry_point == "native_open");

        const auto* close = find_method(comp, "Close");
        REQUIRE(close != nullptr);
        REQUIRE(close->dll_import.has_value());
        CHECK(close->dll_import->entry_point == "Close");
    }

    TEST_CASE("Forward references resolve") {
        auto comp = read_snapshot(R"(
            (unit "A.cs")
            (method A Run (body (block (expr (call B Helper)))))
            (type A class (base B))
            (type B class)
            (method B Helper static)
        )");

        const auto* run = find_method(comp, "Run");
        REQUIRE(run != nullptr);
        const operation* body = comp.operation_block(*run);
        REQUIRE(body != nullptr);

        bool found_call = false;
        for (const operation* op : descendants(*body)) {
            if (const auto* call = std::get_if<invocation_op>(&op->node)) {
                found_call = call->target_method == find_method(comp, "Helper");
            }
        }
        CHECK(found_call);
    }

    TEST_CASE("Partial types collect locations from every unit") {
        auto comp = read_snapshot(R"(
            (unit "A.1.cs")
            (type A class @1:15)
            (unit "A.2.cs")
            (type A class @4:15 (implements I))
            (type I interface)
        )");

        const auto& a = type_of(comp, "A");
        REQUIRE(a.locations.size() == 2);
        CHECK(a.locations[0].start.file == "A.1.cs");
        CHECK(a.locations[1].start.file == "A.2.cs");
        CHECK(a.locations[1].start.line == 4);
        CHECK(a.interfaces.size() == 1);
        CHECK(comp.units().size() == 2);
    }

    TEST_CASE("Operations carry attributes") {
        auto comp = read_snapshot(R"(
            (type System.Boolean struct (special boolean))
            (unit "Ops.cs" generated)
            (type Ops class)
            (field Ops flag System.Boolean)
            (method Ops Run (body
              (block @2:5
                (local ok (literal @3:14 true))
                (expr (assign implicit (field_ref Ops flag (this)) (literal "text")))
                (if (binary Equals (constant true) (literal 1) (literal 1))
                  (return (literal null))
                  (throw))
                (return (invalid (local_ref ok) (param_ref x))))))
        )");

        REQUIRE(comp.units().size() == 1);
        const auto& unit = comp.units()[0];
        CHECK(unit.file_path == "Ops.cs");
        CHECK(unit.is_generated);
        REQUIRE(unit.roots.size() == 1);

        const operation& block = *unit.roots[0];
        CHECK(block.kind() == operation_kind::block);
        CHECK(block.span.start.line == 2);
        CHECK(block.span.start.file == "Ops.cs");

        std::vector<operation_kind> kinds;
        const operation* literal_true = nullptr;
        const operation* assignment = nullptr;
        const operation* comparison = nullptr;
        const operation* flag = nullptr;
        for (const operation* op : descendants(block)) {
            kinds.push_back(op->kind());
            if (op->kind() == operation_kind::literal && !literal_true) literal_true = op;
            if (op->kind() == operation_kind::simple_assignment) assignment = op;
            if (op->kind() == operation_kind::binary) comparison = op;
            if (op->kind() == operation_kind::field_reference) flag = op;
        }

        std::vector<operation_kind> expected = {
            operation_kind::variable_declaration, operation_kind::literal,
            operation_kind::expression_statement, operation_kind::simple_assignment,
            operation_kind::field_reference, operation_kind::instance_reference, operation_kind::literal,
            operation_kind::conditional, operation_kind::binary, operation_kind::literal, operation_kind::literal,
            operation_kind::return_statement, operation_kind::literal, operation_kind::throw_statement,
            operation_kind::return_statement, operation_kind::invalid,
            operation_kind::local_reference, operation_kind::parameter_reference
        };
        CHECK(kinds == expected);

        REQUIRE(literal_true != nullptr);
        CHECK(is_constant_true(*literal_true));
        CHECK(literal_true->span.start.column == 14);

        REQUIRE(assignment != nullptr);
        CHECK(assignment->is_implicit);

        REQUIRE(comparison != nullptr);
        CHECK(is_constant_true(*comparison));
        CHECK(std::get<binary_op>(comparison->node).operator_name == "Equals");

        REQUIRE(flag != nullptr);
        CHECK(flag->type == comp.find_type("System.Boolean"));
    }

    TEST_CASE("Lambdas get their own symbol") {
        auto comp = read_snapshot(R"(
            (type System.Boolean struct (special boolean))
            (type System.Object class (special object))
            (unit "L.cs")
            (type L class)
            (method L Run (body
              (block (expr (delegate (lambda @4:20 (params (System.Object o)) (returns System.Boolean)
                (return (literal false))))))))
        )");

        const method_symbol* lambda = nullptr;
        for (const auto& m : comp.methods()) {
            if (m.kind == method_kind::lambda) lambda = &m;
        }
        REQUIRE(lambda != nullptr);
        CHECK(lambda->containing_type == comp.find_type("L"));
        CHECK(lambda->return_type == comp.find_type("System.Boolean"));
        REQUIRE(lambda->parameters.size() == 1);
        CHECK(lambda->parameters[0].type == comp.find_type("System.Object"));
        CHECK(lambda->location.start.line == 4);
    }

    TEST_CASE("String escapes") {
        auto comp = read_snapshot(R"(
            (unit "S.cs")
            (type S class)
            (method S Run (body (return (literal "a\"b\\c\n"))))
        )");

        const operation& ret = *comp.units()[0].roots[0];
        const operation& value = *std::get<return_op>(ret.node).value;
        REQUIRE(value.constant.has_value());
        CHECK(std::get<std::string>(*value.constant) == "a\"b\\c\n");
    }

    TEST_CASE("Reading from a file") {
        auto path = std::filesystem::temp_directory_path() / "opcheck_reader_test.snapshot";
        {
            std::ofstream out(path);
            out << "(unit \"F.cs\")\n(type F class @1:7)\n";
        }

        auto comp = read_snapshot_file(path);
        std::filesystem::remove(path);

        REQUIRE(comp.units().size() == 1);
        CHECK(comp.units()[0].file_path == "F.cs");
        CHECK(type_of(comp, "F").locations.size() == 1);
    }

    TEST_CASE("Missing file") {
        CHECK_THROWS_AS(read_snapshot_file("/nonexistent/opcheck.snapshot"), std::runtime_error);
    }

    TEST_CASE("Deeply nested expressions") {
        constexpr int depth = 200;

        std::string chain;
        for (int i = 0; i < depth; ++i) {
            chain += "(binary Add (literal 1) ";
        }
        chain += "(literal 1)";
        chain += std::string(depth, ')');

        auto comp = read_snapshot(R"(
            (type System.Int32 struct (special int32))
            (unit "Deep.cs")
            (type Deep class)
            (field Deep total System.Int32)
            (method Deep Sum (body
              (block (expr (assign (field_ref Deep total (this)) )" + chain + R"()))))
        )");

        REQUIRE(comp.units().size() == 1);
        REQUIRE(comp.units()[0].roots.size() == 1);

        int binaries = 0;
        int literals = 0;
        for (const operation* op : descendants(*comp.units()[0].roots[0])) {
            if (op->kind() == operation_kind::binary) ++binaries;
            if (op->kind() == operation_kind::literal) ++literals;
        }
        CHECK(binaries == depth);
        CHECK(literals == depth + 1);
    }

    TEST_CASE("Empty input") {
        auto comp = read_snapshot("  ; nothing here\n");
        CHECK(comp.units().empty());
        CHECK(comp.types().empty());
    }
}

TEST_SUITE("Snapshot - errors") {
    TEST_CASE("Syntax errors") {
        check_error("(type A class", 1, 14, "Syntax error");
        check_error("(type A class))", 1, 15, "Syntax error");
    }

    TEST_CASE("Lexical errors") {
        check_error("(type A class)\n  (type # class)", 2, 9, "Unexpected character");
        check_error("(literal \"bad\\q\")", 1, 10, "escape");
        check_error("(literal 99999999999999999999)", 1, 10, "out of range");
    }

    TEST_CASE("Unknown names") {
        check_error("(type A class (base B))", 1, 21, "unknown type 'B'");
        check_error("(unit \"A.cs\")\n(type A class)\n(method A Run (body (call A Missing)))", 3, 29,
                    "unknown method 'A.Missing'");
        check_error("(unit \"A.cs\")\n(type A class)\n(method A Run (body (field_ref A f)))", 3, 34,
                    "unknown field 'A.f'");
        check_error("(unit \"A.cs\")\n(type A class)\n(method A Run (body (frobnicate)))", 3, 22,
                    "unknown operation 'frobnicate'");
        check_error("(module A)", 1, 2, "unknown top-level form 'module'");
    }

    TEST_CASE("Duplicates and conflicts") {
        check_error("(type A class)\n(method A Run)\n(method A Run)", 3, 11, "overloads are not supported");
        check_error("(type A class)\n(type B class)\n(field A f B)\n(field A f B)", 4, 10, "duplicate field");
        check_error("(type A class)\n(type A struct)", 2, 9, "redeclared");
        check_error("(unit \"A.cs\")\n(type A class)\n(method A Run (body (block)) (body (block)))", 3, 30,
                    "already has a body");
    }

    TEST_CASE("Code outside of a unit") {
        check_error("(type A class)\n(method A Run (body (block)))", 2, 15, "outside of a compilation unit");
    }

    TEST_CASE("Wrong operand counts") {
        check_error("(unit \"A.cs\")\n(type A class)\n(method A Run (body (assign (this))))", 3, 21,
                    "wrong number of operands for 'assign'");
    }
}
