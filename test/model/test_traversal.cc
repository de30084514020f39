//
// Tests for operation tree traversal
//

#include <doctest/doctest.h>
#include <opcheck/traversal.hh>
#include <opcheck/compilation.hh>
#include <string>
#include <vector>

using namespace opcheck;

namespace {
    operation_ptr local(const std::string& name, bool is_implicit = false) {
        auto op = make_operation(local_reference_op{name});
        op->is_implicit = is_implicit;
        return op;
    }

    std::vector<operation_ptr> list(operation_ptr a, operation_ptr b = nullptr, operation_ptr c = nullptr) {
        std::vector<operation_ptr> out;
        out.push_back(std::move(a));
        if (b) out.push_back(std::move(b));
        if (c) out.push_back(std::move(c));
        return out;
    }

    // Names of local references in visiting order; other kinds by kind name
    template<typename Range>
    std::vector<std::string> names(const Range& range) {
        std::vector<std::string> out;
        for (const operation* op : range) {
            if (const auto* ref = std::get_if<local_reference_op>(&op->node)) {
                out.push_back(ref->name);
            } else {
                out.push_back(operation_kind_name(op->kind()));
            }
        }
        return out;
    }

    //   block
    //     expr
    //       binary +  (a, b)
    //     return
    //       c
    operation_ptr sample_tree() {
        auto sum = make_operation(binary_op{"+", local("a"), local("b")});
        auto expr = make_operation(expression_statement_op{std::move(sum)});
        auto ret = make_operation(return_op{local("c")});
        return make_operation(block_op{list(std::move(expr), std::move(ret))});
    }
}

TEST_SUITE("Traversal - descendants") {
    TEST_CASE("Pre-order, excluding the root") {
        auto root = sample_tree();

        std::vector<std::string> expected = {
            "expression-statement", "binary", "a", "b", "return", "c"
        };
        CHECK(names(descendants(*root)) == expected);
    }

    TEST_CASE("descendants_and_self starts with the root") {
        auto root = sample_tree();

        auto visited = names(descendants_and_self(*root));
        REQUIRE(visited.size() == 7);
        CHECK(visited.front() == "block");
    }

    TEST_CASE("Leaf has no descendants") {
        auto leaf = local("x");

        CHECK(names(descendants(*leaf)).empty());
        CHECK(names(descendants_and_self(*leaf)) == std::vector<std::string>{"x"});
    }

    TEST_CASE("Range is restartable") {
        auto root = sample_tree();
        auto range = descendants(*root);

        auto first = names(range);
        auto second = names(range);
        CHECK(first == second);

        // Abandoning a walk midway does not affect a new one
        auto it = range.begin();
        ++it;
        ++it;
        CHECK(names(range) == first);
    }

    TEST_CASE("Null children are skipped") {
        auto cond = make_operation(conditional_op{local("p"), local("q"), nullptr});
        auto ret = make_operation(return_op{});

        CHECK(names(descendants(*cond)) == std::vector<std::string>{"p", "q"});
        CHECK(names(descendants(*ret)).empty());
    }

    TEST_CASE("Invalid nodes keep their children visible") {
        auto bad = make_operation(invalid_op{list(local("x"), local("y"))});

        CHECK(names(descendants(*bad)) == std::vector<std::string>{"x", "y"});
    }
}

TEST_SUITE("Traversal - without_implicit") {
    TEST_CASE("Implicit nodes are dropped, order kept") {
        auto root = make_operation(block_op{list(local("a"), local("hidden", true), local("b"))});

        CHECK(names(without_implicit(descendants(*root))) == std::vector<std::string>{"a", "b"});
    }

    TEST_CASE("Children of an implicit node are still produced") {
        auto wrapper = make_operation(conversion_op{local("inner")});
        wrapper->is_implicit = true;
        auto root = make_operation(return_op{std::move(wrapper)});

        CHECK(names(without_implicit(descendants(*root))) == std::vector<std::string>{"inner"});
    }

    TEST_CASE("All implicit yields an empty range") {
        auto root = make_operation(block_op{list(local("x", true), local("y", true))});

        auto filtered = without_implicit(descendants(*root));
        CHECK(filtered.begin() == filtered.end());
    }

    TEST_CASE("Implicit root is filtered from descendants_and_self") {
        auto root = make_operation(block_op{list(local("a"))});
        root->is_implicit = true;

        CHECK(names(without_implicit(descendants_and_self(*root))) == std::vector<std::string>{"a"});
    }
}
