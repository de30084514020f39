//
// Operation tree
//
// A typed, semantically resolved tree over a method or expression body.
// Each node kind is its own struct; `operation_node` is the closed variant
// over all of them. Matchers dispatch with std::get_if / std::visit, so a new
// kind must be added to the variant, to `operation_kind` (same position) and
// to every exhaustive visitor.
//

#pragma once

#include "source.hh"
#include "symbols.hh"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace opcheck {

struct operation;
using operation_ptr = std::unique_ptr<operation>;

// -----------------------------
// Compile-time constants
// -----------------------------
using constant_value = std::variant<
    std::nullptr_t,
    bool,
    std::int64_t,
    std::string
>;

// -----------------------------
// Statements
// -----------------------------
struct block_op {
    std::vector<operation_ptr> operations;
};

struct expression_statement_op {
    operation_ptr operand;
};

struct variable_declaration_op {
    std::string name;
    operation_ptr initializer;  // may be null
};

struct return_op {
    operation_ptr value;  // null for `return;`
};

struct throw_op {
    operation_ptr exception;  // null for a rethrow
};

struct conditional_op {
    operation_ptr condition;
    operation_ptr when_true;
    operation_ptr when_false;  // may be null
};

// -----------------------------
// Expressions
// -----------------------------
struct literal_op {
};

struct local_reference_op {
    std::string name;
};

struct parameter_reference_op {
    std::string name;
};

struct instance_reference_op {
};

struct field_reference_op {
    const field_symbol* field;
    operation_ptr instance;  // null for static access
};

struct method_reference_op {
    const method_symbol* method;
    operation_ptr instance;
};

struct anonymous_function_op {
    const method_symbol* symbol;
    operation_ptr body;
};

struct delegate_creation_op {
    operation_ptr target;
};

struct simple_assignment_op {
    operation_ptr target;
    operation_ptr value;
};

struct invocation_op {
    const method_symbol* target_method;
    operation_ptr instance;
    std::vector<operation_ptr> arguments;
};

struct object_creation_op {
    std::vector<operation_ptr> arguments;
};

struct conversion_op {
    operation_ptr operand;
};

struct unary_op {
    std::string operator_name;
    operation_ptr operand;
};

struct binary_op {
    std::string operator_name;
    operation_ptr left;
    operation_ptr right;
};

/// Erroneous code the host could not bind. Children are kept so that
/// traversal still sees whatever did bind underneath.
struct invalid_op {
    std::vector<operation_ptr> children;
};

using operation_node = std::variant<
    block_op,
    expression_statement_op,
    variable_declaration_op,
    return_op,
    throw_op,
    conditional_op,
    literal_op,
    local_reference_op,
    parameter_reference_op,
    instance_reference_op,
    field_reference_op,
    method_reference_op,
    anonymous_function_op,
    delegate_creation_op,
    simple_assignment_op,
    invocation_op,
    object_creation_op,
    conversion_op,
    unary_op,
    binary_op,
    invalid_op
>;

/// Node kind tag. Order matches the alternatives of `operation_node`.
enum class operation_kind {
    block,
    expression_statement,
    variable_declaration,
    return_statement,
    throw_statement,
    conditional,
    literal,
    local_reference,
    parameter_reference,
    instance_reference,
    field_reference,
    method_reference,
    anonymous_function,
    delegate_creation,
    simple_assignment,
    invocation,
    object_creation,
    conversion,
    unary,
    binary,
    invalid
};

inline constexpr std::size_t operation_kind_count = static_cast<std::size_t>(operation_kind::invalid) + 1;

static_assert(std::variant_size_v<operation_node> == operation_kind_count,
              "operation_kind must list every alternative of operation_node");

struct operation {
    operation_node node;
    const type_symbol* type = nullptr;          ///< Declared type, null for statements
    std::optional<constant_value> constant;     ///< Set when the host folded the node to a constant
    bool is_implicit = false;                   ///< Synthesized by the host, not written by the user
    source_span span;

    [[nodiscard]] operation_kind kind() const {
        return static_cast<operation_kind>(node.index());
    }
};

/// Direct children of a node in source order. Null slots are skipped.
std::vector<const operation*> children(const operation& op);

const char* operation_kind_name(operation_kind kind);

/// True if the node is folded to the boolean constant `true`.
[[nodiscard]] bool is_constant_true(const operation& op);

} // namespace opcheck
