//
// Operation tree helpers
//

#include <opcheck/operation.hh>
#include <type_traits>

namespace opcheck {

namespace {
    template<class> inline constexpr bool always_false_v = false;

    void push(std::vector<const operation*>& out, const operation_ptr& op) {
        if (op) {
            out.push_back(op.get());
        }
    }

    void push_all(std::vector<const operation*>& out, const std::vector<operation_ptr>& ops) {
        for (const auto& op : ops) {
            push(out, op);
        }
    }
}

std::vector<const operation*> children(const operation& op) {
    std::vector<const operation*> out;

    std::visit([&out](const auto& node) {
        using T = std::decay_t<decltype(node)>;

        if constexpr (std::is_same_v<T, block_op>) {
            push_all(out, node.operations);
        } else if constexpr (std::is_same_v<T, expression_statement_op>) {
            push(out, node.operand);
        } else if constexpr (std::is_same_v<T, variable_declaration_op>) {
            push(out, node.initializer);
        } else if constexpr (std::is_same_v<T, return_op>) {
            push(out, node.value);
        } else if constexpr (std::is_same_v<T, throw_op>) {
            push(out, node.exception);
        } else if constexpr (std::is_same_v<T, conditional_op>) {
            push(out, node.condition);
            push(out, node.when_true);
            push(out, node.when_false);
        } else if constexpr (std::is_same_v<T, literal_op> ||
                             std::is_same_v<T, local_reference_op> ||
                             std::is_same_v<T, parameter_reference_op> ||
                             std::is_same_v<T, instance_reference_op>) {
            // leaves
        } else if constexpr (std::is_same_v<T, field_reference_op>) {
            push(out, node.instance);
        } else if constexpr (std::is_same_v<T, method_reference_op>) {
            push(out, node.instance);
        } else if constexpr (std::is_same_v<T, anonymous_function_op>) {
            push(out, node.body);
        } else if constexpr (std::is_same_v<T, delegate_creation_op>) {
            push(out, node.target);
        } else if constexpr (std::is_same_v<T, simple_assignment_op>) {
            push(out, node.target);
            push(out, node.value);
        } else if constexpr (std::is_same_v<T, invocation_op>) {
            push(out, node.instance);
            push_all(out, node.arguments);
        } else if constexpr (std::is_same_v<T, object_creation_op>) {
            push_all(out, node.arguments);
        } else if constexpr (std::is_same_v<T, conversion_op>) {
            push(out, node.operand);
        } else if constexpr (std::is_same_v<T, unary_op>) {
            push(out, node.operand);
        } else if constexpr (std::is_same_v<T, binary_op>) {
            push(out, node.left);
            push(out, node.right);
        } else if constexpr (std::is_same_v<T, invalid_op>) {
            push_all(out, node.children);
        } else {
            static_assert(always_false_v<T>, "children() does not handle this operation kind");
        }
    }, op.node);

    return out;
}

const char* operation_kind_name(operation_kind kind) {
    switch (kind) {
        case operation_kind::block: return "block";
        case operation_kind::expression_statement: return "expression-statement";
        case operation_kind::variable_declaration: return "variable-declaration";
        case operation_kind::return_statement: return "return";
        case operation_kind::throw_statement: return "throw";
        case operation_kind::conditional: return "conditional";
        case operation_kind::literal: return "literal";
        case operation_kind::local_reference: return "local-reference";
        case operation_kind::parameter_reference: return "parameter-reference";
        case operation_kind::instance_reference: return "instance-reference";
        case operation_kind::field_reference: return "field-reference";
        case operation_kind::method_reference: return "method-reference";
        case operation_kind::anonymous_function: return "anonymous-function";
        case operation_kind::delegate_creation: return "delegate-creation";
        case operation_kind::simple_assignment: return "simple-assignment";
        case operation_kind::invocation: return "invocation";
        case operation_kind::object_creation: return "object-creation";
        case operation_kind::conversion: return "conversion";
        case operation_kind::unary: return "unary";
        case operation_kind::binary: return "binary";
        case operation_kind::invalid: return "invalid";
    }
    return "unknown";
}

bool is_constant_true(const operation& op) {
    if (!op.constant) {
        return false;
    }
    const bool* value = std::get_if<bool>(&*op.constant);
    return value && *value;
}

} // namespace opcheck
