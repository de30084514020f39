//
// Compilation snapshot and builder
//

#include <opcheck/compilation.hh>
#include <stdexcept>
#include <utility>

namespace opcheck {

// ============================================================================
// compilation
// ============================================================================

const type_symbol* compilation::find_type(const std::string& metadata_name) const {
    auto it = types_by_name_.find(metadata_name);
    return it != types_by_name_.end() ? it->second : nullptr;
}

const operation* compilation::operation_block(const method_symbol& method) const {
    auto it = bodies_.find(&method);
    return it != bodies_.end() ? it->second : nullptr;
}

// ============================================================================
// compilation_builder
// ============================================================================

void compilation_builder::begin_unit(std::string file_path, bool is_generated) {
    compilation_unit unit;
    unit.file_path = std::move(file_path);
    unit.is_generated = is_generated;
    result_.units_.push_back(std::move(unit));
}

compilation_unit& compilation_builder::current_unit() {
    if (result_.units_.empty()) {
        throw std::logic_error("compilation_builder: no compilation unit started");
    }
    return result_.units_.back();
}

type_symbol& compilation_builder::add_type(const std::string& metadata_name, type_kind kind) {
    if (auto* existing = find_type(metadata_name)) {
        return *existing;
    }

    type_symbol& type = result_.types_.emplace_back();
    type.metadata_name = metadata_name;
    type.kind = kind;
    result_.types_by_name_[metadata_name] = &type;
    return type;
}

type_symbol* compilation_builder::find_type(const std::string& metadata_name) {
    auto it = result_.types_by_name_.find(metadata_name);
    return it != result_.types_by_name_.end() ? it->second : nullptr;
}

field_symbol& compilation_builder::add_field(type_symbol& containing_type, std::string name,
                                             const type_symbol* type) {
    field_symbol& field = result_.fields_.emplace_back();
    field.name = std::move(name);
    field.type = type;
    field.containing_type = &containing_type;
    return field;
}

method_symbol& compilation_builder::add_method(type_symbol& containing_type, std::string name) {
    method_symbol& method = result_.methods_.emplace_back();
    method.name = std::move(name);
    method.containing_type = &containing_type;
    return method;
}

method_symbol& compilation_builder::add_lambda(const type_symbol* containing_type) {
    method_symbol& method = result_.methods_.emplace_back();
    method.name = "<lambda>";
    method.kind = method_kind::lambda;
    method.containing_type = containing_type;
    return method;
}

field_symbol* compilation_builder::find_field(const type_symbol& containing_type, const std::string& name) {
    for (auto& field : result_.fields_) {
        if (field.containing_type == &containing_type && field.name == name) {
            return &field;
        }
    }
    return nullptr;
}

method_symbol* compilation_builder::find_method(const type_symbol& containing_type, const std::string& name) {
    for (auto& method : result_.methods_) {
        if (method.kind != method_kind::lambda &&
            method.containing_type == &containing_type && method.name == name) {
            return &method;
        }
    }
    return nullptr;
}

const operation& compilation_builder::set_body(const method_symbol& method, operation_ptr body) {
    if (!body) {
        throw std::logic_error("compilation_builder: null body for method " + method.name);
    }
    if (result_.bodies_.count(&method) != 0) {
        throw std::logic_error("compilation_builder: method " + method.name + " already has a body");
    }

    const operation& root = add_root(std::move(body));
    result_.bodies_[&method] = &root;
    return root;
}

const operation& compilation_builder::add_root(operation_ptr tree) {
    if (!tree) {
        throw std::logic_error("compilation_builder: null root operation");
    }

    compilation_unit& unit = current_unit();
    const operation* root = tree.get();
    result_.trees_.push_back(std::move(tree));
    unit.roots.push_back(root);
    return *root;
}

compilation compilation_builder::build() {
    compilation out = std::move(result_);
    result_ = compilation{};
    return out;
}

// ============================================================================
// Helpers
// ============================================================================

operation_ptr make_operation(operation_node node, source_span span, const type_symbol* type) {
    auto op = std::make_unique<operation>();
    op->node = std::move(node);
    op->span = std::move(span);
    op->type = type;
    return op;
}

} // namespace opcheck
