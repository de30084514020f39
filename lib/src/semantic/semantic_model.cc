//
// Semantic model adapter
//

#include <opcheck/semantic_model.hh>

namespace opcheck {

const type_symbol* semantic_model::resolve_type(const std::string& metadata_name) const {
    return compilation_.find_type(metadata_name);
}

bool semantic_model::types_equal(const type_symbol* a, const type_symbol* b) {
    return a != nullptr && a == b;
}

std::set<const type_symbol*> semantic_model::interfaces_of(const type_symbol& type) {
    auto all = all_interfaces(type);
    return {all.begin(), all.end()};
}

bool semantic_model::implements(const type_symbol& type, const type_symbol* interface_type) {
    if (!interface_type) {
        return false;
    }
    for (const type_symbol* iface : all_interfaces(type)) {
        if (iface == interface_type) {
            return true;
        }
    }
    return false;
}

bool semantic_model::has_finalizer(const type_symbol& type) {
    return type.declares_finalizer;
}

bool semantic_model::is_value_type(const type_symbol& type) {
    return type.is_value_type();
}

std::optional<dll_import_data> semantic_model::interop_marker(const method_symbol& method) {
    return method.dll_import;
}

const operation* semantic_model::operation_block(const method_symbol& method) const {
    return compilation_.operation_block(method);
}

} // namespace opcheck
