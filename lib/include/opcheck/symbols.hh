//
// Symbols of the semantic model
//
// Symbols are owned by a compilation and refer to each other through
// non-owning const pointers. They are immutable once the compilation
// has been built.
//

#pragma once

#include "source.hh"
#include <optional>
#include <string>
#include <vector>

namespace opcheck {

enum class type_kind {
    class_type,
    struct_type,
    interface_type,
    enum_type,
    delegate_type
};

/// Classification of types the runtime treats specially.
enum class special_type {
    none,
    system_object,
    system_boolean,
    system_void,
    system_int32,
    system_string,
    system_intptr,
    system_uintptr
};

struct type_symbol {
    std::string metadata_name;                        ///< Fully-qualified metadata name, e.g. "System.IDisposable"
    type_kind kind = type_kind::class_type;
    special_type special = special_type::none;
    const type_symbol* base_type = nullptr;           ///< Direct base class, nullptr for roots and interfaces
    std::vector<const type_symbol*> interfaces;       ///< Directly declared interfaces
    std::vector<source_span> locations;               ///< One entry per declaration (partial types have several)
    bool declares_finalizer = false;

    [[nodiscard]] bool is_value_type() const {
        return kind == type_kind::struct_type || kind == type_kind::enum_type;
    }

    /// Simple name: the part after the last '.'
    [[nodiscard]] std::string name() const;
};

struct field_symbol {
    std::string name;
    const type_symbol* type = nullptr;
    const type_symbol* containing_type = nullptr;
    bool is_static = false;
    source_span location;
};

struct parameter_symbol {
    std::string name;
    const type_symbol* type = nullptr;
};

/// Native entry point data attached to a method declared as a platform invoke.
struct dll_import_data {
    std::string module_name;
    std::string entry_point;
};

enum class method_kind {
    ordinary,
    lambda
};

struct method_symbol {
    std::string name;
    method_kind kind = method_kind::ordinary;
    const type_symbol* containing_type = nullptr;
    const type_symbol* return_type = nullptr;
    std::vector<parameter_symbol> parameters;
    bool is_static = false;
    std::optional<dll_import_data> dll_import;
    source_span location;
};

/// All interfaces of a type: declared ones, those of its bases, and the
/// interfaces those interfaces inherit. Each interface appears once, in
/// discovery order.
std::vector<const type_symbol*> all_interfaces(const type_symbol& type);

const char* type_kind_name(type_kind kind);

} // namespace opcheck
