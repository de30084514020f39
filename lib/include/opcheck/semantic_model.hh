//
// Semantic model adapter
//
// Typed queries over a compilation snapshot. Every query is a pure function
// of the snapshot; the adapter holds nothing but a reference to it.
//

#pragma once

#include "compilation.hh"
#include "symbols.hh"
#include <optional>
#include <set>
#include <string>

namespace opcheck {

class semantic_model {
public:
    explicit semantic_model(const compilation& comp)
        : compilation_(comp) {
    }

    [[nodiscard]] const compilation& get_compilation() const { return compilation_; }

    /// @return nullptr when the type is absent from the compilation
    [[nodiscard]] const type_symbol* resolve_type(const std::string& metadata_name) const;

    /// Symbol identity. An absent type never equals anything, itself included.
    [[nodiscard]] static bool types_equal(const type_symbol* a, const type_symbol* b);

    /// Every interface implemented by `type`, directly or through bases.
    [[nodiscard]] static std::set<const type_symbol*> interfaces_of(const type_symbol& type);

    [[nodiscard]] static bool implements(const type_symbol& type, const type_symbol* interface_type);

    [[nodiscard]] static bool has_finalizer(const type_symbol& type);

    [[nodiscard]] static bool is_value_type(const type_symbol& type);

    /// Native entry point data of a method, if it is a platform invoke.
    [[nodiscard]] static std::optional<dll_import_data> interop_marker(const method_symbol& method);

    /// @return nullptr if the method has no accessible body
    [[nodiscard]] const operation* operation_block(const method_symbol& method) const;

private:
    const compilation& compilation_;
};

} // namespace opcheck
