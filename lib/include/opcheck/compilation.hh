//
// Compilation snapshot
//
// A compilation owns every symbol and operation tree produced by the host
// for one compilation unit set. It is built once (through
// compilation_builder or the snapshot reader) and is read-only afterwards,
// so any number of analyzers may query it concurrently.
//

#pragma once

#include "operation.hh"
#include "symbols.hh"
#include <deque>
#include <map>
#include <string>
#include <vector>

namespace opcheck {

/// One source file of the compilation and the operation trees built from it.
struct compilation_unit {
    std::string file_path;
    bool is_generated = false;              ///< Produced by a tool rather than written by the user
    std::vector<const operation*> roots;    ///< Method bodies and initializers, in declaration order
};

class compilation {
public:
    compilation() = default;
    compilation(const compilation&) = delete;
    compilation& operator=(const compilation&) = delete;
    compilation(compilation&&) = default;
    compilation& operator=(compilation&&) = default;

    /// Find a type by fully-qualified metadata name.
    /// @return nullptr if the compilation does not contain the type
    [[nodiscard]] const type_symbol* find_type(const std::string& metadata_name) const;

    /// Top-level operation block of a method (its body).
    /// @return nullptr if the method has no body available (extern, abstract, metadata-only)
    [[nodiscard]] const operation* operation_block(const method_symbol& method) const;

    [[nodiscard]] const std::vector<compilation_unit>& units() const { return units_; }
    [[nodiscard]] const std::deque<type_symbol>& types() const { return types_; }
    [[nodiscard]] const std::deque<field_symbol>& fields() const { return fields_; }
    [[nodiscard]] const std::deque<method_symbol>& methods() const { return methods_; }

private:
    friend class compilation_builder;

    // deques keep element addresses stable while symbols are added
    std::deque<type_symbol> types_;
    std::deque<field_symbol> fields_;
    std::deque<method_symbol> methods_;
    std::vector<operation_ptr> trees_;

    std::map<std::string, type_symbol*> types_by_name_;
    std::map<const method_symbol*, const operation*> bodies_;
    std::vector<compilation_unit> units_;
};

/// Incremental construction of a compilation.
///
/// Example:
///   compilation_builder b;
///   b.begin_unit("R.cs");
///   auto& obj = b.add_type("System.Object", type_kind::class_type);
///   obj.special = special_type::system_object;
///   auto& r = b.add_type("R", type_kind::class_type);
///   auto& open = b.add_method(r, "NativeOpen");
///   open.dll_import = dll_import_data{"native.so", "NativeOpen"};
///   compilation c = b.build();
class compilation_builder {
public:
    compilation_builder() = default;

    /// Start a new compilation unit. Roots added afterwards belong to it.
    void begin_unit(std::string file_path, bool is_generated = false);

    /// Declare a type. Declaring an existing name again returns the existing
    /// symbol (partial declaration); the caller may append a location.
    type_symbol& add_type(const std::string& metadata_name, type_kind kind);

    [[nodiscard]] type_symbol* find_type(const std::string& metadata_name);

    field_symbol& add_field(type_symbol& containing_type, std::string name, const type_symbol* type);

    method_symbol& add_method(type_symbol& containing_type, std::string name);

    /// Symbol for an anonymous function declared inside `containing_type`.
    /// Lambda symbols are not findable by name.
    method_symbol& add_lambda(const type_symbol* containing_type);

    [[nodiscard]] field_symbol* find_field(const type_symbol& containing_type, const std::string& name);
    [[nodiscard]] method_symbol* find_method(const type_symbol& containing_type, const std::string& name);

    /// Attach a body to a method; the body becomes a root of the current unit.
    /// @throws std::logic_error if the method already has a body or no unit was started
    const operation& set_body(const method_symbol& method, operation_ptr body);

    /// Add a root tree that is not a method body (e.g., a field initializer).
    const operation& add_root(operation_ptr tree);

    /// Finish construction. The builder is empty afterwards.
    compilation build();

private:
    compilation_unit& current_unit();

    compilation result_;
};

/// Convenience for building trees by hand.
operation_ptr make_operation(operation_node node,
                             source_span span = {},
                             const type_symbol* type = nullptr);

} // namespace opcheck
