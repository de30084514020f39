//
// Snapshot reader
//
// Interprets the form tree in three passes over the top-level forms:
//   1. declare types (names, kinds, locations, special classification)
//   2. resolve type relations, fields and method signatures
//   3. open compilation units and build method bodies and field initializers
// Types and members may therefore be referenced before they are declared.
//

#include <opcheck/snapshot.hh>
#include "snapshot/parser.hh"

#include <algorithm>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

namespace opcheck {

namespace {
    using snapshot::form;
    using snapshot::form_kind;

    [[noreturn]] void fail(const form& f, const std::string& message) {
        throw snapshot_error(message, f.pos.file, static_cast<int>(f.pos.line), static_cast<int>(f.pos.column));
    }

    const form& head_of(const form& list) {
        if (list.kind != form_kind::list || list.items.empty() || list.items.front().kind != form_kind::symbol) {
            fail(list, "expected a form starting with a symbol");
        }
        return list.items.front();
    }

    bool has_head(const form& f, const char* name) {
        return f.kind == form_kind::list && !f.items.empty() && f.items.front().is_symbol(name);
    }

    const std::string& symbol_at(const form& list, std::size_t index, const char* what) {
        if (index >= list.items.size() || list.items[index].kind != form_kind::symbol) {
            fail(list, std::string("expected ") + what);
        }
        return list.items[index].text;
    }

    const std::string& string_at(const form& list, std::size_t index, const char* what) {
        if (index >= list.items.size() || list.items[index].kind != form_kind::string) {
            fail(list, std::string("expected ") + what);
        }
        return list.items[index].text;
    }

    type_kind parse_type_kind(const form& f) {
        static const std::map<std::string_view, type_kind> kinds = {
            {"class", type_kind::class_type},
            {"struct", type_kind::struct_type},
            {"interface", type_kind::interface_type},
            {"enum", type_kind::enum_type},
            {"delegate", type_kind::delegate_type}
        };

        auto it = f.kind == form_kind::symbol ? kinds.find(f.text) : kinds.end();
        if (it == kinds.end()) {
            fail(f, "expected type kind (class, struct, interface, enum or delegate)");
        }
        return it->second;
    }

    special_type parse_special_type(const form& f) {
        static const std::map<std::string_view, special_type> specials = {
            {"object", special_type::system_object},
            {"boolean", special_type::system_boolean},
            {"void", special_type::system_void},
            {"int32", special_type::system_int32},
            {"string", special_type::system_string},
            {"intptr", special_type::system_intptr},
            {"uintptr", special_type::system_uintptr}
        };

        auto it = f.kind == form_kind::symbol ? specials.find(f.text) : specials.end();
        if (it == specials.end()) {
            fail(f, "unknown special type");
        }
        return it->second;
    }

    constant_value parse_constant(const form& f) {
        switch (f.kind) {
            case form_kind::integer:
                return f.integer;
            case form_kind::string:
                return f.text;
            case form_kind::symbol:
                if (f.text == "true") return true;
                if (f.text == "false") return false;
                if (f.text == "null") return nullptr;
                break;
            default:
                break;
        }
        fail(f, "expected constant (true, false, null, integer or string)");
    }

    class snapshot_reader {
        public:
            explicit snapshot_reader(std::string source_name)
                : source_name_(std::move(source_name)) {
            }

            compilation read(const std::vector<form>& forms) {
                declare_types(forms);
                resolve_members(forms);
                build_bodies(forms);
                return builder_.build();
            }

        private:
            // ----------------------------------------------------------------
            // Helpers
            // ----------------------------------------------------------------

            source_span span_of(const form& location) const {
                source_span span;
                span.start = source_pos{current_file_,
                                        static_cast<std::size_t>(location.integer),
                                        static_cast<std::size_t>(location.column)};
                return span;
            }

            const type_symbol* resolve_type(const form& f) {
                if (f.kind != form_kind::symbol) {
                    fail(f, "expected type name");
                }
                const type_symbol* type = builder_.find_type(f.text);
                if (!type) {
                    fail(f, "unknown type '" + f.text + "'");
                }
                return type;
            }

            type_symbol& resolve_declared_type(const form& list, std::size_t index) {
                const std::string& name = symbol_at(list, index, "type name");
                type_symbol* type = builder_.find_type(name);
                if (!type) {
                    fail(list.items[index], "unknown type '" + name + "'");
                }
                return *type;
            }

            void enter_unit(const form& f) {
                current_file_ = string_at(f, 1, "unit file name");
            }

            // ----------------------------------------------------------------
            // Pass 1: types
            // ----------------------------------------------------------------

            void declare_types(const std::vector<form>& forms) {
                current_file_ = source_name_;

                for (const auto& f : forms) {
                    const form& head = head_of(f);

                    if (head.is_symbol("unit")) {
                        enter_unit(f);
                    } else if (head.is_symbol("type")) {
                        declare_type(f);
                    } else if (!head.is_symbol("field") && !head.is_symbol("method")) {
                        fail(head, "unknown top-level form '" + head.text + "'");
                    }
                }
            }

            void declare_type(const form& f) {
                const std::string& name = symbol_at(f, 1, "type name");
                if (f.items.size() < 3) {
                    fail(f, "expected type kind");
                }
                type_kind kind = parse_type_kind(f.items[2]);

                bool redeclared = builder_.find_type(name) != nullptr;
                type_symbol& type = builder_.add_type(name, kind);
                if (redeclared && type.kind != kind) {
                    fail(f.items[2], "type '" + name + "' redeclared as " + type_kind_name(kind));
                }

                for (std::size_t i = 3; i < f.items.size(); ++i) {
                    const form& item = f.items[i];

                    if (item.kind == form_kind::location) {
                        type.locations.push_back(span_of(item));
                    } else if (item.is_symbol("finalizer")) {
                        type.declares_finalizer = true;
                    } else if (has_head(item, "special")) {
                        if (item.items.size() != 2) {
                            fail(item, "expected (special NAME)");
                        }
                        type.special = parse_special_type(item.items[1]);
                    } else if (!has_head(item, "base") && !has_head(item, "implements")) {
                        fail(item, "unexpected item in type declaration");
                    }
                }
            }

            // ----------------------------------------------------------------
            // Pass 2: relations, fields, signatures
            // ----------------------------------------------------------------

            void resolve_members(const std::vector<form>& forms) {
                current_file_ = source_name_;

                for (const auto& f : forms) {
                    const form& head = head_of(f);

                    if (head.is_symbol("unit")) {
                        enter_unit(f);
                    } else if (head.is_symbol("type")) {
                        resolve_relations(f);
                    } else if (head.is_symbol("field")) {
                        declare_field(f);
                    } else if (head.is_symbol("method")) {
                        declare_method(f);
                    }
                }
            }

            void resolve_relations(const form& f) {
                type_symbol& type = resolve_declared_type(f, 1);

                for (std::size_t i = 3; i < f.items.size(); ++i) {
                    const form& item = f.items[i];

                    if (has_head(item, "base")) {
                        if (item.items.size() != 2) {
                            fail(item, "expected (base TYPE)");
                        }
                        const type_symbol* base = resolve_type(item.items[1]);
                        if (type.base_type && type.base_type != base) {
                            fail(item, "conflicting base type for '" + type.metadata_name + "'");
                        }
                        type.base_type = base;
                    } else if (has_head(item, "implements")) {
                        for (std::size_t k = 1; k < item.items.size(); ++k) {
                            const type_symbol* iface = resolve_type(item.items[k]);
                            if (std::find(type.interfaces.begin(), type.interfaces.end(), iface) ==
                                type.interfaces.end()) {
                                type.interfaces.push_back(iface);
                            }
                        }
                    }
                }
            }

            void declare_field(const form& f) {
                type_symbol& owner = resolve_declared_type(f, 1);
                const std::string& name = symbol_at(f, 2, "field name");
                if (f.items.size() < 4) {
                    fail(f, "expected field type");
                }
                const type_symbol* field_type = resolve_type(f.items[3]);

                if (builder_.find_field(owner, name)) {
                    fail(f.items[2], "duplicate field '" + owner.metadata_name + "." + name + "'");
                }

                field_symbol& field = builder_.add_field(owner, name, field_type);

                for (std::size_t i = 4; i < f.items.size(); ++i) {
                    const form& item = f.items[i];

                    if (item.is_symbol("static")) {
                        field.is_static = true;
                    } else if (item.kind == form_kind::location) {
                        field.location = span_of(item);
                    } else if (!has_head(item, "init")) {
                        fail(item, "unexpected item in field declaration");
                    }
                }
            }

            void declare_method(const form& f) {
                type_symbol& owner = resolve_declared_type(f, 1);
                const std::string& name = symbol_at(f, 2, "method name");

                if (builder_.find_method(owner, name)) {
                    fail(f.items[2], "duplicate method '" + owner.metadata_name + "." + name +
                                     "' (overloads are not supported)");
                }

                method_symbol& method = builder_.add_method(owner, name);

                for (std::size_t i = 3; i < f.items.size(); ++i) {
                    const form& item = f.items[i];

                    if (item.kind == form_kind::location) {
                        method.location = span_of(item);
                    } else if (item.is_symbol("static")) {
                        method.is_static = true;
                    } else if (has_head(item, "params")) {
                        method.parameters = read_parameters(item);
                    } else if (has_head(item, "returns")) {
                        method.return_type = read_return_type(item);
                    } else if (has_head(item, "dllimport")) {
                        dll_import_data data;
                        data.module_name = string_at(item, 1, "dll module name");
                        data.entry_point = item.items.size() > 2 ? string_at(item, 2, "entry point") : name;
                        method.dll_import = std::move(data);
                    } else if (!has_head(item, "body")) {
                        fail(item, "unexpected item in method declaration");
                    }
                }
            }

            std::vector<parameter_symbol> read_parameters(const form& params) {
                std::vector<parameter_symbol> out;
                for (std::size_t i = 1; i < params.items.size(); ++i) {
                    const form& p = params.items[i];
                    if (p.kind != form_kind::list || p.items.size() != 2) {
                        fail(p, "expected (TYPE name)");
                    }

                    parameter_symbol param;
                    param.type = resolve_type(p.items[0]);
                    param.name = symbol_at(p, 1, "parameter name");
                    out.push_back(std::move(param));
                }
                return out;
            }

            const type_symbol* read_return_type(const form& returns) {
                if (returns.items.size() != 2) {
                    fail(returns, "expected (returns TYPE)");
                }
                return resolve_type(returns.items[1]);
            }

            // ----------------------------------------------------------------
            // Pass 3: units and bodies
            // ----------------------------------------------------------------

            void build_bodies(const std::vector<form>& forms) {
                current_file_ = source_name_;
                bool in_unit = false;

                for (const auto& f : forms) {
                    const form& head = head_of(f);

                    if (head.is_symbol("unit")) {
                        enter_unit(f);
                        bool generated = false;
                        for (std::size_t i = 2; i < f.items.size(); ++i) {
                            if (!f.items[i].is_symbol("generated")) {
                                fail(f.items[i], "unexpected item in unit declaration");
                            }
                            generated = true;
                        }
                        builder_.begin_unit(current_file_, generated);
                        in_unit = true;
                        continue;
                    }

                    const bool is_field = head.is_symbol("field");
                    if (!is_field && !head.is_symbol("method")) {
                        continue;
                    }

                    for (const auto& item : f.items) {
                        if (!has_head(item, is_field ? "init" : "body")) {
                            continue;
                        }
                        if (!in_unit) {
                            fail(item, "code outside of a compilation unit");
                        }
                        if (item.items.size() != 2) {
                            fail(item, is_field ? "expected (init OP)" : "expected (body OP)");
                        }

                        type_symbol& owner = resolve_declared_type(f, 1);
                        containing_type_ = &owner;

                        if (is_field) {
                            builder_.add_root(read_operation(item.items[1]));
                            continue;
                        }

                        const method_symbol* method = builder_.find_method(owner, f.items[2].text);
                        if (!with_body_.insert(method).second) {
                            fail(item, "method '" + f.items[2].text + "' already has a body");
                        }
                        builder_.set_body(*method, read_operation(item.items[1]));
                    }
                }
            }

            // ----------------------------------------------------------------
            // Operations
            // ----------------------------------------------------------------

            struct operation_form {
                const form* head = nullptr;
                std::vector<const form*> operands;
                source_span span;
                const type_symbol* type = nullptr;
                std::optional<constant_value> constant;
                bool is_implicit = false;
            };

            operation_form split_operation(const form& f) {
                operation_form out;
                out.head = &head_of(f);

                for (std::size_t i = 1; i < f.items.size(); ++i) {
                    const form& item = f.items[i];

                    if (item.kind == form_kind::location) {
                        out.span = span_of(item);
                    } else if (item.is_symbol("implicit")) {
                        out.is_implicit = true;
                    } else if (has_head(item, "type")) {
                        if (item.items.size() != 2) {
                            fail(item, "expected (type TYPE)");
                        }
                        out.type = resolve_type(item.items[1]);
                    } else if (has_head(item, "constant")) {
                        if (item.items.size() != 2) {
                            fail(item, "expected (constant VALUE)");
                        }
                        out.constant = parse_constant(item.items[1]);
                    } else {
                        out.operands.push_back(&item);
                    }
                }
                return out;
            }

            void expect_operands(const form& f, const operation_form& parts, std::size_t min, std::size_t max) {
                std::size_t n = parts.operands.size();
                if (n < min || n > max) {
                    fail(f, "wrong number of operands for '" + parts.head->text + "'");
                }
            }

            operation_ptr read_optional(const operation_form& parts, std::size_t index) {
                return index < parts.operands.size() ? read_operation(*parts.operands[index]) : nullptr;
            }

            std::vector<operation_ptr> read_all(const operation_form& parts, std::size_t from) {
                std::vector<operation_ptr> out;
                for (std::size_t i = from; i < parts.operands.size(); ++i) {
                    out.push_back(read_operation(*parts.operands[i]));
                }
                return out;
            }

            const std::string& name_operand(const form& f, const operation_form& parts, std::size_t index) {
                if (index >= parts.operands.size() || parts.operands[index]->kind != form_kind::symbol) {
                    fail(f, "expected name operand for '" + parts.head->text + "'");
                }
                return parts.operands[index]->text;
            }

            const field_symbol* member_field(const form& f, const operation_form& parts) {
                const type_symbol* owner = resolve_type(*parts.operands[0]);
                const std::string& name = name_operand(f, parts, 1);
                const field_symbol* field = builder_.find_field(*owner, name);
                if (!field) {
                    fail(*parts.operands[1], "unknown field '" + owner->metadata_name + "." + name + "'");
                }
                return field;
            }

            const method_symbol* member_method(const form& f, const operation_form& parts) {
                const type_symbol* owner = resolve_type(*parts.operands[0]);
                const std::string& name = name_operand(f, parts, 1);
                const method_symbol* method = builder_.find_method(*owner, name);
                if (!method) {
                    fail(*parts.operands[1], "unknown method '" + owner->metadata_name + "." + name + "'");
                }
                return method;
            }

            operation_node read_node(const form& f, operation_form& parts) {
                const form& head = *parts.head;
                const std::string& h = head.text;

                if (h == "block") {
                    return block_op{read_all(parts, 0)};
                }
                if (h == "expr") {
                    expect_operands(f, parts, 1, 1);
                    return expression_statement_op{read_operation(*parts.operands[0])};
                }
                if (h == "local") {
                    expect_operands(f, parts, 1, 2);
                    return variable_declaration_op{name_operand(f, parts, 0), read_optional(parts, 1)};
                }
                if (h == "return") {
                    expect_operands(f, parts, 0, 1);
                    return return_op{read_optional(parts, 0)};
                }
                if (h == "throw") {
                    expect_operands(f, parts, 0, 1);
                    return throw_op{read_optional(parts, 0)};
                }
                if (h == "if") {
                    expect_operands(f, parts, 2, 3);
                    return conditional_op{
                        read_operation(*parts.operands[0]),
                        read_operation(*parts.operands[1]),
                        read_optional(parts, 2)
                    };
                }
                if (h == "literal") {
                    expect_operands(f, parts, 1, 1);
                    if (!parts.constant) {
                        parts.constant = parse_constant(*parts.operands[0]);
                    }
                    return literal_op{};
                }
                if (h == "local_ref") {
                    expect_operands(f, parts, 1, 1);
                    return local_reference_op{name_operand(f, parts, 0)};
                }
                if (h == "param_ref") {
                    expect_operands(f, parts, 1, 1);
                    return parameter_reference_op{name_operand(f, parts, 0)};
                }
                if (h == "this") {
                    expect_operands(f, parts, 0, 0);
                    return instance_reference_op{};
                }
                if (h == "field_ref") {
                    expect_operands(f, parts, 2, 3);
                    const field_symbol* field = member_field(f, parts);
                    if (!parts.type) {
                        parts.type = field->type;
                    }
                    return field_reference_op{field, read_optional(parts, 2)};
                }
                if (h == "method_ref") {
                    expect_operands(f, parts, 2, 3);
                    return method_reference_op{member_method(f, parts), read_optional(parts, 2)};
                }
                if (h == "lambda") {
                    return read_lambda(f, parts);
                }
                if (h == "delegate") {
                    expect_operands(f, parts, 1, 1);
                    return delegate_creation_op{read_operation(*parts.operands[0])};
                }
                if (h == "assign") {
                    expect_operands(f, parts, 2, 2);
                    return simple_assignment_op{
                        read_operation(*parts.operands[0]),
                        read_operation(*parts.operands[1])
                    };
                }
                if (h == "call") {
                    return read_call(f, parts);
                }
                if (h == "new") {
                    return object_creation_op{read_all(parts, 0)};
                }
                if (h == "conversion") {
                    expect_operands(f, parts, 1, 1);
                    return conversion_op{read_operation(*parts.operands[0])};
                }
                if (h == "unary") {
                    expect_operands(f, parts, 2, 2);
                    return unary_op{name_operand(f, parts, 0), read_operation(*parts.operands[1])};
                }
                if (h == "binary") {
                    expect_operands(f, parts, 3, 3);
                    return binary_op{
                        name_operand(f, parts, 0),
                        read_operation(*parts.operands[1]),
                        read_operation(*parts.operands[2])
                    };
                }
                if (h == "invalid") {
                    return invalid_op{read_all(parts, 0)};
                }

                fail(head, "unknown operation '" + h + "'");
            }

            operation_node read_lambda(const form& f, const operation_form& parts) {
                method_symbol& symbol = builder_.add_lambda(containing_type_);
                symbol.location = parts.span;

                const form* body = nullptr;
                for (const form* operand : parts.operands) {
                    if (has_head(*operand, "params")) {
                        symbol.parameters = read_parameters(*operand);
                    } else if (has_head(*operand, "returns")) {
                        symbol.return_type = read_return_type(*operand);
                    } else if (!body) {
                        body = operand;
                    } else {
                        fail(*operand, "lambda takes a single body operation");
                    }
                }

                if (!body) {
                    fail(f, "lambda without body");
                }
                return anonymous_function_op{&symbol, read_operation(*body)};
            }

            operation_node read_call(const form& f, operation_form& parts) {
                if (parts.operands.size() < 2) {
                    fail(f, "expected (call TYPE NAME ...)");
                }
                const method_symbol* method = member_method(f, parts);
                if (!parts.type) {
                    parts.type = method->return_type;
                }

                invocation_op call{method, nullptr, {}};
                for (std::size_t i = 2; i < parts.operands.size(); ++i) {
                    const form& operand = *parts.operands[i];

                    if (has_head(operand, "instance")) {
                        if (operand.items.size() != 2 || call.instance) {
                            fail(operand, "expected a single (instance OP)");
                        }
                        call.instance = read_operation(operand.items[1]);
                    } else {
                        call.arguments.push_back(read_operation(operand));
                    }
                }
                return operation_node{std::move(call)};
            }

            operation_ptr read_operation(const form& f) {
                if (f.kind != form_kind::list) {
                    fail(f, "expected operation form");
                }

                operation_form parts = split_operation(f);
                operation_node node = read_node(f, parts);

                auto op = make_operation(std::move(node), parts.span, parts.type);
                op->constant = std::move(parts.constant);
                op->is_implicit = parts.is_implicit;
                return op;
            }

        private:
            compilation_builder builder_;
            std::string source_name_;
            std::string current_file_;
            const type_symbol* containing_type_ = nullptr;
            std::set<const method_symbol*> with_body_;
    };

} // anonymous namespace

compilation read_snapshot(const std::string& text, const std::string& source_name) {
    std::vector<snapshot::form> forms = snapshot::parse_forms(text, source_name);
    return snapshot_reader(source_name).read(forms);
}

compilation read_snapshot_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return read_snapshot(buffer.str(), path.string());
}

} // namespace opcheck
