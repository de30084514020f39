//
// CA2216: Disposable types should declare finalizer
//
// Triggered by simple assignments. The assignment is a candidate when it
// stores the result of a platform invoke into an instance field of a native
// handle type, and the field belongs to an IDisposable reference type. The
// diagnostic is reported on that type unless it already has a finalizer.
//

#include <opcheck/rules.hh>
#include <opcheck/well_known_types.hh>
#include "rules/rule_config.hh"
#include <algorithm>
#include <array>
#include <utility>

namespace opcheck {

namespace {

    struct disposable_types {
        std::array<const type_symbol*, 3> native_resource_types;  // IntPtr, UIntPtr, HandleRef
        const type_symbol* disposable;
    };

    class disposable_finalizer_checker final : public compilation_analyzer {
        public:
            disposable_finalizer_checker(const rule_descriptor& descriptor, disposable_types types)
                : descriptor_(descriptor),
                  types_(types) {
            }

            std::optional<diagnostic> evaluate(const operation& op,
                                               const analysis_context&) const override {
                const auto* assignment = std::get_if<simple_assignment_op>(&op.node);
                if (!assignment) {
                    return std::nullopt;
                }

                // Null when the left-hand side is an undefined symbol
                if (!assignment->target) {
                    return std::nullopt;
                }

                const auto* field_reference = std::get_if<field_reference_op>(&assignment->target->node);
                if (!field_reference || !field_reference->field || field_reference->field->is_static) {
                    return std::nullopt;
                }

                const field_symbol& field = *field_reference->field;

                if (!is_native_resource_type(field.type)) {
                    return std::nullopt;
                }

                const type_symbol* containing_type = field.containing_type;
                if (!containing_type || semantic_model::is_value_type(*containing_type)) {
                    return std::nullopt;
                }

                if (!semantic_model::implements(*containing_type, types_.disposable)) {
                    return std::nullopt;
                }

                if (semantic_model::has_finalizer(*containing_type)) {
                    return std::nullopt;
                }

                if (!assignment->value) {
                    return std::nullopt;
                }

                const auto* invocation = std::get_if<invocation_op>(&assignment->value->node);
                if (!invocation || !invocation->target_method) {
                    return std::nullopt;
                }

                // TODO: COM interop methods acquire native resources as well but carry no dll import data
                if (!semantic_model::interop_marker(*invocation->target_method)) {
                    return std::nullopt;
                }

                return report_on_type(*containing_type, op);
            }

        private:
            bool is_native_resource_type(const type_symbol* type) const {
                if (!type) {
                    return false;
                }
                return std::find(types_.native_resource_types.begin(),
                                 types_.native_resource_types.end(),
                                 type) != types_.native_resource_types.end();
            }

            diagnostic report_on_type(const type_symbol& type, const operation& op) const {
                // First declaration is the primary location, other partial
                // declarations go along as additional locations
                if (type.locations.empty()) {
                    return make_diagnostic(descriptor_, op.span, {type.name()});
                }

                std::vector<source_span> additional(type.locations.begin() + 1, type.locations.end());
                return make_diagnostic(descriptor_, type.locations.front(), {type.name()}, std::move(additional));
            }

            const rule_descriptor& descriptor_;
            const disposable_types types_;
    };

} // anonymous namespace

disposable_finalizer_analyzer::disposable_finalizer_analyzer()
    : descriptor_(rule_ids::CA2216_DISPOSABLE_TYPES_SHOULD_DECLARE_FINALIZER,
                  "Disposable types should declare finalizer",
                  "Disposable type '{0}' should declare a finalizer",
                  rule_categories::USAGE,
                  diagnostic_level::warning,
                  rules_enabled_by_default,
                  "A type that implements System.IDisposable and has fields that suggest the use of "
                  "unmanaged resources does not implement a finalizer, as described by Object.Finalize.",
                  "https://docs.microsoft.com/visualstudio/code-quality/ca2216-disposable-types-should-declare-finalizer",
                  {rule_tags::PORTED_FXCOP_RULE}) {
}

std::set<operation_kind> disposable_finalizer_analyzer::interested_kinds() const {
    return {operation_kind::simple_assignment};
}

std::unique_ptr<compilation_analyzer> disposable_finalizer_analyzer::on_compilation_start(
    const semantic_model& model) const {
    using namespace well_known_types;

    disposable_types types{
        {
            model.resolve_type(SYSTEM_INTPTR),
            model.resolve_type(SYSTEM_UINTPTR),
            model.resolve_type(SYSTEM_RUNTIME_INTEROPSERVICES_HANDLEREF)
        },
        model.resolve_type(SYSTEM_IDISPOSABLE)
    };

    for (const type_symbol* type : types.native_resource_types) {
        if (!type) {
            return nullptr;
        }
    }
    if (!types.disposable) {
        return nullptr;
    }

    return std::make_unique<disposable_finalizer_checker>(descriptor_, types);
}

} // namespace opcheck
