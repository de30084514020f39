//
// CA5359: Do not disable certificate validation
//
// Flags delegate creations of RemoteCertificateValidationCallback whose
// target (lambda or named method) returns the constant `true` on every
// return. Only folded constants are recognized; a local that always holds
// `true` is not.
//

#include <opcheck/rules.hh>
#include <opcheck/traversal.hh>
#include <opcheck/well_known_types.hh>
#include "rules/rule_config.hh"

namespace opcheck {

namespace rules {

bool is_certificate_validation_function(const method_symbol& method,
                                        const certificate_validation_types& types) {
    if (!method.return_type || method.return_type->special != special_type::system_boolean) {
        return false;
    }

    const auto& parameters = method.parameters;

    if (parameters.size() != 4) {
        return false;
    }

    if (!semantic_model::types_equal(parameters[0].type, types.object) ||
        !semantic_model::types_equal(parameters[1].type, types.certificate) ||
        !semantic_model::types_equal(parameters[2].type, types.chain) ||
        !semantic_model::types_equal(parameters[3].type, types.policy_errors)) {
        return false;
    }

    return true;
}

} // namespace rules

namespace {

    class certificate_validation_checker final : public compilation_analyzer {
        public:
            certificate_validation_checker(const rule_descriptor& descriptor,
                                           rules::certificate_validation_types types)
                : descriptor_(descriptor),
                  types_(types) {
            }

            std::optional<diagnostic> evaluate(const operation& op,
                                               const analysis_context& context) const override {
                const auto* creation = std::get_if<delegate_creation_op>(&op.node);
                if (!creation || !creation->target) {
                    return std::nullopt;
                }

                if (!semantic_model::types_equal(types_.callback, op.type)) {
                    return std::nullopt;
                }

                const operation& target = *creation->target;
                bool always_true = false;

                if (const auto* lambda = std::get_if<anonymous_function_op>(&target.node)) {
                    if (!lambda->symbol || !rules::is_certificate_validation_function(*lambda->symbol, types_)) {
                        return std::nullopt;
                    }

                    always_true = rules::always_returns_true(descendants(target));
                } else if (const auto* reference = std::get_if<method_reference_op>(&target.node)) {
                    if (!reference->method || !rules::is_certificate_validation_function(*reference->method, types_)) {
                        return std::nullopt;
                    }

                    const operation* block = context.model.operation_block(*reference->method);
                    if (!block) {
                        return std::nullopt;
                    }

                    // A body reached through the symbol carries host-inserted
                    // wrapper nodes that must not count as user returns
                    always_true = rules::always_returns_true(without_implicit(descendants(*block)));
                }

                if (!always_true) {
                    return std::nullopt;
                }

                // Unlocated creations still name the unit they came from
                source_span span = op.span;
                if (!span.valid()) {
                    span.start = source_pos(context.unit.file_path, 0, 0);
                }
                return make_diagnostic(descriptor_, span);
            }

        private:
            const rule_descriptor& descriptor_;
            const rules::certificate_validation_types types_;
    };

} // anonymous namespace

certificate_validation_analyzer::certificate_validation_analyzer()
    : descriptor_(rule_ids::CA5359_DO_NOT_DISABLE_CERTIFICATE_VALIDATION,
                  "Do Not Disable Certificate Validation",
                  "The certificate validation callback always returns true",
                  rule_categories::SECURITY,
                  diagnostic_level::warning,
                  rules_enabled_by_default,
                  "A certificate can help authenticate the identity of the server. Clients should validate "
                  "the server certificate to ensure requests are sent to the intended server. If the "
                  "ServerCertificateValidationCallback always returns 'true', any certificate will pass validation.",
                  {},
                  {rule_tags::TELEMETRY}) {
}

std::set<operation_kind> certificate_validation_analyzer::interested_kinds() const {
    return {operation_kind::delegate_creation};
}

std::unique_ptr<compilation_analyzer> certificate_validation_analyzer::on_compilation_start(
    const semantic_model& model) const {
    using namespace well_known_types;

    rules::certificate_validation_types types{
        model.resolve_type(SYSTEM_NET_SECURITY_REMOTECERTIFICATEVALIDATIONCALLBACK),
        model.resolve_type(SYSTEM_OBJECT),
        model.resolve_type(SYSTEM_SECURITY_CRYPTOGRAPHY_X509CERTIFICATES_X509CERTIFICATE),
        model.resolve_type(SYSTEM_SECURITY_CRYPTOGRAPHY_X509CERTIFICATES_X509CHAIN),
        model.resolve_type(SYSTEM_NET_SECURITY_SSLPOLICYERRORS)
    };

    if (!types.callback || !types.object || !types.certificate || !types.chain || !types.policy_errors) {
        return nullptr;
    }

    return std::make_unique<certificate_validation_checker>(descriptor_, types);
}

} // namespace opcheck
