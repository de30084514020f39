//
// Builtin rules
//
// CA5359  Do not disable certificate validation
//         A RemoteCertificateValidationCallback is created from a function
//         whose every return yields the constant `true`.
//
// CA2216  Disposable types should declare finalizer
//         An IDisposable reference type stores a native handle obtained from
//         a platform invoke in an instance field but has no finalizer.
//

#pragma once

#include "analyzer.hh"
#include "diagnostic.hh"
#include "operation.hh"
#include "symbols.hh"
#include <memory>
#include <set>
#include <vector>

namespace opcheck {

class certificate_validation_analyzer final : public analyzer {
public:
    certificate_validation_analyzer();

    [[nodiscard]] const rule_descriptor& descriptor() const override { return descriptor_; }
    [[nodiscard]] std::set<operation_kind> interested_kinds() const override;

    // Security rule: generated code is analyzed and reported too
    [[nodiscard]] bool analyzes_generated_code() const override { return true; }

    [[nodiscard]] std::unique_ptr<compilation_analyzer> on_compilation_start(
        const semantic_model& model) const override;

private:
    const rule_descriptor descriptor_;
};

class disposable_finalizer_analyzer final : public analyzer {
public:
    disposable_finalizer_analyzer();

    [[nodiscard]] const rule_descriptor& descriptor() const override { return descriptor_; }
    [[nodiscard]] std::set<operation_kind> interested_kinds() const override;

    [[nodiscard]] std::unique_ptr<compilation_analyzer> on_compilation_start(
        const semantic_model& model) const override;

private:
    const rule_descriptor descriptor_;
};

/// Every builtin rule, in registration order.
std::vector<std::unique_ptr<analyzer>> builtin_analyzers();

namespace rules {

/// Well-known types CA5359 needs; all non-null once resolved.
struct certificate_validation_types {
    const type_symbol* callback;
    const type_symbol* object;
    const type_symbol* certificate;
    const type_symbol* chain;
    const type_symbol* policy_errors;
};

/// True if `method` has the signature
///   bool (object, X509Certificate, X509Chain, SslPolicyErrors)
[[nodiscard]] bool is_certificate_validation_function(const method_symbol& method,
                                                      const certificate_validation_types& types);

/// True if every return in `ops` yields the constant `true` and there is at
/// least one return. A valueless return ends the scan with false. Only
/// folded constants count; no flow analysis is attempted.
template<typename Range>
[[nodiscard]] bool always_returns_true(const Range& ops) {
    bool has_return_statement = false;

    for (const operation* op : ops) {
        const auto* ret = std::get_if<return_op>(&op->node);
        if (!ret) {
            continue;
        }

        if (!ret->value) {
            return false;
        }

        has_return_statement = true;

        if (!is_constant_true(*ret->value)) {
            return false;
        }
    }

    return has_return_statement;
}

} // namespace rules

} // namespace opcheck
