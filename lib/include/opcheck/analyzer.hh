//
// Analyzer interface
//
// The host drives analysis; rules only describe which node kinds they care
// about and how to judge one node. A rule is split in two objects:
//
//   analyzer              - process-wide, immutable, owns the rule_descriptor
//   compilation_analyzer  - created once per compilation by
//                           analyzer::on_compilation_start(), holds the
//                           well-known types resolved for that compilation,
//                           immutable afterwards
//
// Neither object has mutable state, so the engine may call evaluate()
// concurrently for different nodes and different compilations.
//

#pragma once

#include "compilation.hh"
#include "diagnostic.hh"
#include "operation.hh"
#include "semantic_model.hh"
#include <memory>
#include <optional>
#include <set>

namespace opcheck {

/// What a rule sees while judging one node.
struct analysis_context {
    const semantic_model& model;
    const compilation_unit& unit;
};

class compilation_analyzer {
public:
    virtual ~compilation_analyzer() = default;

    /// Judge one node of a kind listed in analyzer::interested_kinds().
    /// @return the diagnostic if the node violates the rule
    [[nodiscard]] virtual std::optional<diagnostic> evaluate(const operation& op,
                                                             const analysis_context& context) const = 0;
};

class analyzer {
public:
    virtual ~analyzer() = default;

    [[nodiscard]] virtual const rule_descriptor& descriptor() const = 0;

    /// Node kinds evaluate() is called for.
    [[nodiscard]] virtual std::set<operation_kind> interested_kinds() const = 0;

    /// Whether nodes in generated compilation units are analyzed and reported.
    [[nodiscard]] virtual bool analyzes_generated_code() const { return false; }

    /// Whether evaluate() may run on several threads at once. A compilation
    /// with any active rule answering false is analyzed on the calling thread.
    [[nodiscard]] virtual bool supports_concurrent_execution() const { return true; }

    /// Resolve everything the rule needs from the compilation.
    /// @return nullptr when a required well-known type is missing; the rule
    ///         is then inert for this compilation
    [[nodiscard]] virtual std::unique_ptr<compilation_analyzer> on_compilation_start(
        const semantic_model& model) const = 0;
};

} // namespace opcheck
