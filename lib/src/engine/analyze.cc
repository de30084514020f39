//
// Main analysis pipeline
//

#include <opcheck/engine.hh>
#include <opcheck/rules.hh>
#include <opcheck/traversal.hh>
#include <algorithm>
#include <array>
#include <atomic>
#include <exception>
#include <iterator>
#include <thread>

namespace opcheck {

bool is_rule_enabled(const analyzer& a, const analysis_options& opts) {
    const std::string& id = a.descriptor().id();

    if (opts.disabled_rules.contains(id)) {
        return false;
    }

    return a.descriptor().enabled_by_default() || opts.enabled_rules.contains(id);
}

namespace {
    const rule_descriptor& analyzer_exception_descriptor() {
        static const rule_descriptor descriptor(
            rule_ids::AD0001_ANALYZER_EXCEPTION,
            "Analyzer failure",
            "Analyzer '{0}' threw an exception while evaluating a {1} node: {2}",
            rule_categories::RELIABILITY,
            diagnostic_level::warning,
            true);
        return descriptor;
    }

    struct active_analyzer {
        const analyzer* rule;
        std::unique_ptr<compilation_analyzer> checker;
        bool analyzes_generated_code;
    };

    using dispatch_table = std::array<std::vector<const active_analyzer*>, operation_kind_count>;

    // A rule failing on one node must not abort the rest of the compilation
    std::optional<diagnostic> evaluate_guarded(const active_analyzer& active,
                                               const operation& op,
                                               const analysis_context& context) {
        try {
            return active.checker->evaluate(op, context);
        } catch (const std::exception& e) {
            return make_diagnostic(analyzer_exception_descriptor(), op.span, {
                active.rule->descriptor().id(),
                operation_kind_name(op.kind()),
                e.what()
            });
        }
    }

    void analyze_unit(const compilation_unit& unit,
                      const semantic_model& model,
                      const dispatch_table& dispatch,
                      const analysis_options& opts,
                      std::vector<diagnostic>& out) {
        analysis_context context{model, unit};

        for (const operation* root : unit.roots) {
            for (const operation* op : descendants_and_self(*root)) {
                const auto& interested = dispatch[static_cast<size_t>(op->kind())];

                for (const active_analyzer* active : interested) {
                    if (unit.is_generated && !active->analyzes_generated_code) {
                        continue;
                    }

                    if (opts.cancellation && opts.cancellation->is_cancelled()) {
                        throw analysis_cancelled();
                    }

                    if (auto diag = evaluate_guarded(*active, *op, context)) {
                        out.push_back(std::move(*diag));
                    }
                }
            }
        }
    }

    std::vector<diagnostic> analyze_units_parallel(const compilation& comp,
                                                   const semantic_model& model,
                                                   const dispatch_table& dispatch,
                                                   const analysis_options& opts) {
        const auto& units = comp.units();
        const size_t worker_count = std::min(opts.max_parallelism, units.size());

        std::atomic<size_t> next_unit{0};
        std::vector<std::vector<diagnostic>> worker_diagnostics(worker_count);
        std::vector<std::exception_ptr> worker_errors(worker_count);
        std::vector<std::thread> workers;
        workers.reserve(worker_count);

        for (size_t w = 0; w < worker_count; ++w) {
            workers.emplace_back([&, w]() {
                try {
                    for (size_t i = next_unit++; i < units.size(); i = next_unit++) {
                        analyze_unit(units[i], model, dispatch, opts, worker_diagnostics[w]);
                    }
                } catch (...) {
                    // Handed to the calling thread, rethrown after join
                    worker_errors[w] = std::current_exception();
                }
            });
        }

        for (auto& worker : workers) {
            worker.join();
        }

        for (const auto& error : worker_errors) {
            if (error) {
                std::rethrow_exception(error);
            }
        }

        std::vector<diagnostic> all;
        for (auto& diags : worker_diagnostics) {
            std::move(diags.begin(), diags.end(), std::back_inserter(all));
        }
        return all;
    }
}

analysis_result analyze(const compilation& comp,
                        const std::vector<const analyzer*>& analyzers,
                        const analysis_options& opts) {
    analysis_result result;
    semantic_model model(comp);

    // Compilation start: resolve well-known types once per rule
    std::vector<active_analyzer> active;
    active.reserve(analyzers.size());

    for (const analyzer* a : analyzers) {
        if (!a || !is_rule_enabled(*a, opts)) {
            continue;
        }

        auto checker = a->on_compilation_start(model);
        if (!checker) {
            result.inert_rules.push_back(a->descriptor().id());
            continue;
        }

        result.active_rules.push_back(a->descriptor().id());
        active.push_back(active_analyzer{a, std::move(checker), a->analyzes_generated_code()});
    }

    bool concurrent = true;
    dispatch_table dispatch;
    for (const auto& a : active) {
        concurrent = concurrent && a.rule->supports_concurrent_execution();
        for (operation_kind kind : a.rule->interested_kinds()) {
            dispatch[static_cast<size_t>(kind)].push_back(&a);
        }
    }

    // Node evaluation
    std::vector<diagnostic> diagnostics;
    if (concurrent && opts.max_parallelism > 1 && comp.units().size() > 1) {
        diagnostics = analyze_units_parallel(comp, model, dispatch, opts);
    } else {
        for (const auto& unit : comp.units()) {
            analyze_unit(unit, model, dispatch, opts, diagnostics);
        }
    }

    // Filter diagnostics by minimum level
    std::vector<diagnostic> filtered_diags;
    for (const auto& diag : diagnostics) {
        if (diag.level > opts.min_level) {
            continue;
        }

        // Treat warnings as errors if requested
        if (opts.warnings_as_errors && diag.level == diagnostic_level::warning) {
            diagnostic error_diag = diag;
            error_diag.level = diagnostic_level::error;
            filtered_diags.push_back(std::move(error_diag));
        } else {
            filtered_diags.push_back(diag);
        }
    }

    // Independent of unit scheduling
    std::stable_sort(filtered_diags.begin(), filtered_diags.end(), diagnostic_less);

    result.diagnostics = std::move(filtered_diags);
    return result;
}

analysis_result analyze(const compilation& comp, const analysis_options& opts) {
    auto owned = builtin_analyzers();

    std::vector<const analyzer*> analyzers;
    analyzers.reserve(owned.size());
    for (const auto& a : owned) {
        analyzers.push_back(a.get());
    }

    return analyze(comp, analyzers, opts);
}

} // namespace opcheck
