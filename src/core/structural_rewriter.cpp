#include "pytestify/core/structural_rewriter.hpp"
#include "pytestify/core/default_rules.hpp"
#include "pytestify/core/import_transform.hpp"
#include "pytestify/core/yield_transform.hpp"
#include <functional>
#include <stdexcept>

namespace pytestify {

namespace {

using Pass = std::function<PassResult(const python::SourceModule&)>;

auto overlaps(const SourceEdit& lhs, const SourceEdit& rhs) -> bool {
    if (lhs.begin == lhs.end || rhs.begin == rhs.end) {
        // Insertions only clash with a replacement strictly around them
        auto point = lhs.begin == lhs.end ? lhs.begin : rhs.begin;
        const auto& range = lhs.begin == lhs.end ? rhs : lhs;
        return range.begin < point && point < range.end;
    }
    return lhs.begin < rhs.end && rhs.begin < lhs.end;
}

auto run_pass(RewriteOutcome& outcome, const std::string& rule_id, const Pass& pass) -> void {
    auto module = python::parse_module(outcome.text);
    auto result = pass(module);

    outcome.unresolved.insert(result.unresolved.begin(), result.unresolved.end());
    outcome.diagnostics.insert(outcome.diagnostics.end(), result.diagnostics.begin(),
                               result.diagnostics.end());

    std::vector<SourceEdit> accepted;
    ChangeLog records;
    for (auto& unit : result.units) {
        bool clashes = false;
        for (const auto& edit : unit.edits) {
            for (const auto& other : accepted) {
                clashes = clashes || overlaps(edit, other);
            }
        }
        if (clashes) {
            auto location = unit.records.empty() ? std::nullopt
                                                 : std::optional(unit.records.front().location);
            outcome.unresolved.insert(rule_id);
            outcome.diagnostics.push_back(Diagnostic{
                .kind = DiagnosticKind::STRUCTURAL_AMBIGUITY,
                .pattern_id = rule_id,
                .message = "rewrite overlaps another rewrite of the same pass",
                .location = location,
            });
            continue;
        }
        accepted.insert(accepted.end(), unit.edits.begin(), unit.edits.end());
        records.insert(records.end(), unit.records.begin(), unit.records.end());
    }
    if (accepted.empty()) {
        return;
    }

    try {
        outcome.text = apply_edits(outcome.text, std::move(accepted));
    } catch (const std::logic_error& e) {
        outcome.unresolved.insert(rule_id);
        outcome.diagnostics.push_back(Diagnostic{
            .kind = DiagnosticKind::STRUCTURAL_AMBIGUITY,
            .pattern_id = rule_id,
            .message = std::string("pass abandoned: ") + e.what(),
            .location = std::nullopt,
        });
        return;
    }
    outcome.change_log.insert(outcome.change_log.end(), records.begin(), records.end());
}

} // namespace

auto structural_options_from(const PatternRegistry& registry) -> StructuralOptions {
    StructuralOptions options;
    options.lifecycle.base_rule = registry.structural_rule_id(TAG_LIFECYCLE_BASE);
    options.lifecycle.hooks_rule = registry.structural_rule_id(TAG_LIFECYCLE_HOOKS);
    options.lifecycle.flatten_rule = registry.structural_rule_id(TAG_FLATTEN_CLASS);
    options.yield_rule = registry.structural_rule_id(TAG_YIELD_TESTS);
    options.imports_rule = registry.structural_rule_id(TAG_PYTEST_IMPORTS);
    return options;
}

StructuralRewriter::StructuralRewriter(StructuralOptions options)
    : options_(std::move(options)) {}

auto StructuralRewriter::apply(const std::string& text) const -> RewriteOutcome {
    RewriteOutcome outcome{.text = text};
    apply(outcome);
    return outcome;
}

auto StructuralRewriter::apply(RewriteOutcome& outcome) const -> void {
    const auto& lifecycle = options_.lifecycle;
    if (lifecycle.base_rule || lifecycle.hooks_rule) {
        auto rule_id = lifecycle.base_rule.value_or(lifecycle.hooks_rule.value_or(""));
        run_pass(outcome, rule_id, [&lifecycle](const python::SourceModule& module) {
            return rewrite_lifecycle(module, lifecycle);
        });
    }
    if (options_.yield_rule) {
        const auto& rule_id = *options_.yield_rule;
        run_pass(outcome, rule_id, [&rule_id](const python::SourceModule& module) {
            return rewrite_yield_tests(module, rule_id);
        });
    }
    if (options_.imports_rule) {
        const auto& rule_id = *options_.imports_rule;
        run_pass(outcome, rule_id, [&rule_id](const python::SourceModule& module) {
            return rewrite_pytest_imports(module, rule_id);
        });
    }
}

} // namespace pytestify
