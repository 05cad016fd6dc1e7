#pragma once

#include "pytestify/core/transformation_rule.hpp"
#include "pytestify/types.hpp"
#include <set>
#include <span>
#include <string>
#include <vector>

namespace pytestify {

// Text plus everything a pass learned while producing it
struct RewriteOutcome {
    std::string text;
    ChangeLog change_log;
    std::set<std::string> unresolved;
    std::vector<Diagnostic> diagnostics;
};

// Applies textual rules in the given order. Each rule scans the text left by
// the previous one; a rule's own matches never overlap and are rewritten in
// a single left-to-right step. Declined matches leave their span untouched.
// A rule that matched nothing on its turn but matches the final text is
// reported unresolved: its input was produced by a rule that runs later.
auto apply_textual_rules(const std::string& text, std::span<const TransformationRule> rules)
    -> RewriteOutcome;

// Runs one rule over the text, appending to the outcome
auto apply_textual_rule(RewriteOutcome& outcome, const TransformationRule& rule) -> void;

} // namespace pytestify
