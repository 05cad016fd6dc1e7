#include "pytestify/core/pattern_registry.hpp"
#include <algorithm>

namespace pytestify {

DuplicateRuleError::DuplicateRuleError(const std::string& rule_id)
    : std::runtime_error("duplicate rule id: " + rule_id), rule_id_(rule_id) {}

RegistryFinalizedError::RegistryFinalizedError(const std::string& operation)
    : std::runtime_error("pattern registry is finalized: cannot " + operation) {}

auto PatternRegistry::register_rule(TransformationRule rule) -> void {
    if (finalized_) {
        throw RegistryFinalizedError("register " + rule.id);
    }
    if (contains(rule.id)) {
        throw DuplicateRuleError(rule.id);
    }
    rules_.push_back(std::move(rule));
}

auto PatternRegistry::set_enabled(const std::string& id, bool enabled) -> bool {
    if (finalized_) {
        throw RegistryFinalizedError((enabled ? "enable " : "disable ") + id);
    }
    auto* rule = find_mutable(id);
    if (rule == nullptr) {
        return false;
    }
    rule->enabled = enabled;
    return true;
}

auto PatternRegistry::finalize() -> void {
    finalized_ = true;
}

auto PatternRegistry::rules_for_pass() const -> std::vector<TransformationRule> {
    return ordered(true);
}

auto PatternRegistry::rules_for_pass(RuleKind kind) const -> std::vector<TransformationRule> {
    auto rules = ordered(true);
    std::erase_if(rules, [kind](const TransformationRule& rule) { return rule.kind != kind; });
    return rules;
}

auto PatternRegistry::all_rules() const -> std::vector<TransformationRule> {
    return ordered(false);
}

auto PatternRegistry::find(const std::string& id) const -> const TransformationRule* {
    auto it = std::find_if(rules_.begin(), rules_.end(),
                           [&id](const TransformationRule& rule) { return rule.id == id; });
    return it == rules_.end() ? nullptr : &*it;
}

auto PatternRegistry::contains(const std::string& id) const -> bool {
    return find(id) != nullptr;
}

auto PatternRegistry::structural_rule_id(std::string_view tag) const
    -> std::optional<std::string> {
    for (const auto& rule : ordered(true)) {
        if (rule.kind == RuleKind::STRUCTURAL && structural_tag_name(rule.pattern) == tag) {
            return rule.id;
        }
    }
    return std::nullopt;
}

auto PatternRegistry::is_structural_enabled(std::string_view tag) const -> bool {
    return structural_rule_id(tag).has_value();
}

auto PatternRegistry::find_mutable(const std::string& id) -> TransformationRule* {
    auto it = std::find_if(rules_.begin(), rules_.end(),
                           [&id](const TransformationRule& rule) { return rule.id == id; });
    return it == rules_.end() ? nullptr : &*it;
}

auto PatternRegistry::ordered(bool enabled_only) const -> std::vector<TransformationRule> {
    std::vector<TransformationRule> result;
    result.reserve(rules_.size());
    for (const auto& rule : rules_) {
        if (!enabled_only || rule.enabled) {
            result.push_back(rule);
        }
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const TransformationRule& lhs, const TransformationRule& rhs) {
                         return lhs.priority < rhs.priority;
                     });
    return result;
}

} // namespace pytestify
