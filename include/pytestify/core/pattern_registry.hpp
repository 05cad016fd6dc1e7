#pragma once

#include "pytestify/core/transformation_rule.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace pytestify {

class DuplicateRuleError : public std::runtime_error {
public:
    explicit DuplicateRuleError(const std::string& rule_id);

    auto rule_id() const -> const std::string&
    {
        return rule_id_;
    }

private:
    std::string rule_id_;
};

class RegistryFinalizedError : public std::runtime_error {
public:
    explicit RegistryFinalizedError(const std::string& operation);
};

// Ordered collection of transformation rules. Mutable until finalize(),
// read-only afterwards so it can be shared by concurrent file workers.
class PatternRegistry {
public:
    // Throws DuplicateRuleError if the id is taken, RegistryFinalizedError after finalize()
    auto register_rule(TransformationRule rule) -> void;

    // Returns false for an unknown id
    auto set_enabled(const std::string& id, bool enabled) -> bool;

    auto finalize() -> void;
    auto is_finalized() const -> bool
    {
        return finalized_;
    }

    // Enabled rules by ascending priority; ties keep registration order
    auto rules_for_pass() const -> std::vector<TransformationRule>;
    auto rules_for_pass(RuleKind kind) const -> std::vector<TransformationRule>;

    // Every rule, disabled ones included, in pass order
    auto all_rules() const -> std::vector<TransformationRule>;

    auto find(const std::string& id) const -> const TransformationRule*;
    auto contains(const std::string& id) const -> bool;
    auto size() const -> size_t
    {
        return rules_.size();
    }

    // Id of the first enabled structural rule carrying the tag
    auto structural_rule_id(std::string_view tag) const -> std::optional<std::string>;
    auto is_structural_enabled(std::string_view tag) const -> bool;

private:
    auto find_mutable(const std::string& id) -> TransformationRule*;
    auto ordered(bool enabled_only) const -> std::vector<TransformationRule>;

    std::vector<TransformationRule> rules_;  // Registration order
    bool finalized_ = false;
};

} // namespace pytestify
