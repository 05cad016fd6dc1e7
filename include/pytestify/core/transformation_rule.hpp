#pragma once

#include "pytestify/types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pytestify {

// Finds every candidate span in a text. Spans may be returned in any order.
using RuleMatcher = std::function<std::vector<MatchSpan>(std::string_view text)>;

// Computes the replacement for one match, or std::nullopt when the match
// cannot be rewritten safely (the span is then reported as unresolved)
using RuleProducer = std::function<std::optional<std::string>(const Captures& captures)>;

enum class RuleKind {
    TEXTUAL,     // Matched and rewritten by the textual rewriter
    STRUCTURAL   // Toggles a transform of the structural rewriter
};

struct RegexFlags {
    bool multiline = false;     // '^' and '$' also match at line boundaries
    bool ignore_case = false;
    bool dotall = false;        // '.' also matches newlines

    auto operator==(const RegexFlags& other) const -> bool = default;
};

struct TransformationRule {
    std::string id;
    RuleKind kind = RuleKind::TEXTUAL;
    RuleMatcher matcher;
    RuleProducer producer;
    int priority = 50;
    bool enabled = true;
    std::string description;
    std::string pattern;        // Regex source or structural tag, for listings
    std::string replacement;    // Template source, for listings
};

// Mapping form of a rule, as written in rule files
struct RuleSpec {
    std::string id;
    std::string pattern;
    std::string replacement;
    std::string description;
    int priority = 50;
    bool enabled = true;
    RegexFlags flags;
};

inline constexpr std::string_view STRUCTURAL_TAG_PREFIX = "structural:";

auto is_structural_tag(std::string_view pattern) -> bool;
auto structural_tag_name(std::string_view pattern) -> std::string;

// Rewrites unescaped '.' outside character classes so it also matches newlines
auto translate_dotall(std::string_view pattern) -> std::string;

// Throws std::regex_error for an invalid pattern
auto make_regex_matcher(const std::string& pattern, RegexFlags flags) -> RuleMatcher;

// Expands \1..\9, \g<N>, \n, \t and \\ in a replacement template.
// Groups that did not participate in the match expand to nothing.
auto expand_template(std::string_view replacement_template, const Captures& captures)
    -> std::string;
auto make_template_producer(std::string replacement_template) -> RuleProducer;

// Builds a rule from its mapping form. Structural tags yield a STRUCTURAL
// rule with no matcher; anything else is compiled as a regex.
auto make_rule(const RuleSpec& spec) -> TransformationRule;

// Regex matcher compiled from spec.pattern combined with a custom producer
auto make_rule(const RuleSpec& spec, RuleProducer producer) -> TransformationRule;

// Fully custom matcher and producer
auto make_rule(const RuleSpec& spec, RuleMatcher matcher, RuleProducer producer)
    -> TransformationRule;

auto parse_regex_flags(std::string_view text) -> std::optional<RegexFlags>;
auto describe_regex_flags(const RegexFlags& flags) -> std::string;

} // namespace pytestify
