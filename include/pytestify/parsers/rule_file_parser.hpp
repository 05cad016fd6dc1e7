#pragma once

#include "pytestify/core/pattern_registry.hpp"
#include "pytestify/core/transformation_rule.hpp"
#include <regex>
#include <string>
#include <vector>

namespace pytestify {

struct RuleFileError {
    size_t line{};  // 1-based; 0 when the problem is not tied to a line
    std::string message;
};

struct RuleFileParseResult {
    std::vector<RuleSpec> rules;
    std::vector<std::string> disabled;
    std::vector<std::string> enabled;
    std::vector<RuleFileError> errors;

    auto ok() const -> bool
    {
        return errors.empty();
    }
};

// Reads rule files made of [rule ID], [disable ID] and [enable ID] sections
// with "key = value" entries under [rule]. Malformed lines are reported and
// skipped; the rest of the file is still parsed.
class RuleFileParser {
public:
    auto parse(const std::string& content) -> RuleFileParseResult;

private:
    static inline const std::regex section_pattern_{
        R"(^\[(rule|disable|enable)\s+([A-Za-z0-9_.\-]+)\]\s*$)"};
    static inline const std::regex entry_pattern_{R"(^([a-z_]+)\s*=\s?(.*)$)"};
};

// Registers the parsed rules and applies the toggles. Returns one message
// per rule that could not be added (invalid regex, duplicate or unknown id).
auto apply_rule_file(PatternRegistry& registry, const RuleFileParseResult& parsed)
    -> std::vector<std::string>;

auto format_rule_file_error(const RuleFileError& error) -> std::string;

} // namespace pytestify
