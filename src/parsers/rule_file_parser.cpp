#include "pytestify/parsers/rule_file_parser.hpp"
#include <optional>
#include <set>
#include <sstream>

namespace pytestify {

namespace {

// [rule ...] section being filled in
struct PendingRule {
    size_t line{};
    RuleSpec spec;
    bool has_pattern = false;
    bool has_replacement = false;
    std::set<std::string> keys;
};

auto trim_right(std::string text) -> std::string {
    while (!text.empty() && (text.back() == '\r' || text.back() == ' ' || text.back() == '\t')) {
        text.pop_back();
    }
    return text;
}

auto parse_bool(const std::string& value) -> std::optional<bool> {
    if (value == "true" || value == "yes" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "0") {
        return false;
    }
    return std::nullopt;
}

auto finish_rule(std::optional<PendingRule>& pending, RuleFileParseResult& result) -> void {
    if (!pending) {
        return;
    }
    auto& rule = *pending;
    if (!rule.has_pattern) {
        result.errors.push_back({rule.line, "rule " + rule.spec.id + " has no pattern"});
    } else if (!rule.has_replacement && !is_structural_tag(rule.spec.pattern)) {
        result.errors.push_back({rule.line, "rule " + rule.spec.id + " has no replacement"});
    } else {
        if (rule.spec.description.empty()) {
            rule.spec.description = rule.spec.id;
        }
        result.rules.push_back(std::move(rule.spec));
    }
    pending.reset();
}

auto set_entry(PendingRule& rule, const std::string& key, const std::string& value, size_t line,
               RuleFileParseResult& result) -> void {
    if (!rule.keys.insert(key).second) {
        result.errors.push_back({line, "duplicate key '" + key + "'"});
        return;
    }

    if (key == "pattern") {
        rule.spec.pattern = value;
        rule.has_pattern = true;
    } else if (key == "replacement") {
        rule.spec.replacement = value;
        rule.has_replacement = true;
    } else if (key == "description") {
        rule.spec.description = value;
    } else if (key == "priority") {
        try {
            size_t consumed = 0;
            rule.spec.priority = std::stoi(value, &consumed);
            if (consumed != value.size()) {
                result.errors.push_back({line, "invalid priority '" + value + "'"});
            }
        } catch (const std::exception&) {
            result.errors.push_back({line, "invalid priority '" + value + "'"});
        }
    } else if (key == "enabled") {
        if (auto enabled = parse_bool(value)) {
            rule.spec.enabled = *enabled;
        } else {
            result.errors.push_back({line, "invalid enabled value '" + value + "'"});
        }
    } else if (key == "flags") {
        if (auto flags = parse_regex_flags(value)) {
            rule.spec.flags = *flags;
        } else {
            result.errors.push_back({line, "unknown flags '" + value + "'"});
        }
    } else {
        result.errors.push_back({line, "unknown key '" + key + "'"});
    }
}

} // namespace

auto RuleFileParser::parse(const std::string& content) -> RuleFileParseResult {
    RuleFileParseResult result;
    std::istringstream iss(content);
    std::string raw_line;
    size_t line_number = 0;

    std::optional<PendingRule> pending;
    bool in_toggle_section = false;

    while (std::getline(iss, raw_line)) {
        ++line_number;
        auto line = trim_right(raw_line);
        auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }

        std::smatch match;
        if (line[first] == '[') {
            finish_rule(pending, result);
            in_toggle_section = false;
            if (!std::regex_match(line, match, section_pattern_)) {
                result.errors.push_back({line_number, "malformed section header: " + line});
                continue;
            }

            auto kind = match[1].str();
            auto id = match[2].str();
            if (kind == "rule") {
                pending = PendingRule{.line = line_number, .spec = RuleSpec{.id = id}};
            } else {
                (kind == "disable" ? result.disabled : result.enabled).push_back(id);
                in_toggle_section = true;
            }
            continue;
        }

        if (!std::regex_match(line, match, entry_pattern_)) {
            result.errors.push_back({line_number, "malformed line: " + line});
            continue;
        }
        if (!pending) {
            result.errors.push_back(
                {line_number, in_toggle_section ? "entries are not allowed in enable/disable sections"
                                                : "entry outside a [rule] section"});
            continue;
        }
        set_entry(*pending, match[1].str(), match[2].str(), line_number, result);
    }
    finish_rule(pending, result);

    return result;
}

auto apply_rule_file(PatternRegistry& registry, const RuleFileParseResult& parsed)
    -> std::vector<std::string> {
    std::vector<std::string> problems;
    for (const auto& spec : parsed.rules) {
        try {
            registry.register_rule(make_rule(spec));
        } catch (const std::regex_error& e) {
            problems.push_back("rule " + spec.id + ": invalid pattern: " + e.what());
        } catch (const DuplicateRuleError&) {
            problems.push_back("rule " + spec.id + ": id is already registered");
        }
    }
    for (const auto& id : parsed.disabled) {
        if (!registry.set_enabled(id, false)) {
            problems.push_back("cannot disable unknown rule " + id);
        }
    }
    for (const auto& id : parsed.enabled) {
        if (!registry.set_enabled(id, true)) {
            problems.push_back("cannot enable unknown rule " + id);
        }
    }
    return problems;
}

auto format_rule_file_error(const RuleFileError& error) -> std::string {
    if (error.line == 0) {
        return error.message;
    }
    return "line " + std::to_string(error.line) + ": " + error.message;
}

} // namespace pytestify
