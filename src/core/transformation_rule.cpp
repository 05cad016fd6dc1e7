#include "pytestify/core/transformation_rule.hpp"
#include <algorithm>
#include <cctype>
#include <memory>
#include <regex>
#include <sstream>

namespace pytestify {

namespace {

auto collect_matches(std::string_view text, const std::regex& regex, std::vector<MatchSpan>& spans)
    -> void {
    const char* first = text.data();
    const char* last = text.data() + text.size();
    for (std::cregex_iterator it(first, last, regex), end; it != end; ++it) {
        const auto& match = *it;
        if (match.length(0) == 0) {
            continue;  // Empty matches would rewrite forever
        }

        MatchSpan span;
        span.begin = static_cast<size_t>(match.position(0));
        span.end = span.begin + static_cast<size_t>(match.length(0));
        span.groups.reserve(match.size());
        for (size_t group = 0; group < match.size(); ++group) {
            if (match[group].matched) {
                span.groups.emplace_back(match[group].str());
            } else {
                span.groups.emplace_back(std::nullopt);
            }
        }
        spans.push_back(std::move(span));
    }
}

auto group_text(const Captures& captures, size_t index) -> std::string {
    if (index < captures.size() && captures[index]) {
        return *captures[index];
    }
    return "";
}

auto trim_flag(std::string_view text) -> std::string {
    std::string result;
    for (char ch : text) {
        if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
            result += static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        }
    }
    return result;
}

} // namespace

auto is_structural_tag(std::string_view pattern) -> bool {
    return pattern.starts_with(STRUCTURAL_TAG_PREFIX) &&
           pattern.size() > STRUCTURAL_TAG_PREFIX.size();
}

auto structural_tag_name(std::string_view pattern) -> std::string {
    if (!is_structural_tag(pattern)) {
        return "";
    }
    return std::string(pattern.substr(STRUCTURAL_TAG_PREFIX.size()));
}

auto translate_dotall(std::string_view pattern) -> std::string {
    std::string result;
    result.reserve(pattern.size());
    bool in_class = false;

    for (size_t i = 0; i < pattern.size(); ++i) {
        char ch = pattern[i];
        if (ch == '\\' && i + 1 < pattern.size()) {
            result += ch;
            result += pattern[++i];
            continue;
        }
        if (in_class) {
            if (ch == ']') {
                in_class = false;
            }
            result += ch;
            continue;
        }
        if (ch == '[') {
            in_class = true;
            result += ch;
            // A leading ']' (or '^]') is a literal member of the class
            if (i + 1 < pattern.size() && pattern[i + 1] == '^') {
                result += pattern[++i];
            }
            if (i + 1 < pattern.size() && pattern[i + 1] == ']') {
                result += pattern[++i];
            }
            continue;
        }
        if (ch == '.') {
            result += R"([\s\S])";
            continue;
        }
        result += ch;
    }
    return result;
}

auto make_regex_matcher(const std::string& pattern, RegexFlags flags) -> RuleMatcher {
    auto syntax = std::regex::ECMAScript;
    if (flags.ignore_case) {
        syntax |= std::regex::icase;
    }
    // '^' and '$' anchor at every line boundary; matches may still span lines
    if (flags.multiline) {
        syntax |= std::regex::multiline;
    }
    auto source = flags.dotall ? translate_dotall(pattern) : pattern;
    auto regex = std::make_shared<const std::regex>(source, syntax);

    return [regex](std::string_view text) -> std::vector<MatchSpan> {
        std::vector<MatchSpan> spans;
        collect_matches(text, *regex, spans);
        return spans;
    };
}

auto expand_template(std::string_view replacement_template, const Captures& captures)
    -> std::string {
    std::string result;
    result.reserve(replacement_template.size());

    for (size_t i = 0; i < replacement_template.size(); ++i) {
        char ch = replacement_template[i];
        if (ch != '\\' || i + 1 >= replacement_template.size()) {
            result += ch;
            continue;
        }

        char next = replacement_template[i + 1];
        if (next >= '1' && next <= '9') {
            result += group_text(captures, static_cast<size_t>(next - '0'));
            ++i;
        } else if (next == 'g' && i + 2 < replacement_template.size() &&
                   replacement_template[i + 2] == '<') {
            auto close = replacement_template.find('>', i + 3);
            auto digits = close == std::string_view::npos
                              ? std::string_view{}
                              : replacement_template.substr(i + 3, close - i - 3);
            bool numeric = !digits.empty() && digits.size() <= 3 &&
                           std::all_of(digits.begin(), digits.end(), [](char d) {
                               return std::isdigit(static_cast<unsigned char>(d)) != 0;
                           });
            if (!numeric) {
                result += ch;
                continue;
            }
            result += group_text(captures, static_cast<size_t>(std::stoul(std::string(digits))));
            i = close;
        } else if (next == 'n') {
            result += '\n';
            ++i;
        } else if (next == 't') {
            result += '\t';
            ++i;
        } else if (next == '\\') {
            result += '\\';
            ++i;
        } else {
            result += ch;
        }
    }
    return result;
}

auto make_template_producer(std::string replacement_template) -> RuleProducer {
    return [replacement_template = std::move(replacement_template)](
               const Captures& captures) -> std::optional<std::string> {
        return expand_template(replacement_template, captures);
    };
}

auto make_rule(const RuleSpec& spec) -> TransformationRule {
    if (is_structural_tag(spec.pattern)) {
        return TransformationRule{
            .id = spec.id,
            .kind = RuleKind::STRUCTURAL,
            .matcher = nullptr,
            .producer = nullptr,
            .priority = spec.priority,
            .enabled = spec.enabled,
            .description = spec.description.empty() ? spec.id : spec.description,
            .pattern = spec.pattern,
            .replacement = spec.replacement,
        };
    }
    return make_rule(spec, make_template_producer(spec.replacement));
}

auto make_rule(const RuleSpec& spec, RuleProducer producer) -> TransformationRule {
    return make_rule(spec, make_regex_matcher(spec.pattern, spec.flags), std::move(producer));
}

auto make_rule(const RuleSpec& spec, RuleMatcher matcher, RuleProducer producer)
    -> TransformationRule {
    return TransformationRule{
        .id = spec.id,
        .kind = RuleKind::TEXTUAL,
        .matcher = std::move(matcher),
        .producer = std::move(producer),
        .priority = spec.priority,
        .enabled = spec.enabled,
        .description = spec.description.empty() ? spec.id : spec.description,
        .pattern = spec.pattern,
        .replacement = spec.replacement,
    };
}

auto parse_regex_flags(std::string_view text) -> std::optional<RegexFlags> {
    RegexFlags flags;
    std::stringstream stream{std::string(text)};
    std::string item;

    while (std::getline(stream, item, ',')) {
        auto flag = trim_flag(item);
        if (flag.empty()) {
            continue;
        }
        if (flag == "MULTILINE" || flag == "M") {
            flags.multiline = true;
        } else if (flag == "IGNORECASE" || flag == "I") {
            flags.ignore_case = true;
        } else if (flag == "DOTALL" || flag == "S") {
            flags.dotall = true;
        } else {
            return std::nullopt;
        }
    }
    return flags;
}

auto describe_regex_flags(const RegexFlags& flags) -> std::string {
    std::string result;
    auto append = [&result](const char* name) {
        if (!result.empty()) {
            result += ",";
        }
        result += name;
    };
    if (flags.multiline) {
        append("MULTILINE");
    }
    if (flags.ignore_case) {
        append("IGNORECASE");
    }
    if (flags.dotall) {
        append("DOTALL");
    }
    return result;
}

} // namespace pytestify
