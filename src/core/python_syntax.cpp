#include "pytestify/core/python_syntax.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <regex>

namespace pytestify::python {

namespace {

constexpr std::array<std::string_view, 35> PYTHON_KEYWORDS = {
    "False",  "None",   "True",    "and",      "as",       "assert", "async",
    "await",  "break",  "class",   "continue", "def",      "del",    "elif",
    "else",   "except", "finally", "for",      "from",     "global", "if",
    "import", "in",     "is",      "lambda",   "nonlocal", "not",    "or",
    "pass",   "raise",  "return",  "try",      "while",    "with",   "yield"};

auto is_open_bracket(char ch) -> bool {
    return ch == '(' || ch == '[' || ch == '{';
}

auto is_close_bracket(char ch) -> bool {
    return ch == ')' || ch == ']' || ch == '}';
}

auto is_quote(char ch) -> bool {
    return ch == '\'' || ch == '"';
}

auto skip_comment(std::string_view text, size_t pos) -> size_t {
    while (pos < text.size() && text[pos] != '\n') {
        ++pos;
    }
    return pos;
}

} // namespace

auto is_identifier_char(char ch) -> bool {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

auto is_identifier(std::string_view text) -> bool {
    if (text.empty() || std::isdigit(static_cast<unsigned char>(text.front())) != 0) {
        return false;
    }
    return std::all_of(text.begin(), text.end(), is_identifier_char) && !is_keyword(text);
}

auto is_dotted_name(std::string_view text) -> bool {
    if (text.empty()) {
        return false;
    }
    size_t start = 0;
    while (start <= text.size()) {
        auto dot = text.find('.', start);
        auto part = text.substr(start, dot == std::string_view::npos ? dot : dot - start);
        if (!is_identifier(part)) {
            return false;
        }
        if (dot == std::string_view::npos) {
            return true;
        }
        start = dot + 1;
    }
    return false;
}

auto is_keyword(std::string_view word) -> bool {
    return std::find(PYTHON_KEYWORDS.begin(), PYTHON_KEYWORDS.end(), word) !=
           PYTHON_KEYWORDS.end();
}

auto trim(std::string_view text) -> std::string {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(begin, end - begin + 1));
}

auto leading_whitespace(std::string_view line) -> std::string {
    auto end = line.find_first_not_of(" \t");
    return std::string(line.substr(0, end == std::string_view::npos ? line.size() : end));
}

auto string_literal_end(std::string_view text, size_t quote_pos) -> size_t {
    char quote = text[quote_pos];
    bool triple = quote_pos + 2 < text.size() && text[quote_pos + 1] == quote &&
                  text[quote_pos + 2] == quote;
    size_t pos = quote_pos + (triple ? 3 : 1);

    while (pos < text.size()) {
        char ch = text[pos];
        if (ch == '\\') {
            pos += 2;
            continue;
        }
        if (triple) {
            if (ch == quote && pos + 2 < text.size() && text[pos + 1] == quote &&
                text[pos + 2] == quote) {
                return pos + 3;
            }
        } else if (ch == quote) {
            return pos + 1;
        } else if (ch == '\n') {
            return pos;  // Unterminated single-quoted literal stops at the line end
        }
        ++pos;
    }
    return text.size();
}

auto code_mask(std::string_view text) -> std::vector<bool> {
    std::vector<bool> mask(text.size(), true);
    size_t pos = 0;
    while (pos < text.size()) {
        char ch = text[pos];
        if (ch == '#') {
            auto end = skip_comment(text, pos);
            std::fill(mask.begin() + static_cast<std::ptrdiff_t>(pos),
                      mask.begin() + static_cast<std::ptrdiff_t>(end), false);
            pos = end;
        } else if (is_quote(ch)) {
            auto end = std::min(string_literal_end(text, pos), text.size());
            std::fill(mask.begin() + static_cast<std::ptrdiff_t>(pos),
                      mask.begin() + static_cast<std::ptrdiff_t>(end), false);
            pos = end;
        } else {
            ++pos;
        }
    }
    return mask;
}

auto find_closing_bracket(std::string_view text, size_t open_pos) -> std::optional<size_t> {
    if (open_pos >= text.size() || !is_open_bracket(text[open_pos])) {
        return std::nullopt;
    }
    int depth = 0;
    size_t pos = open_pos;
    while (pos < text.size()) {
        char ch = text[pos];
        if (ch == '#') {
            pos = skip_comment(text, pos);
            continue;
        }
        if (is_quote(ch)) {
            pos = string_literal_end(text, pos);
            continue;
        }
        if (is_open_bracket(ch)) {
            ++depth;
        } else if (is_close_bracket(ch)) {
            --depth;
            if (depth == 0) {
                return pos;
            }
        }
        ++pos;
    }
    return std::nullopt;
}

auto split_top_level(std::string_view text, char separator) -> std::vector<std::string> {
    std::vector<std::string> parts;
    int depth = 0;
    size_t part_start = 0;
    size_t pos = 0;

    while (pos < text.size()) {
        char ch = text[pos];
        if (ch == '#') {
            pos = skip_comment(text, pos);
            continue;
        }
        if (is_quote(ch)) {
            pos = string_literal_end(text, pos);
            continue;
        }
        if (is_open_bracket(ch)) {
            ++depth;
        } else if (is_close_bracket(ch)) {
            depth = std::max(0, depth - 1);
        } else if (ch == separator && depth == 0) {
            parts.push_back(trim(text.substr(part_start, pos - part_start)));
            part_start = pos + 1;
        }
        ++pos;
    }

    auto last = trim(text.substr(std::min(part_start, text.size())));
    if (!last.empty() || !parts.empty()) {
        parts.push_back(last);
    }
    if (!parts.empty() && parts.back().empty()) {
        parts.pop_back();
    }
    return parts;
}

auto flatten_top_level(std::string_view text) -> std::string {
    std::string result(text);
    int depth = 0;
    size_t pos = 0;

    while (pos < text.size()) {
        char ch = text[pos];
        if (ch == '#') {
            auto end = skip_comment(text, pos);
            std::fill(result.begin() + static_cast<std::ptrdiff_t>(pos),
                      result.begin() + static_cast<std::ptrdiff_t>(end), ' ');
            pos = end;
            continue;
        }
        if (is_quote(ch)) {
            auto end = std::min(string_literal_end(text, pos), text.size());
            std::fill(result.begin() + static_cast<std::ptrdiff_t>(pos),
                      result.begin() + static_cast<std::ptrdiff_t>(end), ' ');
            pos = end;
            continue;
        }
        if (is_open_bracket(ch)) {
            ++depth;
            result[pos] = ' ';
        } else if (is_close_bracket(ch)) {
            depth = std::max(0, depth - 1);
            result[pos] = ' ';
        } else if (depth > 0) {
            result[pos] = ' ';
        }
        ++pos;
    }
    return result;
}

auto blank_non_code(std::string_view text) -> std::string {
    std::string result(text);
    auto mask = code_mask(text);
    for (size_t pos = 0; pos < result.size(); ++pos) {
        if (!mask[pos] && result[pos] != '\n') {
            result[pos] = ' ';
        }
    }
    return result;
}

auto strip_enclosing_parens(std::string_view text) -> std::string {
    auto trimmed = trim(text);
    while (trimmed.size() >= 2 && trimmed.front() == '(') {
        auto close = find_closing_bracket(trimmed, 0);
        if (!close || *close != trimmed.size() - 1) {
            break;
        }
        trimmed = trim(std::string_view(trimmed).substr(1, trimmed.size() - 2));
    }
    return trimmed;
}

auto needs_parentheses(std::string_view expression) -> bool {
    static const std::regex loose_binding{
        R"((^|[^\w.])(and|or|not|if|else|lambda|in|is|yield|await)(?![\w]))"};
    static const std::regex comparison{R"(==|!=|<=|>=|<|>|:=)"};

    auto flat = flatten_top_level(expression);
    if (flat.find(',') != std::string::npos) {
        return true;
    }
    if (std::regex_search(flat, comparison)) {
        return true;
    }
    // "await x" binds tightly enough on its own; only flag it alongside other operators
    std::smatch match;
    auto begin = flat.cbegin();
    while (std::regex_search(begin, flat.cend(), match, loose_binding)) {
        if (match[2] != "await") {
            return true;
        }
        begin = match[0].second;
    }
    return false;
}

auto parenthesize_if_needed(std::string_view expression) -> std::string {
    auto trimmed = trim(expression);
    if (needs_parentheses(trimmed)) {
        return "(" + trimmed + ")";
    }
    return trimmed;
}

auto has_top_level_line_break(std::string_view expression) -> bool {
    return flatten_top_level(expression).find('\n') != std::string::npos;
}

auto keyword_argument(std::string_view argument)
    -> std::optional<std::pair<std::string, std::string>> {
    auto flat = flatten_top_level(argument);
    auto equals = flat.find('=');
    if (equals == std::string::npos || equals == 0) {
        return std::nullopt;
    }
    if (equals + 1 < flat.size() && flat[equals + 1] == '=') {
        return std::nullopt;
    }
    char before = flat[equals - 1];
    if (before == '=' || before == '!' || before == '<' || before == '>' || before == ':') {
        return std::nullopt;
    }
    auto name = trim(argument.substr(0, equals));
    if (!is_identifier(name)) {
        return std::nullopt;
    }
    return std::make_pair(name, trim(argument.substr(equals + 1)));
}

auto parse_parameter_names(std::string_view parameters)
    -> std::optional<std::vector<std::string>> {
    std::vector<std::string> names;
    for (const auto& part : split_top_level(parameters)) {
        if (part.empty() || part.front() == '*' || part == "/") {
            return std::nullopt;
        }
        auto flat = flatten_top_level(part);
        auto end = flat.find_first_of(":=");
        auto name = trim(std::string_view(part).substr(0, end));
        if (!is_identifier(name)) {
            return std::nullopt;
        }
        names.push_back(name);
    }
    return names;
}

auto find_identifier_uses(std::string_view text, std::string_view name) -> std::vector<size_t> {
    std::vector<size_t> uses;
    if (name.empty()) {
        return uses;
    }
    auto mask = code_mask(text);
    size_t pos = text.find(name);
    while (pos != std::string_view::npos) {
        auto end = pos + name.size();
        bool boundary_before = pos == 0 || (!is_identifier_char(text[pos - 1]) && text[pos - 1] != '.');
        bool boundary_after = end >= text.size() || !is_identifier_char(text[end]);
        if (boundary_before && boundary_after && mask[pos]) {
            uses.push_back(pos);
        }
        pos = text.find(name, pos + 1);
    }
    return uses;
}

auto contains_identifier(std::string_view text, std::string_view name) -> bool {
    return !find_identifier_uses(text, name).empty();
}

auto mentioned_in_strings(std::string_view text, std::string_view name) -> bool {
    if (name.empty()) {
        return false;
    }
    size_t pos = 0;
    while (pos < text.size()) {
        char ch = text[pos];
        if (ch == '#') {
            pos = skip_comment(text, pos);
            continue;
        }
        if (!is_quote(ch)) {
            ++pos;
            continue;
        }
        auto end = std::min(string_literal_end(text, pos), text.size());
        auto literal = text.substr(pos, end - pos);
        for (auto at = literal.find(name); at != std::string_view::npos;
             at = literal.find(name, at + 1)) {
            auto after = at + name.size();
            bool boundary_before = at == 0 || !is_identifier_char(literal[at - 1]);
            bool boundary_after = after >= literal.size() || !is_identifier_char(literal[after]);
            if (boundary_before && boundary_after) {
                return true;
            }
        }
        pos = end;
    }
    return false;
}

auto find_attribute_uses(std::string_view text, std::string_view object,
                         std::string_view attribute) -> std::vector<size_t> {
    std::vector<size_t> uses;
    auto needle = std::string(object) + "." + std::string(attribute);
    auto mask = code_mask(text);
    size_t pos = text.find(needle);
    while (pos != std::string_view::npos) {
        auto end = pos + needle.size();
        bool boundary_before = pos == 0 || (!is_identifier_char(text[pos - 1]) && text[pos - 1] != '.');
        bool boundary_after = end >= text.size() || !is_identifier_char(text[end]);
        if (boundary_before && boundary_after && mask[pos]) {
            uses.push_back(pos);
        }
        pos = text.find(needle, pos + 1);
    }
    return uses;
}

auto replace_attribute(std::string_view text, std::string_view object,
                       std::string_view attribute, std::string_view replacement) -> std::string {
    auto uses = find_attribute_uses(text, object, attribute);
    auto needle_size = object.size() + 1 + attribute.size();
    std::string result;
    result.reserve(text.size());
    size_t cursor = 0;
    for (auto use : uses) {
        result.append(text.substr(cursor, use - cursor));
        result.append(replacement);
        cursor = use + needle_size;
    }
    result.append(text.substr(cursor));
    return result;
}

} // namespace pytestify::python
