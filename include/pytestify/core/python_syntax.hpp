#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Lexical helpers over Python source text. Nothing here builds a syntax
// tree: string literals, comments and bracket nesting are the only
// structure these functions understand.
namespace pytestify::python {

auto is_identifier_char(char ch) -> bool;
auto is_identifier(std::string_view text) -> bool;
auto is_dotted_name(std::string_view text) -> bool;
auto is_keyword(std::string_view word) -> bool;

auto trim(std::string_view text) -> std::string;
auto leading_whitespace(std::string_view line) -> std::string;

// Offset one past the end of the string literal whose opening quote is at quote_pos
auto string_literal_end(std::string_view text, size_t quote_pos) -> size_t;

// true for every character that is code, false inside string literals and comments
auto code_mask(std::string_view text) -> std::vector<bool>;

// Position of the bracket closing the one at open_pos
auto find_closing_bracket(std::string_view text, size_t open_pos) -> std::optional<size_t>;

// Splits on separator outside brackets and strings. Parts are trimmed and a
// trailing empty part (trailing comma) is dropped.
auto split_top_level(std::string_view text, char separator = ',') -> std::vector<std::string>;

// Copy where string literals, comments and bracketed regions are blanked out
auto flatten_top_level(std::string_view text) -> std::string;

// Copy where only string literals and comments are blanked out (newlines kept)
auto blank_non_code(std::string_view text) -> std::string;

// "(a, b)" -> "a, b" when the outer parentheses enclose the whole text
auto strip_enclosing_parens(std::string_view text) -> std::string;

// true when the expression binds more loosely than a comparison operand
auto needs_parentheses(std::string_view expression) -> bool;
auto parenthesize_if_needed(std::string_view expression) -> std::string;

// Line break outside brackets and strings; such text cannot be moved out of a call
auto has_top_level_line_break(std::string_view expression) -> bool;

// "name=value" at the top level of one call argument
auto keyword_argument(std::string_view argument)
    -> std::optional<std::pair<std::string, std::string>>;

// Parameter names of a def signature; nullopt for *args, **kwargs or '/'
auto parse_parameter_names(std::string_view parameters) -> std::optional<std::vector<std::string>>;

// Offsets of name used as a bare identifier (not an attribute) in code
auto find_identifier_uses(std::string_view text, std::string_view name) -> std::vector<size_t>;
auto contains_identifier(std::string_view text, std::string_view name) -> bool;

// name as a whole word inside a string literal, f-string fields included
auto mentioned_in_strings(std::string_view text, std::string_view name) -> bool;

// object.attribute occurrences in code
auto find_attribute_uses(std::string_view text, std::string_view object,
                         std::string_view attribute) -> std::vector<size_t>;
auto replace_attribute(std::string_view text, std::string_view object,
                       std::string_view attribute, std::string_view replacement) -> std::string;

} // namespace pytestify::python
