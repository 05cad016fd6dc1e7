#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pytestify::python {

// One logical line: physical lines joined by open brackets, backslash
// continuations or multi-line strings
struct LogicalLine {
    size_t begin{};          // Offset of the first physical line
    size_t end{};            // Offset just past the trailing newline (or end of text)
    size_t code_begin{};     // Offset of the first non-blank character
    size_t first_line{};     // 1-based physical line numbers
    size_t last_line{};
    std::string indent;
    std::string code;        // Text from code_begin to the end, without the trailing newline
    bool blank = false;
    bool comment_only = false;
    bool has_multiline_string = false;

    auto is_statement() const -> bool
    {
        return !blank && !comment_only;
    }
};

enum class DeclarationKind {
    CLASS,
    FUNCTION
};

struct Declaration {
    DeclarationKind kind = DeclarationKind::FUNCTION;
    std::string name;
    std::string indent;
    std::vector<std::string> decorators;    // Decorator lines without the leading '@'
    std::string signature;                  // Text between the header parentheses
    bool has_parentheses = false;
    bool is_async = false;
    std::string inline_body;                // "def f(): pass" -> "pass"
    size_t first_line{};                    // Index of the first decorator (or header) line
    size_t header_line{};                   // Index of the def/class logical line
    size_t last_line{};                     // Index of the last body line
    std::vector<Declaration> children;

    auto has_body_lines() const -> bool
    {
        return last_line > header_line;
    }
};

struct SourceModule {
    std::string text;
    std::vector<LogicalLine> lines;
    std::vector<Declaration> declarations;
};

auto split_logical_lines(std::string_view text) -> std::vector<LogicalLine>;
auto parse_module(std::string text) -> SourceModule;

// Header fields of "class X(...):", "def f(...):" or "async def f(...):"
auto parse_header(std::string_view code) -> std::optional<Declaration>;

// Offsets covering a declaration including its decorators and body
auto declaration_begin(const SourceModule& module, const Declaration& declaration) -> size_t;
auto declaration_end(const SourceModule& module, const Declaration& declaration) -> size_t;
auto declaration_text(const SourceModule& module, const Declaration& declaration) -> std::string;

// Offsets of the body lines (empty range for inline bodies)
auto body_begin(const SourceModule& module, const Declaration& declaration) -> size_t;
auto body_text(const SourceModule& module, const Declaration& declaration) -> std::string;

// Indentation of the first statement in the body
auto body_indent(const SourceModule& module, const Declaration& declaration) -> std::string;

// Statements of a body at the body's own indentation, skipping nested lines
auto body_statements(const SourceModule& module, const Declaration& declaration)
    -> std::vector<size_t>;

auto is_docstring(std::string_view code) -> bool;
auto has_decorator(const Declaration& declaration, std::string_view name) -> bool;
auto find_child(const Declaration& declaration, std::string_view name) -> const Declaration*;

} // namespace pytestify::python
