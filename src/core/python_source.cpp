#include "pytestify/core/python_source.hpp"
#include "pytestify/core/python_syntax.hpp"
#include <algorithm>

namespace pytestify::python {

namespace {

auto is_line_break_at(std::string_view text, size_t pos) -> size_t {
    if (pos < text.size() && text[pos] == '\n') {
        return 1;
    }
    if (pos + 1 < text.size() && text[pos] == '\r' && text[pos + 1] == '\n') {
        return 2;
    }
    return 0;
}

auto starts_with_keyword(std::string_view code, std::string_view keyword) -> bool {
    return code.starts_with(keyword) && code.size() > keyword.size() &&
           (code[keyword.size()] == ' ' || code[keyword.size()] == '\t');
}

auto skip_blanks(std::string_view code, size_t pos) -> size_t {
    while (pos < code.size() && (code[pos] == ' ' || code[pos] == '\t')) {
        ++pos;
    }
    return pos;
}

auto parse_block(const std::vector<LogicalLine>& lines, size_t start, size_t end)
    -> std::vector<Declaration> {
    std::vector<Declaration> result;
    std::optional<size_t> block_indent;
    std::optional<size_t> decorator_start;
    size_t index = start;

    while (index < end) {
        const auto& line = lines[index];
        if (!line.is_statement()) {
            ++index;
            continue;
        }
        if (!block_indent) {
            block_indent = line.indent.size();
        }
        if (line.indent.size() != *block_indent) {
            decorator_start.reset();
            ++index;
            continue;
        }
        if (line.code.starts_with('@')) {
            if (!decorator_start) {
                decorator_start = index;
            }
            ++index;
            continue;
        }

        auto header = parse_header(line.code);
        if (!header) {
            decorator_start.reset();
            ++index;
            continue;
        }

        Declaration declaration = std::move(*header);
        declaration.indent = line.indent;
        declaration.header_line = index;
        declaration.first_line = decorator_start.value_or(index);
        for (size_t k = declaration.first_line; k < index; ++k) {
            if (lines[k].is_statement() && lines[k].code.starts_with('@')) {
                declaration.decorators.push_back(trim(std::string_view(lines[k].code).substr(1)));
            }
        }

        size_t last = index;
        if (declaration.inline_body.empty()) {
            for (size_t next = index + 1; next < lines.size(); ++next) {
                if (!lines[next].is_statement()) {
                    continue;
                }
                if (lines[next].indent.size() <= line.indent.size()) {
                    break;
                }
                last = next;
            }
        }
        declaration.last_line = last;
        if (last > index) {
            declaration.children = parse_block(lines, index + 1, last + 1);
        }

        result.push_back(std::move(declaration));
        decorator_start.reset();
        index = last + 1;
    }
    return result;
}

} // namespace

auto split_logical_lines(std::string_view text) -> std::vector<LogicalLine> {
    std::vector<LogicalLine> lines;
    size_t pos = 0;
    size_t line_number = 1;

    while (pos < text.size()) {
        LogicalLine line;
        line.begin = pos;
        line.first_line = line_number;
        std::optional<size_t> code_begin;
        int depth = 0;
        size_t content_end = text.size();
        bool ended_by_newline = false;

        while (pos < text.size()) {
            char ch = text[pos];
            if (ch == '#') {
                if (!code_begin) {
                    code_begin = pos;
                    line.comment_only = true;
                }
                while (pos < text.size() && text[pos] != '\n') {
                    ++pos;
                }
                continue;
            }
            if (ch == '\'' || ch == '"') {
                if (!code_begin) {
                    code_begin = pos;
                }
                auto end = std::min(string_literal_end(text, pos), text.size());
                auto newlines = static_cast<size_t>(
                    std::count(text.begin() + static_cast<std::ptrdiff_t>(pos),
                               text.begin() + static_cast<std::ptrdiff_t>(end), '\n'));
                if (newlines > 0) {
                    line.has_multiline_string = true;
                    line_number += newlines;
                }
                pos = end;
                continue;
            }
            if (ch == '\\') {
                if (auto width = is_line_break_at(text, pos + 1); width > 0) {
                    pos += 1 + width;
                    ++line_number;
                    continue;
                }
            }
            if (ch == '\n') {
                ++line_number;
                ++pos;
                if (depth > 0 && !line.comment_only) {
                    continue;
                }
                content_end = pos - 1;
                ended_by_newline = true;
                break;
            }
            if (ch != ' ' && ch != '\t' && ch != '\r' && ch != '\f' && !code_begin) {
                code_begin = pos;
            }
            if (ch == '(' || ch == '[' || ch == '{') {
                ++depth;
            } else if (ch == ')' || ch == ']' || ch == '}') {
                depth = std::max(0, depth - 1);
            }
            ++pos;
        }

        if (content_end > line.begin && text[content_end - 1] == '\r') {
            --content_end;
        }
        line.end = pos;
        line.last_line = ended_by_newline ? line_number - 1 : line_number;
        line.blank = !code_begin;
        line.code_begin = code_begin.value_or(content_end);
        line.indent = std::string(text.substr(line.begin, line.code_begin - line.begin));
        if (!line.blank) {
            line.code = std::string(text.substr(line.code_begin, content_end - line.code_begin));
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

auto parse_module(std::string text) -> SourceModule {
    SourceModule module;
    module.text = std::move(text);
    module.lines = split_logical_lines(module.text);
    module.declarations = parse_block(module.lines, 0, module.lines.size());
    return module;
}

auto parse_header(std::string_view code) -> std::optional<Declaration> {
    Declaration declaration;
    size_t pos = 0;

    if (starts_with_keyword(code, "async")) {
        declaration.is_async = true;
        pos = skip_blanks(code, 5);
    }
    auto rest = code.substr(pos);
    if (starts_with_keyword(rest, "def")) {
        declaration.kind = DeclarationKind::FUNCTION;
        pos += 3;
    } else if (starts_with_keyword(rest, "class") && !declaration.is_async) {
        declaration.kind = DeclarationKind::CLASS;
        pos += 5;
    } else {
        return std::nullopt;
    }

    pos = skip_blanks(code, pos);
    auto name_end = pos;
    while (name_end < code.size() && is_identifier_char(code[name_end])) {
        ++name_end;
    }
    declaration.name = std::string(code.substr(pos, name_end - pos));
    if (!is_identifier(declaration.name)) {
        return std::nullopt;
    }

    pos = skip_blanks(code, name_end);
    if (pos < code.size() && code[pos] == '(') {
        auto close = find_closing_bracket(code, pos);
        if (!close) {
            return std::nullopt;
        }
        declaration.has_parentheses = true;
        declaration.signature = std::string(code.substr(pos + 1, *close - pos - 1));
        pos = *close + 1;
    } else if (declaration.kind == DeclarationKind::FUNCTION) {
        return std::nullopt;
    }

    auto flat = flatten_top_level(code);
    auto colon = flat.find(':', pos);
    if (colon == std::string::npos) {
        return std::nullopt;
    }

    auto mask = code_mask(code);
    auto body_end = colon + 1;
    while (body_end < code.size() && mask[body_end]) {
        ++body_end;
    }
    declaration.inline_body = trim(code.substr(colon + 1, body_end - colon - 1));
    return declaration;
}

auto declaration_begin(const SourceModule& module, const Declaration& declaration) -> size_t {
    return module.lines[declaration.first_line].begin;
}

auto declaration_end(const SourceModule& module, const Declaration& declaration) -> size_t {
    return module.lines[declaration.last_line].end;
}

auto declaration_text(const SourceModule& module, const Declaration& declaration)
    -> std::string {
    auto begin = declaration_begin(module, declaration);
    return module.text.substr(begin, declaration_end(module, declaration) - begin);
}

auto body_begin(const SourceModule& module, const Declaration& declaration) -> size_t {
    return module.lines[declaration.header_line].end;
}

auto body_text(const SourceModule& module, const Declaration& declaration) -> std::string {
    if (!declaration.has_body_lines()) {
        return "";
    }
    auto begin = body_begin(module, declaration);
    return module.text.substr(begin, declaration_end(module, declaration) - begin);
}

auto body_indent(const SourceModule& module, const Declaration& declaration) -> std::string {
    for (auto index = declaration.header_line + 1; index <= declaration.last_line; ++index) {
        if (module.lines[index].is_statement()) {
            return module.lines[index].indent;
        }
    }
    return "";
}

auto body_statements(const SourceModule& module, const Declaration& declaration)
    -> std::vector<size_t> {
    std::vector<size_t> statements;
    if (!declaration.has_body_lines()) {
        return statements;
    }
    auto indent = body_indent(module, declaration);
    for (auto index = declaration.header_line + 1; index <= declaration.last_line; ++index) {
        const auto& line = module.lines[index];
        if (line.is_statement() && line.indent == indent) {
            statements.push_back(index);
        }
    }
    return statements;
}

auto is_docstring(std::string_view code) -> bool {
    size_t pos = 0;
    while (pos < code.size() && pos < 2 && std::string_view("rRuUbB").find(code[pos]) !=
                                                std::string_view::npos) {
        ++pos;
    }
    if (pos >= code.size() || (code[pos] != '"' && code[pos] != '\'')) {
        return false;
    }
    return string_literal_end(code, pos) == code.size();
}

auto has_decorator(const Declaration& declaration, std::string_view name) -> bool {
    return std::any_of(declaration.decorators.begin(), declaration.decorators.end(),
                       [name](const std::string& decorator) {
                           return decorator == name ||
                                  (decorator.starts_with(name) && decorator.size() > name.size() &&
                                   decorator[name.size()] == '(');
                       });
}

auto find_child(const Declaration& declaration, std::string_view name) -> const Declaration* {
    auto it = std::find_if(declaration.children.begin(), declaration.children.end(),
                           [name](const Declaration& child) { return child.name == name; });
    return it == declaration.children.end() ? nullptr : &*it;
}

} // namespace pytestify::python
