#include "pytestify/core/import_transform.hpp"
#include "pytestify/core/python_syntax.hpp"
#include <algorithm>
#include <set>

namespace pytestify {

namespace {

using python::LogicalLine;
using python::SourceModule;

auto statement_code(const LogicalLine& line) -> std::string {
    auto code = python::blank_non_code(line.code);
    return python::trim(code);
}

auto is_import(const LogicalLine& line) -> bool {
    auto code = statement_code(line);
    return code.starts_with("import ") || code.starts_with("from ");
}

auto is_future_import(const LogicalLine& line) -> bool {
    return statement_code(line).starts_with("from __future__ ");
}

// Names bound by "import a, b as c"
auto imported_modules(const LogicalLine& line) -> std::vector<std::string> {
    auto code = statement_code(line);
    if (!code.starts_with("import ")) {
        return {};
    }
    return python::split_top_level(std::string_view(code).substr(7));
}

auto top_level_lines(const SourceModule& module) -> std::vector<size_t> {
    std::vector<size_t> indices;
    for (size_t index = 0; index < module.lines.size(); ++index) {
        const auto& line = module.lines[index];
        if (line.is_statement() && line.indent.empty()) {
            indices.push_back(index);
        }
    }
    return indices;
}

// Identifier uses outside the given lines
auto used_outside(const SourceModule& module, std::string_view name,
                  const std::vector<size_t>& excluded) -> bool {
    for (auto use : python::find_identifier_uses(module.text, name)) {
        bool excluded_use = std::any_of(excluded.begin(), excluded.end(), [&](size_t index) {
            return use >= module.lines[index].begin && use < module.lines[index].end;
        });
        if (!excluded_use) {
            return true;
        }
    }
    return false;
}

auto line_removal(const SourceModule& module, size_t index, const std::string& rule_id)
    -> UnitRewrite {
    const auto& line = module.lines[index];
    UnitRewrite unit;
    unit.records.push_back(ApplicationRecord{
        .rule_id = rule_id,
        .original_fragment = line.code,
        .replacement_fragment = "",
        .location = location_at(module.text, line.code_begin),
    });
    unit.edits.push_back(SourceEdit{.begin = line.begin, .end = line.end, .replacement = ""});
    return unit;
}

auto line_replacement(const SourceModule& module, size_t index, const std::string& code,
                      const std::string& rule_id) -> UnitRewrite {
    const auto& line = module.lines[index];
    UnitRewrite unit;
    unit.records.push_back(ApplicationRecord{
        .rule_id = rule_id,
        .original_fragment = line.code,
        .replacement_fragment = code,
        .location = location_at(module.text, line.code_begin),
    });
    unit.edits.push_back(SourceEdit{
        .begin = line.code_begin,
        .end = line.code_begin + line.code.size(),
        .replacement = code,
    });
    return unit;
}

// Blank lines wanted between the import block and the statement after it
auto separation_before(const LogicalLine& line) -> std::string {
    auto code = statement_code(line);
    bool definition = code.starts_with("def ") || code.starts_with("class ") ||
                      code.starts_with("async def ") || code.starts_with("@");
    return definition ? "\n\n" : "\n";
}

auto pytest_insertion(const SourceModule& module, const std::vector<size_t>& statements)
    -> SourceEdit {
    std::optional<size_t> last_future;
    for (auto index : statements) {
        const auto& line = module.lines[index];
        if (is_future_import(line)) {
            last_future = index;
            continue;
        }
        if (is_import(line)) {
            return SourceEdit{.begin = line.begin, .end = line.begin, .replacement = "import pytest\n"};
        }
    }

    auto after_line = [&module](size_t index, std::string text) {
        const auto& line = module.lines[index];
        if (line.end == 0 || module.text[line.end - 1] != '\n') {
            text = "\n" + text;
        }
        return SourceEdit{.begin = line.end, .end = line.end, .replacement = text};
    };

    if (last_future) {
        return after_line(*last_future, "import pytest\n");
    }
    if (statements.empty()) {
        auto prefix = module.text.empty() || module.text.back() == '\n' ? "" : "\n";
        return SourceEdit{
            .begin = module.text.size(),
            .end = module.text.size(),
            .replacement = std::string(prefix) + "import pytest\n",
        };
    }
    const auto& first = module.lines[statements.front()];
    if (python::is_docstring(python::trim(first.code))) {
        return after_line(statements.front(), "\nimport pytest\n");
    }
    return SourceEdit{
        .begin = first.begin,
        .end = first.begin,
        .replacement = "import pytest\n" + separation_before(first),
    };
}

// Resets the blank run between the import block and the first statement
// after it, counting import lines that are being removed as blank
auto import_block_spacing(const SourceModule& module, const std::vector<size_t>& statements,
                          const std::set<size_t>& removed, bool pytest_inserted)
    -> std::vector<SourceEdit> {
    auto next = std::find_if(statements.begin(), statements.end(), [&](size_t index) {
        const auto& line = module.lines[index];
        bool leading_docstring =
            index == statements.front() && python::is_docstring(python::trim(line.code));
        return !is_import(line) && !leading_docstring;
    });
    if (next == statements.end() || *next == statements.front()) {
        return {};
    }

    std::vector<size_t> blanks;
    auto index = *next;
    while (index > 0) {
        const auto& line = module.lines[index - 1];
        if (line.blank) {
            blanks.push_back(index - 1);
        } else if (!removed.contains(index - 1)) {
            break;
        }
        --index;
    }
    // A comment directly above the statement belongs to it
    if (index > 0 && !module.lines[index - 1].is_statement()) {
        return {};
    }

    const auto& target = module.lines[*next];
    // Nothing is left above when every import went and none was added
    auto separation = index == 0 && !pytest_inserted ? std::string{} : separation_before(target);
    if (blanks.size() == separation.size()) {
        return {};
    }
    std::vector<SourceEdit> edits;
    for (auto blank : blanks) {
        const auto& line = module.lines[blank];
        edits.push_back(SourceEdit{.begin = line.begin, .end = line.end, .replacement = ""});
    }
    edits.push_back(SourceEdit{.begin = target.begin, .end = target.begin, .replacement = separation});
    return edits;
}

// "from unittest import a, b as c" without the names nothing else uses
auto prune_from_unittest(const SourceModule& module, size_t index,
                         const std::vector<size_t>& import_lines, const std::string& rule_id)
    -> std::optional<UnitRewrite> {
    auto code = statement_code(module.lines[index]);
    const std::string prefix = "from unittest import ";
    if (!code.starts_with(prefix)) {
        return std::nullopt;
    }
    auto names = python::split_top_level(python::strip_enclosing_parens(code.substr(prefix.size())));
    std::vector<std::string> kept;
    for (const auto& name : names) {
        auto flat = python::flatten_top_level(name);
        auto as_pos = flat.find(" as ");
        auto bound = python::trim(as_pos == std::string::npos ? name : name.substr(as_pos + 4));
        if (!python::is_identifier(bound)) {
            return std::nullopt;
        }
        if (used_outside(module, bound, import_lines)) {
            kept.push_back(name);
        }
    }
    if (kept.size() == names.size()) {
        return std::nullopt;
    }
    if (kept.empty()) {
        return line_removal(module, index, rule_id);
    }
    std::string joined;
    for (const auto& name : kept) {
        joined += (joined.empty() ? "" : ", ") + name;
    }
    return line_replacement(module, index, prefix + joined, rule_id);
}

} // namespace

auto rewrite_pytest_imports(const python::SourceModule& module, const std::string& rule_id)
    -> PassResult {
    PassResult result;
    auto statements = top_level_lines(module);

    std::vector<size_t> import_lines;
    std::vector<size_t> pytest_imports;
    for (auto index : statements) {
        if (!is_import(module.lines[index])) {
            continue;
        }
        import_lines.push_back(index);
        auto modules = imported_modules(module.lines[index]);
        if (std::find(modules.begin(), modules.end(), "pytest") != modules.end()) {
            pytest_imports.push_back(index);
        }
    }

    if (used_outside(module, "pytest", import_lines) && pytest_imports.empty()) {
        auto edit = pytest_insertion(module, statements);
        UnitRewrite unit;
        unit.records.push_back(ApplicationRecord{
            .rule_id = rule_id,
            .original_fragment = "",
            .replacement_fragment = "import pytest",
            .location = location_at(module.text, edit.begin),
        });
        unit.edits.push_back(std::move(edit));
        result.units.push_back(std::move(unit));
    }

    std::set<size_t> removed;
    bool pytest_inserted = !result.units.empty();

    // Only exact duplicates go; "import os, pytest" is left alone
    bool seen_plain = false;
    for (auto index : pytest_imports) {
        if (statement_code(module.lines[index]) != "import pytest") {
            continue;
        }
        if (seen_plain) {
            result.units.push_back(line_removal(module, index, rule_id));
            removed.insert(index);
        }
        seen_plain = true;
    }

    for (auto index : import_lines) {
        const auto& line = module.lines[index];
        if (statement_code(line) == "import unittest") {
            if (!used_outside(module, "unittest", import_lines)) {
                result.units.push_back(line_removal(module, index, rule_id));
                removed.insert(index);
            }
        } else if (auto unit = prune_from_unittest(module, index, import_lines, rule_id)) {
            if (unit->records.front().replacement_fragment.empty()) {
                removed.insert(index);
            }
            result.units.push_back(std::move(*unit));
        }
    }

    if (!result.units.empty()) {
        auto spacing = import_block_spacing(module, statements, removed, pytest_inserted);
        auto& edits = result.units.back().edits;
        edits.insert(edits.end(), spacing.begin(), spacing.end());
    }
    return result;
}

} // namespace pytestify
