#include "pytestify/core/yield_transform.hpp"
#include "pytestify/core/python_syntax.hpp"
#include <algorithm>
#include <set>
#include <variant>

namespace pytestify {

namespace {

using python::Declaration;
using python::DeclarationKind;
using python::SourceModule;

// A yield test in a shape we can express with parametrize
struct YieldPlan {
    std::vector<std::string> names;           // parametrize argument names
    std::string values;                       // value list, or the loop iterable
    std::string invocation;
    std::optional<size_t> docstring_line;
};

struct Rejection {
    std::string reason;
};

// Code of one logical line with any trailing comment removed
auto strip_comment(std::string_view code) -> std::string {
    size_t pos = 0;
    while (pos < code.size()) {
        if (code[pos] == '#') {
            return python::trim(code.substr(0, pos));
        }
        if (code[pos] == '\'' || code[pos] == '"') {
            pos = python::string_literal_end(code, pos);
            continue;
        }
        ++pos;
    }
    return python::trim(code);
}

auto yield_expression(std::string_view code) -> std::optional<std::string> {
    auto statement = strip_comment(code);
    if (statement == "yield") {
        return std::string{};
    }
    if (!statement.starts_with("yield") || statement.size() < 6 ||
        python::is_identifier_char(statement[5])) {
        return std::nullopt;
    }
    return python::trim(std::string_view(statement).substr(5));
}

auto join(const std::vector<std::string>& parts) -> std::string {
    std::string joined;
    for (const auto& part : parts) {
        joined += (joined.empty() ? "" : ", ") + part;
    }
    return joined;
}

auto positional_names(size_t count) -> std::vector<std::string> {
    std::vector<std::string> names;
    for (size_t index = 1; index <= count; ++index) {
        names.push_back("arg" + std::to_string(index));
    }
    return names;
}

// Root identifier of a callable expression: "helper" for "helper.run"
auto callable_root(std::string_view callable) -> std::string {
    size_t end = 0;
    while (end < callable.size() && python::is_identifier_char(callable[end])) {
        ++end;
    }
    return std::string(callable.substr(0, end));
}

// Parameter names of a callable defined in the same file, when they fit
auto parameter_names_for(const SourceModule& module, const Declaration* owner,
                         const std::string& callable, size_t arity)
    -> std::optional<std::vector<std::string>> {
    const Declaration* target = nullptr;
    bool is_method = false;
    if (python::is_identifier(callable)) {
        for (const auto& declaration : module.declarations) {
            if (declaration.kind == DeclarationKind::FUNCTION && declaration.name == callable) {
                target = &declaration;
            }
        }
    } else if (owner != nullptr && callable.starts_with("self.") &&
               python::is_identifier(std::string_view(callable).substr(5))) {
        target = python::find_child(*owner, std::string_view(callable).substr(5));
        is_method = true;
    }
    if (target == nullptr || target->kind != DeclarationKind::FUNCTION) {
        return std::nullopt;
    }

    auto names = python::parse_parameter_names(target->signature);
    if (!names) {
        return std::nullopt;
    }
    if (is_method && !python::has_decorator(*target, "staticmethod")) {
        if (names->empty()) {
            return std::nullopt;
        }
        names->erase(names->begin());
    }
    if (names->size() != arity) {
        return std::nullopt;
    }
    return names;
}

auto value_list(const std::vector<std::vector<std::string>>& rows) -> std::string {
    std::vector<std::string> items;
    for (const auto& row : rows) {
        items.push_back(row.size() == 1 ? row.front() : "(" + join(row) + ")");
    }
    return "[" + join(items) + "]";
}

auto plan_static(const SourceModule& module, const Declaration* owner,
                 const std::vector<size_t>& yields) -> std::variant<YieldPlan, Rejection> {
    std::vector<std::string> callables;
    std::vector<std::vector<std::string>> arguments;
    for (auto index : yields) {
        auto expression = yield_expression(module.lines[index].code);
        if (!expression || expression->empty() || expression->starts_with("from ")) {
            return Rejection{"unsupported yield statement"};
        }
        auto parts = python::split_top_level(python::strip_enclosing_parens(*expression));
        if (parts.empty()) {
            return Rejection{"empty yield"};
        }
        callables.push_back(parts.front());
        arguments.emplace_back(parts.begin() + 1, parts.end());
    }

    auto arity = arguments.front().size();
    for (const auto& row : arguments) {
        if (row.size() != arity) {
            return Rejection{"yielded tuples differ in length"};
        }
        for (const auto& value : row) {
            if (python::contains_identifier(value, "self")) {
                return Rejection{"yielded values reference self"};
            }
        }
    }

    bool varying = std::any_of(callables.begin(), callables.end(),
                               [&](const std::string& callable) { return callable != callables.front(); });

    YieldPlan plan;
    if (varying) {
        for (const auto& callable : callables) {
            if (python::contains_identifier(callable, "self")) {
                return Rejection{"varying callable references self"};
            }
        }
        plan.names = positional_names(arity);
        plan.names.insert(plan.names.begin(), "func");
        for (size_t row = 0; row < arguments.size(); ++row) {
            arguments[row].insert(arguments[row].begin(), callables[row]);
        }
        plan.invocation = "func(" + join(std::vector<std::string>(plan.names.begin() + 1,
                                                                  plan.names.end())) + ")";
        plan.values = value_list(arguments);
        return plan;
    }

    const auto& callable = callables.front();
    if (arity == 0) {
        if (yields.size() > 1) {
            return Rejection{"repeated yield without arguments"};
        }
        plan.invocation = callable + "()";
        return plan;
    }

    auto names = parameter_names_for(module, owner, callable, arity);
    auto root = callable_root(callable);
    if (!names || std::find(names->begin(), names->end(), root) != names->end() ||
        std::find(names->begin(), names->end(), "self") != names->end()) {
        names = positional_names(arity);
    }
    if (std::find(names->begin(), names->end(), root) != names->end()) {
        return Rejection{"callable name clashes with parameter names"};
    }
    plan.names = *names;
    plan.invocation = callable + "(" + join(plan.names) + ")";
    plan.values = value_list(arguments);
    return plan;
}

// "for a, b in CASES:" followed by a single "yield check, a, b"
auto plan_loop(const SourceModule& module, const Declaration& function, size_t loop_index)
    -> std::variant<YieldPlan, Rejection> {
    auto header = strip_comment(module.lines[loop_index].code);
    if (!header.ends_with(":")) {
        return Rejection{"loop body on the same line"};
    }
    auto clause = std::string_view(header).substr(4, header.size() - 5);
    auto flat = python::flatten_top_level(clause);
    auto in_pos = flat.find(" in ");
    if (in_pos == std::string::npos) {
        return Rejection{"unsupported loop header"};
    }
    auto targets = python::split_top_level(python::strip_enclosing_parens(clause.substr(0, in_pos)));
    auto iterable = python::trim(clause.substr(in_pos + 4));
    if (targets.empty() || iterable.empty()) {
        return Rejection{"unsupported loop header"};
    }
    for (const auto& target : targets) {
        if (!python::is_identifier(target) || target == "self") {
            return Rejection{"loop targets are not plain names"};
        }
    }
    if (python::contains_identifier(iterable, "self")) {
        return Rejection{"loop iterable references self"};
    }

    std::vector<size_t> inner;
    for (auto index = loop_index + 1; index <= function.last_line; ++index) {
        if (module.lines[index].is_statement()) {
            inner.push_back(index);
        }
    }
    if (inner.size() != 1) {
        return Rejection{"loop body is not a single yield"};
    }
    auto expression = yield_expression(module.lines[inner.front()].code);
    if (!expression || expression->empty() || expression->starts_with("from ")) {
        return Rejection{"loop body is not a single yield"};
    }
    auto parts = python::split_top_level(python::strip_enclosing_parens(*expression));
    if (parts.empty()) {
        return Rejection{"empty yield"};
    }
    const auto& callable = parts.front();
    if (std::find(targets.begin(), targets.end(), callable_root(callable)) != targets.end()) {
        return Rejection{"callable varies with the loop"};
    }
    for (auto it = parts.begin() + 1; it != parts.end(); ++it) {
        if (std::find(targets.begin(), targets.end(), *it) == targets.end()) {
            return Rejection{"yielded arguments are not the loop targets"};
        }
    }

    YieldPlan plan;
    plan.names = targets;
    plan.values = iterable;
    plan.invocation =
        callable + "(" + join(std::vector<std::string>(parts.begin() + 1, parts.end())) + ")";
    return plan;
}

auto plan_yield_test(const SourceModule& module, const Declaration* owner,
                     const Declaration& function) -> std::variant<YieldPlan, Rejection> {
    if (function.is_async) {
        return Rejection{"async generator"};
    }
    if (!function.children.empty()) {
        return Rejection{"contains nested definitions"};
    }
    auto expected_signature = owner != nullptr ? "self" : "";
    if (python::trim(function.signature) != expected_signature) {
        return Rejection{"test already takes parameters"};
    }
    if (!function.inline_body.empty() || !function.has_body_lines()) {
        return Rejection{"inline body"};
    }

    auto statements = python::body_statements(module, function);
    std::optional<size_t> docstring;
    if (!statements.empty() && python::is_docstring(strip_comment(module.lines[statements.front()].code))) {
        docstring = statements.front();
        statements.erase(statements.begin());
    }
    if (statements.empty()) {
        return Rejection{"no yield statements"};
    }

    std::variant<YieldPlan, Rejection> planned = Rejection{""};
    if (statements.size() == 1 && strip_comment(module.lines[statements.front()].code).starts_with("for ")) {
        planned = plan_loop(module, function, statements.front());
    } else {
        auto indent = python::body_indent(module, function);
        for (auto index = function.header_line + 1; index <= function.last_line; ++index) {
            const auto& line = module.lines[index];
            if (line.is_statement() && line.indent != indent) {
                return Rejection{"yields inside nested blocks"};
            }
        }
        for (auto index : statements) {
            if (!yield_expression(module.lines[index].code)) {
                return Rejection{"body mixes yields with other statements"};
            }
        }
        planned = plan_static(module, owner, statements);
    }
    if (auto* plan = std::get_if<YieldPlan>(&planned)) {
        plan->docstring_line = docstring;
    }
    return planned;
}

auto render(const SourceModule& module, const Declaration& function, const YieldPlan& plan)
    -> std::string {
    const auto& header = module.lines[function.header_line];
    auto decorators = module.text.substr(module.lines[function.first_line].begin,
                                         header.begin - module.lines[function.first_line].begin);

    std::string text = decorators;
    if (!plan.names.empty()) {
        text += function.indent + "@pytest.mark.parametrize(\"" + join(plan.names) + "\", " +
                plan.values + ")\n";
    }

    auto open = header.code.find('(');
    auto close = python::find_closing_bracket(header.code, open);
    auto parameters = python::trim(function.signature);
    if (!plan.names.empty()) {
        parameters += (parameters.empty() ? "" : ", ") + join(plan.names);
    }
    text += function.indent + header.code.substr(0, open + 1) + parameters +
            header.code.substr(*close) + "\n";

    auto inner_indent = python::body_indent(module, function);
    if (plan.docstring_line) {
        const auto& line = module.lines[*plan.docstring_line];
        auto docstring = module.text.substr(line.begin, line.end - line.begin);
        if (docstring.empty() || docstring.back() != '\n') {
            docstring += '\n';
        }
        text += docstring;
    }
    text += inner_indent + plan.invocation + "\n";
    return text;
}

auto is_yield_test(const SourceModule& module, const Declaration& declaration) -> bool {
    if (declaration.kind != DeclarationKind::FUNCTION || !declaration.name.starts_with("test")) {
        return false;
    }
    if (std::any_of(declaration.decorators.begin(), declaration.decorators.end(),
                    [](const std::string& decorator) {
                        return decorator.find("fixture") != std::string::npos;
                    })) {
        return false;
    }
    auto body = python::blank_non_code(python::body_text(module, declaration) + declaration.inline_body);
    return python::contains_identifier(body, "yield");
}

auto marker_above(const SourceModule& module, const Declaration& declaration) -> bool {
    if (declaration.first_line == 0) {
        return false;
    }
    const auto& line = module.lines[declaration.first_line - 1];
    return line.comment_only && line.code.starts_with(FOLLOW_UP_MARKER);
}

auto process(const SourceModule& module, const Declaration* owner, const Declaration& function,
             const std::string& rule_id, PassResult& result) -> void {
    auto location = location_at(module.text, module.lines[function.header_line].code_begin);
    auto planned = plan_yield_test(module, owner, function);

    if (const auto* rejection = std::get_if<Rejection>(&planned)) {
        result.reject(rule_id, function.name + ": " + rejection->reason, location);
        if (marker_above(module, function)) {
            return;
        }
        auto marker = follow_up_marker(function.indent, rule_id, rejection->reason);
        auto position = module.lines[function.first_line].begin;
        UnitRewrite unit;
        unit.records.push_back(ApplicationRecord{
            .rule_id = rule_id,
            .original_fragment = "",
            .replacement_fragment = marker,
            .location = location_at(module.text, position),
        });
        unit.edits.push_back(SourceEdit{.begin = position, .end = position, .replacement = marker});
        result.units.push_back(std::move(unit));
        return;
    }

    auto rewritten = render(module, function, std::get<YieldPlan>(planned));
    UnitRewrite unit;
    unit.records.push_back(ApplicationRecord{
        .rule_id = rule_id,
        .original_fragment = python::declaration_text(module, function),
        .replacement_fragment = rewritten,
        .location = location,
    });
    unit.edits.push_back(SourceEdit{
        .begin = python::declaration_begin(module, function),
        .end = python::declaration_end(module, function),
        .replacement = std::move(rewritten),
    });
    result.units.push_back(std::move(unit));
}

} // namespace

auto follow_up_marker(std::string_view indent, std::string_view rule_id, std::string_view reason)
    -> std::string {
    return std::string(indent) + std::string(FOLLOW_UP_MARKER) + " (" + std::string(rule_id) +
           "): " + std::string(reason) + "\n";
}

auto rewrite_yield_tests(const python::SourceModule& module, const std::string& rule_id)
    -> PassResult {
    PassResult result;
    for (const auto& declaration : module.declarations) {
        if (declaration.kind == DeclarationKind::CLASS) {
            for (const auto& child : declaration.children) {
                if (is_yield_test(module, child)) {
                    process(module, &declaration, child, rule_id, result);
                }
            }
        } else if (is_yield_test(module, declaration)) {
            process(module, nullptr, declaration, rule_id, result);
        }
    }
    return result;
}

} // namespace pytestify
