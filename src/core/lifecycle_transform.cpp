#include "pytestify/core/lifecycle_transform.hpp"
#include "pytestify/core/python_syntax.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <set>

namespace pytestify {

namespace {

using python::Declaration;
using python::DeclarationKind;
using python::SourceModule;

constexpr std::string_view CLASS_FIXTURE_DECORATOR = "@pytest.fixture(autouse=True)";
constexpr std::string_view MODULE_FIXTURE_DECORATOR =
    R"(@pytest.fixture(scope="module", autouse=True))";
constexpr std::string_view CLASS_FIXTURE_NAME = "setup_teardown";
constexpr std::string_view MODULE_FIXTURE_NAME = "module_setup_teardown";

// Attribute names that would shadow a pytest built-in fixture or our own names
const std::set<std::string, std::less<>> RESERVED_FIXTURE_NAMES = {
    "self",     "cls",         "request", "tmp_path",    "tmpdir",         "monkeypatch",
    "capsys",   "capfd",       "caplog",  "recwarn",     "pytestconfig",   "setup_teardown",
    "setup",    "teardown",    "cache",   "doctest_namespace", "record_property", "testdir"};

struct Hooks {
    const Declaration* setup = nullptr;
    const Declaration* teardown = nullptr;
    const Declaration* setup_class = nullptr;
    const Declaration* teardown_class = nullptr;
    bool duplicated = false;

    auto has_method_hooks() const -> bool
    {
        return setup != nullptr || teardown != nullptr;
    }

    auto has_class_hooks() const -> bool
    {
        return setup_class != nullptr || teardown_class != nullptr;
    }
};

auto lowercase(std::string_view text) -> std::string {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return result;
}

auto is_fixture(const Declaration& declaration) -> bool {
    return std::any_of(declaration.decorators.begin(), declaration.decorators.end(),
                       [](const std::string& decorator) {
                           return decorator.find("fixture") != std::string::npos;
                       });
}

auto header_location(const SourceModule& module, const Declaration& declaration)
    -> SourceLocation {
    return location_at(module.text, module.lines[declaration.header_line].code_begin);
}

auto ensure_newline(std::string text) -> std::string {
    if (!text.empty() && text.back() != '\n') {
        text += '\n';
    }
    return text;
}

auto join(const std::vector<std::string>& parts) -> std::string {
    std::string joined;
    for (const auto& part : parts) {
        joined += (joined.empty() ? "" : ", ") + part;
    }
    return joined;
}

auto find_hooks(const Declaration& owner) -> Hooks {
    Hooks hooks;
    auto assign = [&hooks](const Declaration*& slot, const Declaration& child) {
        if (slot != nullptr) {
            hooks.duplicated = true;
        }
        slot = &child;
    };

    for (const auto& child : owner.children) {
        if (child.kind != DeclarationKind::FUNCTION || is_fixture(child)) {
            continue;
        }
        auto name = lowercase(child.name);
        if (name == "setup") {
            assign(hooks.setup, child);
        } else if (name == "teardown") {
            assign(hooks.teardown, child);
        } else if (name == "setupclass") {
            assign(hooks.setup_class, child);
        } else if (name == "teardownclass") {
            assign(hooks.teardown_class, child);
        }
    }
    return hooks;
}

auto uses_legacy_api(std::string_view class_text) -> bool {
    static const std::regex legacy_api{
        R"(\bself\.(assert|fail|skipTest|addCleanup|doCleanups|subTest|maxDiff|longMessage|)"
        R"(addTypeEqualityFunc|shortDescription|countTestCases|defaultTestResult|)"
        R"(_testMethodName|_outcome)|\bself\.(id|run|debug)\s*\(|)"
        R"(\bcls\.(assert|fail|skipTest|addClassCleanup)|\bsuper\s*\()"};
    auto code = python::blank_non_code(class_text);
    return std::regex_search(code, legacy_api);
}

// Every statement of a hook body, nested ones included
auto body_mentions(const SourceModule& module, const Declaration& declaration,
                   std::string_view word) -> bool {
    return python::contains_identifier(python::blank_non_code(python::body_text(module, declaration)),
                                       word);
}

// Reason the hook cannot become part of a fixture, if any
auto hook_problem(const SourceModule& module, const Declaration& hook, std::string_view receiver,
                  bool is_setup) -> std::optional<std::string> {
    if (!hook.decorators.empty()) {
        return hook.name + " has decorators";
    }
    if (hook.is_async) {
        return hook.name + " is async";
    }
    if (python::trim(hook.signature) != receiver) {
        return hook.name + " has an unsupported signature";
    }
    if (!hook.inline_body.empty() || !hook.has_body_lines()) {
        return hook.name + " has an inline body";
    }
    auto body = python::blank_non_code(python::body_text(module, hook));
    if (body.find("super(") != std::string::npos) {
        return hook.name + " calls super()";
    }
    if (is_setup && (python::contains_identifier(body, "return") ||
                     python::contains_identifier(body, "yield"))) {
        return hook.name + " returns or yields";
    }
    return std::nullopt;
}

auto assigns_attribute(std::string_view body, const std::optional<std::string>& only_name)
    -> std::set<std::string> {
    static const std::regex assignment{R"(\bself\.(\w+)\s*(?:\*\*|//|>>|<<|[-+*/%&|^@])?=(?!=))"};
    std::set<std::string> names;
    auto code = python::blank_non_code(body);
    for (std::sregex_iterator it(code.begin(), code.end(), assignment), end; it != end; ++it) {
        auto name = (*it)[1].str();
        if (!only_name || name == *only_name) {
            names.insert(name);
        }
    }
    return names;
}

auto only_attribute_self_uses(std::string_view body, const std::string& name) -> bool {
    return python::find_identifier_uses(body, "self").size() ==
           python::find_attribute_uses(body, "self", name).size();
}

// self used as a plain value (call argument, assignment, return) in a method body
auto self_escapes(std::string_view body) -> bool {
    for (auto use : python::find_identifier_uses(body, "self")) {
        auto next = body.find_first_not_of(" \t", use + 4);
        if (next == std::string_view::npos || body[next] != '.') {
            return true;
        }
    }
    return false;
}

auto names_base(const Declaration& declaration, std::string_view name) -> bool {
    if (!declaration.has_parentheses) {
        return false;
    }
    for (const auto& base : python::split_top_level(declaration.signature)) {
        if (base == name || base.ends_with("." + std::string(name))) {
            return true;
        }
    }
    return false;
}

auto has_subclass(const std::vector<Declaration>& declarations, const Declaration& cls) -> bool {
    return std::any_of(declarations.begin(), declarations.end(), [&cls](const Declaration& other) {
        return (&other != &cls && other.kind == DeclarationKind::CLASS &&
                names_base(other, cls.name)) ||
               has_subclass(other.children, cls);
    });
}

// Attribute set by setUp that can be handed to the tests as a fixture value
auto fixture_attribute(const SourceModule& module, const Declaration& cls, const Hooks& hooks)
    -> std::optional<std::string> {
    if (hooks.setup == nullptr) {
        return std::nullopt;
    }
    auto setup_body = python::body_text(module, *hooks.setup);
    auto assigned = assigns_attribute(setup_body, std::nullopt);
    if (assigned.size() != 1) {
        return std::nullopt;
    }
    auto name = *assigned.begin();
    if (!python::is_identifier(name) || RESERVED_FIXTURE_NAMES.contains(name) ||
        name.starts_with("test")) {
        return std::nullopt;
    }
    if (!only_attribute_self_uses(setup_body, name)) {
        return std::nullopt;
    }
    if (hooks.teardown != nullptr) {
        auto teardown_body = python::body_text(module, *hooks.teardown);
        if (!only_attribute_self_uses(teardown_body, name) ||
            !assigns_attribute(teardown_body, name).empty()) {
            return std::nullopt;
        }
    }
    // A bare NAME anywhere in the class would clash with the new parameter
    auto class_text = python::declaration_text(module, cls);
    if (python::contains_identifier(class_text, name)) {
        return std::nullopt;
    }
    // self.NAME reads inside strings or subclasses cannot be rewritten
    if (python::mentioned_in_strings(class_text, name) || has_subclass(module.declarations, cls)) {
        return std::nullopt;
    }
    for (const auto& child : cls.children) {
        if (child.kind == DeclarationKind::FUNCTION &&
            self_escapes(python::body_text(module, child) + child.inline_body)) {
            return std::nullopt;
        }
    }

    bool read_by_test = false;
    for (const auto& child : cls.children) {
        if (&child == hooks.setup || &child == hooks.teardown) {
            continue;
        }
        auto child_text = python::declaration_text(module, child);
        if (python::find_attribute_uses(child_text, "self", name).empty()) {
            continue;
        }
        if (child.kind != DeclarationKind::FUNCTION || !child.name.starts_with("test") ||
            !assigns_attribute(child_text, name).empty()) {
            return std::nullopt;
        }
        auto parameters = python::parse_parameter_names(child.signature);
        if (!parameters || parameters->empty() || parameters->front() != "self") {
            return std::nullopt;
        }
        read_by_test = true;
    }
    if (!read_by_test) {
        return std::nullopt;
    }
    return name;
}

auto hook_body(const SourceModule& module, const Declaration* hook,
               const std::optional<std::string>& attribute) -> std::string {
    if (hook == nullptr) {
        return "";
    }
    auto body = python::body_text(module, *hook);
    if (attribute) {
        body = python::replace_attribute(body, "self", *attribute, *attribute);
    }
    return ensure_newline(body);
}

auto build_fixture(const SourceModule& module, const Hooks& hooks, std::string_view decorator,
                   std::string_view name, std::string_view parameters,
                   const std::optional<std::string>& attribute) -> std::string {
    const auto* anchor = hooks.setup != nullptr ? hooks.setup : hooks.teardown;
    const auto& indent = anchor->indent;
    auto inner_indent = python::body_indent(module, *anchor);

    auto text = indent + std::string(decorator) + "\n" + indent + "def " + std::string(name) + "(" +
                std::string(parameters) + "):\n";
    text += hook_body(module, hooks.setup, attribute);
    text += inner_indent + (attribute ? "yield " + *attribute : std::string("yield")) + "\n";
    text += hook_body(module, hooks.teardown, attribute);
    return text;
}

// Teardown range including the blank lines directly above it
auto removal_edit(const SourceModule& module, const Declaration& method, size_t floor_line)
    -> SourceEdit {
    auto first = method.first_line;
    while (first > floor_line && module.lines[first - 1].blank) {
        --first;
    }
    return SourceEdit{
        .begin = module.lines[first].begin,
        .end = python::declaration_end(module, method),
        .replacement = "",
    };
}

auto fixture_edits(const SourceModule& module, const Hooks& hooks, size_t floor_line,
                   std::string fixture_text, const std::string& rule_id, UnitRewrite& unit)
    -> void {
    const auto* anchor = hooks.setup != nullptr ? hooks.setup : hooks.teardown;
    auto anchor_begin = python::declaration_begin(module, *anchor);

    unit.records.push_back(ApplicationRecord{
        .rule_id = rule_id,
        .original_fragment = python::declaration_text(module, *anchor),
        .replacement_fragment = fixture_text,
        .location = header_location(module, *anchor),
    });
    unit.edits.push_back(SourceEdit{
        .begin = anchor_begin,
        .end = python::declaration_end(module, *anchor),
        .replacement = std::move(fixture_text),
    });

    if (hooks.setup != nullptr && hooks.teardown != nullptr) {
        auto floor = floor_line;
        if (hooks.setup->last_line < hooks.teardown->first_line) {
            floor = std::max(floor, hooks.setup->last_line + 1);
        }
        unit.records.push_back(ApplicationRecord{
            .rule_id = rule_id,
            .original_fragment = python::declaration_text(module, *hooks.teardown),
            .replacement_fragment = "",
            .location = header_location(module, *hooks.teardown),
        });
        unit.edits.push_back(removal_edit(module, *hooks.teardown, floor));
    }
}

auto add_fixture_parameter(const SourceModule& module, const Declaration& method,
                           const std::string& name) -> std::string {
    auto text = python::declaration_text(module, method);
    auto method_begin = python::declaration_begin(module, method);
    const auto& header = module.lines[method.header_line];
    auto header_start = header.code_begin - method_begin;
    auto header_end = header.end - method_begin;

    auto open = text.find('(', header_start);
    auto close = python::find_closing_bracket(text, open);
    if (open == std::string::npos || !close) {
        return text;
    }
    auto parameters = python::trim(std::string_view(text).substr(open + 1, *close - open - 1));
    if (parameters.ends_with(',')) {
        parameters = python::trim(std::string_view(parameters).substr(0, parameters.size() - 1));
    }

    auto result = text.substr(0, open + 1) + parameters + ", " + name +
                  text.substr(*close, header_end - *close);
    result += python::replace_attribute(std::string_view(text).substr(header_end), "self", name,
                                        name);
    return result;
}

auto rename_edit(const SourceModule& module, const Declaration& method,
                 const std::string& new_name, const std::string& rule_id, UnitRewrite& unit)
    -> void {
    const auto& header = module.lines[method.header_line];
    auto def_pos = module.text.find("def", header.code_begin);
    auto name_pos = module.text.find(method.name, def_pos + 3);
    unit.records.push_back(ApplicationRecord{
        .rule_id = rule_id,
        .original_fragment = method.name,
        .replacement_fragment = new_name,
        .location = location_at(module.text, name_pos),
    });
    unit.edits.push_back(SourceEdit{
        .begin = name_pos,
        .end = name_pos + method.name.size(),
        .replacement = new_name,
    });
}

auto drop_self_parameter(const std::string& segment) -> std::optional<std::string> {
    auto def_pos = segment.find("def");
    auto open = segment.find('(', def_pos);
    if (def_pos == std::string::npos || open == std::string::npos) {
        return std::nullopt;
    }
    auto close = python::find_closing_bracket(segment, open);
    if (!close) {
        return std::nullopt;
    }
    auto parameters = python::split_top_level(std::string_view(segment).substr(open + 1, *close - open - 1));
    if (parameters.empty() || parameters.front() != "self") {
        return std::nullopt;
    }
    parameters.erase(parameters.begin());
    return segment.substr(0, open + 1) + join(parameters) + segment.substr(*close);
}

auto dedent(std::string_view segment, size_t width) -> std::string {
    std::string result;
    size_t start = 0;
    while (start < segment.size()) {
        auto newline = segment.find('\n', start);
        auto end = newline == std::string_view::npos ? segment.size() : newline + 1;
        auto line = segment.substr(start, end - start);

        size_t leading = 0;
        while (leading < line.size() && (line[leading] == ' ' || line[leading] == '\t')) {
            ++leading;
        }
        bool blank = leading == line.size() || line[leading] == '\n' || line[leading] == '\r';
        if (blank) {
            result += line.substr(leading);
        } else if (leading >= width) {
            result += line.substr(width);
        } else {
            result += line;
        }
        start = end;
    }
    return result;
}

// Module-level functions for a class whose methods never touch self
auto flatten_class(const SourceModule& module, const Declaration& cls,
                   const std::set<std::string>& taken_names) -> std::optional<std::string> {
    if (!cls.decorators.empty() || cls.children.empty() || !cls.has_body_lines()) {
        return std::nullopt;
    }

    std::set<size_t> child_headers;
    for (const auto& child : cls.children) {
        if (child.kind != DeclarationKind::FUNCTION || child.is_async ||
            taken_names.contains(child.name) || is_fixture(child) ||
            python::has_decorator(child, "staticmethod") ||
            python::has_decorator(child, "classmethod") ||
            python::has_decorator(child, "property")) {
            return std::nullopt;
        }
        auto parameters = python::parse_parameter_names(child.signature);
        if (!parameters || parameters->empty() || parameters->front() != "self") {
            return std::nullopt;
        }
        auto body = python::body_text(module, child) + child.inline_body;
        if (python::contains_identifier(body, "self") || python::contains_identifier(body, "super")) {
            return std::nullopt;
        }
        child_headers.insert(child.header_line);
    }

    // Only methods at class level: no docstring, attributes or other statements
    for (auto index : python::body_statements(module, cls)) {
        bool inside_method = std::any_of(cls.children.begin(), cls.children.end(),
                                         [index](const Declaration& child) {
                                             return index >= child.first_line &&
                                                    index <= child.last_line;
                                         });
        if (!inside_method) {
            return std::nullopt;
        }
    }

    auto member_indent = python::body_indent(module, cls);
    if (member_indent.size() <= cls.indent.size()) {
        return std::nullopt;
    }
    auto width = member_indent.size() - cls.indent.size();

    std::string flattened;
    for (auto index = cls.header_line + 1; index <= cls.last_line; ++index) {
        const auto& line = module.lines[index];
        if (line.has_multiline_string) {
            return std::nullopt;
        }
        auto segment = module.text.substr(line.begin, line.end - line.begin);
        if (child_headers.contains(index)) {
            auto rewritten = drop_self_parameter(segment);
            if (!rewritten) {
                return std::nullopt;
            }
            segment = std::move(*rewritten);
        }
        flattened += dedent(segment, width);
    }
    return flattened;
}

auto remaining_bases(const std::vector<std::string>& bases, const std::vector<std::string>& legacy)
    -> std::vector<std::string> {
    std::vector<std::string> remaining;
    for (const auto& base : bases) {
        if (std::find(legacy.begin(), legacy.end(), base) == legacy.end()) {
            remaining.push_back(base);
        }
    }
    return remaining;
}

auto base_edit(const SourceModule& module, const Declaration& cls,
               const std::vector<std::string>& remaining, const std::string& rule_id,
               UnitRewrite& unit) -> bool {
    const auto& header = module.lines[cls.header_line];
    auto open = module.text.find('(', header.code_begin);
    auto close = python::find_closing_bracket(module.text, open);
    if (open == std::string::npos || !close) {
        return false;
    }

    auto replacement = remaining.empty() ? std::string{} : "(" + join(remaining) + ")";
    auto relative_open = open - header.code_begin;
    auto relative_close = *close - header.code_begin;
    auto new_header = header.code.substr(0, relative_open) + replacement +
                      header.code.substr(relative_close + 1);

    unit.records.push_back(ApplicationRecord{
        .rule_id = rule_id,
        .original_fragment = header.code,
        .replacement_fragment = new_header,
        .location = header_location(module, cls),
    });
    unit.edits.push_back(SourceEdit{.begin = open, .end = *close + 1, .replacement = replacement});
    return true;
}

auto process_class(const SourceModule& module, const Declaration& cls,
                   const LifecycleOptions& options, std::set<std::string>& taken_names,
                   PassResult& result) -> void {
    auto bases = cls.has_parentheses ? python::split_top_level(cls.signature)
                                     : std::vector<std::string>{};
    auto remaining = remaining_bases(bases, options.legacy_bases);
    bool has_legacy_base = remaining.size() != bases.size();
    bool drop_base = has_legacy_base && options.base_rule.has_value();
    bool keeps_legacy_base = has_legacy_base && !drop_base;

    auto hooks = find_hooks(cls);
    bool is_test_class = has_legacy_base || cls.name.starts_with("Test");
    bool convert_hooks = options.hooks_rule && !keeps_legacy_base && is_test_class &&
                         (hooks.has_method_hooks() || hooks.has_class_hooks());

    if (!drop_base && !convert_hooks) {
        return;
    }

    auto location = header_location(module, cls);
    auto reject = [&](const std::string& rule_id, const std::string& reason) {
        result.reject(rule_id, "class " + cls.name + ": " + reason, location);
    };

    if (drop_base) {
        if (uses_legacy_api(python::declaration_text(module, cls))) {
            reject(*options.base_rule, "still uses the unittest.TestCase API");
            return;
        }
        if (python::find_child(cls, "__init__") != nullptr) {
            reject(*options.base_rule, "defines __init__");
            return;
        }
        if ((hooks.has_method_hooks() || hooks.has_class_hooks()) && !options.hooks_rule) {
            reject(*options.base_rule, "has lifecycle hooks but hook conversion is disabled");
            return;
        }
    }

    const auto hooks_rule = options.hooks_rule.value_or("");
    if (convert_hooks) {
        if (hooks.duplicated) {
            reject(hooks_rule, "defines a lifecycle hook twice");
            return;
        }
        if (hooks.setup != nullptr) {
            if (auto problem = hook_problem(module, *hooks.setup, "self", true)) {
                reject(hooks_rule, *problem);
                return;
            }
        }
        if (hooks.teardown != nullptr) {
            if (auto problem = hook_problem(module, *hooks.teardown, "self", false)) {
                reject(hooks_rule, *problem);
                return;
            }
        }
        if (hooks.setup != nullptr && hooks.teardown != nullptr &&
            python::body_indent(module, *hooks.setup) !=
                python::body_indent(module, *hooks.teardown)) {
            reject(hooks_rule, "setUp and tearDown bodies are indented differently");
            return;
        }
        for (const auto* class_hook : {hooks.setup_class, hooks.teardown_class}) {
            if (class_hook == nullptr) {
                continue;
            }
            auto parameters = python::parse_parameter_names(class_hook->signature);
            if (!python::has_decorator(*class_hook, "classmethod") ||
                class_hook->decorators.size() != 1 || !parameters || parameters->size() != 1) {
                reject(hooks_rule, class_hook->name + " is not a plain classmethod");
                return;
            }
        }
        auto class_text = python::declaration_text(module, cls);
        for (const auto* hook : {hooks.setup, hooks.teardown, hooks.setup_class, hooks.teardown_class}) {
            if (hook != nullptr && !python::find_attribute_uses(class_text, "self", hook->name).empty()) {
                reject(hooks_rule, hook->name + " is called directly");
                return;
            }
        }
        if (hooks.has_method_hooks() && python::find_child(cls, CLASS_FIXTURE_NAME) != nullptr) {
            reject(hooks_rule, std::string(CLASS_FIXTURE_NAME) + " is already defined");
            return;
        }
        if ((hooks.setup_class != nullptr && hooks.setup_class->name != "setup_class" &&
             python::find_child(cls, "setup_class") != nullptr) ||
            (hooks.teardown_class != nullptr && hooks.teardown_class->name != "teardown_class" &&
             python::find_child(cls, "teardown_class") != nullptr)) {
            reject(hooks_rule, "setup_class/teardown_class already defined");
            return;
        }
    }

    UnitRewrite unit;

    // A class with nothing but self-free methods can become plain functions
    if (drop_base && remaining.empty() && options.flatten_rule && !hooks.has_method_hooks() &&
        !hooks.has_class_hooks()) {
        if (auto flattened = flatten_class(module, cls, taken_names)) {
            unit.records.push_back(ApplicationRecord{
                .rule_id = *options.base_rule,
                .original_fragment = module.lines[cls.header_line].code,
                .replacement_fragment = "",
                .location = location,
            });
            unit.records.push_back(ApplicationRecord{
                .rule_id = *options.flatten_rule,
                .original_fragment = python::declaration_text(module, cls),
                .replacement_fragment = *flattened,
                .location = location,
            });
            unit.edits.push_back(SourceEdit{
                .begin = python::declaration_begin(module, cls),
                .end = python::declaration_end(module, cls),
                .replacement = std::move(*flattened),
            });
            for (const auto& child : cls.children) {
                taken_names.insert(child.name);
            }
            result.units.push_back(std::move(unit));
            return;
        }
    }

    if (drop_base && !base_edit(module, cls, remaining, *options.base_rule, unit)) {
        reject(*options.base_rule, "base class list could not be located");
        return;
    }

    if (convert_hooks) {
        if (hooks.has_method_hooks()) {
            auto attribute = fixture_attribute(module, cls, hooks);
            auto name = attribute ? *attribute : std::string(CLASS_FIXTURE_NAME);
            auto fixture = build_fixture(module, hooks, CLASS_FIXTURE_DECORATOR, name, "self",
                                         attribute);
            fixture_edits(module, hooks, cls.header_line + 1, std::move(fixture), hooks_rule, unit);

            if (attribute) {
                for (const auto& child : cls.children) {
                    if (&child == hooks.setup || &child == hooks.teardown ||
                        python::find_attribute_uses(python::declaration_text(module, child), "self",
                                                    *attribute)
                            .empty()) {
                        continue;
                    }
                    auto rewritten = add_fixture_parameter(module, child, *attribute);
                    unit.records.push_back(ApplicationRecord{
                        .rule_id = hooks_rule,
                        .original_fragment = python::declaration_text(module, child),
                        .replacement_fragment = rewritten,
                        .location = header_location(module, child),
                    });
                    unit.edits.push_back(SourceEdit{
                        .begin = python::declaration_begin(module, child),
                        .end = python::declaration_end(module, child),
                        .replacement = std::move(rewritten),
                    });
                }
            }
        }
        if (hooks.setup_class != nullptr && hooks.setup_class->name != "setup_class") {
            rename_edit(module, *hooks.setup_class, "setup_class", hooks_rule, unit);
        }
        if (hooks.teardown_class != nullptr && hooks.teardown_class->name != "teardown_class") {
            rename_edit(module, *hooks.teardown_class, "teardown_class", hooks_rule, unit);
        }
    }

    if (!unit.edits.empty()) {
        result.units.push_back(std::move(unit));
    }
}

// nose-style module setup()/teardown() functions
auto process_module_hooks(const SourceModule& module, const std::string& rule_id,
                          const std::set<std::string>& taken_names, PassResult& result) -> void {
    Hooks hooks;
    for (const auto& declaration : module.declarations) {
        if (declaration.kind != DeclarationKind::FUNCTION || is_fixture(declaration)) {
            continue;
        }
        auto name = lowercase(declaration.name);
        if (name == "setup") {
            hooks.duplicated = hooks.duplicated || hooks.setup != nullptr;
            hooks.setup = &declaration;
        } else if (name == "teardown") {
            hooks.duplicated = hooks.duplicated || hooks.teardown != nullptr;
            hooks.teardown = &declaration;
        }
    }
    if (!hooks.has_method_hooks()) {
        return;
    }

    const auto* anchor = hooks.setup != nullptr ? hooks.setup : hooks.teardown;
    auto location = header_location(module, *anchor);
    auto reject = [&](const std::string& reason) {
        result.reject(rule_id, "module hooks: " + reason, location);
    };

    if (hooks.duplicated) {
        reject("setup or teardown is defined twice");
        return;
    }
    for (const auto* hook : {hooks.setup, hooks.teardown}) {
        if (hook == nullptr) {
            continue;
        }
        if (auto problem = hook_problem(module, *hook, "", hook == hooks.setup)) {
            reject(*problem);
            return;
        }
        auto header_name = module.text.find(hook->name, module.lines[hook->header_line].code_begin);
        for (auto use : python::find_identifier_uses(module.text, hook->name)) {
            if (use != header_name) {
                reject(hook->name + " is referenced elsewhere");
                return;
            }
        }
    }
    if (hooks.setup != nullptr && hooks.teardown != nullptr &&
        python::body_indent(module, *hooks.setup) != python::body_indent(module, *hooks.teardown)) {
        reject("setup and teardown bodies are indented differently");
        return;
    }
    if (taken_names.contains(std::string(MODULE_FIXTURE_NAME))) {
        reject(std::string(MODULE_FIXTURE_NAME) + " is already defined");
        return;
    }

    UnitRewrite unit;
    auto fixture = build_fixture(module, hooks, MODULE_FIXTURE_DECORATOR, MODULE_FIXTURE_NAME, "",
                                 std::nullopt);
    fixture_edits(module, hooks, 0, std::move(fixture), rule_id, unit);
    result.units.push_back(std::move(unit));
}

} // namespace

auto rewrite_lifecycle(const python::SourceModule& module, const LifecycleOptions& options)
    -> PassResult {
    PassResult result;
    if (!options.base_rule && !options.hooks_rule) {
        return result;
    }

    std::set<std::string> taken_names;
    for (const auto& declaration : module.declarations) {
        taken_names.insert(declaration.name);
    }

    for (const auto& declaration : module.declarations) {
        if (declaration.kind == DeclarationKind::CLASS) {
            process_class(module, declaration, options, taken_names, result);
        }
    }
    if (options.hooks_rule) {
        process_module_hooks(module, *options.hooks_rule, taken_names, result);
    }
    return result;
}

} // namespace pytestify
