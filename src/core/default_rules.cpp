#include "pytestify/core/default_rules.hpp"
#include "pytestify/core/call_site.hpp"
#include "pytestify/core/python_source.hpp"
#include "pytestify/core/python_syntax.hpp"
#include <algorithm>
#include <regex>
#include <utility>

namespace pytestify {

namespace {

constexpr int DECORATOR_PRIORITY = 20;
constexpr int NOSE_CONTEXT_PRIORITY = 24;
constexpr int NOSE_CALL_PRIORITY = 25;
constexpr int UNITTEST_CONTEXT_PRIORITY = 29;
constexpr int UNITTEST_CALL_PRIORITY = 30;
constexpr int LIFECYCLE_BASE_PRIORITY = 40;
constexpr int LIFECYCLE_HOOKS_PRIORITY = 41;
constexpr int FLATTEN_CLASS_PRIORITY = 45;
constexpr int YIELD_TESTS_PRIORITY = 50;
constexpr int RENAME_PRIORITY = 60;
constexpr int IMPORT_PRIORITY = 90;
constexpr int PYTEST_IMPORTS_PRIORITY = 95;

// ---------------------------------------------------------------------------
// Assertion call rewriting
// ---------------------------------------------------------------------------

struct Operands {
    std::vector<std::string> values;
    std::optional<std::string> message;
};

auto drop_none(std::optional<std::string> value) -> std::optional<std::string> {
    if (value && python::trim(*value) == "None") {
        return std::nullopt;
    }
    return value;
}

// Positional operands plus an optional message (trailing positional or msg=)
auto take_operands(const CallArguments& call, size_t count) -> std::optional<Operands> {
    if (call.has_star_arguments()) {
        return std::nullopt;
    }
    for (const auto& [name, value] : call.keywords) {
        if (name != "msg") {
            return std::nullopt;
        }
    }

    Operands operands;
    auto keyword_message = call.keyword("msg");
    if (call.positional.size() == count) {
        operands.message = keyword_message;
    } else if (call.positional.size() == count + 1 && !keyword_message) {
        operands.message = call.positional.back();
    } else {
        return std::nullopt;
    }
    operands.values.assign(call.positional.begin(),
                           call.positional.begin() + static_cast<std::ptrdiff_t>(count));
    operands.message = drop_none(std::move(operands.message));
    return operands;
}

auto assert_statement(const std::string& condition, const std::optional<std::string>& message)
    -> std::string {
    return "assert " + condition + (message ? ", " + python::trim(*message) : "");
}

// A bare assert condition only needs parentheses around walrus and lambda forms
auto bare_condition(const std::string& expression) -> std::string {
    static const std::regex needs_wrapping{R"((:=|(^|[^\w.])lambda(?!\w)))"};
    auto trimmed = python::trim(expression);
    if (std::regex_search(python::flatten_top_level(trimmed), needs_wrapping)) {
        return "(" + trimmed + ")";
    }
    return trimmed;
}

auto comparison(std::string op) -> CallRewriter {
    return [op = std::move(op)](const CallArguments& call) -> std::optional<std::string> {
        auto operands = take_operands(call, 2);
        if (!operands) {
            return std::nullopt;
        }
        return assert_statement(python::parenthesize_if_needed(operands->values[0]) + " " + op +
                                    " " + python::parenthesize_if_needed(operands->values[1]),
                                operands->message);
    };
}

auto truthiness(bool expected) -> CallRewriter {
    return [expected](const CallArguments& call) -> std::optional<std::string> {
        auto operands = take_operands(call, 1);
        if (!operands) {
            return std::nullopt;
        }
        const auto& value = operands->values[0];
        auto condition = expected ? bare_condition(value)
                                  : "not " + python::parenthesize_if_needed(value);
        return assert_statement(condition, operands->message);
    };
}

auto none_check(bool is_none) -> CallRewriter {
    return [is_none](const CallArguments& call) -> std::optional<std::string> {
        auto operands = take_operands(call, 1);
        if (!operands) {
            return std::nullopt;
        }
        return assert_statement(python::parenthesize_if_needed(operands->values[0]) +
                                    (is_none ? " is None" : " is not None"),
                                operands->message);
    };
}

auto instance_check(bool expected) -> CallRewriter {
    return [expected](const CallArguments& call) -> std::optional<std::string> {
        auto operands = take_operands(call, 2);
        if (!operands) {
            return std::nullopt;
        }
        auto check = "isinstance(" + python::trim(operands->values[0]) + ", " +
                     python::trim(operands->values[1]) + ")";
        return assert_statement(expected ? check : "not " + check, operands->message);
    };
}

auto set_equality() -> CallRewriter {
    return [](const CallArguments& call) -> std::optional<std::string> {
        auto operands = take_operands(call, 2);
        if (!operands) {
            return std::nullopt;
        }
        return assert_statement("set(" + python::trim(operands->values[0]) + ") == set(" +
                                    python::trim(operands->values[1]) + ")",
                                operands->message);
    };
}

// assertAlmostEqual(first, second, places=None, msg=None, delta=None)
auto almost_equal() -> CallRewriter {
    return [](const CallArguments& call) -> std::optional<std::string> {
        if (call.has_star_arguments() || call.positional.size() < 2 ||
            call.positional.size() > 4) {
            return std::nullopt;
        }
        for (const auto& [name, value] : call.keywords) {
            if (name != "places" && name != "msg" && name != "delta") {
                return std::nullopt;
            }
        }

        auto places = call.keyword("places");
        auto message = call.keyword("msg");
        auto delta = call.keyword("delta");
        if (call.positional.size() >= 3) {
            if (places) {
                return std::nullopt;
            }
            places = call.positional[2];
        }
        if (call.positional.size() == 4) {
            if (message) {
                return std::nullopt;
            }
            message = call.positional[3];
        }
        places = drop_none(std::move(places));
        delta = drop_none(std::move(delta));
        message = drop_none(std::move(message));
        if (places && delta) {
            return std::nullopt;
        }

        // unittest passes when round(a - b, places) == 0, i.e. |a - b| < 0.5e-places
        std::string tolerance = "abs=5e-8";
        if (delta) {
            tolerance = "abs=" + python::trim(*delta);
        } else if (places) {
            auto digits = python::trim(*places);
            bool literal = !digits.empty() && digits.size() <= 3 &&
                           std::all_of(digits.begin(), digits.end(), [](char ch) {
                               return ch >= '0' && ch <= '9';
                           });
            tolerance = literal ? "abs=5e-" + std::to_string(std::stoi(digits) + 1)
                                : "abs=0.5 * 10 ** -(" + digits + ")";
        }

        return assert_statement(python::parenthesize_if_needed(call.positional[0]) +
                                    " == pytest.approx(" + python::trim(call.positional[1]) +
                                    ", " + tolerance + ")",
                                message);
    };
}

// assertRaises(exc, callable, *args, **kwargs) as a statement
auto raises_block() -> CallRewriter {
    return [](const CallArguments& call) -> std::optional<std::string> {
        if (call.positional.size() < 2 || call.positional[0].starts_with('*') ||
            call.positional[1].starts_with('*')) {
            return std::nullopt;
        }

        std::vector<std::string> arguments(call.positional.begin() + 2, call.positional.end());
        for (const auto& [name, value] : call.keywords) {
            arguments.push_back(name + "=" + value);
        }
        std::string joined;
        for (const auto& argument : arguments) {
            joined += (joined.empty() ? "" : ", ") + argument;
        }

        auto step = call.indent.find('\t') != std::string::npos ? std::string("\t")
                                                                 : std::string("    ");
        return "with pytest.raises(" + python::trim(call.positional[0]) + "):\n" + call.indent +
               step + python::trim(call.positional[1]) + "(" + joined + ")";
    };
}

auto qualified(std::vector<std::string> names, const std::string& prefix)
    -> std::vector<std::string> {
    auto count = names.size();
    for (size_t index = 0; index < count; ++index) {
        names.push_back(prefix + names[index]);
    }
    return names;
}

auto prefixed(const std::vector<std::string>& names, const std::string& prefix)
    -> std::vector<std::string> {
    std::vector<std::string> result;
    result.reserve(names.size());
    for (const auto& name : names) {
        result.push_back(prefix + name);
    }
    return result;
}

struct CallRuleDefinition {
    std::string id;
    std::vector<std::string> callees;
    CallRewriter rewriter;
    std::string description;
};

auto make_call_rule(const CallRuleDefinition& definition, int priority) -> TransformationRule {
    std::string pattern;
    for (const auto& callee : definition.callees) {
        pattern += (pattern.empty() ? "" : "|") + callee + "(";
    }
    return make_rule(
        RuleSpec{
            .id = definition.id,
            .pattern = pattern,
            .replacement = "",
            .description = definition.description,
            .priority = priority,
            .enabled = true,
            .flags = {},
        },
        make_call_matcher(definition.callees), make_call_producer(definition.rewriter));
}

// ---------------------------------------------------------------------------
// Regex rules restricted to code
// ---------------------------------------------------------------------------

auto code_only(RuleMatcher matcher) -> RuleMatcher {
    return [matcher = std::move(matcher)](std::string_view text) -> std::vector<MatchSpan> {
        auto spans = matcher(text);
        auto mask = python::code_mask(text);
        std::erase_if(spans, [&mask](const MatchSpan& span) {
            return span.begin < mask.size() && !mask[span.begin];
        });
        return spans;
    };
}

auto make_code_rule(const RuleSpec& spec, RuleProducer producer) -> TransformationRule {
    return make_rule(spec, code_only(make_regex_matcher(spec.pattern, spec.flags)),
                     std::move(producer));
}

auto make_code_rule(const RuleSpec& spec) -> TransformationRule {
    return make_code_rule(spec, make_template_producer(spec.replacement));
}

auto capture(const Captures& captures, size_t index) -> std::string {
    return index < captures.size() && captures[index] ? *captures[index] : std::string{};
}

// Appends a marker group to every match whose method name (group 3) is used
// elsewhere in the file; renaming such a method would break its callers
auto mark_referenced_methods(RuleMatcher matcher) -> RuleMatcher {
    return [matcher = std::move(matcher)](std::string_view text) -> std::vector<MatchSpan> {
        auto spans = matcher(text);
        for (auto& span : spans) {
            auto name = capture(span.groups, 3);
            bool referenced = python::find_identifier_uses(text, name).size() > 1 ||
                              !python::find_attribute_uses(text, "self", name).empty() ||
                              !python::find_attribute_uses(text, "cls", name).empty();
            span.groups.emplace_back(referenced ? std::optional<std::string>("referenced")
                                                : std::nullopt);
        }
        return spans;
    };
}

auto rename_method_producer() -> RuleProducer {
    return [](const Captures& captures) -> std::optional<std::string> {
        if (captures.size() > 6 && captures[6]) {
            return std::nullopt;
        }
        // Extra parameters would be taken for fixtures once the method is collected
        auto rest = python::trim(capture(captures, 5));
        if (!rest.empty() && rest != ",") {
            return std::nullopt;
        }
        return expand_template(R"(\1\2def test_\3(\4self\5))", captures);
    };
}

// "(A, B)" -> "A, B" only when the parentheses are balanced
auto balanced_arguments(const std::string& inner) -> std::optional<std::vector<std::string>> {
    auto wrapped = "(" + inner + ")";
    auto close = python::find_closing_bracket(wrapped, 0);
    if (!close || *close != wrapped.size() - 1) {
        return std::nullopt;
    }
    return python::split_top_level(inner);
}

auto raises_decorator_producer() -> RuleProducer {
    return [](const Captures& captures) -> std::optional<std::string> {
        auto arguments = balanced_arguments(capture(captures, 2));
        if (!arguments || arguments->empty()) {
            return std::nullopt;
        }
        std::string exceptions;
        for (const auto& argument : *arguments) {
            if (argument.starts_with('*')) {
                return std::nullopt;
            }
            exceptions += (exceptions.empty() ? "" : ", ") + argument;
        }
        if (arguments->size() > 1) {
            exceptions = "(" + exceptions + ")";
        }
        return capture(captures, 1) + "@pytest.mark.xfail(raises=" + exceptions + ")";
    };
}

// with assert_raises(E): / with self.assertRaises(E): / with self.assertRaisesRegex(E, r):
auto raises_context_producer() -> RuleProducer {
    return [](const Captures& captures) -> std::optional<std::string> {
        if (captures.size() > 3 && captures[3]) {
            return std::nullopt;  // "as cm" exposes .exception, which pytest.raises does not
        }
        auto arguments = balanced_arguments(capture(captures, 2));
        if (!arguments) {
            return std::nullopt;
        }
        bool with_pattern = capture(captures, 1).find("Regex") != std::string::npos;
        if (with_pattern) {
            if (arguments->size() != 2) {
                return std::nullopt;
            }
            return "with pytest.raises(" + (*arguments)[0] + ", match=" + (*arguments)[1] + "):";
        }
        if (arguments->size() != 1 || (*arguments)[0].starts_with('*')) {
            return std::nullopt;
        }
        return "with pytest.raises(" + (*arguments)[0] + "):";
    };
}

auto always_unresolved() -> RuleProducer {
    return [](const Captures&) -> std::optional<std::string> { return std::nullopt; };
}

// ---------------------------------------------------------------------------
// Import cleanup
// ---------------------------------------------------------------------------

enum class ImportFamily {
    NOSE_TOOLS,
    NOSE_OTHER
};

struct ImportedName {
    std::string text;
    std::string bound;
    bool candidate = false;
};

auto belongs_to(std::string_view module, ImportFamily family) -> bool {
    bool tools = module == "nose.tools" || module.starts_with("nose.tools.");
    bool nose = module == "nose" || module.starts_with("nose.");
    return family == ImportFamily::NOSE_TOOLS ? tools : (nose && !tools);
}

// Comments and backslash continuations removed from an import list
auto clean_import_list(std::string_view list) -> std::string {
    std::string result;
    bool in_comment = false;
    for (size_t pos = 0; pos < list.size(); ++pos) {
        char ch = list[pos];
        if (ch == '\n') {
            in_comment = false;
            result += ' ';
        } else if (ch == '#') {
            in_comment = true;
        } else if (ch == '\\' && !in_comment) {
            result += ' ';
        } else if (!in_comment) {
            result += ch;
        }
    }
    return python::trim(result);
}

auto parse_import_items(std::string_view list, bool from_form)
    -> std::optional<std::vector<ImportedName>> {
    static const std::regex item_pattern{R"(^([\w.]+)(?:\s+as\s+(\w+))?$)"};

    std::vector<ImportedName> items;
    for (const auto& part : python::split_top_level(python::strip_enclosing_parens(list))) {
        std::smatch match;
        if (!std::regex_match(part, match, item_pattern)) {
            return std::nullopt;
        }
        ImportedName item;
        item.text = part;
        if (match[2].matched) {
            item.bound = match[2].str();
        } else if (from_form) {
            item.bound = match[1].str();
        } else {
            auto dotted = match[1].str();
            item.bound = dotted.substr(0, dotted.find('.'));
        }
        items.push_back(std::move(item));
    }
    if (items.empty()) {
        return std::nullopt;
    }
    return items;
}

auto is_referenced(std::string_view text, const std::string& name,
                   const std::vector<std::pair<size_t, size_t>>& import_ranges) -> bool {
    for (auto use : python::find_identifier_uses(text, name)) {
        bool inside_import = std::any_of(
            import_ranges.begin(), import_ranges.end(),
            [use](const auto& range) { return use >= range.first && use < range.second; });
        if (inside_import) {
            continue;
        }
        auto after = use + name.size();
        while (after < text.size() && (text[after] == ' ' || text[after] == '\t')) {
            ++after;
        }
        bool keyword_argument = after + 1 < text.size() && text[after] == '=' &&
                                text[after + 1] != '=';
        if (!keyword_argument) {
            return true;
        }
    }
    return false;
}

auto join_items(const std::vector<ImportedName>& items) -> std::string {
    std::string joined;
    for (const auto& item : items) {
        joined += (joined.empty() ? "" : ", ") + item.text;
    }
    return joined;
}

// Captures: [0] whole statement lines, [1] "ok" / "wildcard" / "unsupported", [2] replacement
auto make_import_cleanup_matcher(ImportFamily family) -> RuleMatcher {
    return [family](std::string_view text) -> std::vector<MatchSpan> {
        static const std::regex from_pattern{R"(^from\s+([\w.]+)\s+import\s+([\s\S]+)$)"};
        static const std::regex import_pattern{R"(^import\s+([\s\S]+)$)"};

        std::vector<MatchSpan> spans;
        auto lines = python::split_logical_lines(text);
        std::vector<std::pair<size_t, size_t>> import_ranges;
        for (const auto& line : lines) {
            if (line.is_statement() &&
                (line.code.starts_with("import ") || line.code.starts_with("from "))) {
                import_ranges.emplace_back(line.begin, line.end);
            }
        }

        for (const auto& line : lines) {
            if (!line.is_statement()) {
                continue;
            }
            std::smatch match;
            std::string status = "ok";
            std::string header;
            std::vector<ImportedName> items;

            if (std::regex_match(line.code, match, from_pattern)) {
                auto module = match[1].str();
                if (!belongs_to(module, family)) {
                    continue;
                }
                header = "from " + module + " import ";
                auto list = clean_import_list(match[2].str());
                if (list == "*") {
                    status = "wildcard";
                } else if (auto parsed = parse_import_items(list, true)) {
                    items = std::move(*parsed);
                    for (auto& item : items) {
                        item.candidate = true;
                    }
                } else {
                    status = "unsupported";
                }
            } else if (std::regex_match(line.code, match, import_pattern)) {
                header = "import ";
                auto parsed = parse_import_items(clean_import_list(match[1].str()), false);
                if (!parsed) {
                    continue;
                }
                items = std::move(*parsed);
                bool any_candidate = false;
                for (auto& item : items) {
                    auto module = item.text.substr(0, item.text.find_first_of(" \t"));
                    item.candidate = belongs_to(module, family);
                    any_candidate = any_candidate || item.candidate;
                }
                if (!any_candidate) {
                    continue;
                }
            } else {
                continue;
            }

            auto original = std::string(text.substr(line.begin, line.end - line.begin));
            auto replacement = original;
            if (status == "ok") {
                std::vector<ImportedName> kept;
                for (const auto& item : items) {
                    if (!item.candidate || is_referenced(text, item.bound, import_ranges)) {
                        kept.push_back(item);
                    }
                }
                if (kept.size() != items.size()) {
                    replacement.clear();
                    if (!kept.empty()) {
                        replacement = line.indent + header + join_items(kept) +
                                      (original.ends_with('\n') ? "\n" : "");
                    }
                }
            }

            spans.push_back(MatchSpan{
                .begin = line.begin,
                .end = line.end,
                .groups = {original, status, replacement},
            });
        }
        return spans;
    };
}

auto import_cleanup_producer() -> RuleProducer {
    return [](const Captures& captures) -> std::optional<std::string> {
        if (capture(captures, 1) != "ok" || captures.size() < 3 || !captures[2]) {
            return std::nullopt;
        }
        return *captures[2];
    };
}

auto make_import_rule(std::string id, ImportFamily family, std::string description)
    -> TransformationRule {
    return make_rule(
        RuleSpec{
            .id = std::move(id),
            .pattern = family == ImportFamily::NOSE_TOOLS ? "from nose.tools import ..."
                                                          : "import nose / from nose... import ...",
            .replacement = "",
            .description = std::move(description),
            .priority = IMPORT_PRIORITY,
            .enabled = true,
            .flags = {},
        },
        make_import_cleanup_matcher(family), import_cleanup_producer());
}

// ---------------------------------------------------------------------------
// Catalogue
// ---------------------------------------------------------------------------

auto nose_call_rules() -> std::vector<CallRuleDefinition> {
    const std::string nose_prefix = "nose.tools.";
    return {
        {"assert_equal",
         qualified({"assert_equal", "assert_equals", "eq_", "assert_dict_equal",
                    "assert_list_equal", "assert_tuple_equal", "assert_set_equal",
                    "assert_multi_line_equal", "assert_sequence_equal"},
                   nose_prefix),
         comparison("=="), "assert_equal(a, b) -> assert a == b"},
        {"assert_not_equal", qualified({"assert_not_equal", "assert_not_equals", "ne_"}, nose_prefix),
         comparison("!="), "assert_not_equal(a, b) -> assert a != b"},
        {"assert_true", qualified({"assert_true", "ok_"}, nose_prefix), truthiness(true),
         "assert_true(x) -> assert x"},
        {"assert_false", qualified({"assert_false"}, nose_prefix), truthiness(false),
         "assert_false(x) -> assert not x"},
        {"assert_in", qualified({"assert_in"}, nose_prefix), comparison("in"),
         "assert_in(a, b) -> assert a in b"},
        {"assert_not_in", qualified({"assert_not_in"}, nose_prefix), comparison("not in"),
         "assert_not_in(a, b) -> assert a not in b"},
        {"assert_is", qualified({"assert_is"}, nose_prefix), comparison("is"),
         "assert_is(a, b) -> assert a is b"},
        {"assert_is_not", qualified({"assert_is_not"}, nose_prefix), comparison("is not"),
         "assert_is_not(a, b) -> assert a is not b"},
        {"assert_is_none", qualified({"assert_is_none"}, nose_prefix), none_check(true),
         "assert_is_none(x) -> assert x is None"},
        {"assert_is_not_none", qualified({"assert_is_not_none"}, nose_prefix), none_check(false),
         "assert_is_not_none(x) -> assert x is not None"},
        {"assert_is_instance", qualified({"assert_is_instance"}, nose_prefix),
         instance_check(true), "assert_is_instance(a, T) -> assert isinstance(a, T)"},
        {"assert_not_is_instance", qualified({"assert_not_is_instance"}, nose_prefix),
         instance_check(false), "assert_not_is_instance(a, T) -> assert not isinstance(a, T)"},
        {"assert_greater", qualified({"assert_greater"}, nose_prefix), comparison(">"),
         "assert_greater(a, b) -> assert a > b"},
        {"assert_greater_equal", qualified({"assert_greater_equal"}, nose_prefix),
         comparison(">="), "assert_greater_equal(a, b) -> assert a >= b"},
        {"assert_less", qualified({"assert_less"}, nose_prefix), comparison("<"),
         "assert_less(a, b) -> assert a < b"},
        {"assert_less_equal", qualified({"assert_less_equal"}, nose_prefix), comparison("<="),
         "assert_less_equal(a, b) -> assert a <= b"},
        {"assert_almost_equal",
         qualified({"assert_almost_equal", "assert_almost_equals"}, nose_prefix), almost_equal(),
         "assert_almost_equal(a, b) -> assert a == pytest.approx(b, abs=...)"},
        {"assert_raises", qualified({"assert_raises"}, nose_prefix), raises_block(),
         "assert_raises(E, f, *args) -> with pytest.raises(E): f(*args)"},
    };
}

auto unittest_call_rules() -> std::vector<CallRuleDefinition> {
    const std::string self_prefix = "self.";
    return {
        {"assertEqual",
         prefixed({"assertEqual", "assertEquals", "failUnlessEqual", "assertDictEqual",
                   "assertListEqual", "assertTupleEqual", "assertSetEqual",
                   "assertMultiLineEqual", "assertSequenceEqual"},
                  self_prefix),
         comparison("=="), "self.assertEqual(a, b) -> assert a == b"},
        {"assertNotEqual", prefixed({"assertNotEqual", "assertNotEquals", "failIfEqual"}, self_prefix),
         comparison("!="), "self.assertNotEqual(a, b) -> assert a != b"},
        {"assertTrue", prefixed({"assertTrue", "assert_", "failUnless"}, self_prefix),
         truthiness(true), "self.assertTrue(x) -> assert x"},
        {"assertFalse", prefixed({"assertFalse", "failIf"}, self_prefix), truthiness(false),
         "self.assertFalse(x) -> assert not x"},
        {"assertIn", prefixed({"assertIn"}, self_prefix), comparison("in"),
         "self.assertIn(a, b) -> assert a in b"},
        {"assertNotIn", prefixed({"assertNotIn"}, self_prefix), comparison("not in"),
         "self.assertNotIn(a, b) -> assert a not in b"},
        {"assertIs", prefixed({"assertIs"}, self_prefix), comparison("is"),
         "self.assertIs(a, b) -> assert a is b"},
        {"assertIsNot", prefixed({"assertIsNot"}, self_prefix), comparison("is not"),
         "self.assertIsNot(a, b) -> assert a is not b"},
        {"assertIsNone", prefixed({"assertIsNone"}, self_prefix), none_check(true),
         "self.assertIsNone(x) -> assert x is None"},
        {"assertIsNotNone", prefixed({"assertIsNotNone"}, self_prefix), none_check(false),
         "self.assertIsNotNone(x) -> assert x is not None"},
        {"assertIsInstance", prefixed({"assertIsInstance"}, self_prefix), instance_check(true),
         "self.assertIsInstance(a, T) -> assert isinstance(a, T)"},
        {"assertNotIsInstance", prefixed({"assertNotIsInstance"}, self_prefix),
         instance_check(false), "self.assertNotIsInstance(a, T) -> assert not isinstance(a, T)"},
        {"assertGreater", prefixed({"assertGreater"}, self_prefix), comparison(">"),
         "self.assertGreater(a, b) -> assert a > b"},
        {"assertGreaterEqual", prefixed({"assertGreaterEqual"}, self_prefix), comparison(">="),
         "self.assertGreaterEqual(a, b) -> assert a >= b"},
        {"assertLess", prefixed({"assertLess"}, self_prefix), comparison("<"),
         "self.assertLess(a, b) -> assert a < b"},
        {"assertLessEqual", prefixed({"assertLessEqual"}, self_prefix), comparison("<="),
         "self.assertLessEqual(a, b) -> assert a <= b"},
        {"assertAlmostEqual", prefixed({"assertAlmostEqual", "assertAlmostEquals"}, self_prefix),
         almost_equal(), "self.assertAlmostEqual(a, b) -> assert a == pytest.approx(b, abs=...)"},
        {"assertEqualSet", prefixed({"assertEqualSet"}, self_prefix), set_equality(),
         "self.assertEqualSet(a, b) -> assert set(a) == set(b)"},
        {"assertRaises", prefixed({"assertRaises"}, self_prefix), raises_block(),
         "self.assertRaises(E, f, *args) -> with pytest.raises(E): f(*args)"},
    };
}

auto decorator_rules() -> std::vector<TransformationRule> {
    std::vector<TransformationRule> rules;
    rules.push_back(make_code_rule(
        RuleSpec{
            .id = "raises_decorator",
            .pattern = R"(^([ \t]*)@(?:nose\.tools\.)?raises\((.*)\)[ \t]*$)",
            .replacement = R"(\1@pytest.mark.xfail(raises=\2))",
            .description = "@raises(E) -> @pytest.mark.xfail(raises=E)",
            .priority = DECORATOR_PRIORITY,
            .enabled = true,
            .flags = {.multiline = true, .ignore_case = false, .dotall = false},
        },
        raises_decorator_producer()));
    rules.push_back(make_code_rule(RuleSpec{
        .id = "expected_failure_decorator",
        .pattern = R"(^([ \t]*)@(?:unittest\.)?(?:expected_failure|expectedFailure)[ \t]*$)",
        .replacement = R"(\1@pytest.mark.xfail)",
        .description = "@expected_failure -> @pytest.mark.xfail",
        .priority = DECORATOR_PRIORITY,
        .enabled = true,
        .flags = {.multiline = true, .ignore_case = false, .dotall = false},
    }));
    rules.push_back(make_code_rule(RuleSpec{
        .id = "expected_failure_function",
        .pattern = R"(def[ \t]+expected_failure\(test\):.*?return[ \t]+inner[ \t]*(?:\n|$))",
        .replacement = "",
        .description = "Remove the hand-written expected_failure decorator",
        .priority = DECORATOR_PRIORITY,
        .enabled = true,
        .flags = {.multiline = false, .ignore_case = false, .dotall = true},
    }));
    rules.push_back(make_code_rule(RuleSpec{
        .id = "istest_decorator",
        .pattern = R"(^[ \t]*@(?:nose\.tools\.)?istest[ \t]*\n|\n[ \t]*@(?:nose\.tools\.)?istest[ \t]*(?=\n|$))",
        .replacement = "",
        .description = "Remove @istest",
        .priority = DECORATOR_PRIORITY,
        .enabled = true,
        .flags = {},
    }));
    rules.push_back(make_code_rule(RuleSpec{
        .id = "nottest_decorator",
        .pattern = R"(^([ \t]*)@(?:nose\.tools\.)?nottest[ \t]*$)",
        .replacement = R"(\1@pytest.mark.skip(reason="Not a test"))",
        .description = "@nottest -> @pytest.mark.skip(reason=\"Not a test\")",
        .priority = DECORATOR_PRIORITY,
        .enabled = true,
        .flags = {.multiline = true, .ignore_case = false, .dotall = false},
    }));
    rules.push_back(make_code_rule(
        RuleSpec{
            .id = "with_setup_decorator",
            .pattern = R"(^[ \t]*@(?:nose\.tools\.)?with_setup\()",
            .replacement = "",
            .description = "@with_setup needs a hand-written fixture",
            .priority = DECORATOR_PRIORITY,
            .enabled = true,
            .flags = {.multiline = true, .ignore_case = false, .dotall = false},
        },
        always_unresolved()));
    return rules;
}

auto context_rules() -> std::vector<TransformationRule> {
    // One level of nested parentheses inside the argument list, e.g. (KeyError, ValueError)
    const std::string arguments = R"(((?:[^()\n]|\([^()\n]*\))*))";
    std::vector<TransformationRule> rules;
    rules.push_back(make_code_rule(
        RuleSpec{
            .id = "with_assert_raises",
            .pattern = R"(\bwith[ \t]+()(?:nose\.tools\.)?assert_raises\()" + arguments +
                       R"(\)([ \t]+as[ \t]+\w+)?[ \t]*:)",
            .replacement = "with pytest.raises(\\2):",
            .description = "with assert_raises(E): -> with pytest.raises(E):",
            .priority = NOSE_CONTEXT_PRIORITY,
            .enabled = true,
            .flags = {},
        },
        raises_context_producer()));
    rules.push_back(make_code_rule(
        RuleSpec{
            .id = "with_assertRaises",
            .pattern = R"(\bwith[ \t]+self\.(assertRaises|assertRaisesRegexp?)\()" + arguments +
                       R"(\)([ \t]+as[ \t]+\w+)?[ \t]*:)",
            .replacement = "with pytest.raises(\\2):",
            .description = "with self.assertRaises(E): -> with pytest.raises(E):",
            .priority = UNITTEST_CONTEXT_PRIORITY,
            .enabled = true,
            .flags = {},
        },
        raises_context_producer()));
    return rules;
}

auto unittest_regex_rules() -> std::vector<TransformationRule> {
    std::vector<TransformationRule> rules;
    rules.push_back(make_code_rule(RuleSpec{
        .id = "self_fail",
        .pattern = R"(\bself\.fail\()",
        .replacement = "pytest.fail(",
        .description = "self.fail(msg) -> pytest.fail(msg)",
        .priority = UNITTEST_CALL_PRIORITY,
        .enabled = true,
        .flags = {},
    }));
    rules.push_back(make_code_rule(RuleSpec{
        .id = "self_skipTest",
        .pattern = R"(\bself\.skipTest\()",
        .replacement = "pytest.skip(",
        .description = "self.skipTest(msg) -> pytest.skip(msg)",
        .priority = UNITTEST_CALL_PRIORITY,
        .enabled = true,
        .flags = {},
    }));
    rules.push_back(make_code_rule(RuleSpec{
        .id = "raise_SkipTest",
        .pattern = R"(\braise[ \t]+(?:unittest\.|nose\.)?SkipTest\()",
        .replacement = "pytest.skip(",
        .description = "raise SkipTest(msg) -> pytest.skip(msg)",
        .priority = UNITTEST_CALL_PRIORITY,
        .enabled = true,
        .flags = {},
    }));
    return rules;
}

auto structural_rule(std::string_view tag, int priority, bool enabled, std::string description)
    -> TransformationRule {
    return make_rule(RuleSpec{
        .id = std::string(tag),
        .pattern = std::string(STRUCTURAL_TAG_PREFIX) + std::string(tag),
        .replacement = "",
        .description = std::move(description),
        .priority = priority,
        .enabled = enabled,
        .flags = {},
    });
}

} // namespace

auto register_default_rules(PatternRegistry& registry) -> void {
    for (auto& rule : decorator_rules()) {
        registry.register_rule(std::move(rule));
    }
    for (auto& rule : context_rules()) {
        registry.register_rule(std::move(rule));
    }
    for (const auto& definition : nose_call_rules()) {
        registry.register_rule(make_call_rule(definition, NOSE_CALL_PRIORITY));
    }
    for (const auto& definition : unittest_call_rules()) {
        registry.register_rule(make_call_rule(definition, UNITTEST_CALL_PRIORITY));
    }
    for (auto& rule : unittest_regex_rules()) {
        registry.register_rule(std::move(rule));
    }

    RuleSpec rename_spec{
        .id = "rename_non_test_method",
        .pattern = R"(^([ \t]+)(async[ \t]+)?def[ \t]+(?!test)([A-Za-z]\w*_test)[ \t]*\(([ \t]*)self\b([^)]*)\))",
        .replacement = R"(\1\2def test_\3(\4self\5))",
        .description = "def foo_test(self) -> def test_foo_test(self)",
        .priority = RENAME_PRIORITY,
        .enabled = true,
        .flags = {.multiline = true, .ignore_case = false, .dotall = false},
    };
    registry.register_rule(make_rule(
        rename_spec,
        code_only(mark_referenced_methods(make_regex_matcher(rename_spec.pattern, rename_spec.flags))),
        rename_method_producer()));

    registry.register_rule(make_import_rule("nose_tools_import", ImportFamily::NOSE_TOOLS,
                                            "Drop nose.tools names that are no longer used"));
    registry.register_rule(make_import_rule("nose_import", ImportFamily::NOSE_OTHER,
                                            "Drop nose imports that are no longer used"));

    registry.register_rule(structural_rule(TAG_LIFECYCLE_BASE, LIFECYCLE_BASE_PRIORITY, true,
                                           "Drop the unittest.TestCase base class"));
    registry.register_rule(structural_rule(TAG_LIFECYCLE_HOOKS, LIFECYCLE_HOOKS_PRIORITY, true,
                                           "setUp/tearDown -> autouse yield fixture"));
    registry.register_rule(structural_rule(TAG_FLATTEN_CLASS, FLATTEN_CLASS_PRIORITY, false,
                                           "Turn stateless test classes into module functions"));
    registry.register_rule(structural_rule(TAG_YIELD_TESTS, YIELD_TESTS_PRIORITY, true,
                                           "Generator tests -> @pytest.mark.parametrize"));
    registry.register_rule(structural_rule(TAG_PYTEST_IMPORTS, PYTEST_IMPORTS_PRIORITY, true,
                                           "Add import pytest, drop unused import unittest"));
}

auto make_default_registry() -> PatternRegistry {
    PatternRegistry registry;
    register_default_rules(registry);
    return registry;
}

} // namespace pytestify
