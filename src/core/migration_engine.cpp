#include "pytestify/core/migration_engine.hpp"
#include "pytestify/core/python_syntax.hpp"
#include <algorithm>
#include <regex>

namespace pytestify {

namespace {

auto finalized(PatternRegistry registry) -> PatternRegistry {
    registry.finalize();
    return registry;
}

// Changed region of a conversion, widened to whole lines
auto diff_record(const std::string& before, const std::string& after) -> ApplicationRecord {
    size_t prefix = 0;
    auto limit = std::min(before.size(), after.size());
    while (prefix < limit && before[prefix] == after[prefix]) {
        ++prefix;
    }
    size_t suffix = 0;
    while (suffix < limit - prefix &&
           before[before.size() - 1 - suffix] == after[after.size() - 1 - suffix]) {
        ++suffix;
    }

    auto line_start = before.rfind('\n', prefix == 0 ? 0 : prefix - 1);
    auto begin = (line_start == std::string::npos || prefix == 0) ? 0 : line_start + 1;
    auto before_end = before.find('\n', before.size() - suffix);
    before_end = before_end == std::string::npos ? before.size() : before_end;
    auto after_end = after.size() - (before.size() - before_end);

    return ApplicationRecord{
        .rule_id = std::string(ASSERTION_CONVERTER_ID),
        .original_fragment = before.substr(begin, before_end - begin),
        .replacement_fragment = after.substr(begin, after_end - begin),
        .location = location_at(before, begin),
    };
}

auto merge(RewriteOutcome& into, RewriteOutcome&& from) -> void {
    into.text = std::move(from.text);
    into.change_log.insert(into.change_log.end(), from.change_log.begin(), from.change_log.end());
    // Declines already reported by the first round are not repeated
    for (auto& diagnostic : from.diagnostics) {
        if (!into.unresolved.contains(diagnostic.pattern_id)) {
            into.diagnostics.push_back(std::move(diagnostic));
        }
    }
    into.unresolved.insert(from.unresolved.begin(), from.unresolved.end());
}

} // namespace

auto has_legacy_assertions(std::string_view text) -> bool {
    static const std::regex legacy_call{
        R"((^|[^\w.])(assert_[a-z_]+|eq_|ok_|ne_)\s*\(|\bself\.(assert[A-Z_]\w*|fail[A-Z]\w*)\s*\()"};
    auto code = python::blank_non_code(text);
    return std::regex_search(code, legacy_call);
}

MigrationEngine::MigrationEngine(PatternRegistry registry, IAssertionConverter* converter)
    : registry_(finalized(std::move(registry)))
    , textual_rules_(registry_.rules_for_pass(RuleKind::TEXTUAL))
    , structural_(structural_options_from(registry_))
    , converter_(converter) {}

auto MigrationEngine::rewrite(RewriteOutcome& outcome) const -> void {
    for (const auto& rule : textual_rules_) {
        apply_textual_rule(outcome, rule);
    }
    structural_.apply(outcome);
}

auto MigrationEngine::transform_text(const std::string& path, const std::string& text) const
    -> FileTransformResult {
    RewriteOutcome outcome{.text = text};
    rewrite(outcome);

    FileTransformResult result{.path = path};
    if (has_legacy_assertions(outcome.text)) {
        run_assertion_converter(outcome, result);
    }

    result.original_text = text;
    result.new_text = std::move(outcome.text);
    result.changed = result.new_text != result.original_text;
    result.change_log = std::move(outcome.change_log);
    result.unresolved_patterns = std::move(outcome.unresolved);
    result.diagnostics.insert(result.diagnostics.begin(), outcome.diagnostics.begin(),
                              outcome.diagnostics.end());
    return result;
}

auto MigrationEngine::run_assertion_converter(RewriteOutcome& outcome,
                                              FileTransformResult& result) const -> void {
    const std::string converter_id(ASSERTION_CONVERTER_ID);
    if (converter_ == nullptr || !converter_->is_available()) {
        result.assertion_pass = AssertionPassStatus::SKIPPED;
        result.diagnostics.push_back(Diagnostic{
            .kind = DiagnosticKind::COLLABORATOR_SKIPPED,
            .pattern_id = converter_id,
            .message = "assertion converter not available; remaining assertions left as they are",
            .location = std::nullopt,
        });
        return;
    }

    AssertionConversion conversion;
    try {
        conversion = converter_->convert(outcome.text);
    } catch (const std::exception& e) {
        conversion = AssertionConversion{.text = outcome.text, .success = false, .message = e.what()};
    }

    if (!conversion.success) {
        result.assertion_pass = AssertionPassStatus::FAILED;
        result.diagnostics.push_back(Diagnostic{
            .kind = DiagnosticKind::COLLABORATOR_FAILURE,
            .pattern_id = converter_id,
            .message = converter_->name() + " failed" +
                       (conversion.message.empty() ? "" : ": " + conversion.message),
            .location = std::nullopt,
        });
        return;
    }
    if (conversion.text == outcome.text) {
        result.assertion_pass = AssertionPassStatus::UNCHANGED;
        result.diagnostics.push_back(Diagnostic{
            .kind = DiagnosticKind::COLLABORATOR_FAILURE,
            .pattern_id = converter_id,
            .message = converter_->name() + " left the text unchanged",
            .location = std::nullopt,
        });
        return;
    }

    result.assertion_pass = AssertionPassStatus::APPLIED;
    outcome.change_log.push_back(diff_record(outcome.text, conversion.text));

    // The converter may introduce pytest references or free up imports
    RewriteOutcome cleanup{.text = std::move(conversion.text)};
    rewrite(cleanup);
    merge(outcome, std::move(cleanup));
}

} // namespace pytestify
