#include "pytestify/core/textual_rewriter.hpp"
#include <algorithm>
#include <regex>

namespace pytestify {

namespace {

// Sorted by position; a span overlapping one already accepted is dropped
auto select_non_overlapping(std::vector<MatchSpan> spans) -> std::vector<MatchSpan> {
    std::stable_sort(spans.begin(), spans.end(), [](const MatchSpan& lhs, const MatchSpan& rhs) {
        return lhs.begin < rhs.begin;
    });

    std::vector<MatchSpan> selected;
    for (auto& span : spans) {
        if (span.end <= span.begin) {
            continue;
        }
        if (!selected.empty() && selected.back().overlaps(span)) {
            continue;
        }
        selected.push_back(std::move(span));
    }
    return selected;
}

auto unresolved_diagnostic(const TransformationRule& rule, const std::string& text,
                           const MatchSpan& span, const std::string& reason) -> Diagnostic {
    auto fragment = text.substr(span.begin, std::min<size_t>(span.length(), 80));
    auto newline = fragment.find('\n');
    if (newline != std::string::npos) {
        fragment = fragment.substr(0, newline) + " ...";
    }
    return Diagnostic{
        .kind = DiagnosticKind::UNRESOLVED_MATCH,
        .pattern_id = rule.id,
        .message = reason + ": " + fragment,
        .location = location_at(text, span.begin),
    };
}

} // namespace

auto apply_textual_rule(RewriteOutcome& outcome, const TransformationRule& rule) -> void {
    if (!rule.enabled || rule.kind != RuleKind::TEXTUAL || !rule.matcher || !rule.producer) {
        return;
    }

    std::vector<MatchSpan> spans;
    try {
        spans = select_non_overlapping(rule.matcher(outcome.text));
    } catch (const std::regex_error& e) {
        outcome.unresolved.insert(rule.id);
        outcome.diagnostics.push_back(Diagnostic{
            .kind = DiagnosticKind::UNRESOLVED_MATCH,
            .pattern_id = rule.id,
            .message = std::string("matcher failed: ") + e.what(),
            .location = std::nullopt,
        });
        return;
    }
    if (spans.empty()) {
        return;
    }

    const auto& current = outcome.text;
    std::string rewritten;
    rewritten.reserve(current.size());
    size_t cursor = 0;

    for (const auto& span : spans) {
        if (span.end > current.size()) {
            continue;
        }

        std::optional<std::string> replacement;
        std::string reason = "cannot be rewritten safely";
        try {
            replacement = rule.producer(span.groups);
        } catch (const std::exception& e) {
            replacement.reset();
            reason = std::string("replacement failed: ") + e.what();
        }

        if (!replacement) {
            outcome.unresolved.insert(rule.id);
            outcome.diagnostics.push_back(unresolved_diagnostic(rule, current, span, reason));
            continue;
        }

        auto original = current.substr(span.begin, span.length());
        if (*replacement == original) {
            continue;
        }

        rewritten.append(current, cursor, span.begin - cursor);
        rewritten.append(*replacement);
        cursor = span.end;

        outcome.change_log.push_back(ApplicationRecord{
            .rule_id = rule.id,
            .original_fragment = std::move(original),
            .replacement_fragment = std::move(*replacement),
            .location = location_at(current, span.begin),
        });
    }

    if (cursor == 0) {
        return;  // Nothing rewritten
    }
    rewritten.append(current, cursor, std::string::npos);
    outcome.text = std::move(rewritten);
}

auto apply_textual_rules(const std::string& text, std::span<const TransformationRule> rules)
    -> RewriteOutcome {
    RewriteOutcome outcome{.text = text, .change_log = {}, .unresolved = {}, .diagnostics = {}};
    std::vector<const TransformationRule*> idle;
    for (const auto& rule : rules) {
        auto changes = outcome.change_log.size();
        auto diagnostics = outcome.diagnostics.size();
        apply_textual_rule(outcome, rule);
        if (outcome.change_log.size() == changes && outcome.diagnostics.size() == diagnostics) {
            idle.push_back(&rule);
        }
    }

    // A rule that found nothing on its turn but matches the final text needed
    // output of a rule that runs after it
    for (const auto* rule : idle) {
        RewriteOutcome late{.text = outcome.text, .change_log = {}, .unresolved = {}, .diagnostics = {}};
        apply_textual_rule(late, *rule);
        if (late.change_log.empty() && late.diagnostics.empty()) {
            continue;
        }
        outcome.unresolved.insert(rule->id);
        if (!late.change_log.empty()) {
            const auto& record = late.change_log.front();
            outcome.diagnostics.push_back(Diagnostic{
                .kind = DiagnosticKind::UNRESOLVED_MATCH,
                .pattern_id = rule->id,
                .message = "matches only after a later rule ran: " + record.original_fragment,
                .location = record.location,
            });
        } else {
            outcome.diagnostics.push_back(late.diagnostics.front());
        }
    }
    return outcome;
}

} // namespace pytestify
