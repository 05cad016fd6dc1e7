#include "pytestify/core/change_reporter.hpp"

namespace pytestify {

auto summarize(std::span<const FileTransformResult> results) -> MigrationSummary {
    MigrationSummary summary;
    summary.files_total = results.size();

    for (const auto& result : results) {
        if (result.has_fatal_error()) {
            ++summary.files_failed;
        } else if (result.changed) {
            ++summary.files_changed;
        } else {
            ++summary.files_unchanged;
        }

        for (const auto& record : result.change_log) {
            ++summary.rules_fired[record.rule_id];
        }

        if (!result.unresolved_patterns.empty()) {
            summary.files_with_unresolved.push_back(result.path);
            for (const auto& pattern_id : result.unresolved_patterns) {
                ++summary.unresolved_by_pattern[pattern_id];
            }
        }

        for (const auto& diagnostic : result.diagnostics) {
            if (diagnostic.kind != DiagnosticKind::IO_FAILURE) {
                ++summary.warning_count;
            }
        }

        switch (result.assertion_pass) {
        case AssertionPassStatus::APPLIED:
            ++summary.assertion_passes_applied;
            break;
        case AssertionPassStatus::SKIPPED:
            ++summary.assertion_passes_skipped;
            break;
        case AssertionPassStatus::FAILED:
        case AssertionPassStatus::UNCHANGED:
            ++summary.assertion_passes_failed;
            break;
        case AssertionPassStatus::NOT_NEEDED:
            break;
        }
    }
    return summary;
}

} // namespace pytestify
