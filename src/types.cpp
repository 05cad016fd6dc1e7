#include "pytestify/types.hpp"
#include <algorithm>

namespace pytestify {

auto FileTransformResult::has_fatal_error() const -> bool {
    return std::any_of(diagnostics.begin(), diagnostics.end(), [](const Diagnostic& diagnostic) {
        return diagnostic.kind == DiagnosticKind::IO_FAILURE;
    });
}

auto FileTransformResult::has_warnings() const -> bool {
    return std::any_of(diagnostics.begin(), diagnostics.end(), [](const Diagnostic& diagnostic) {
        return diagnostic.kind == DiagnosticKind::COLLABORATOR_FAILURE ||
               diagnostic.kind == DiagnosticKind::COLLABORATOR_SKIPPED;
    });
}

auto diagnostic_kind_name(DiagnosticKind kind) -> std::string {
    switch (kind) {
    case DiagnosticKind::UNRESOLVED_MATCH:
        return "unresolved";
    case DiagnosticKind::STRUCTURAL_AMBIGUITY:
        return "ambiguous";
    case DiagnosticKind::COLLABORATOR_FAILURE:
        return "converter-failure";
    case DiagnosticKind::COLLABORATOR_SKIPPED:
        return "converter-skipped";
    case DiagnosticKind::IO_FAILURE:
        return "io-failure";
    }
    return "unknown";
}

auto assertion_status_name(AssertionPassStatus status) -> std::string {
    switch (status) {
    case AssertionPassStatus::NOT_NEEDED:
        return "not needed";
    case AssertionPassStatus::APPLIED:
        return "applied";
    case AssertionPassStatus::UNCHANGED:
        return "unchanged";
    case AssertionPassStatus::FAILED:
        return "failed";
    case AssertionPassStatus::SKIPPED:
        return "skipped";
    }
    return "unknown";
}

auto review_policy_name(ReviewPolicy policy) -> std::string {
    switch (policy) {
    case ReviewPolicy::AUTO_KEEP:
        return "auto-keep";
    case ReviewPolicy::AUTO_DISCARD:
        return "auto-discard";
    case ReviewPolicy::PROMPT:
        return "prompt";
    }
    return "unknown";
}

auto parse_review_policy(const std::string& text) -> std::optional<ReviewPolicy> {
    if (text == "auto-keep") {
        return ReviewPolicy::AUTO_KEEP;
    }
    if (text == "auto-discard") {
        return ReviewPolicy::AUTO_DISCARD;
    }
    if (text == "prompt") {
        return ReviewPolicy::PROMPT;
    }
    return std::nullopt;
}

auto location_at(const std::string& text, size_t offset) -> SourceLocation {
    SourceLocation location{.offset = offset, .line = 1, .column = 1};
    auto limit = std::min(offset, text.size());
    for (size_t i = 0; i < limit; ++i) {
        if (text[i] == '\n') {
            ++location.line;
            location.column = 1;
        } else {
            ++location.column;
        }
    }
    return location;
}

} // namespace pytestify
