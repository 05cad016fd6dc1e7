#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pytestify {

// Captured groups of one match; index 0 is the whole match, absent groups are nullopt
using Captures = std::vector<std::optional<std::string>>;

// Half-open span [begin, end) in the text a matcher scanned
struct MatchSpan {
    size_t begin{};
    size_t end{};
    Captures groups;

    auto length() const -> size_t
    {
        return end - begin;
    }

    auto overlaps(const MatchSpan& other) const -> bool
    {
        return begin < other.end && other.begin < end;
    }
};

struct SourceLocation {
    size_t offset{};
    size_t line{};    // 1-based
    size_t column{};  // 1-based

    auto operator==(const SourceLocation& other) const -> bool = default;
};

// One successful rewrite
struct ApplicationRecord {
    std::string rule_id;
    std::string original_fragment;
    std::string replacement_fragment;
    SourceLocation location;

    auto operator==(const ApplicationRecord& other) const -> bool = default;
};

using ChangeLog = std::vector<ApplicationRecord>;

enum class DiagnosticKind {
    UNRESOLVED_MATCH,       // A textual rule matched but declined to rewrite
    STRUCTURAL_AMBIGUITY,   // A structural unit only partially fits a transform
    COLLABORATOR_FAILURE,   // Assertion converter or test runner failed
    COLLABORATOR_SKIPPED,   // Assertion converter is not available
    IO_FAILURE              // File could not be read or written
};

struct Diagnostic {
    DiagnosticKind kind = DiagnosticKind::UNRESOLVED_MATCH;
    std::string pattern_id;
    std::string message;
    std::optional<SourceLocation> location;
};

enum class AssertionPassStatus {
    NOT_NEEDED,
    APPLIED,
    UNCHANGED,
    FAILED,
    SKIPPED
};

// Outcome of running every pass over one file
struct FileTransformResult {
    std::string path;
    bool changed = false;
    ChangeLog change_log;
    std::set<std::string> unresolved_patterns;
    std::vector<Diagnostic> diagnostics;
    AssertionPassStatus assertion_pass = AssertionPassStatus::NOT_NEEDED;
    std::string original_text;
    std::string new_text;

    auto has_fatal_error() const -> bool;
    auto has_warnings() const -> bool;

    // Changed files need a keep/discard decision before anything is written
    auto needs_decision() const -> bool
    {
        return changed && !has_fatal_error();
    }
};

// Aggregate over a batch of FileTransformResults
struct MigrationSummary {
    size_t files_total{};
    size_t files_changed{};
    size_t files_unchanged{};
    size_t files_failed{};
    std::map<std::string, size_t> rules_fired;
    std::vector<std::string> files_with_unresolved;
    std::map<std::string, size_t> unresolved_by_pattern;
    size_t warning_count{};
    size_t assertion_passes_applied{};
    size_t assertion_passes_skipped{};
    size_t assertion_passes_failed{};

    auto operator==(const MigrationSummary& other) const -> bool = default;
};

enum class ReviewDecision {
    KEEP,
    DISCARD,
    KEEP_ALL,
    QUIT
};

enum class ReviewPolicy {
    AUTO_KEEP,
    AUTO_DISCARD,
    PROMPT
};

auto diagnostic_kind_name(DiagnosticKind kind) -> std::string;
auto assertion_status_name(AssertionPassStatus status) -> std::string;
auto review_policy_name(ReviewPolicy policy) -> std::string;
auto parse_review_policy(const std::string& text) -> std::optional<ReviewPolicy>;

// Line and column (both 1-based) of a byte offset
auto location_at(const std::string& text, size_t offset) -> SourceLocation;

} // namespace pytestify
