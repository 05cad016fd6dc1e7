#include "pytestify/core/change_reporter.hpp"
#include <gtest/gtest.h>

namespace pytestify {

class ChangeReporterTest : public ::testing::Test {
protected:
    static auto record(const std::string& rule_id) -> ApplicationRecord
    {
        return ApplicationRecord{.rule_id = rule_id, .original_fragment = "a",
                                 .replacement_fragment = "b", .location = {}};
    }

    static auto diagnostic(DiagnosticKind kind, const std::string& pattern_id) -> Diagnostic
    {
        return Diagnostic{.kind = kind, .pattern_id = pattern_id, .message = "m", .location = {}};
    }
};

TEST_F(ChangeReporterTest, EmptyBatch)
{
    auto summary = summarize({});
    EXPECT_EQ(summary, MigrationSummary{});
}

TEST_F(ChangeReporterTest, CountsOutcomesAndRules)
{
    std::vector<FileTransformResult> results(3);
    results[0].path = "changed.py";
    results[0].changed = true;
    results[0].change_log = {record("assertEqual"), record("assertEqual"), record("lifecycle_base")};

    results[1].path = "same.py";

    results[2].path = "broken.py";
    results[2].changed = true;
    results[2].diagnostics = {diagnostic(DiagnosticKind::IO_FAILURE, "io")};

    auto summary = summarize(results);

    EXPECT_EQ(summary.files_total, 3);
    EXPECT_EQ(summary.files_changed, 1);
    EXPECT_EQ(summary.files_unchanged, 1);
    EXPECT_EQ(summary.files_failed, 1);
    EXPECT_EQ(summary.rules_fired.at("assertEqual"), 2);
    EXPECT_EQ(summary.rules_fired.at("lifecycle_base"), 1);
    EXPECT_EQ(summary.warning_count, 0);
}

TEST_F(ChangeReporterTest, GroupsUnresolvedPatternsByFile)
{
    std::vector<FileTransformResult> results(2);
    results[0].path = "a.py";
    results[0].unresolved_patterns = {"yield_tests", "assertEqual"};
    results[0].diagnostics = {diagnostic(DiagnosticKind::STRUCTURAL_AMBIGUITY, "yield_tests"),
                              diagnostic(DiagnosticKind::UNRESOLVED_MATCH, "assertEqual")};
    results[1].path = "b.py";
    results[1].unresolved_patterns = {"yield_tests"};
    results[1].diagnostics = {diagnostic(DiagnosticKind::STRUCTURAL_AMBIGUITY, "yield_tests")};

    auto summary = summarize(results);

    EXPECT_EQ(summary.files_with_unresolved, (std::vector<std::string>{"a.py", "b.py"}));
    EXPECT_EQ(summary.unresolved_by_pattern.at("yield_tests"), 2);
    EXPECT_EQ(summary.unresolved_by_pattern.at("assertEqual"), 1);
    EXPECT_EQ(summary.warning_count, 3);
}

TEST_F(ChangeReporterTest, AssertionPassCounts)
{
    std::vector<FileTransformResult> results(5);
    results[0].assertion_pass = AssertionPassStatus::APPLIED;
    results[1].assertion_pass = AssertionPassStatus::SKIPPED;
    results[2].assertion_pass = AssertionPassStatus::FAILED;
    results[3].assertion_pass = AssertionPassStatus::UNCHANGED;
    results[4].assertion_pass = AssertionPassStatus::NOT_NEEDED;

    auto summary = summarize(results);

    EXPECT_EQ(summary.assertion_passes_applied, 1);
    EXPECT_EQ(summary.assertion_passes_skipped, 1);
    EXPECT_EQ(summary.assertion_passes_failed, 2);
}

TEST_F(ChangeReporterTest, ChangedFileWithWarningsIsStillChanged)
{
    std::vector<FileTransformResult> results(1);
    results[0].changed = true;
    results[0].diagnostics = {diagnostic(DiagnosticKind::COLLABORATOR_SKIPPED, "assertion_converter")};

    auto summary = summarize(results);

    EXPECT_EQ(summary.files_changed, 1);
    EXPECT_EQ(summary.files_failed, 0);
    EXPECT_EQ(summary.warning_count, 1);
    EXPECT_TRUE(results[0].has_warnings());
    EXPECT_TRUE(results[0].needs_decision());
}

} // namespace pytestify
