#pragma once

#include "pytestify/core/migration_engine.hpp"
#include "pytestify/core/pattern_registry.hpp"
#include "pytestify/interfaces.hpp"
#include "pytestify/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pytestify {

inline constexpr const char* DEFAULT_BACKUP_DIR = ".pytestify_backup";

struct Config {
    std::vector<std::string> paths;
    bool dry_run = false;
    ReviewPolicy review_policy = ReviewPolicy::AUTO_KEEP;
    std::optional<std::string> backup_dir;    // Set when --backup is given
    std::string rules_file;                   // Extra rules, empty for none
    std::vector<std::string> disabled_rules;
    std::vector<std::string> enabled_rules;
    std::string assertion_converter = "nose2pytest";
    bool use_assertion_converter = true;
    std::string tracking_file;                // Empty disables tracking
    size_t jobs = 1;
    bool list_rules = false;
    bool strict = false;
    bool verify = false;                      // Run the tests of every written file
    std::string test_command = "pytest -q";    // Used by --verify
};

class MigrationApp {
private:
    std::unique_ptr<IFileSystem> filesystem_;
    std::unique_ptr<IAssertionConverter> converter_;   // May be null
    std::unique_ptr<ITrackingStore> tracking_;         // May be null
    std::unique_ptr<IReviewTerminal> terminal_;        // May be null
    std::unique_ptr<ITestRunner> test_runner_;         // May be null

public:
    MigrationApp(std::unique_ptr<IFileSystem> filesystem,
                 std::unique_ptr<IAssertionConverter> converter,
                 std::unique_ptr<ITrackingStore> tracking,
                 std::unique_ptr<IReviewTerminal> terminal,
                 std::unique_ptr<ITestRunner> test_runner = nullptr);

    // Returns the process exit code
    auto run(const Config& config) -> int;

    // Default catalogue plus the rule file and --enable/--disable toggles
    auto build_registry(const Config& config) -> std::optional<PatternRegistry>;

    // Explicit files are taken as given; directories contribute test files
    // that mention nose or unittest
    auto discover_files(const std::vector<std::string>& paths,
                        std::vector<FileTransformResult>& missing) -> std::vector<std::string>;

private:
    auto transform_file(const MigrationEngine& engine, const std::string& path)
        -> FileTransformResult;
    auto transform_all(const MigrationEngine& engine, const std::vector<std::string>& files,
                       size_t jobs) -> std::vector<std::optional<FileTransformResult>>;
    auto write_result(FileTransformResult& result, const Config& config) -> bool;
    // Runs the tests of a written file; a failing file gets its original text back
    auto verify_result(FileTransformResult& result) -> TestRunOutcome;
    auto track(const FileTransformResult& result, bool success, const std::string& outcome) -> void;
    auto report_diagnostics(const FileTransformResult& result) -> void;
};

auto is_test_file_name(const std::string& path) -> bool;
auto references_legacy_framework(const std::string& text) -> bool;

// Text rendering of a summary for the console
auto render_summary(const MigrationSummary& summary) -> std::string;

// Registry listing for --list-rules, in pass order
auto render_rule_list(const PatternRegistry& registry) -> std::string;

// Whole-run cancellation (SIGINT). Checked between files.
auto request_cancellation() -> void;
auto cancellation_requested() -> bool;
auto reset_cancellation() -> void;
auto install_interrupt_handler() -> void;

} // namespace pytestify
