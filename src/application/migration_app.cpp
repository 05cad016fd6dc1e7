#include "pytestify/application/migration_app.hpp"
#include "pytestify/application/worker_pool.hpp"
#include "pytestify/core/change_reporter.hpp"
#include "pytestify/core/default_rules.hpp"
#include "pytestify/core/python_syntax.hpp"
#include "pytestify/parsers/rule_file_parser.hpp"
#include <algorithm>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <regex>
#include <set>
#include <sstream>

namespace pytestify {

namespace {

std::atomic<bool> cancel_flag{false};

auto handle_interrupt(int /*signal*/) -> void {
    cancel_flag.store(true);
}

auto io_failure(const std::string& path, const std::string& message) -> FileTransformResult {
    FileTransformResult result{.path = path};
    result.diagnostics.push_back(Diagnostic{
        .kind = DiagnosticKind::IO_FAILURE,
        .pattern_id = "io",
        .message = message,
        .location = std::nullopt,
    });
    return result;
}

auto describe_location(const Diagnostic& diagnostic) -> std::string {
    if (!diagnostic.location) {
        return "";
    }
    return ":" + std::to_string(diagnostic.location->line);
}

} // namespace

auto request_cancellation() -> void {
    cancel_flag.store(true);
}

auto cancellation_requested() -> bool {
    return cancel_flag.load();
}

auto reset_cancellation() -> void {
    cancel_flag.store(false);
}

auto install_interrupt_handler() -> void {
    std::signal(SIGINT, handle_interrupt);
}

auto is_test_file_name(const std::string& path) -> bool {
    auto name = std::filesystem::path(path).filename().string();
    if (!name.ends_with(".py")) {
        return false;
    }
    return name.starts_with("test_") || name.ends_with("_test.py");
}

auto references_legacy_framework(const std::string& text) -> bool {
    static const std::regex legacy_reference{
        R"(\b(import|from)\s+(nose|unittest)\b|\b(nose|unittest)\.\w)"};
    auto code = python::blank_non_code(text);
    return std::regex_search(code, legacy_reference);
}

auto render_summary(const MigrationSummary& summary) -> std::string {
    std::ostringstream out;
    out << "Migration summary\n";
    out << "  Files processed: " << summary.files_total << "\n";
    out << "  Changed: " << summary.files_changed << "  Unchanged: " << summary.files_unchanged
        << "  Failed: " << summary.files_failed << "\n";

    if (!summary.rules_fired.empty()) {
        out << "  Rules fired:\n";
        for (const auto& [rule_id, count] : summary.rules_fired) {
            out << "    " << std::left << std::setw(32) << rule_id << count << "\n";
        }
    }

    if (!summary.files_with_unresolved.empty()) {
        out << "  Files needing manual follow-up: " << summary.files_with_unresolved.size() << "\n";
        for (const auto& path : summary.files_with_unresolved) {
            out << "    " << path << "\n";
        }
        out << "  Unresolved by pattern:\n";
        for (const auto& [pattern_id, count] : summary.unresolved_by_pattern) {
            out << "    " << std::left << std::setw(32) << pattern_id << count << "\n";
        }
    }

    out << "  Warnings: " << summary.warning_count << "\n";
    if (summary.assertion_passes_applied + summary.assertion_passes_skipped +
            summary.assertion_passes_failed >
        0) {
        out << "  Assertion converter: applied " << summary.assertion_passes_applied
            << ", skipped " << summary.assertion_passes_skipped << ", failed "
            << summary.assertion_passes_failed << "\n";
    }
    return out.str();
}

auto render_rule_list(const PatternRegistry& registry) -> std::string {
    std::ostringstream out;
    out << std::left << std::setw(6) << "PRIO" << std::setw(30) << "ID" << std::setw(12) << "KIND"
        << std::setw(10) << "STATE" << "DESCRIPTION\n";
    for (const auto& rule : registry.all_rules()) {
        out << std::left << std::setw(6) << rule.priority << std::setw(30) << rule.id
            << std::setw(12) << (rule.kind == RuleKind::STRUCTURAL ? "structural" : "textual")
            << std::setw(10) << (rule.enabled ? "enabled" : "disabled") << rule.description
            << "\n";
    }
    return out.str();
}

MigrationApp::MigrationApp(std::unique_ptr<IFileSystem> filesystem,
                           std::unique_ptr<IAssertionConverter> converter,
                           std::unique_ptr<ITrackingStore> tracking,
                           std::unique_ptr<IReviewTerminal> terminal,
                           std::unique_ptr<ITestRunner> test_runner)
    : filesystem_(std::move(filesystem)), converter_(std::move(converter)),
      tracking_(std::move(tracking)), terminal_(std::move(terminal)),
      test_runner_(std::move(test_runner)) {}

auto MigrationApp::build_registry(const Config& config) -> std::optional<PatternRegistry> {
    auto registry = make_default_registry();

    if (!config.rules_file.empty()) {
        auto content = filesystem_->read_file(config.rules_file);
        if (!content) {
            std::cerr << "Error: Could not read rules file " << config.rules_file << "\n";
            return std::nullopt;
        }

        RuleFileParser parser;
        auto parsed = parser.parse(*content);
        for (const auto& error : parsed.errors) {
            std::cerr << "Error: " << config.rules_file << ": " << format_rule_file_error(error)
                      << "\n";
        }
        auto problems = apply_rule_file(registry, parsed);
        for (const auto& problem : problems) {
            std::cerr << "Error: " << config.rules_file << ": " << problem << "\n";
        }
        if (!parsed.ok() || !problems.empty()) {
            return std::nullopt;
        }
    }

    bool toggles_ok = true;
    for (const auto& id : config.disabled_rules) {
        if (!registry.set_enabled(id, false)) {
            std::cerr << "Error: Unknown rule id " << id << "\n";
            toggles_ok = false;
        }
    }
    for (const auto& id : config.enabled_rules) {
        if (!registry.set_enabled(id, true)) {
            std::cerr << "Error: Unknown rule id " << id << "\n";
            toggles_ok = false;
        }
    }
    if (!toggles_ok) {
        return std::nullopt;
    }
    return registry;
}

auto MigrationApp::discover_files(const std::vector<std::string>& paths,
                                  std::vector<FileTransformResult>& missing)
    -> std::vector<std::string> {
    std::vector<std::string> files;
    std::set<std::string> seen;
    auto add = [&files, &seen](const std::string& path) {
        if (seen.insert(path).second) {
            files.push_back(path);
        }
    };

    for (const auto& path : paths) {
        if (filesystem_->is_directory(path)) {
            for (const auto& candidate : filesystem_->list_files(path)) {
                if (!is_test_file_name(candidate)) {
                    continue;
                }
                auto content = filesystem_->read_file(candidate);
                if (content && references_legacy_framework(*content)) {
                    add(candidate);
                }
            }
        } else if (filesystem_->file_exists(path)) {
            add(path);
        } else {
            std::cerr << "Error: No such file or directory: " << path << "\n";
            missing.push_back(io_failure(path, "no such file or directory"));
        }
    }
    return files;
}

auto MigrationApp::transform_file(const MigrationEngine& engine, const std::string& path)
    -> FileTransformResult {
    auto content = filesystem_->read_file(path);
    if (!content) {
        return io_failure(path, "cannot read file");
    }
    try {
        return engine.transform_text(path, *content);
    } catch (const std::exception& e) {
        // The file is left as it is; the rest of the batch continues
        return io_failure(path, std::string("internal error while rewriting: ") + e.what());
    }
}

auto MigrationApp::transform_all(const MigrationEngine& engine,
                                 const std::vector<std::string>& files, size_t jobs)
    -> std::vector<std::optional<FileTransformResult>> {
    std::vector<std::optional<FileTransformResult>> results(files.size());
    parallel_for(
        files.size(), jobs,
        [&](size_t index) { results[index] = transform_file(engine, files[index]); },
        [] { return cancellation_requested(); });
    return results;
}

auto MigrationApp::write_result(FileTransformResult& result, const Config& config) -> bool {
    if (config.backup_dir) {
        if (!filesystem_->create_backup(result.path, *config.backup_dir)) {
            std::cerr << "Error: Could not back up " << result.path << "; file left unchanged\n";
            result.diagnostics.push_back(Diagnostic{
                .kind = DiagnosticKind::IO_FAILURE,
                .pattern_id = "io",
                .message = "cannot create backup",
                .location = std::nullopt,
            });
            return false;
        }
    }
    if (!filesystem_->write_file_atomic(result.path, result.new_text)) {
        std::cerr << "Error: Could not write " << result.path << "\n";
        result.diagnostics.push_back(Diagnostic{
            .kind = DiagnosticKind::IO_FAILURE,
            .pattern_id = "io",
            .message = "cannot write file",
            .location = std::nullopt,
        });
        return false;
    }
    return true;
}

auto MigrationApp::verify_result(FileTransformResult& result) -> TestRunOutcome {
    auto outcome = test_runner_->run(result.path);
    if (outcome.success) {
        std::cout << "Verified " << result.path
                  << (outcome.message.empty() ? "" : " (" + outcome.message + ")") << "\n";
        return outcome;
    }

    std::cerr << "Error: Verification failed for " << result.path << ": " << outcome.message
              << "\n";
    result.diagnostics.push_back(Diagnostic{
        .kind = DiagnosticKind::COLLABORATOR_FAILURE,
        .pattern_id = "verification",
        .message = outcome.message,
        .location = std::nullopt,
    });
    if (filesystem_->write_file_atomic(result.path, result.original_text)) {
        std::cout << "Restored " << result.path << " to its original content\n";
    } else {
        std::cerr << "Error: Could not restore " << result.path << "\n";
        result.diagnostics.push_back(Diagnostic{
            .kind = DiagnosticKind::IO_FAILURE,
            .pattern_id = "io",
            .message = "cannot restore original content",
            .location = std::nullopt,
        });
    }
    return outcome;
}

auto MigrationApp::track(const FileTransformResult& result, bool success,
                         const std::string& outcome) -> void {
    if (!tracking_) {
        return;
    }
    auto message = outcome;
    if (!result.unresolved_patterns.empty()) {
        message += "; " + std::to_string(result.unresolved_patterns.size()) + " unresolved pattern(s)";
    }
    if (!tracking_->record(result.path, success, message)) {
        std::cerr << "Warning: Could not update tracking store for " << result.path << "\n";
    }
}

auto MigrationApp::report_diagnostics(const FileTransformResult& result) -> void {
    for (const auto& diagnostic : result.diagnostics) {
        if (diagnostic.kind == DiagnosticKind::IO_FAILURE) {
            continue;  // Reported where it happened
        }
        std::cerr << "Warning: " << result.path << describe_location(diagnostic) << ": ["
                  << diagnostic_kind_name(diagnostic.kind) << "] " << diagnostic.pattern_id
                  << ": " << diagnostic.message << "\n";
    }
}

auto MigrationApp::run(const Config& config) -> int {
    auto registry = build_registry(config);
    if (!registry) {
        return 1;
    }

    if (config.list_rules) {
        std::cout << render_rule_list(*registry);
        return 0;
    }

    if (config.paths.empty()) {
        std::cerr << "Error: No input paths given (see --help)\n";
        return 1;
    }

    bool verifying = config.verify && !config.dry_run;
    if (verifying && (!test_runner_ || !test_runner_->is_available())) {
        std::cerr << "Error: Test runner '" << (test_runner_ ? test_runner_->name() : config.test_command)
                  << "' not found; cannot verify migrated files\n";
        return 1;
    }

    std::vector<FileTransformResult> processed;
    auto files = discover_files(config.paths, processed);
    if (files.empty() && processed.empty()) {
        std::cout << "No nose or unittest test files found.\n";
        return 0;
    }
    std::cout << "Found " << files.size() << " file(s) to migrate.\n";

    if (converter_ && !converter_->is_available()) {
        std::cerr << "Warning: Assertion converter '" << converter_->name()
                  << "' not found; remaining assertions will not be converted\n";
    }

    MigrationEngine engine(std::move(*registry), converter_.get());
    auto results = transform_all(engine, files, config.jobs);

    auto policy = config.review_policy;
    if (policy == ReviewPolicy::PROMPT && !config.dry_run &&
        (!terminal_ || !terminal_->is_interactive())) {
        std::cerr << "Warning: No interactive terminal, falling back to auto-keep\n";
        policy = ReviewPolicy::AUTO_KEEP;
    }

    auto pending_reviews = static_cast<size_t>(
        std::count_if(results.begin(), results.end(), [](const auto& result) {
            return result && result->needs_decision();
        }));
    size_t review_index = 0;
    size_t written = 0;
    size_t discarded = 0;
    size_t handled = 0;
    size_t verified = 0;
    std::vector<std::string> failed_verifications;

    // Review, writes and tracking stay sequential and in input order
    for (auto& slot : results) {
        if (!slot) {
            break;
        }
        auto& result = *slot;
        report_diagnostics(result);

        std::string outcome;
        bool verification_passed = true;
        if (result.has_fatal_error()) {
            std::cerr << "Error: " << result.path << ": " << result.diagnostics.back().message
                      << "\n";
            outcome = "failed: " + result.diagnostics.back().message;
        } else if (!result.changed) {
            outcome = "unchanged";
        } else if (config.dry_run) {
            std::cout << "Would change " << result.path << " (" << result.change_log.size()
                      << " rewrites)\n";
            outcome = "dry run: " + std::to_string(result.change_log.size()) + " rewrites";
        } else {
            auto decision = ReviewDecision::KEEP;
            if (policy == ReviewPolicy::AUTO_DISCARD) {
                decision = ReviewDecision::DISCARD;
            } else if (policy == ReviewPolicy::PROMPT) {
                decision = terminal_->review(result, review_index, pending_reviews);
            }
            ++review_index;

            if (decision == ReviewDecision::KEEP_ALL) {
                policy = ReviewPolicy::AUTO_KEEP;
                decision = ReviewDecision::KEEP;
            }

            if (decision == ReviewDecision::QUIT) {
                std::cout << "Review stopped; " << result.path << " and remaining files left unchanged\n";
                break;
            }
            if (decision == ReviewDecision::DISCARD) {
                std::cout << "Discarded changes to " << result.path << "\n";
                outcome = "discarded";
                ++discarded;
            } else if (write_result(result, config)) {
                std::cout << "Migrated " << result.path << " (" << result.change_log.size()
                          << " rewrites)\n";
                outcome = "migrated: " + std::to_string(result.change_log.size()) + " rewrites";
                if (!verifying) {
                    ++written;
                } else if (auto run = verify_result(result); run.success) {
                    outcome += "; verified";
                    ++verified;
                    ++written;
                } else {
                    outcome = "verification failed: " + run.message;
                    verification_passed = false;
                    failed_verifications.push_back(result.path);
                }
            } else {
                outcome = "failed: " + result.diagnostics.back().message;
            }
        }

        track(result, !result.has_fatal_error() && verification_passed, outcome);
        processed.push_back(std::move(result));
        ++handled;

        if (cancellation_requested()) {
            break;
        }
    }

    if (cancellation_requested()) {
        std::cerr << "Warning: Interrupted; " << files.size() - handled
                  << " file(s) not processed\n";
    }

    auto summary = summarize(processed);
    std::cout << "\n" << render_summary(summary);
    if (config.dry_run) {
        std::cout << "Dry run - no files modified.\n";
    } else {
        std::cout << "Written: " << written << "  Discarded: " << discarded << "\n";
    }
    if (verifying) {
        std::cout << "Verification: passed " << verified << ", failed "
                  << failed_verifications.size() << "\n";
        for (const auto& path : failed_verifications) {
            std::cout << "  " << path << "\n";
        }
    }

    if (summary.files_failed > 0 || !failed_verifications.empty()) {
        return 1;
    }
    if (config.strict && (!summary.unresolved_by_pattern.empty() || summary.warning_count > 0)) {
        return 1;
    }
    return 0;
}

} // namespace pytestify
