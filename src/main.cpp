#include "pytestify/application/migration_app.hpp"
#include "pytestify/io/file_system.hpp"
#include "pytestify/io/subprocess_assertion_converter.hpp"
#include "pytestify/io/subprocess_test_runner.hpp"
#include "pytestify/io/tracking_store.hpp"
#include "pytestify/ui/ftxui_review_terminal.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace {

auto print_usage() -> void {
    std::cout << "Usage: pytestify [options] <path>...\n";
    std::cout << "Migrates nose and unittest test files to pytest.\n\n";
    std::cout << "      --dry-run                 Report changes without modifying files\n";
    std::cout << "      --review <policy>         auto-keep (default), auto-discard or prompt\n";
    std::cout << "      --backup[=DIR]            Copy files to DIR before writing (default "
              << pytestify::DEFAULT_BACKUP_DIR << ")\n";
    std::cout << "      --rules <file>            Load additional rules\n";
    std::cout << "      --disable <id>            Disable a rule (repeatable)\n";
    std::cout << "      --enable <id>             Enable a rule (repeatable)\n";
    std::cout << "      --assertion-converter <cmd>  External converter command (default nose2pytest)\n";
    std::cout << "      --no-assertion-converter  Skip the external assertion conversion\n";
    std::cout << "      --track <file>            Record per-file results in a tracking file\n";
    std::cout << "      --jobs <n>                Compute file results on n threads\n";
    std::cout << "      --list-rules              Print the rule registry and exit\n";
    std::cout << "      --strict                  Exit with 1 on unresolved patterns or warnings\n";
    std::cout << "      --verify                  Run the tests of each written file, restore it on failure\n";
    std::cout << "      --test-command <cmd>      Test command used by --verify (default "
              << pytestify::DEFAULT_TEST_COMMAND << ")\n";
    std::cout << "  -h, --help                    Show this help\n";
    std::cout << "\nExamples:\n";
    std::cout << "  pytestify tests/                          # Migrate every nose/unittest test file\n";
    std::cout << "  pytestify --dry-run tests/test_models.py  # Preview only\n";
    std::cout << "  pytestify --review prompt --backup tests/ # Review each file before writing\n";
}

[[noreturn]] auto usage_error(const std::string& message) -> void {
    std::cerr << "Error: " << message << " (see --help)\n";
    std::exit(1);
}

auto parse_args(int argc, char* argv[]) -> pytestify::Config {
    pytestify::Config config;

    auto value_of = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            usage_error(flag + " requires a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--dry-run") {
            config.dry_run = true;
        } else if (arg == "--review") {
            auto value = value_of(i, arg);
            auto policy = pytestify::parse_review_policy(value);
            if (!policy) {
                usage_error("unknown review policy '" + value + "'");
            }
            config.review_policy = *policy;
        } else if (arg == "--backup") {
            config.backup_dir = pytestify::DEFAULT_BACKUP_DIR;
        } else if (arg.starts_with("--backup=")) {
            config.backup_dir = arg.substr(9);
        } else if (arg == "--rules") {
            config.rules_file = value_of(i, arg);
        } else if (arg == "--disable") {
            config.disabled_rules.push_back(value_of(i, arg));
        } else if (arg == "--enable") {
            config.enabled_rules.push_back(value_of(i, arg));
        } else if (arg == "--assertion-converter") {
            config.assertion_converter = value_of(i, arg);
            config.use_assertion_converter = true;
        } else if (arg == "--no-assertion-converter") {
            config.use_assertion_converter = false;
        } else if (arg == "--track") {
            config.tracking_file = value_of(i, arg);
        } else if (arg == "--jobs" || arg == "-j") {
            auto value = value_of(i, arg);
            try {
                auto jobs = std::stoul(value);
                if (jobs == 0) {
                    usage_error("--jobs must be at least 1");
                }
                config.jobs = jobs;
            } catch (const std::exception&) {
                usage_error("invalid --jobs value '" + value + "'");
            }
        } else if (arg == "--list-rules") {
            config.list_rules = true;
        } else if (arg == "--strict") {
            config.strict = true;
        } else if (arg == "--verify") {
            config.verify = true;
        } else if (arg == "--test-command") {
            config.test_command = value_of(i, arg);
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            std::exit(0);
        } else if (arg.starts_with("-")) {
            usage_error("unknown option '" + arg + "'");
        } else {
            config.paths.push_back(arg);
        }
    }

    return config;
}

} // namespace

auto main(int argc, char* argv[]) -> int {
    auto config = parse_args(argc, argv);

    std::unique_ptr<pytestify::IAssertionConverter> converter;
    if (config.use_assertion_converter) {
        converter = std::make_unique<pytestify::SubprocessAssertionConverter>(
            config.assertion_converter);
    }

    std::unique_ptr<pytestify::ITrackingStore> tracking;
    if (!config.tracking_file.empty()) {
        tracking = std::make_unique<pytestify::FileTrackingStore>(config.tracking_file);
    }

    std::unique_ptr<pytestify::ITestRunner> test_runner;
    if (config.verify) {
        test_runner = std::make_unique<pytestify::SubprocessTestRunner>(config.test_command);
    }

    pytestify::install_interrupt_handler();

    pytestify::MigrationApp app(std::make_unique<pytestify::FileSystem>(), std::move(converter),
                                std::move(tracking),
                                std::make_unique<pytestify::FTXUIReviewTerminal>(),
                                std::move(test_runner));
    return app.run(config);
}
