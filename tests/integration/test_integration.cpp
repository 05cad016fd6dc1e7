#include "pytestify/application/migration_app.hpp"
#include "pytestify/io/file_system.hpp"
#include "pytestify/io/subprocess_assertion_converter.hpp"
#include "pytestify/io/tracking_store.hpp"
#include <filesystem>
#include <fstream>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <iostream>
#include <sstream>

namespace pytestify {

namespace fs = std::filesystem;

using testing::HasSubstr;

// Runs the whole application against real files in a scratch directory
class IntegrationTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        reset_cancellation();
        auto name = std::string("pytestify_it_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name();
        root_ = fs::temp_directory_path() / name;
        fs::remove_all(root_);
        fs::create_directories(root_ / "tests");

        original_cout_ = std::cout.rdbuf(captured_out_.rdbuf());
        original_cerr_ = std::cerr.rdbuf(captured_err_.rdbuf());
    }

    void TearDown() override
    {
        std::cout.rdbuf(original_cout_);
        std::cerr.rdbuf(original_cerr_);
        std::error_code ignored;
        fs::remove_all(root_, ignored);
    }

    auto path(const std::string& relative) const -> std::string
    {
        return (root_ / relative).string();
    }

    auto write(const std::string& relative, const std::string& content) -> void
    {
        std::ofstream(path(relative), std::ios::binary) << content;
    }

    auto read(const std::string& relative) -> std::string
    {
        FileSystem file_system;
        return file_system.read_file(path(relative)).value_or("<missing>");
    }

    auto run(const Config& config, std::unique_ptr<IAssertionConverter> converter = nullptr) -> int
    {
        MigrationApp app(std::make_unique<FileSystem>(), std::move(converter),
                         std::make_unique<FileTrackingStore>(path("track.txt")), nullptr);
        return app.run(config);
    }

    fs::path root_;
    std::ostringstream captured_out_;
    std::ostringstream captured_err_;
    std::streambuf* original_cout_ = nullptr;
    std::streambuf* original_cerr_ = nullptr;

    const std::string legacy_ = "import unittest\n"
                                "\n"
                                "from nose.tools import eq_\n"
                                "\n"
                                "\n"
                                "class TestThing(unittest.TestCase):\n"
                                "    def setUp(self):\n"
                                "        self.x = 1\n"
                                "\n"
                                "    def test_x(self):\n"
                                "        self.assertEqual(self.x, 1)\n"
                                "        eq_(self.x, 1)\n"
                                "\n"
                                "\n"
                                "def test_pairs():\n"
                                "    yield check_fn, 1, 2\n"
                                "    yield check_fn, 3, 4\n";

    const std::string migrated_ = "import pytest\n"
                                  "\n"
                                  "\n"
                                  "class TestThing:\n"
                                  "    @pytest.fixture(autouse=True)\n"
                                  "    def x(self):\n"
                                  "        x = 1\n"
                                  "        yield x\n"
                                  "\n"
                                  "    def test_x(self, x):\n"
                                  "        assert x == 1\n"
                                  "        assert x == 1\n"
                                  "\n"
                                  "\n"
                                  "@pytest.mark.parametrize(\"arg1, arg2\", [(1, 2), (3, 4)])\n"
                                  "def test_pairs(arg1, arg2):\n"
                                  "    check_fn(arg1, arg2)\n";

    const std::string modern_ = "import pytest\n\n\ndef test_ok():\n    assert True\n";
};

TEST_F(IntegrationTest, MigratesDirectoryWithBackupAndTracking)
{
    write("tests/test_legacy.py", legacy_);
    write("tests/test_modern.py", modern_);
    write("tests/helper.py", "import unittest\n");

    Config config;
    config.paths = {path("tests")};
    config.backup_dir = path("backup");

    EXPECT_EQ(run(config), 0);

    EXPECT_EQ(read("tests/test_legacy.py"), migrated_);
    EXPECT_EQ(read("tests/test_modern.py"), modern_);
    EXPECT_EQ(read("tests/helper.py"), "import unittest\n");
    FileSystem file_system;
    auto backup = backup_path_for(path("tests/test_legacy.py"), path("backup"));
    EXPECT_EQ(file_system.read_file(backup).value_or(""), legacy_);

    FileTrackingStore tracking(path("track.txt"));
    auto entry = tracking.read_status(path("tests/test_legacy.py"));
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->success);
    EXPECT_THAT(entry->message, HasSubstr("migrated"));
    EXPECT_FALSE(tracking.read_status(path("tests/test_modern.py")).has_value());

    EXPECT_THAT(captured_out_.str(), HasSubstr("Found 1 file(s) to migrate."));
    EXPECT_THAT(captured_out_.str(), HasSubstr("Written: 1  Discarded: 0"));
}

TEST_F(IntegrationTest, SecondRunFindsNothingToDo)
{
    write("tests/test_legacy.py", legacy_);

    Config config;
    config.paths = {path("tests/test_legacy.py")};
    ASSERT_EQ(run(config), 0);
    ASSERT_EQ(read("tests/test_legacy.py"), migrated_);

    EXPECT_EQ(run(config), 0);
    EXPECT_EQ(read("tests/test_legacy.py"), migrated_);

    FileTrackingStore tracking(path("track.txt"));
    auto entry = tracking.read_status(path("tests/test_legacy.py"));
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->message, "unchanged");
}

TEST_F(IntegrationTest, DryRunLeavesFilesUntouched)
{
    write("tests/test_legacy.py", legacy_);

    Config config;
    config.paths = {path("tests")};
    config.dry_run = true;
    config.backup_dir = path("backup");

    EXPECT_EQ(run(config), 0);

    EXPECT_EQ(read("tests/test_legacy.py"), legacy_);
    EXPECT_FALSE(fs::exists(path("backup")));
    EXPECT_THAT(captured_out_.str(), HasSubstr("Would change " + path("tests/test_legacy.py")));
}

TEST_F(IntegrationTest, ParallelJobsKeepInputOrder)
{
    for (int i = 0; i < 6; ++i) {
        write("tests/test_" + std::to_string(i) + ".py", legacy_);
    }

    Config config;
    config.paths = {path("tests")};
    config.jobs = 4;

    EXPECT_EQ(run(config), 0);

    auto output = captured_out_.str();
    size_t previous = 0;
    for (int i = 0; i < 6; ++i) {
        auto file = path("tests/test_" + std::to_string(i) + ".py");
        EXPECT_EQ(read("tests/test_" + std::to_string(i) + ".py"), migrated_);
        auto position = output.find("Migrated " + file);
        ASSERT_NE(position, std::string::npos);
        EXPECT_GT(position, previous);
        previous = position;
    }
}

TEST_F(IntegrationTest, ExternalConverterHandlesLeftoverAssertions)
{
    write("tests/test_leftover.py", "def test_a():\n    value = eq_(a, b)\n");

    Config config;
    config.paths = {path("tests/test_leftover.py")};

    auto converter =
        std::make_unique<SubprocessAssertionConverter>("sed -i -e 's/eq_(a, b)/(a == b)/'");
    EXPECT_EQ(run(config, std::move(converter)), 0);

    EXPECT_EQ(read("tests/test_leftover.py"), "def test_a():\n    value = (a == b)\n");
    EXPECT_THAT(captured_out_.str(), HasSubstr("Assertion converter: applied 1"));
}

TEST_F(IntegrationTest, FailingConverterKeepsRuleRewrites)
{
    write("tests/test_mixed.py", "def test_a():\n    eq_(x, 1)\n    value = eq_(a, b)\n");

    Config config;
    config.paths = {path("tests/test_mixed.py")};

    EXPECT_EQ(run(config, std::make_unique<SubprocessAssertionConverter>("false")), 0);

    EXPECT_EQ(read("tests/test_mixed.py"), "def test_a():\n    assert x == 1\n    value = eq_(a, b)\n");
    EXPECT_THAT(captured_err_.str(), HasSubstr("false failed: exit status 1"));

    config.strict = true;
    write("tests/test_mixed.py", "def test_a():\n    eq_(x, 1)\n    value = eq_(a, b)\n");
    EXPECT_EQ(run(config, std::make_unique<SubprocessAssertionConverter>("false")), 1);
}

TEST_F(IntegrationTest, RuleFileExtendsCatalogue)
{
    write("rules.txt", "[rule main_guard]\n"
                       "pattern = ^unittest\\.main\\(\\)$\n"
                       "replacement = pytest.main()\n"
                       "flags = MULTILINE\n"
                       "priority = 10\n");
    write("tests/test_main.py", "import unittest\n\nunittest.main()\n");

    Config config;
    config.paths = {path("tests/test_main.py")};
    config.rules_file = path("rules.txt");

    EXPECT_EQ(run(config), 0);
    EXPECT_EQ(read("tests/test_main.py"), "import pytest\n\npytest.main()\n");
}

TEST_F(IntegrationTest, MissingInputFails)
{
    Config config;
    config.paths = {path("tests/test_missing.py")};

    EXPECT_EQ(run(config), 1);
    EXPECT_THAT(captured_out_.str(), HasSubstr("Failed: 1"));
}

} // namespace pytestify
