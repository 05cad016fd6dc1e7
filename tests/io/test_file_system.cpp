#include "pytestify/io/file_system.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

namespace pytestify {

namespace fs = std::filesystem;

class FileSystemTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        auto name = std::string("pytestify_fs_") +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name();
        root_ = fs::temp_directory_path() / name;
        fs::remove_all(root_);
        fs::create_directories(root_);
    }

    void TearDown() override
    {
        std::error_code ignored;
        fs::remove_all(root_, ignored);
    }

    auto path(const std::string& relative) const -> std::string
    {
        return (root_ / relative).string();
    }

    auto write(const std::string& relative, const std::string& content) -> void
    {
        fs::create_directories(fs::path(path(relative)).parent_path());
        std::ofstream(path(relative), std::ios::binary) << content;
    }

    fs::path root_;
    FileSystem file_system_;
};

TEST_F(FileSystemTest, ReadMissingFile)
{
    EXPECT_FALSE(file_system_.read_file(path("missing.py")).has_value());
    EXPECT_FALSE(file_system_.file_exists(path("missing.py")));
}

TEST_F(FileSystemTest, WriteAtomicReplacesContent)
{
    write("test_a.py", "old\n");

    ASSERT_TRUE(file_system_.write_file_atomic(path("test_a.py"), "new\r\ncontent"));

    auto content = file_system_.read_file(path("test_a.py"));
    ASSERT_TRUE(content.has_value());
    EXPECT_EQ(*content, "new\r\ncontent");
    EXPECT_FALSE(fs::exists(path("test_a.py.pytestify.tmp")));
}

TEST_F(FileSystemTest, WriteIntoMissingDirectoryFails)
{
    EXPECT_FALSE(file_system_.write_file_atomic(path("no/such/dir/test_a.py"), "x"));
}

TEST_F(FileSystemTest, ListFilesIsRecursiveAndSorted)
{
    write("b/test_two.py", "");
    write("a/test_one.py", "");
    write("z.txt", "");

    auto files = file_system_.list_files(root_.string());

    ASSERT_EQ(files.size(), 3);
    EXPECT_EQ(files[0], path("a/test_one.py"));
    EXPECT_EQ(files[1], path("b/test_two.py"));
    EXPECT_EQ(files[2], path("z.txt"));
    EXPECT_TRUE(file_system_.is_directory(path("a")));
    EXPECT_FALSE(file_system_.is_directory(path("z.txt")));
}

TEST_F(FileSystemTest, BackupPathKeepsLayout)
{
    EXPECT_EQ(backup_path_for("tests/test_a.py", "backup"),
              (fs::path("backup") / "tests" / "test_a.py").string());
    EXPECT_EQ(backup_path_for("/abs/test_a.py", "backup"),
              (fs::path("backup") / "abs" / "test_a.py").string());
    EXPECT_EQ(backup_path_for("../outside/test_a.py", "backup"),
              (fs::path("backup") / "outside" / "test_a.py").string());
}

TEST_F(FileSystemTest, BackupAndRestore)
{
    write("pkg/test_a.py", "original\n");
    auto backup_dir = path("backup");

    auto backup = file_system_.create_backup(path("pkg/test_a.py"), backup_dir);
    ASSERT_TRUE(backup.has_value());
    EXPECT_EQ(*backup, backup_path_for(path("pkg/test_a.py"), backup_dir));
    EXPECT_EQ(file_system_.read_file(*backup).value_or(""), "original\n");

    ASSERT_TRUE(file_system_.write_file_atomic(path("pkg/test_a.py"), "changed\n"));
    ASSERT_TRUE(restore_backup(file_system_, path("pkg/test_a.py"), backup_dir));
    EXPECT_EQ(file_system_.read_file(path("pkg/test_a.py")).value_or(""), "original\n");
}

TEST_F(FileSystemTest, BackupOfMissingFileFails)
{
    EXPECT_FALSE(file_system_.create_backup(path("missing.py"), path("backup")).has_value());
    EXPECT_FALSE(restore_backup(file_system_, path("missing.py"), path("backup")));
}

} // namespace pytestify
