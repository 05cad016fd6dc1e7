#include "pytestify/io/tracking_store.hpp"
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

namespace pytestify {

namespace fs = std::filesystem;

class TrackingStoreTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        store_path_ = (fs::temp_directory_path() / "pytestify_tracking_test.txt").string();
        fs::remove(store_path_);
    }

    void TearDown() override
    {
        std::error_code ignored;
        fs::remove(store_path_, ignored);
    }

    std::string store_path_;
};

TEST_F(TrackingStoreTest, FormatAndParseEntry)
{
    TrackingEntry entry{.file = "tests/test_a.py", .success = false, .message = "nose2pytest failed"};

    auto line = format_tracking_entry(entry);
    EXPECT_EQ(line, "tests/test_a.py|failed|nose2pytest failed");

    auto parsed = parse_tracking_entry(line);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, entry);
}

TEST_F(TrackingStoreTest, ParseRejectsMalformedLines)
{
    EXPECT_FALSE(parse_tracking_entry("no separators").has_value());
    EXPECT_FALSE(parse_tracking_entry("|ok|missing path").has_value());
    EXPECT_FALSE(parse_tracking_entry("a.py|maybe|x").has_value());
    EXPECT_FALSE(parse_tracking_entry("a.py|ok|x|y").has_value());
    EXPECT_FALSE(parse_tracking_entry("a.py|ok").has_value());

    auto empty_message = parse_tracking_entry("a.py|ok|");
    ASSERT_TRUE(empty_message.has_value());
    EXPECT_TRUE(empty_message->success);
    EXPECT_EQ(empty_message->message, "");
}

TEST_F(TrackingStoreTest, SeparatorsInTextAreSanitized)
{
    auto line = format_tracking_entry(
        TrackingEntry{.file = "a|b.py", .success = true, .message = "line one\nline|two"});
    EXPECT_EQ(line, "a b.py|ok|line one line two");
    EXPECT_TRUE(parse_tracking_entry(line).has_value());
}

TEST_F(TrackingStoreTest, RecordsPersistAcrossInstances)
{
    {
        FileTrackingStore store(store_path_);
        EXPECT_FALSE(store.read_status("test_a.py").has_value());
        ASSERT_TRUE(store.record("test_a.py", true, ""));
        ASSERT_TRUE(store.record("test_b.py", false, "write failed"));
        ASSERT_TRUE(store.record("test_a.py", false, "converter failed"));
    }

    FileTrackingStore reloaded(store_path_);
    EXPECT_EQ(reloaded.entries().size(), 2);

    auto a = reloaded.read_status("test_a.py");
    ASSERT_TRUE(a.has_value());
    EXPECT_FALSE(a->success);
    EXPECT_EQ(a->message, "converter failed");

    auto b = reloaded.read_status("test_b.py");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->message, "write failed");
}

TEST_F(TrackingStoreTest, MalformedLinesInStoreAreIgnored)
{
    std::ofstream(store_path_) << "garbage\n\ntest_a.py|ok|\n";

    FileTrackingStore store(store_path_);

    EXPECT_EQ(store.entries().size(), 1);
    EXPECT_TRUE(store.read_status("test_a.py").has_value());
}

TEST_F(TrackingStoreTest, UnwritableStoreReportsFailure)
{
    FileTrackingStore store((fs::temp_directory_path() / "no_such_dir" / "track.txt").string());

    EXPECT_FALSE(store.record("test_a.py", true, ""));
    // Kept in memory even though it could not be saved
    EXPECT_TRUE(store.read_status("test_a.py").has_value());
}

} // namespace pytestify
