#include "pytestify/io/subprocess_assertion_converter.hpp"
#include <gtest/gtest.h>

namespace pytestify {

class SubprocessAssertionConverterTest : public ::testing::Test {
protected:
    const std::string source_ = "def test_a():\n    eq_(a, b)\n";
};

TEST_F(SubprocessAssertionConverterTest, FindsExecutablesOnPath)
{
    EXPECT_TRUE(find_executable("sh").has_value());
    EXPECT_FALSE(find_executable("").has_value());
    EXPECT_FALSE(find_executable("pytestify-no-such-program").has_value());
    EXPECT_FALSE(find_executable("/nonexistent/dir/program").has_value());
}

TEST_F(SubprocessAssertionConverterTest, MissingCommandIsUnavailable)
{
    SubprocessAssertionConverter converter("pytestify-no-such-program --flag");

    EXPECT_EQ(converter.name(), "pytestify-no-such-program");
    EXPECT_FALSE(converter.is_available());
}

TEST_F(SubprocessAssertionConverterTest, CommandRewritesTheFile)
{
    SubprocessAssertionConverter converter("sed -i -e 's/eq_(a, b)/assert a == b/'");
    ASSERT_TRUE(converter.is_available());

    auto conversion = converter.convert(source_);

    EXPECT_TRUE(conversion.success);
    EXPECT_EQ(conversion.text, "def test_a():\n    assert a == b\n");
}

TEST_F(SubprocessAssertionConverterTest, NonZeroExitIsFailure)
{
    SubprocessAssertionConverter converter("false");

    auto conversion = converter.convert(source_);

    EXPECT_FALSE(conversion.success);
    EXPECT_EQ(conversion.text, source_);
    EXPECT_EQ(conversion.message, "exit status 1");
}

TEST_F(SubprocessAssertionConverterTest, OutputIsKeptInFailureMessage)
{
    SubprocessAssertionConverter converter("sh -c 'echo cannot parse; exit 3'");

    auto conversion = converter.convert(source_);

    EXPECT_FALSE(conversion.success);
    EXPECT_EQ(conversion.message, "exit status 3: cannot parse");
}

TEST_F(SubprocessAssertionConverterTest, SuccessfulNoOpReturnsSameText)
{
    SubprocessAssertionConverter converter("true");

    auto conversion = converter.convert(source_);

    EXPECT_TRUE(conversion.success);
    EXPECT_EQ(conversion.text, source_);
}

} // namespace pytestify
