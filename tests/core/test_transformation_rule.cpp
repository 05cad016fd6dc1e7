#include "pytestify/core/transformation_rule.hpp"
#include <gtest/gtest.h>
#include <regex>

namespace pytestify {

TEST(TransformationRuleTest, RegexMatcherReportsSpansAndGroups)
{
    auto matcher = make_regex_matcher(R"(ok_\((\w+)\))", RegexFlags{});
    auto spans = matcher("ok_(a)\nok_(bb)\n");

    ASSERT_EQ(spans.size(), 2);
    EXPECT_EQ(spans[0].begin, 0);
    EXPECT_EQ(spans[0].end, 6);
    ASSERT_EQ(spans[0].groups.size(), 2);
    EXPECT_EQ(spans[0].groups[1], "a");
    EXPECT_EQ(spans[1].begin, 7);
    EXPECT_EQ(spans[1].groups[1], "bb");
}

TEST(TransformationRuleTest, MultilineAnchorsEachLine)
{
    auto single = make_regex_matcher(R"(^import nose$)", RegexFlags{});
    auto multi = make_regex_matcher(R"(^import nose$)", RegexFlags{.multiline = true});
    std::string text = "import os\nimport nose\nx = 1\n";

    EXPECT_TRUE(single(text).empty());
    auto spans = multi(text);
    ASSERT_EQ(spans.size(), 1);
    EXPECT_EQ(spans[0].begin, 10);
    EXPECT_EQ(spans[0].end, 21);
}

TEST(TransformationRuleTest, MultilineMatchMaySpanLines)
{
    auto matcher = make_regex_matcher(R"(^def f\(\):\n    pass$)", RegexFlags{.multiline = true});
    std::string text = "x = 1\ndef f():\n    pass\ny = 2\n";

    auto spans = matcher(text);
    ASSERT_EQ(spans.size(), 1);
    EXPECT_EQ(spans[0].begin, 6);
    EXPECT_EQ(spans[0].end, 23);
}

TEST(TransformationRuleTest, IgnoreCaseFlag)
{
    auto matcher = make_regex_matcher("setup", RegexFlags{.ignore_case = true});
    EXPECT_EQ(matcher("setUp SETUP").size(), 2);
}

TEST(TransformationRuleTest, DotallLetsDotCrossNewlines)
{
    auto plain = make_regex_matcher("a.b", RegexFlags{});
    auto dotall = make_regex_matcher("a.b", RegexFlags{.dotall = true});

    EXPECT_TRUE(plain("a\nb").empty());
    EXPECT_EQ(dotall("a\nb").size(), 1);
}

TEST(TransformationRuleTest, TranslateDotallLeavesEscapesAndClassesAlone)
{
    EXPECT_EQ(translate_dotall(R"(a\.b)"), R"(a\.b)");
    EXPECT_EQ(translate_dotall("[.]"), "[.]");
    EXPECT_EQ(translate_dotall("x.y"), R"(x[\s\S]y)");
}

TEST(TransformationRuleTest, EmptyMatchesAreSkipped)
{
    auto matcher = make_regex_matcher("x*", RegexFlags{});
    auto spans = matcher("abxxc");
    ASSERT_EQ(spans.size(), 1);
    EXPECT_EQ(spans[0].begin, 2);
    EXPECT_EQ(spans[0].end, 4);
}

TEST(TransformationRuleTest, InvalidPatternThrows)
{
    EXPECT_THROW(make_regex_matcher("(unclosed", RegexFlags{}), std::regex_error);
}

TEST(TransformationRuleTest, ExpandTemplateSubstitutesGroups)
{
    Captures captures{std::string("whole"), std::string("a"), std::nullopt, std::string("c")};

    EXPECT_EQ(expand_template(R"(assert \1 == \3)", captures), "assert a == c");
    EXPECT_EQ(expand_template(R"(\g<1>0)", captures), "a0");
    EXPECT_EQ(expand_template(R"([\2])", captures), "[]");
    EXPECT_EQ(expand_template(R"(x\ny\t\\)", captures), "x\ny\t\\");
    EXPECT_EQ(expand_template(R"(\q)", captures), R"(\q)");
}

TEST(TransformationRuleTest, MakeRuleFromSpecCompilesRegex)
{
    auto rule = make_rule(RuleSpec{
        .id = "nose_ok",
        .pattern = R"(ok_\((\w+)\))",
        .replacement = R"(assert \1)",
        .priority = 15,
    });

    EXPECT_EQ(rule.kind, RuleKind::TEXTUAL);
    EXPECT_EQ(rule.priority, 15);
    EXPECT_EQ(rule.description, "nose_ok");
    ASSERT_TRUE(rule.matcher);
    ASSERT_TRUE(rule.producer);

    auto spans = rule.matcher("ok_(flag)");
    ASSERT_EQ(spans.size(), 1);
    EXPECT_EQ(rule.producer(spans[0].groups), "assert flag");
}

TEST(TransformationRuleTest, StructuralTagBuildsStructuralRule)
{
    auto rule = make_rule(RuleSpec{
        .id = "yield_tests",
        .pattern = "structural:yield_tests",
        .description = "Parametrize yield tests",
    });

    EXPECT_EQ(rule.kind, RuleKind::STRUCTURAL);
    EXPECT_FALSE(rule.matcher);
    EXPECT_FALSE(rule.producer);
    EXPECT_EQ(structural_tag_name(rule.pattern), "yield_tests");
}

TEST(TransformationRuleTest, StructuralTagNeedsName)
{
    EXPECT_FALSE(is_structural_tag("structural:"));
    EXPECT_FALSE(is_structural_tag("assertEqual"));
    EXPECT_TRUE(is_structural_tag("structural:x"));
    EXPECT_EQ(structural_tag_name("plain"), "");
}

TEST(TransformationRuleTest, ParseRegexFlags)
{
    auto flags = parse_regex_flags("MULTILINE, i");
    ASSERT_TRUE(flags.has_value());
    EXPECT_TRUE(flags->multiline);
    EXPECT_TRUE(flags->ignore_case);
    EXPECT_FALSE(flags->dotall);

    EXPECT_EQ(parse_regex_flags(""), RegexFlags{});
    EXPECT_FALSE(parse_regex_flags("VERBOSE").has_value());
}

TEST(TransformationRuleTest, DescribeRegexFlags)
{
    EXPECT_EQ(describe_regex_flags(RegexFlags{}), "");
    EXPECT_EQ(describe_regex_flags(RegexFlags{.multiline = true, .dotall = true}),
              "MULTILINE,DOTALL");
}

} // namespace pytestify
