#include "pytestify/core/python_syntax.hpp"
#include <gtest/gtest.h>

namespace pytestify::python {

TEST(PythonSyntaxTest, Identifiers)
{
    EXPECT_TRUE(is_identifier("value_1"));
    EXPECT_FALSE(is_identifier("1value"));
    EXPECT_FALSE(is_identifier("yield"));
    EXPECT_FALSE(is_identifier(""));
    EXPECT_TRUE(is_dotted_name("unittest.TestCase"));
    EXPECT_FALSE(is_dotted_name("unittest."));
    EXPECT_FALSE(is_dotted_name("a..b"));
}

TEST(PythonSyntaxTest, StringLiteralEnd)
{
    std::string text = R"(x = 'a\'b' + """t"r""" + "open)";
    EXPECT_EQ(string_literal_end(text, 4), 10);
    EXPECT_EQ(string_literal_end(text, 13), 22);
    EXPECT_EQ(string_literal_end(text, 25), text.size());
}

TEST(PythonSyntaxTest, CodeMaskHidesStringsAndComments)
{
    std::string text = "a = '#' # note\nb";
    auto mask = code_mask(text);

    EXPECT_TRUE(mask[0]);
    EXPECT_FALSE(mask[4]);
    EXPECT_FALSE(mask[5]);
    EXPECT_TRUE(mask[7]);
    EXPECT_FALSE(mask[8]);
    EXPECT_TRUE(mask[text.size() - 1]);
}

TEST(PythonSyntaxTest, FindClosingBracketSkipsStrings)
{
    std::string text = "f(a, ')', [1, 2])";
    EXPECT_EQ(find_closing_bracket(text, 1), text.size() - 1);
    EXPECT_EQ(find_closing_bracket(text, 10), 15);
    EXPECT_FALSE(find_closing_bracket("f(a", 1).has_value());
    EXPECT_FALSE(find_closing_bracket("abc", 0).has_value());
}

TEST(PythonSyntaxTest, SplitTopLevel)
{
    auto parts = split_top_level("a, (b, c), 'd,e',");
    EXPECT_EQ(parts, (std::vector<std::string>{"a", "(b, c)", "'d,e'"}));
    EXPECT_TRUE(split_top_level("   ").empty());
}

TEST(PythonSyntaxTest, StripEnclosingParens)
{
    EXPECT_EQ(strip_enclosing_parens("((a, b))"), "a, b");
    EXPECT_EQ(strip_enclosing_parens("(a)(b)"), "(a)(b)");
    EXPECT_EQ(strip_enclosing_parens(" x "), "x");
}

TEST(PythonSyntaxTest, ParenthesizeLooseExpressions)
{
    EXPECT_EQ(parenthesize_if_needed("a + b"), "a + b");
    EXPECT_EQ(parenthesize_if_needed("f(a, b == c)"), "f(a, b == c)");
    EXPECT_EQ(parenthesize_if_needed("a == b"), "(a == b)");
    EXPECT_EQ(parenthesize_if_needed("x if y else z"), "(x if y else z)");
    EXPECT_EQ(parenthesize_if_needed("not x"), "(not x)");
    EXPECT_EQ(parenthesize_if_needed("a, b"), "(a, b)");
    EXPECT_EQ(parenthesize_if_needed("'a == b'"), "'a == b'");
}

TEST(PythonSyntaxTest, TopLevelLineBreak)
{
    EXPECT_FALSE(has_top_level_line_break("f(a,\n  b)"));
    EXPECT_TRUE(has_top_level_line_break("a +\\\n b"));
}

TEST(PythonSyntaxTest, KeywordArgument)
{
    auto keyword = keyword_argument("msg='x = y'");
    ASSERT_TRUE(keyword.has_value());
    EXPECT_EQ(keyword->first, "msg");
    EXPECT_EQ(keyword->second, "'x = y'");

    EXPECT_FALSE(keyword_argument("a == b").has_value());
    EXPECT_FALSE(keyword_argument("a <= b").has_value());
    EXPECT_FALSE(keyword_argument("f(x=1)").has_value());
}

TEST(PythonSyntaxTest, ParseParameterNames)
{
    auto names = parse_parameter_names("self, a: int = 1, b");
    ASSERT_TRUE(names.has_value());
    EXPECT_EQ(*names, (std::vector<std::string>{"self", "a", "b"}));

    EXPECT_FALSE(parse_parameter_names("self, *args").has_value());
    EXPECT_FALSE(parse_parameter_names("a, /, b").has_value());
    EXPECT_EQ(parse_parameter_names(""), std::vector<std::string>{});
}

TEST(PythonSyntaxTest, IdentifierUsesIgnoreAttributesStringsAndComments)
{
    std::string text = "x = 1  # x\ny = 'x'\nself.x\nfoo(x)";
    auto uses = find_identifier_uses(text, "x");
    ASSERT_EQ(uses.size(), 2);
    EXPECT_EQ(uses[0], 0);
    EXPECT_EQ(text.substr(uses[1] - 4, 5), "foo(x");

    EXPECT_FALSE(contains_identifier("xs = 1", "x"));
}

TEST(PythonSyntaxTest, ReplaceAttribute)
{
    auto result = replace_attribute("self.a + self.ab + other.self.a + 'self.a'", "self", "a", "a");
    EXPECT_EQ(result, "a + self.ab + other.self.a + 'self.a'");
}

TEST(PythonSyntaxTest, BlankNonCodeKeepsNewlines)
{
    EXPECT_EQ(blank_non_code("a # c\n'b'"), "a    \n   ");
}

} // namespace pytestify::python
