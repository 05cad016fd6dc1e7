#include "pytestify/core/default_rules.hpp"
#include "pytestify/core/structural_rewriter.hpp"
#include "pytestify/core/yield_transform.hpp"
#include <algorithm>
#include <gtest/gtest.h>

namespace pytestify {

class StructuralRewriterTest : public ::testing::Test {
protected:
    StructuralRewriter rewriter_{structural_options_from(make_default_registry())};

    auto count_rule(const RewriteOutcome& outcome, const std::string& rule_id) -> size_t
    {
        return static_cast<size_t>(std::count_if(
            outcome.change_log.begin(), outcome.change_log.end(),
            [&rule_id](const ApplicationRecord& record) { return record.rule_id == rule_id; }));
    }
};

TEST_F(StructuralRewriterTest, SetupAttributeBecomesFixtureParameter)
{
    std::string input = "import unittest\n"
                        "\n"
                        "\n"
                        "class TestThing(unittest.TestCase):\n"
                        "    def setUp(self):\n"
                        "        self.x = 1\n"
                        "\n"
                        "    def test_x(self):\n"
                        "        assert self.x == 1\n";

    auto outcome = rewriter_.apply(input);

    EXPECT_EQ(outcome.text, "import pytest\n"
                            "\n"
                            "\n"
                            "class TestThing:\n"
                            "    @pytest.fixture(autouse=True)\n"
                            "    def x(self):\n"
                            "        x = 1\n"
                            "        yield x\n"
                            "\n"
                            "    def test_x(self, x):\n"
                            "        assert x == 1\n");
    EXPECT_TRUE(outcome.unresolved.empty());
    EXPECT_EQ(count_rule(outcome, "lifecycle_base"), 1);
    EXPECT_GE(count_rule(outcome, "lifecycle_hooks"), 2);
    EXPECT_EQ(count_rule(outcome, "pytest_imports"), 2);
}

TEST_F(StructuralRewriterTest, AttributeReadInFormatStringKeepsSelfAttribute)
{
    std::string input = "import unittest\n"
                        "\n"
                        "\n"
                        "class TestThing(unittest.TestCase):\n"
                        "    def setUp(self):\n"
                        "        self.x = 1\n"
                        "\n"
                        "    def test_x(self):\n"
                        "        assert self.x == 1\n"
                        "\n"
                        "    def test_msg(self):\n"
                        "        assert f\"{self.x}\" == \"1\"\n";

    auto outcome = rewriter_.apply(input);

    EXPECT_EQ(outcome.text, "import pytest\n"
                            "\n"
                            "\n"
                            "class TestThing:\n"
                            "    @pytest.fixture(autouse=True)\n"
                            "    def setup_teardown(self):\n"
                            "        self.x = 1\n"
                            "        yield\n"
                            "\n"
                            "    def test_x(self):\n"
                            "        assert self.x == 1\n"
                            "\n"
                            "    def test_msg(self):\n"
                            "        assert f\"{self.x}\" == \"1\"\n");
    EXPECT_TRUE(outcome.unresolved.empty());
}

TEST_F(StructuralRewriterTest, SubclassedTestClassKeepsSelfAttribute)
{
    std::string input = "import unittest\n"
                        "\n"
                        "\n"
                        "class TestBase(unittest.TestCase):\n"
                        "    def setUp(self):\n"
                        "        self.x = 1\n"
                        "\n"
                        "    def test_a(self):\n"
                        "        assert self.x == 1\n"
                        "\n"
                        "\n"
                        "class TestChild(TestBase):\n"
                        "    def test_b(self):\n"
                        "        assert self.x == 1\n";

    auto outcome = rewriter_.apply(input);

    EXPECT_EQ(outcome.text, "import pytest\n"
                            "\n"
                            "\n"
                            "class TestBase:\n"
                            "    @pytest.fixture(autouse=True)\n"
                            "    def setup_teardown(self):\n"
                            "        self.x = 1\n"
                            "        yield\n"
                            "\n"
                            "    def test_a(self):\n"
                            "        assert self.x == 1\n"
                            "\n"
                            "\n"
                            "class TestChild(TestBase):\n"
                            "    def test_b(self):\n"
                            "        assert self.x == 1\n");
}

TEST_F(StructuralRewriterTest, SelfPassedToHelperKeepsSelfAttribute)
{
    std::string input = "class TestThing:\n"
                        "    def setUp(self):\n"
                        "        self.x = 1\n"
                        "\n"
                        "    def test_x(self):\n"
                        "        check(self)\n"
                        "        assert self.x == 1\n";

    auto outcome = rewriter_.apply(input);

    EXPECT_NE(outcome.text.find("def setup_teardown(self):"), std::string::npos);
    EXPECT_NE(outcome.text.find("        assert self.x == 1\n"), std::string::npos);
    EXPECT_EQ(outcome.text.find("def test_x(self, x)"), std::string::npos);
}

TEST_F(StructuralRewriterTest, FixtureWrapsTestBetweenSetupAndTeardown)
{
    std::string input = "import unittest\n"
                        "\n"
                        "\n"
                        "class TestDb(unittest.TestCase):\n"
                        "    def setUp(self):\n"
                        "        self.db = connect()\n"
                        "        self.cursor = self.db.cursor()\n"
                        "\n"
                        "    def tearDown(self):\n"
                        "        self.db.close()\n"
                        "\n"
                        "    def test_query(self):\n"
                        "        assert self.cursor.execute(\"x\")\n";

    auto outcome = rewriter_.apply(input);

    EXPECT_EQ(outcome.text, "import pytest\n"
                            "\n"
                            "\n"
                            "class TestDb:\n"
                            "    @pytest.fixture(autouse=True)\n"
                            "    def setup_teardown(self):\n"
                            "        self.db = connect()\n"
                            "        self.cursor = self.db.cursor()\n"
                            "        yield\n"
                            "        self.db.close()\n"
                            "\n"
                            "    def test_query(self):\n"
                            "        assert self.cursor.execute(\"x\")\n");

    auto setup_pos = outcome.text.find("connect()");
    auto yield_pos = outcome.text.find("yield");
    auto teardown_pos = outcome.text.find("close()");
    EXPECT_LT(setup_pos, yield_pos);
    EXPECT_LT(yield_pos, teardown_pos);
}

TEST_F(StructuralRewriterTest, UnsupportedHookSignatureLeavesClassUntouched)
{
    std::string input = "import unittest\n"
                        "\n"
                        "\n"
                        "class TestThing(unittest.TestCase):\n"
                        "    def setUp(self, extra):\n"
                        "        self.x = extra\n"
                        "\n"
                        "    def test_x(self):\n"
                        "        assert self.x\n";

    auto outcome = rewriter_.apply(input);

    EXPECT_EQ(outcome.text, input);
    EXPECT_TRUE(outcome.change_log.empty());
    EXPECT_TRUE(outcome.unresolved.contains("lifecycle_hooks"));
    ASSERT_EQ(outcome.diagnostics.size(), 1);
    EXPECT_EQ(outcome.diagnostics[0].kind, DiagnosticKind::STRUCTURAL_AMBIGUITY);
    ASSERT_TRUE(outcome.diagnostics[0].location.has_value());
    EXPECT_EQ(outcome.diagnostics[0].location->line, 4);
}

TEST_F(StructuralRewriterTest, ClassStillUsingTestCaseApiKeepsItsBase)
{
    std::string input = "import unittest\n"
                        "\n"
                        "\n"
                        "class TestThing(unittest.TestCase):\n"
                        "    def test_x(self):\n"
                        "        value = self.assertEqual(1, 1)\n";

    auto outcome = rewriter_.apply(input);

    EXPECT_EQ(outcome.text, input);
    EXPECT_TRUE(outcome.unresolved.contains("lifecycle_base"));
}

TEST_F(StructuralRewriterTest, YieldTestBecomesParametrizedTest)
{
    std::string input = "def check_fn(a, b):\n"
                        "    assert a < b\n"
                        "\n"
                        "\n"
                        "def test_pairs():\n"
                        "    yield (check_fn, 1, 2)\n"
                        "    yield (check_fn, 3, 4)\n";

    auto outcome = rewriter_.apply(input);

    EXPECT_EQ(outcome.text, "import pytest\n"
                            "\n"
                            "\n"
                            "def check_fn(a, b):\n"
                            "    assert a < b\n"
                            "\n"
                            "\n"
                            "@pytest.mark.parametrize(\"a, b\", [(1, 2), (3, 4)])\n"
                            "def test_pairs(a, b):\n"
                            "    check_fn(a, b)\n");
    EXPECT_EQ(count_rule(outcome, "yield_tests"), 1);
}

TEST_F(StructuralRewriterTest, UnknownCallableGetsPositionalNames)
{
    std::string input = "import pytest\n"
                        "\n"
                        "\n"
                        "def test_pairs():\n"
                        "    yield check_fn, 1, 2\n"
                        "    yield check_fn, 3, 4\n";

    auto outcome = rewriter_.apply(input);

    EXPECT_EQ(outcome.text, "import pytest\n"
                            "\n"
                            "\n"
                            "@pytest.mark.parametrize(\"arg1, arg2\", [(1, 2), (3, 4)])\n"
                            "def test_pairs(arg1, arg2):\n"
                            "    check_fn(arg1, arg2)\n");
}

TEST_F(StructuralRewriterTest, LoopYieldUsesTheIterable)
{
    std::string input = "CASES = [(1, 2), (3, 4)]\n"
                        "\n"
                        "\n"
                        "def test_loop():\n"
                        "    for a, b in CASES:\n"
                        "        yield check_fn, a, b\n";

    auto outcome = rewriter_.apply(input);

    EXPECT_EQ(outcome.text, "import pytest\n"
                            "\n"
                            "CASES = [(1, 2), (3, 4)]\n"
                            "\n"
                            "\n"
                            "@pytest.mark.parametrize(\"a, b\", CASES)\n"
                            "def test_loop(a, b):\n"
                            "    check_fn(a, b)\n");
}

TEST_F(StructuralRewriterTest, ConditionalYieldIsMarkedForFollowUp)
{
    std::string function = "def test_cond():\n"
                           "    for x in range(3):\n"
                           "        if x:\n"
                           "            yield check, x\n";

    auto outcome = rewriter_.apply(function);

    EXPECT_EQ(outcome.text,
              follow_up_marker("", "yield_tests", "loop body is not a single yield") + function);
    EXPECT_TRUE(outcome.unresolved.contains("yield_tests"));

    auto second = rewriter_.apply(outcome.text);
    EXPECT_EQ(second.text, outcome.text);
    EXPECT_TRUE(second.change_log.empty());
    EXPECT_TRUE(second.unresolved.contains("yield_tests"));
}

TEST_F(StructuralRewriterTest, ModuleSetupAndTeardownBecomeModuleFixture)
{
    std::string input = "def setup():\n"
                        "    prepare()\n"
                        "\n"
                        "\n"
                        "def teardown():\n"
                        "    cleanup()\n"
                        "\n"
                        "\n"
                        "def test_a():\n"
                        "    assert True\n";

    auto outcome = rewriter_.apply(input);

    EXPECT_EQ(outcome.text, "import pytest\n"
                            "\n"
                            "\n"
                            "@pytest.fixture(scope=\"module\", autouse=True)\n"
                            "def module_setup_teardown():\n"
                            "    prepare()\n"
                            "    yield\n"
                            "    cleanup()\n"
                            "\n"
                            "\n"
                            "def test_a():\n"
                            "    assert True\n");
}

TEST_F(StructuralRewriterTest, FlattenOnlyWhenEnabled)
{
    std::string input = "import unittest\n"
                        "\n"
                        "\n"
                        "class TestPlain(unittest.TestCase):\n"
                        "    def test_one(self):\n"
                        "        assert 1\n";

    EXPECT_EQ(rewriter_.apply(input).text, "\n"
                                           "\n"
                                           "class TestPlain:\n"
                                           "    def test_one(self):\n"
                                           "        assert 1\n");

    auto registry = make_default_registry();
    registry.set_enabled("flatten_class", true);
    StructuralRewriter flattening(structural_options_from(registry));

    auto outcome = flattening.apply(input);
    EXPECT_EQ(outcome.text, "\n"
                            "\n"
                            "def test_one():\n"
                            "    assert 1\n");
    EXPECT_EQ(count_rule(outcome, "flatten_class"), 1);
}

TEST_F(StructuralRewriterTest, SecondRunOverOutputIsNoOp)
{
    std::string input = "import unittest\n"
                        "\n"
                        "\n"
                        "class TestThing(unittest.TestCase):\n"
                        "    def setUp(self):\n"
                        "        self.x = 1\n"
                        "\n"
                        "    def test_x(self):\n"
                        "        assert self.x == 1\n"
                        "\n"
                        "\n"
                        "def test_pairs():\n"
                        "    yield check_fn, 1, 2\n";

    auto first = rewriter_.apply(input);
    auto second = rewriter_.apply(first.text);

    EXPECT_FALSE(first.change_log.empty());
    EXPECT_EQ(second.text, first.text);
    EXPECT_TRUE(second.change_log.empty());
    EXPECT_TRUE(second.unresolved.empty());
}

TEST_F(StructuralRewriterTest, DisabledPassesDoNothing)
{
    auto registry = make_default_registry();
    registry.set_enabled("lifecycle_base", false);
    registry.set_enabled("lifecycle_hooks", false);
    registry.set_enabled("yield_tests", false);
    registry.set_enabled("pytest_imports", false);
    StructuralRewriter idle(structural_options_from(registry));

    std::string input = "import unittest\n"
                        "\n"
                        "\n"
                        "class TestThing(unittest.TestCase):\n"
                        "    def setUp(self):\n"
                        "        self.x = 1\n";

    auto outcome = idle.apply(input);
    EXPECT_EQ(outcome.text, input);
    EXPECT_TRUE(outcome.change_log.empty());
}

} // namespace pytestify
