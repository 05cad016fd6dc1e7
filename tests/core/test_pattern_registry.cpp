#include "pytestify/core/pattern_registry.hpp"
#include <gtest/gtest.h>

namespace pytestify {

class PatternRegistryTest : public ::testing::Test {
protected:
    static auto textual(const std::string& id, int priority) -> TransformationRule
    {
        return make_rule(RuleSpec{.id = id, .pattern = id, .replacement = "x", .priority = priority});
    }

    static auto structural(const std::string& id, const std::string& tag) -> TransformationRule
    {
        return make_rule(RuleSpec{.id = id, .pattern = "structural:" + tag, .priority = 100});
    }

    static auto ids(const std::vector<TransformationRule>& rules) -> std::vector<std::string>
    {
        std::vector<std::string> result;
        for (const auto& rule : rules) {
            result.push_back(rule.id);
        }
        return result;
    }
};

TEST_F(PatternRegistryTest, OrdersByPriorityThenRegistration)
{
    PatternRegistry registry;
    registry.register_rule(textual("late", 30));
    registry.register_rule(textual("first_tie", 10));
    registry.register_rule(textual("second_tie", 10));

    EXPECT_EQ(ids(registry.rules_for_pass()),
              (std::vector<std::string>{"first_tie", "second_tie", "late"}));
}

TEST_F(PatternRegistryTest, DuplicateIdThrows)
{
    PatternRegistry registry;
    registry.register_rule(textual("a", 10));

    try {
        registry.register_rule(textual("a", 20));
        FAIL() << "expected DuplicateRuleError";
    } catch (const DuplicateRuleError& error) {
        EXPECT_EQ(error.rule_id(), "a");
    }
    EXPECT_EQ(registry.size(), 1);
}

TEST_F(PatternRegistryTest, DisabledRulesLeaveThePass)
{
    PatternRegistry registry;
    registry.register_rule(textual("a", 10));
    registry.register_rule(textual("b", 20));

    EXPECT_TRUE(registry.set_enabled("a", false));
    EXPECT_FALSE(registry.set_enabled("missing", false));

    EXPECT_EQ(ids(registry.rules_for_pass()), (std::vector<std::string>{"b"}));
    EXPECT_EQ(ids(registry.all_rules()), (std::vector<std::string>{"a", "b"}));
}

TEST_F(PatternRegistryTest, FinalizedRegistryRejectsMutation)
{
    PatternRegistry registry;
    registry.register_rule(textual("a", 10));
    registry.finalize();

    EXPECT_TRUE(registry.is_finalized());
    EXPECT_THROW(registry.register_rule(textual("b", 10)), RegistryFinalizedError);
    EXPECT_THROW(registry.set_enabled("a", false), RegistryFinalizedError);
    EXPECT_EQ(registry.rules_for_pass().size(), 1);
}

TEST_F(PatternRegistryTest, FiltersByKind)
{
    PatternRegistry registry;
    registry.register_rule(textual("text", 10));
    registry.register_rule(structural("hooks", "lifecycle_hooks"));

    EXPECT_EQ(ids(registry.rules_for_pass(RuleKind::TEXTUAL)), (std::vector<std::string>{"text"}));
    EXPECT_EQ(ids(registry.rules_for_pass(RuleKind::STRUCTURAL)),
              (std::vector<std::string>{"hooks"}));
}

TEST_F(PatternRegistryTest, StructuralLookupHonoursEnabledState)
{
    PatternRegistry registry;
    registry.register_rule(structural("hooks", "lifecycle_hooks"));

    EXPECT_EQ(registry.structural_rule_id("lifecycle_hooks"), "hooks");
    EXPECT_FALSE(registry.is_structural_enabled("yield_tests"));

    registry.set_enabled("hooks", false);
    EXPECT_FALSE(registry.is_structural_enabled("lifecycle_hooks"));
}

TEST_F(PatternRegistryTest, FindReturnsNullForUnknownId)
{
    PatternRegistry registry;
    registry.register_rule(textual("a", 10));

    ASSERT_NE(registry.find("a"), nullptr);
    EXPECT_EQ(registry.find("a")->priority, 10);
    EXPECT_EQ(registry.find("b"), nullptr);
    EXPECT_FALSE(registry.contains("b"));
}

} // namespace pytestify
