#include <pathwright/replacement_rule.hpp>

#include <gtest/gtest.h>

#include <stdexcept>

using namespace pathwright;

TEST(replacement_rule, default_constructed_rule_is_identity)
{
    const replacement_rule rule;
    EXPECT_TRUE(rule.is_identity());
    EXPECT_EQ(rule.apply("anything at all"), "anything at all");
    EXPECT_EQ(rule.apply(""), "");
}

TEST(replacement_rule, replaces_every_match)
{
    const replacement_rule rule("o", "0");
    EXPECT_FALSE(rule.is_identity());
    EXPECT_EQ(rule.apply("foo boo"), "f00 b00");
}

TEST(replacement_rule, anchors_apply_to_whole_segment)
{
    const replacement_rule rule("abcdX$", "1ST");
    EXPECT_EQ(rule.apply(":abcdX"), ":1ST");
    EXPECT_EQ(rule.apply("abcdXabcd"), "abcdXabcd");
}

TEST(replacement_rule, substitution_may_refer_to_groups)
{
    const replacement_rule rule("^(The) (.*)$", "$2, $1");
    EXPECT_EQ(rule.apply("The Beatles"), "Beatles, The");
}

TEST(replacement_rule, rules_apply_in_declaration_order)
{
    const rule_set rules{{"abcdX$", "1ST"}, {"1ST$", "2ND"}};
    EXPECT_EQ(apply_rules(":abcdX", rules), ":2ND");

    const rule_set reversed{{"1ST$", "2ND"}, {"abcdX$", "1ST"}};
    EXPECT_EQ(apply_rules(":abcdX", reversed), ":1ST");
}

TEST(replacement_rule, invalid_pattern_throws_invalid_argument)
{
    EXPECT_THROW(replacement_rule("(unbalanced", "x"), std::invalid_argument);
}

TEST(replacement_rule, exposes_pattern_and_substitution)
{
    const replacement_rule rule("foo", "bar");
    EXPECT_EQ(rule.pattern(), "foo");
    EXPECT_EQ(rule.substitution(), "bar");
}
