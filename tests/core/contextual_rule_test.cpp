// File: tests/core/contextual_rule_test.cpp
#include "core/contextual_rule.hpp"
#include <gtest/gtest.h>

namespace profitlift {
namespace {

ContextualRule MakeRule(ItemSet antecedent, ItemSet consequent, double confidence = 0.5) {
    ContextualRule rule;
    rule.antecedent = std::move(antecedent);
    rule.consequent = std::move(consequent);
    rule.support = 0.2;
    rule.confidence = confidence;
    rule.lift = 1.2;
    return rule;
}

// ============================================================================
// Identity
// ============================================================================

TEST(ContextualRuleTest, SignatureIncludesContext) {
    ContextualRule rule = MakeRule({"bread", "milk"}, {"butter"});
    EXPECT_EQ("bread,milk=>butter|store=*;time=*;day=*;quarter=*;festival=*", rule.Signature());

    ContextualRule store_rule = rule;
    store_rule.context.store_id = "S1";
    EXPECT_NE(rule.Signature(), store_rule.Signature());
    EXPECT_NE(rule.Key(), store_rule.Key());
}

TEST(ContextualRuleTest, KeyIgnoresMetrics) {
    ContextualRule a = MakeRule({"a"}, {"b"}, 0.4);
    ContextualRule b = MakeRule({"a"}, {"b"}, 0.9);
    EXPECT_EQ(a.Key(), b.Key());
    EXPECT_EQ(RuleKey::Hash()(a.Key()), RuleKey::Hash()(b.Key()));
}

TEST(ContextualRuleTest, ItemsIsUnion) {
    ContextualRule rule = MakeRule({"a", "b"}, {"c"});
    EXPECT_EQ((ItemSet{"a", "b", "c"}), rule.Items());
}

TEST(ContextualRuleTest, ToStringIsReadable) {
    ContextualRule rule = MakeRule({"bread", "milk"}, {"butter"});
    EXPECT_EQ("bread + milk -> butter (context: Overall)", rule.ToString());
}

// ============================================================================
// Invariants
// ============================================================================

TEST(ContextualRuleTest, IsValidAcceptsWellFormedRule) {
    EXPECT_TRUE(MakeRule({"a"}, {"b"}).IsValid());
}

TEST(ContextualRuleTest, IsValidRejectsBrokenRules) {
    EXPECT_FALSE(MakeRule({}, {"b"}).IsValid());
    EXPECT_FALSE(MakeRule({"a"}, {}).IsValid());
    EXPECT_FALSE(MakeRule({"a", "b"}, {"b"}).IsValid());
    EXPECT_FALSE(MakeRule({"a"}, {"b"}, 1.5).IsValid());

    ContextualRule negative_lift = MakeRule({"a"}, {"b"});
    negative_lift.lift = -0.1;
    EXPECT_FALSE(negative_lift.IsValid());
}

// ============================================================================
// Merging and grouping
// ============================================================================

TEST(ContextualRuleTest, MergeDuplicatesKeepsPositionAndLatestValues) {
    std::vector<ContextualRule> rules = {
        MakeRule({"a"}, {"b"}, 0.4),
        MakeRule({"c"}, {"d"}, 0.6),
        MakeRule({"a"}, {"b"}, 0.9),
    };

    auto merged = MergeDuplicateRules(rules);

    ASSERT_EQ(2u, merged.size());
    EXPECT_EQ((ItemSet{"a"}), merged[0].antecedent);
    EXPECT_DOUBLE_EQ(0.9, merged[0].confidence);
    EXPECT_EQ((ItemSet{"c"}), merged[1].antecedent);
}

TEST(ContextualRuleTest, MergeKeepsSameItemsInDifferentContexts) {
    ContextualRule overall = MakeRule({"a"}, {"b"});
    ContextualRule store = MakeRule({"a"}, {"b"});
    store.context.store_id = "S1";

    EXPECT_EQ(2u, MergeDuplicateRules({overall, store}).size());
}

TEST(ContextualRuleTest, GroupByContextPreservesOrder) {
    ContextualRule r1 = MakeRule({"a"}, {"b"});
    ContextualRule r2 = MakeRule({"c"}, {"d"});
    r2.context.time_bin = "evening";
    ContextualRule r3 = MakeRule({"e"}, {"f"});

    auto groups = GroupByContext({r1, r2, r3});

    ASSERT_EQ(2u, groups.size());
    const auto& overall = groups.at(Context::Overall());
    ASSERT_EQ(2u, overall.size());
    EXPECT_EQ((ItemSet{"a"}), overall[0].antecedent);
    EXPECT_EQ((ItemSet{"e"}), overall[1].antecedent);
    EXPECT_EQ(1u, groups.at(r2.context).size());
}

// ============================================================================
// Uplift status
// ============================================================================

TEST(UpliftStatusTest, NamesRoundTrip) {
    for (UpliftStatus status : {UpliftStatus::NOT_ESTIMATED, UpliftStatus::ESTIMATING,
                                UpliftStatus::ESTIMATED, UpliftStatus::INSUFFICIENT_DATA}) {
        EXPECT_EQ(status, ParseUpliftStatus(ToString(status)));
    }
    EXPECT_STREQ("insufficient_data", ToString(UpliftStatus::INSUFFICIENT_DATA));
}

TEST(UpliftStatusTest, UnknownNameThrows) {
    EXPECT_THROW(ParseUpliftStatus("done"), std::invalid_argument);
}

TEST(UpliftResultTest, SampleSizeSumsGroups) {
    UpliftResult result;
    result.control_size = 21;
    result.treatment_size = 21;
    EXPECT_EQ(42u, result.SampleSize());
    EXPECT_FALSE(result.actionable);
    EXPECT_EQ(UpliftStatus::NOT_ESTIMATED, result.status);
}

} // namespace
} // namespace profitlift
