// File: tests/storage/memory_rule_store_test.cpp
#include "storage/memory_rule_store.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>

namespace profitlift {
namespace {

Context Store(const std::string& id, std::optional<std::string> time_bin = std::nullopt) {
    Context context;
    context.store_id = id;
    context.time_bin = std::move(time_bin);
    return context;
}

ContextualRule Rule(ItemSet antecedent, ItemSet consequent, const Context& context,
                    std::optional<double> score) {
    ContextualRule rule;
    rule.antecedent = std::move(antecedent);
    rule.consequent = std::move(consequent);
    rule.support = 0.2;
    rule.confidence = 0.6;
    rule.lift = 1.5;
    rule.context = context;
    rule.overall_score = score;
    return rule;
}

UpliftResult Uplift(const std::string& signature, double rate) {
    UpliftResult result;
    result.rule_signature = signature;
    result.status = UpliftStatus::ESTIMATED;
    result.incremental_attach_rate = rate;
    return result;
}

class MemoryRuleStoreTest : public ::testing::Test {
protected:
    MemoryRuleStore store;
    Context s1 = Store("S1");
    Context s1_morning = Store("S1", std::string("morning"));
    Context s2 = Store("S2");

    void SetUp() override {
        store.ReplaceContextRules(s1, {Rule({"a"}, {"b"}, s1, 0.5), Rule({"c"}, {"d"}, s1, 0.9)});
        store.ReplaceContextRules(s1_morning, {Rule({"a"}, {"c"}, s1_morning, 0.7)});
        store.ReplaceContextRules(s2, {Rule({"a"}, {"b"}, s2, std::nullopt)});
    }
};

TEST_F(MemoryRuleStoreTest, ReplaceAndCount) {
    EXPECT_EQ(4u, store.RuleCount());
    EXPECT_EQ(3u, store.ListContexts().size());
    EXPECT_EQ(3u, store.GetReplaceCount());

    auto rules = store.GetContextRules(s1);
    ASSERT_EQ(2u, rules.size());
    EXPECT_EQ(ItemSet({"c"}), rules[0].antecedent);
}

TEST_F(MemoryRuleStoreTest, ReplaceLeavesOtherContextsAlone) {
    store.ReplaceContextRules(s1, {Rule({"x"}, {"y"}, s1, 0.1)});

    EXPECT_EQ(1u, store.GetContextRules(s1).size());
    EXPECT_EQ(1u, store.GetContextRules(s1_morning).size());
    EXPECT_EQ(1u, store.GetContextRules(s2).size());
}

TEST_F(MemoryRuleStoreTest, ReplaceWithNothingDropsContext) {
    store.ReplaceContextRules(s2, {});
    EXPECT_TRUE(store.GetContextRules(s2).empty());
    EXPECT_EQ(2u, store.ListContexts().size());
}

TEST_F(MemoryRuleStoreTest, DuplicatesAreMerged) {
    store.ReplaceContextRules(s2, {Rule({"a"}, {"b"}, s2, 0.1), Rule({"a"}, {"b"}, s2, 0.3)});

    auto rules = store.GetContextRules(s2);
    ASSERT_EQ(1u, rules.size());
    EXPECT_DOUBLE_EQ(0.3, rules[0].overall_score.value_or(-1.0));
}

TEST_F(MemoryRuleStoreTest, ForeignContextRuleIsRejected) {
    EXPECT_THROW(store.ReplaceContextRules(s1, {Rule({"a"}, {"b"}, s2, 0.1)}), std::invalid_argument);
    EXPECT_EQ(2u, store.GetContextRules(s1).size());
}

TEST_F(MemoryRuleStoreTest, QueryOrdersByScoreWithUnscoredLast) {
    RuleQuery query;
    auto rules = store.QueryRules(query);

    ASSERT_EQ(4u, rules.size());
    EXPECT_DOUBLE_EQ(0.9, *rules[0].overall_score);
    EXPECT_DOUBLE_EQ(0.7, *rules[1].overall_score);
    EXPECT_DOUBLE_EQ(0.5, *rules[2].overall_score);
    EXPECT_FALSE(rules[3].overall_score.has_value());
}

TEST_F(MemoryRuleStoreTest, QueryFilters) {
    RuleQuery by_store;
    by_store.store_id = "S1";
    EXPECT_EQ(3u, store.QueryRules(by_store).size());

    RuleQuery by_time;
    by_time.time_bin = "morning";
    auto morning = store.QueryRules(by_time);
    ASSERT_EQ(1u, morning.size());
    EXPECT_EQ(s1_morning, morning[0].context);

    RuleQuery by_score;
    by_score.min_score = 0.6;
    EXPECT_EQ(2u, store.QueryRules(by_score).size());

    RuleQuery limited;
    limited.limit = 1;
    auto top = store.QueryRules(limited);
    ASSERT_EQ(1u, top.size());
    EXPECT_DOUBLE_EQ(0.9, *top[0].overall_score);

    RuleQuery unlimited;
    unlimited.limit = 0;
    EXPECT_EQ(4u, store.QueryRules(unlimited).size());
}

TEST_F(MemoryRuleStoreTest, UpliftSurvivesRuleReplacement) {
    std::string signature = Rule({"a"}, {"b"}, s1, 0.5).Signature();
    store.StoreUplift(Uplift(signature, 0.12));

    store.ReplaceContextRules(s1, {});

    auto uplift = store.GetUplift(signature);
    ASSERT_TRUE(uplift.has_value());
    EXPECT_DOUBLE_EQ(0.12, uplift->incremental_attach_rate);
    EXPECT_EQ(UpliftStatus::ESTIMATED, uplift->status);
}

TEST_F(MemoryRuleStoreTest, UpliftIsReplacedBySignature) {
    store.StoreUplift(Uplift("b", 0.1));
    store.StoreUplift(Uplift("a", 0.2));
    store.StoreUplift(Uplift("b", 0.3));

    EXPECT_EQ(2u, store.UpliftCount());
    auto all = store.ListUplifts();
    ASSERT_EQ(2u, all.size());
    EXPECT_EQ("a", all[0].rule_signature);
    EXPECT_DOUBLE_EQ(0.3, all[1].incremental_attach_rate);

    EXPECT_FALSE(store.GetUplift("missing").has_value());
    EXPECT_THROW(store.StoreUplift(Uplift("", 0.1)), std::invalid_argument);
}

TEST_F(MemoryRuleStoreTest, StatsAndClear) {
    store.StoreUplift(Uplift("a", 0.2));

    RuleStoreStats stats = store.GetStats();
    EXPECT_EQ(4u, stats.total_rules);
    EXPECT_EQ(1u, stats.total_uplifts);
    EXPECT_EQ(3u, stats.context_count);

    store.Clear();
    EXPECT_EQ(0u, store.RuleCount());
    EXPECT_EQ(0u, store.UpliftCount());
    EXPECT_TRUE(store.ListContexts().empty());
}

TEST(MemoryRuleStoreConcurrencyTest, ConcurrentReplaceOfDistinctContexts) {
    MemoryRuleStore store;
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&store, t]() {
            Context context = Store("S" + std::to_string(t));
            for (int round = 0; round < 20; ++round) {
                store.ReplaceContextRules(context, {Rule({"a"}, {"b"}, context, round * 0.01),
                                                    Rule({"b"}, {"c"}, context, 0.5)});
                store.QueryRules(RuleQuery());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(16u, store.RuleCount());
    EXPECT_EQ(8u, store.ListContexts().size());
}

} // namespace
} // namespace profitlift
