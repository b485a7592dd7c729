// File: tests/mining/eclat_test.cpp
#include "mining/eclat.hpp"
#include "mining/itemset_validation.hpp"
#include <gtest/gtest.h>

namespace profitlift {
namespace {

TEST(EclatMinerTest, WorkedExample) {
    EclatMiner miner;
    auto itemsets = miner.Mine({{"a", "b"}, {"a", "b"}, {"a", "c"}}, 0.3);

    ASSERT_EQ(5u, itemsets.size());
    SupportTable support = BuildSupportTable(itemsets);
    EXPECT_NEAR(2.0 / 3.0, support.at(ItemSet{"a", "b"}), 1e-12);
    EXPECT_NEAR(1.0 / 3.0, support.at(ItemSet{"a", "c"}), 1e-12);
    EXPECT_DOUBLE_EQ(1.0, support.at(ItemSet{"a"}));
}

TEST(EclatMinerTest, EmptyInputYieldsEmptyResult) {
    EclatMiner miner;
    EXPECT_TRUE(miner.Mine({}, 0.5).empty());
    EXPECT_EQ("eclat", miner.Name());
}

TEST(EclatMinerTest, MaxItemsetSizeBoundsLength) {
    EclatMiner::Config config;
    config.max_itemset_size = 1;
    EclatMiner miner(config);

    auto itemsets = miner.Mine({{"a", "b"}, {"a", "b"}}, 0.5);
    EXPECT_EQ(2u, itemsets.size());
}

// ============================================================================
// CompareItemsets
// ============================================================================

TEST(ItemsetValidationTest, ReportsMissingExtraAndDivergence) {
    std::vector<FrequentItemset> primary = {
        {{"a"}, 3, 1.0},
        {{"a", "b"}, 2, 0.6},
        {{"x"}, 1, 0.3},
    };
    std::vector<FrequentItemset> reference = {
        {{"a"}, 3, 1.0},
        {{"a", "b"}, 2, 2.0 / 3.0},
        {{"c"}, 1, 1.0 / 3.0},
    };

    ItemsetComparison comparison = CompareItemsets(primary, reference);

    EXPECT_FALSE(comparison.agrees);
    ASSERT_EQ(1u, comparison.missing.size());
    EXPECT_EQ((ItemSet{"c"}), comparison.missing[0]);
    ASSERT_EQ(1u, comparison.extra.size());
    EXPECT_EQ((ItemSet{"x"}), comparison.extra[0]);
    EXPECT_NEAR(2.0 / 3.0 - 0.6, comparison.max_support_divergence, 1e-12);
}

TEST(ItemsetValidationTest, IdenticalOutputsAgree) {
    std::vector<FrequentItemset> itemsets = {{{"a"}, 2, 1.0}, {{"b"}, 1, 0.5}};
    ItemsetComparison comparison = CompareItemsets(itemsets, itemsets);
    EXPECT_TRUE(comparison.agrees);
    EXPECT_DOUBLE_EQ(0.0, comparison.max_support_divergence);
}

TEST(ItemsetValidationTest, ToleranceAbsorbsSmallDivergence) {
    std::vector<FrequentItemset> primary = {{{"a"}, 2, 0.5}};
    std::vector<FrequentItemset> reference = {{{"a"}, 2, 0.5001}};

    EXPECT_FALSE(CompareItemsets(primary, reference).agrees);
    EXPECT_TRUE(CompareItemsets(primary, reference, 1e-3).agrees);
}

} // namespace
} // namespace profitlift
