// File: src/mining/itemset_validation.hpp
#pragma once

#include "mining/frequent_itemsets.hpp"
#include <vector>

namespace profitlift {

/// Outcome of cross-checking two miners on the same input
struct ItemsetComparison {
    /// Itemsets found by the reference miner only
    std::vector<ItemSet> missing;

    /// Itemsets found by the primary miner only
    std::vector<ItemSet> extra;

    /// Largest |support difference| over itemsets found by both
    double max_support_divergence{0.0};

    /// True when both miners found the same itemsets with supports within
    /// the tolerance used for the comparison
    bool agrees{true};
};

/// Default divergence tolerance between miners
constexpr double kItemsetSupportTolerance = 1e-9;

/// Compare primary miner output against a reference miner's output
ItemsetComparison CompareItemsets(const std::vector<FrequentItemset>& primary,
                                  const std::vector<FrequentItemset>& reference,
                                  double tolerance = kItemsetSupportTolerance);

} // namespace profitlift
