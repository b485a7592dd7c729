// File: src/mining/itemset_validation.cpp
#include "mining/itemset_validation.hpp"
#include <algorithm>
#include <cmath>

namespace profitlift {

ItemsetComparison CompareItemsets(const std::vector<FrequentItemset>& primary,
                                  const std::vector<FrequentItemset>& reference,
                                  double tolerance) {
    ItemsetComparison comparison;

    SupportTable primary_support = BuildSupportTable(primary);
    SupportTable reference_support = BuildSupportTable(reference);

    for (const auto& itemset : reference) {
        auto it = primary_support.find(itemset.items);
        if (it == primary_support.end()) {
            comparison.missing.push_back(itemset.items);
            continue;
        }
        double divergence = std::fabs(it->second - itemset.support);
        comparison.max_support_divergence = std::max(comparison.max_support_divergence, divergence);
    }

    for (const auto& itemset : primary) {
        if (reference_support.find(itemset.items) == reference_support.end()) {
            comparison.extra.push_back(itemset.items);
        }
    }

    comparison.agrees = comparison.missing.empty() &&
                        comparison.extra.empty() &&
                        comparison.max_support_divergence <= tolerance;
    return comparison;
}

} // namespace profitlift
