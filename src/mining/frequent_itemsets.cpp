// File: src/mining/frequent_itemsets.cpp
#include "mining/frequent_itemsets.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cmath>

namespace profitlift {

size_t MinSupportCount(double min_support, size_t total) {
    // Tolerance absorbs rounding error in the product
    double needed = std::ceil(min_support * static_cast<double>(total) - 1e-9);
    if (needed < 1.0) {
        return 1;
    }
    return static_cast<size_t>(needed);
}

void ValidateMinSupport(double min_support) {
    if (!(min_support > 0.0 && min_support <= 1.0)) {
        throw ConfigurationError("min_support must be in (0, 1] (got " +
                                 std::to_string(min_support) + ")");
    }
}

void SortItemsets(std::vector<FrequentItemset>& itemsets) {
    std::sort(itemsets.begin(), itemsets.end(),
              [](const FrequentItemset& a, const FrequentItemset& b) {
                  if (a.items.size() != b.items.size()) {
                      return a.items.size() < b.items.size();
                  }
                  return a.items < b.items;
              });
}

SupportTable BuildSupportTable(const std::vector<FrequentItemset>& itemsets) {
    SupportTable table;
    table.reserve(itemsets.size());
    for (const auto& itemset : itemsets) {
        table[itemset.items] = itemset.support;
    }
    return table;
}

} // namespace profitlift
