// File: src/mining/frequent_itemsets.hpp
#pragma once

#include "core/types.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace profitlift {

/// An itemset whose support reached the mining threshold
struct FrequentItemset {
    ItemSet items;

    /// Number of baskets containing every item
    size_t count{0};

    /// count / number of baskets
    double support{0.0};
};

/// Support lookup keyed by itemset
using SupportTable = std::unordered_map<ItemSet, double, ItemSetHash>;

/// ItemsetMiner: Abstract frequent-itemset mining algorithm
///
/// support(X) = |{baskets containing X}| / |baskets|. An itemset is
/// frequent when support >= min_support. Empty input yields an empty
/// result. Results are returned sorted by (size, items).
class ItemsetMiner {
public:
    virtual ~ItemsetMiner() = default;

    /// Mine all frequent itemsets
    /// @param baskets One item set per transaction
    /// @param min_support Minimum support fraction in (0, 1]
    /// @throws ConfigurationError if min_support is out of range
    virtual std::vector<FrequentItemset> Mine(const std::vector<ItemSet>& baskets,
                                              double min_support) const = 0;

    /// Algorithm name, used in log lines
    virtual std::string Name() const = 0;
};

/// Smallest basket count satisfying count / total >= min_support (at least 1)
size_t MinSupportCount(double min_support, size_t total);

/// @throws ConfigurationError unless 0 < min_support <= 1
void ValidateMinSupport(double min_support);

/// Sort itemsets by size, then lexicographically by items
void SortItemsets(std::vector<FrequentItemset>& itemsets);

/// Build a support lookup from mined itemsets
SupportTable BuildSupportTable(const std::vector<FrequentItemset>& itemsets);

} // namespace profitlift
