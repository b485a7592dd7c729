// File: src/mining/eclat.hpp
#pragma once

#include "mining/frequent_itemsets.hpp"
#include <vector>

namespace profitlift {

/// EclatMiner: Validation miner over a vertical (tid-list) layout
///
/// Each item maps to the sorted list of basket indices containing it;
/// itemsets are extended depth-first by intersecting tid-lists. Used to
/// cross-check FP-Growth output on the same input.
class EclatMiner : public ItemsetMiner {
public:
    struct Config {
        Config() = default;

        /// Longest itemset to report (0 = unbounded)
        size_t max_itemset_size{4};
    };

    EclatMiner();
    explicit EclatMiner(const Config& config);

    std::vector<FrequentItemset> Mine(const std::vector<ItemSet>& baskets,
                                      double min_support) const override;

    std::string Name() const override { return "eclat"; }

private:
    Config config_;

    using TidList = std::vector<size_t>;

    struct Candidate {
        ItemID item;
        TidList tids;
    };

    void Extend(const ItemSet& prefix,
                const std::vector<Candidate>& candidates,
                size_t min_count,
                size_t total,
                std::vector<FrequentItemset>& out) const;
};

} // namespace profitlift
