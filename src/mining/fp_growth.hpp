// File: src/mining/fp_growth.hpp
#pragma once

#include "mining/frequent_itemsets.hpp"
#include <cstdint>
#include <vector>

namespace profitlift {

/// FPGrowthMiner: Primary frequent-itemset miner
///
/// Builds a prefix tree (FP-tree) of the baskets with items ordered by
/// descending global frequency, then mines it recursively through
/// conditional pattern bases. Nodes live in a flat vector and refer to
/// each other by index.
///
/// Thread-safety: Mine() is const and keeps all state local, so one
/// instance may be shared across worker threads.
class FPGrowthMiner : public ItemsetMiner {
public:
    struct Config {
        Config() = default;

        /// Longest itemset to report (0 = unbounded)
        size_t max_itemset_size{4};
    };

    FPGrowthMiner();
    explicit FPGrowthMiner(const Config& config);

    std::vector<FrequentItemset> Mine(const std::vector<ItemSet>& baskets,
                                      double min_support) const override;

    std::string Name() const override { return "fp-growth"; }

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    /// Encoded item path with a multiplicity
    struct WeightedPath {
        std::vector<uint32_t> items;
        size_t count{0};
    };

    /// Mine one (conditional) database and append results.
    /// `paths` hold item codes sorted by global rank.
    void MineConditional(const std::vector<WeightedPath>& paths,
                         std::vector<uint32_t>& prefix,
                         size_t min_count,
                         size_t total,
                         const std::vector<ItemID>& dictionary,
                         std::vector<FrequentItemset>& out) const;
};

} // namespace profitlift
