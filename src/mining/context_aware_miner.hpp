// File: src/mining/context_aware_miner.hpp
#pragma once

#include "core/contextual_rule.hpp"
#include "mining/context_segmenter.hpp"
#include "mining/eclat.hpp"
#include "mining/fp_growth.hpp"
#include "mining/rule_generator.hpp"
#include <vector>

namespace profitlift {

/// ContextAwareMiner: Mines association rules inside one context bucket
///
/// Converts the bucket's transactions to baskets, mines frequent itemsets
/// with FP-Growth and generates rules tagged with the bucket's context.
/// Optionally re-mines with Eclat and logs any divergence between the two.
///
/// Thread-safety: MineContext() is const; one instance may serve every
/// worker thread.
class ContextAwareMiner {
public:
    struct Config {
        Config() = default;

        /// Minimum support fraction (0, 1]
        double min_support{0.01};

        /// Minimum rule confidence [0, 1]
        double min_confidence{0.3};

        /// Longest itemset mined (0 = unbounded)
        size_t max_itemset_size{4};

        /// Contexts with fewer non-empty baskets are skipped
        size_t min_baskets{5};

        /// Cross-check FP-Growth against Eclat on every context
        bool validate_with_eclat{false};
    };

    ContextAwareMiner();

    /// @throws ConfigurationError for out-of-range thresholds
    explicit ContextAwareMiner(const Config& config);

    /// Mine one context
    /// @return De-duplicated rules of the context (possibly empty)
    /// @throws DataInsufficientError if the context has fewer than
    ///         min_baskets non-empty baskets
    std::vector<ContextualRule> MineContext(const Segment& segment) const;

    /// Non-empty baskets of a transaction list, in input order
    static std::vector<ItemSet> ToBaskets(const std::vector<TransactionRecord>& transactions);

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    FPGrowthMiner primary_;
    EclatMiner validator_;
    RuleGenerator generator_;

    /// Re-mine with Eclat and log disagreements
    void Validate(const std::vector<ItemSet>& baskets,
                  const std::vector<FrequentItemset>& primary,
                  const Context& context) const;
};

} // namespace profitlift
