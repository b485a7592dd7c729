// File: src/mining/rule_generator.hpp
#pragma once

#include "core/contextual_rule.hpp"
#include "mining/frequent_itemsets.hpp"
#include <vector>

namespace profitlift {

/// RuleGenerator: Turns frequent itemsets into association rules
///
/// Every itemset of size >= 2 is split into all non-empty
/// antecedent/consequent partitions:
///
///   confidence(X -> Y) = support(X u Y) / support(X)
///   lift(X -> Y)       = confidence(X -> Y) / support(Y)
///
/// A zero denominator yields 0 instead of a division by zero. Partitions
/// with confidence below min_confidence are dropped.
class RuleGenerator {
public:
    struct Config {
        Config() = default;

        /// Minimum confidence for a rule to be kept (0.0 to 1.0)
        double min_confidence{0.3};
    };

    RuleGenerator();

    /// @throws ConfigurationError unless 0 <= min_confidence <= 1
    explicit RuleGenerator(const Config& config);

    /// Generate rules for one context
    /// @param itemsets Complete frequent-itemset output of a miner
    /// @param context Context the itemsets were mined in
    /// @return Rules ordered by source itemset, then by partition
    std::vector<ContextualRule> Generate(const std::vector<FrequentItemset>& itemsets,
                                         const Context& context) const;

private:
    Config config_;
};

} // namespace profitlift
