// File: src/mining/rule_generator.cpp
#include "mining/rule_generator.hpp"
#include "core/errors.hpp"
#include <algorithm>

namespace profitlift {

namespace {

double Lookup(const SupportTable& table, const ItemSet& items) {
    auto it = table.find(items);
    return it == table.end() ? 0.0 : it->second;
}

double SafeRatio(double numerator, double denominator) {
    return denominator > 0.0 ? numerator / denominator : 0.0;
}

} // namespace

RuleGenerator::RuleGenerator()
    : RuleGenerator(Config()) {}

RuleGenerator::RuleGenerator(const Config& config)
    : config_(config) {
    if (!(config_.min_confidence >= 0.0 && config_.min_confidence <= 1.0)) {
        throw ConfigurationError("min_confidence must be in [0, 1] (got " +
                                 std::to_string(config_.min_confidence) + ")");
    }
}

std::vector<ContextualRule> RuleGenerator::Generate(const std::vector<FrequentItemset>& itemsets,
                                                    const Context& context) const {
    std::vector<ContextualRule> rules;
    SupportTable support = BuildSupportTable(itemsets);

    for (const auto& itemset : itemsets) {
        const size_t n = itemset.items.size();
        // Partitions are enumerated with a bitmask over the ordered items
        if (n < 2 || n >= 64) {
            continue;
        }

        std::vector<ItemID> items(itemset.items.begin(), itemset.items.end());
        const uint64_t full = (uint64_t{1} << n) - 1;

        for (uint64_t mask = 1; mask < full; ++mask) {
            ContextualRule rule;
            for (size_t i = 0; i < n; ++i) {
                if (mask & (uint64_t{1} << i)) {
                    rule.antecedent.insert(items[i]);
                } else {
                    rule.consequent.insert(items[i]);
                }
            }

            double confidence = SafeRatio(itemset.support, Lookup(support, rule.antecedent));
            if (confidence < config_.min_confidence) {
                continue;
            }

            // Floating-point noise must not push confidence past 1
            rule.support = std::clamp(itemset.support, 0.0, 1.0);
            rule.confidence = std::clamp(confidence, 0.0, 1.0);
            rule.lift = SafeRatio(rule.confidence, Lookup(support, rule.consequent));
            rule.context = context;
            rules.push_back(std::move(rule));
        }
    }

    return rules;
}

} // namespace profitlift
