// File: src/mining/context_aware_miner.cpp
#include "mining/context_aware_miner.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "mining/itemset_validation.hpp"
#include <sstream>

namespace profitlift {

namespace {

FPGrowthMiner::Config PrimaryConfig(const ContextAwareMiner::Config& config) {
    FPGrowthMiner::Config c;
    c.max_itemset_size = config.max_itemset_size;
    return c;
}

EclatMiner::Config ValidatorConfig(const ContextAwareMiner::Config& config) {
    EclatMiner::Config c;
    c.max_itemset_size = config.max_itemset_size;
    return c;
}

RuleGenerator::Config GeneratorConfig(const ContextAwareMiner::Config& config) {
    RuleGenerator::Config c;
    c.min_confidence = config.min_confidence;
    return c;
}

} // namespace

ContextAwareMiner::ContextAwareMiner()
    : ContextAwareMiner(Config()) {}

ContextAwareMiner::ContextAwareMiner(const Config& config)
    : config_(config),
      primary_(PrimaryConfig(config)),
      validator_(ValidatorConfig(config)),
      generator_(GeneratorConfig(config)) {
    ValidateMinSupport(config_.min_support);
}

std::vector<ItemSet> ContextAwareMiner::ToBaskets(const std::vector<TransactionRecord>& transactions) {
    std::vector<ItemSet> baskets;
    baskets.reserve(transactions.size());
    for (const auto& record : transactions) {
        ItemSet basket = record.Basket();
        if (!basket.empty()) {
            baskets.push_back(std::move(basket));
        }
    }
    return baskets;
}

std::vector<ContextualRule> ContextAwareMiner::MineContext(const Segment& segment) const {
    const std::string label = segment.context.ToString();
    std::vector<ItemSet> baskets = ToBaskets(segment.transactions);

    if (baskets.size() < config_.min_baskets) {
        throw DataInsufficientError(
            label, "only " + std::to_string(baskets.size()) + " non-empty baskets (need " +
                   std::to_string(config_.min_baskets) + ")");
    }

    auto& log = Logger::Instance();
    log.Debug("ContextAwareMiner", "Mining context " + label + " (" +
                                   std::to_string(baskets.size()) + " baskets)");

    std::vector<FrequentItemset> itemsets = primary_.Mine(baskets, config_.min_support);

    if (config_.validate_with_eclat) {
        Validate(baskets, itemsets, segment.context);
    }

    if (itemsets.empty()) {
        log.Debug("ContextAwareMiner", "No frequent itemsets for context " + label);
        return {};
    }

    std::vector<ContextualRule> rules = MergeDuplicateRules(generator_.Generate(itemsets, segment.context));

    log.Debug("ContextAwareMiner", "Found " + std::to_string(rules.size()) +
                                   " rules for context " + label);
    return rules;
}

void ContextAwareMiner::Validate(const std::vector<ItemSet>& baskets,
                                 const std::vector<FrequentItemset>& primary,
                                 const Context& context) const {
    std::vector<FrequentItemset> reference = validator_.Mine(baskets, config_.min_support);
    ItemsetComparison comparison = CompareItemsets(primary, reference);

    if (comparison.agrees) {
        return;
    }

    std::ostringstream oss;
    oss << "Miner divergence in context " << context.ToString()
        << ": " << comparison.missing.size() << " missing, "
        << comparison.extra.size() << " extra, max support divergence "
        << comparison.max_support_divergence;
    Logger::Instance().Warn("ContextAwareMiner", oss.str());
}

} // namespace profitlift
