// File: src/score/profit_calculator.cpp
#include "score/profit_calculator.hpp"
#include <algorithm>
#include <utility>

namespace profitlift {

ProfitCalculator::ProfitCalculator()
    : ProfitCalculator(Config()) {}

ProfitCalculator::ProfitCalculator(const Config& config)
    : config_(config) {}

double ProfitCalculator::ResolveMargin(const LineItem& line) const {
    if (line.margin_pct) {
        return *line.margin_pct;
    }
    if (line.category) {
        auto it = config_.category_margins.find(*line.category);
        if (it != config_.category_margins.end()) {
            return it->second;
        }
    }
    return config_.default_margin;
}

bool ProfitCalculator::ConsequentEconomics(const ItemSet& items,
                                           const std::vector<TransactionRecord>& transactions,
                                           double& mean_price,
                                           double& mean_margin) const {
    double price_sum = 0.0;
    double margin_sum = 0.0;
    size_t lines = 0;

    for (const auto& record : transactions) {
        for (const auto& line : record.items) {
            if (items.count(line.item_id) == 0) {
                continue;
            }
            price_sum += line.price;
            margin_sum += ResolveMargin(line);
            ++lines;
        }
    }

    if (lines == 0) {
        mean_price = 0.0;
        mean_margin = 0.0;
        return false;
    }

    mean_price = price_sum / static_cast<double>(lines);
    mean_margin = margin_sum / static_cast<double>(lines);
    return true;
}

double ProfitCalculator::CalculateRuleProfit(const ContextualRule& rule,
                                             const std::vector<TransactionRecord>& transactions) const {
    double mean_price = 0.0;
    double mean_margin = 0.0;
    if (!ConsequentEconomics(rule.consequent, transactions, mean_price, mean_margin)) {
        return 0.0;
    }

    // Returns or negative-margin lines can drive this below zero
    return std::max(0.0, mean_price * mean_margin * rule.confidence);
}

std::unordered_map<std::string, double> ProfitCalculator::ObservedCategoryMargins(
    const std::vector<TransactionRecord>& transactions) {

    std::unordered_map<std::string, std::pair<double, size_t>> sums;
    for (const auto& record : transactions) {
        for (const auto& line : record.items) {
            if (line.category && line.margin_pct) {
                auto& entry = sums[*line.category];
                entry.first += *line.margin_pct;
                ++entry.second;
            }
        }
    }

    std::unordered_map<std::string, double> margins;
    for (const auto& [category, entry] : sums) {
        margins[category] = entry.first / static_cast<double>(entry.second);
    }
    return margins;
}

} // namespace profitlift
