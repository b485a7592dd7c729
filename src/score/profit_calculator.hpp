// File: src/score/profit_calculator.hpp
#pragma once

#include "core/contextual_rule.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace profitlift {

/// ProfitCalculator: Expected incremental margin of a rule
///
///   profit = mean_unit_price(consequent lines)
///          x mean_margin(consequent lines)
///          x confidence
///
/// "Consequent lines" are the line items of the supplied transactions whose
/// item id is in the rule's consequent. Per line, the margin is resolved as
/// the line's margin_pct, else the configured margin for its category, else
/// the default margin.
class ProfitCalculator {
public:
    struct Config {
        Config() = default;

        /// Margin used when neither the line nor its category has one
        double default_margin{0.25};

        /// Category -> margin fraction
        std::unordered_map<std::string, double> category_margins;
    };

    ProfitCalculator();
    explicit ProfitCalculator(const Config& config);

    /// Expected profit per basket, >= 0
    /// @return 0 if no consequent line item occurs in `transactions`
    double CalculateRuleProfit(const ContextualRule& rule,
                               const std::vector<TransactionRecord>& transactions) const;

    /// Margin of one line item after resolution
    double ResolveMargin(const LineItem& line) const;

    /// Mean unit price and mean resolved margin over lines whose item is in
    /// `items`
    /// @return {0, 0} and false if no such line exists
    bool ConsequentEconomics(const ItemSet& items,
                             const std::vector<TransactionRecord>& transactions,
                             double& mean_price,
                             double& mean_margin) const;

    /// Mean margin_pct per category over lines carrying both fields
    static std::unordered_map<std::string, double> ObservedCategoryMargins(
        const std::vector<TransactionRecord>& transactions);

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

} // namespace profitlift
