// File: src/causal/what_if_simulator.cpp
#include "causal/what_if_simulator.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace profitlift {

WhatIfSimulator::WhatIfSimulator(const CausalEstimator::Config& config)
    : estimator_(config) {}

WhatIfResult WhatIfSimulator::Simulate(const WhatIfScenario& scenario,
                                       const std::vector<TransactionRecord>& transactions) const {
    if (scenario.antecedent.empty() || scenario.consequent.empty()) {
        throw std::invalid_argument("What-if scenario needs non-empty antecedent and consequent");
    }
    if (Intersects(scenario.antecedent, scenario.consequent)) {
        throw std::invalid_argument("What-if antecedent and consequent must be disjoint");
    }
    if (!(scenario.discount >= 0.0 && scenario.discount < 1.0)) {
        throw std::invalid_argument("What-if discount must be in [0, 1)");
    }

    std::vector<TransactionRecord> in_context;
    for (const auto& record : transactions) {
        if (scenario.context.Matches(record)) {
            in_context.push_back(record);
        }
    }

    ContextualRule rule;
    rule.antecedent = scenario.antecedent;
    rule.consequent = scenario.consequent;
    rule.context = scenario.context;

    WhatIfResult result;
    result.context_transactions = in_context.size();
    result.uplift = estimator_.Estimate(rule, in_context);

    const double keep = 1.0 - scenario.discount;
    result.discounted_revenue = result.uplift.incremental_revenue * keep;
    result.discounted_margin = result.uplift.incremental_margin * keep;
    result.projected_attach_rate = std::clamp(
        std::max(result.uplift.treatment_rate,
                 result.uplift.control_rate + result.uplift.incremental_attach_rate),
        0.0, 1.0);

    if (scenario.expected_traffic) {
        result.total_margin = result.discounted_margin * *scenario.expected_traffic;
    }

    Logger::Instance().Debug("WhatIfSimulator",
                             rule.ToString() + " over " + std::to_string(in_context.size()) +
                             " transactions");
    return result;
}

} // namespace profitlift
