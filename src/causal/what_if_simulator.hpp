// File: src/causal/what_if_simulator.hpp
#pragma once

#include "causal/causal_estimator.hpp"
#include <optional>
#include <vector>

namespace profitlift {

/// Hypothetical bundle offer to evaluate
struct WhatIfScenario {
    ItemSet antecedent;
    ItemSet consequent;
    Context context;

    /// Fractional discount on the consequent, in [0, 1)
    double discount{0.0};

    /// Baskets expected to see the offer; enables total_margin
    std::optional<double> expected_traffic;
};

/// Projection of a scenario
struct WhatIfResult {
    UpliftResult uplift;

    /// Transactions matching the scenario's context
    size_t context_transactions{0};

    double discounted_revenue{0.0};
    double discounted_margin{0.0};

    /// max(treatment_rate, control_rate + incremental_attach_rate), in [0, 1]
    double projected_attach_rate{0.0};

    /// discounted_margin * expected_traffic
    std::optional<double> total_margin;
};

/// WhatIfSimulator: Uplift projection for an arbitrary bundle
///
/// Estimates the uplift of (antecedent -> consequent) on the transactions
/// of the scenario's context and applies the discount to the incremental
/// revenue and margin.
class WhatIfSimulator {
public:
    explicit WhatIfSimulator(const CausalEstimator::Config& config);

    /// @throws std::invalid_argument on an empty or overlapping item set or
    ///         a discount outside [0, 1)
    WhatIfResult Simulate(const WhatIfScenario& scenario,
                          const std::vector<TransactionRecord>& transactions) const;

private:
    CausalEstimator estimator_;
};

} // namespace profitlift
