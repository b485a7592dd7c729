// File: src/causal/causal_estimator.hpp
#pragma once

#include "causal/logistic_estimator.hpp"
#include "causal/outcome_estimator.hpp"
#include "causal/treatment_simulator.hpp"
#include "core/contextual_rule.hpp"
#include "score/profit_calculator.hpp"
#include <cstdint>
#include <utility>
#include <vector>

namespace profitlift {

/// CausalEstimator: T-Learner uplift estimation for one rule at a time
///
/// Steps:
///   1. Select baskets containing the full antecedent
///   2. Split them into control / treatment (TreatmentSimulator)
///   3. Outcome = basket contains the full consequent
///   4. Extract features per basket
///   5. Fit one estimator per group, each from a fresh factory instance
///   6. uplift(x) = treatment.P(x) - control.P(x), averaged over every
///      selected basket
///
/// Groups smaller than min_group_size yield INSUFFICIENT_DATA with all
/// numbers zero and no estimator trained. Results below
/// min_incremental_lift are returned with actionable = false.
///
/// Thread-safety: Estimate() is const; estimators are created per call.
class CausalEstimator {
public:
    struct Config {
        Config() = default;

        /// Minimum baskets in each of control and treatment
        size_t min_group_size{20};

        /// Attach-rate uplift required for actionable = true
        double min_incremental_lift{0.05};

        /// Run seed
        uint64_t seed{42};

        /// Bootstrap resamples for the confidence interval (0 disables it)
        size_t bootstrap_samples{20};

        /// Estimator used when no factory is supplied
        LogisticEstimator::Config estimator;

        /// Margin resolution for incremental margin
        ProfitCalculator::Config profit;
    };

    CausalEstimator();
    explicit CausalEstimator(const Config& config);

    /// Use a custom estimator for both groups
    CausalEstimator(const Config& config, EstimatorFactory factory);

    /// Use a custom feature extractor instead of BasketFeatureExtractor
    void SetFeatureExtractor(FeatureExtractor extractor);

    /// Estimate the uplift of a rule
    /// @param transactions Transactions of the rule's context
    UpliftResult Estimate(const ContextualRule& rule,
                          const std::vector<TransactionRecord>& transactions) const;

    /// Bootstrap percentile interval of mean(treatment) - mean(control)
    /// @return {2.5th, 97.5th} percentiles over `samples` resamples
    static std::pair<double, double> BootstrapInterval(const std::vector<int>& control,
                                                       const std::vector<int>& treatment,
                                                       size_t samples,
                                                       uint64_t seed);

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    EstimatorFactory factory_;
    FeatureExtractor extractor_;
    TreatmentSimulator simulator_;
    ProfitCalculator profit_calculator_;
};

} // namespace profitlift
