// File: src/causal/logistic_estimator.hpp
#pragma once

#include "causal/outcome_estimator.hpp"
#include <optional>

namespace profitlift {

/// LogisticEstimator: L2-regularised logistic regression
///
/// Features are standardised to zero mean and unit variance before fitting.
/// Coefficients are found by iteratively-reweighted least squares (Newton's
/// method): each step solves
///
///   (X^T A X + lambda * I') c = X^T A z
///
/// where A = diag(p_i (1 - p_i)), z is the working response and I' is the
/// identity without the intercept entry (the intercept is not penalised).
///
/// If every training outcome is identical the model degenerates to that
/// constant probability.
class LogisticEstimator : public OutcomeEstimator {
public:
    struct Config {
        Config() = default;

        /// L2 penalty on the standardised slope coefficients
        double l2_penalty{1.0};

        /// Newton iteration cap
        int max_iterations{50};

        /// Stop when no coefficient moves by more than this
        double tolerance{1e-8};
    };

    LogisticEstimator();
    explicit LogisticEstimator(const Config& config);

    void Fit(const std::vector<FeatureVector>& features,
             const std::vector<int>& outcomes) override;

    double PredictProbability(const FeatureVector& x) const override;

    bool IsFitted() const override { return fitted_; }

    std::string Name() const override { return "logistic-irls"; }

    /// Coefficients on standardised features, intercept first
    const std::vector<double>& GetCoefficients() const { return coef_; }

    /// Newton steps taken by the last Fit()
    int GetIterations() const { return iterations_; }

private:
    Config config_;
    bool fitted_{false};
    int iterations_{0};

    std::vector<double> mean_;
    std::vector<double> scale_;
    std::vector<double> coef_;

    /// Set when training outcomes were all identical
    std::optional<double> constant_;

    /// Standardised design row with a leading 1 for the intercept
    std::vector<double> DesignRow(const FeatureVector& x) const;
};

/// Factory producing LogisticEstimators with the given configuration
EstimatorFactory MakeLogisticFactory(const LogisticEstimator::Config& config);

} // namespace profitlift
