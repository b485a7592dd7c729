// File: src/causal/outcome_estimator.hpp
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace profitlift {

/// Numeric feature vector of one basket
using FeatureVector = std::vector<double>;

/// Abstract binary outcome-probability estimator
///
/// The uplift T-Learner fits one instance on the control group and a second,
/// independently constructed instance on the treatment group. Any calibrated
/// binary classifier can implement this interface.
class OutcomeEstimator {
public:
    virtual ~OutcomeEstimator() = default;

    /// Fit on (features, outcome) pairs
    /// @param features One vector per sample, all of the same dimension
    /// @param outcomes 0 or 1 per sample
    /// @throws std::invalid_argument on empty or inconsistent input
    virtual void Fit(const std::vector<FeatureVector>& features,
                     const std::vector<int>& outcomes) = 0;

    /// P(outcome = 1 | x)
    /// @throws std::runtime_error if called before Fit()
    virtual double PredictProbability(const FeatureVector& x) const = 0;

    virtual bool IsFitted() const = 0;

    virtual std::string Name() const = 0;
};

/// Creates a fresh, unfitted estimator
using EstimatorFactory = std::function<std::unique_ptr<OutcomeEstimator>()>;

} // namespace profitlift
