// File: src/causal/logistic_estimator.cpp
#include "causal/logistic_estimator.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace profitlift {

namespace {

double Sigmoid(double t) {
    if (t >= 0.0) {
        return 1.0 / (1.0 + std::exp(-t));
    }
    double e = std::exp(t);
    return e / (1.0 + e);
}

} // namespace

LogisticEstimator::LogisticEstimator()
    : LogisticEstimator(Config()) {}

LogisticEstimator::LogisticEstimator(const Config& config)
    : config_(config) {
    if (config_.l2_penalty < 0.0) {
        throw std::invalid_argument("LogisticEstimator: l2_penalty must be non-negative");
    }
    if (config_.max_iterations <= 0) {
        throw std::invalid_argument("LogisticEstimator: max_iterations must be positive");
    }
}

std::vector<double> LogisticEstimator::DesignRow(const FeatureVector& x) const {
    std::vector<double> row(mean_.size() + 1);
    row[0] = 1.0;
    for (size_t j = 0; j < mean_.size(); ++j) {
        row[j + 1] = (x[j] - mean_[j]) / scale_[j];
    }
    return row;
}

void LogisticEstimator::Fit(const std::vector<FeatureVector>& features,
                            const std::vector<int>& outcomes) {
    if (features.empty()) {
        throw std::invalid_argument("LogisticEstimator: no training samples");
    }
    if (features.size() != outcomes.size()) {
        throw std::invalid_argument("LogisticEstimator: features and outcomes differ in length");
    }

    const size_t n = features.size();
    const size_t d = features.front().size();
    for (const auto& row : features) {
        if (row.size() != d) {
            throw std::invalid_argument("LogisticEstimator: inconsistent feature dimension");
        }
        for (double v : row) {
            if (!std::isfinite(v)) {
                throw std::invalid_argument("LogisticEstimator: feature matrix is not finite");
            }
        }
    }

    fitted_ = false;
    constant_.reset();
    iterations_ = 0;

    // Standardisation parameters; constant columns keep scale 1
    mean_.assign(d, 0.0);
    scale_.assign(d, 1.0);
    for (const auto& row : features) {
        for (size_t j = 0; j < d; ++j) {
            mean_[j] += row[j];
        }
    }
    for (size_t j = 0; j < d; ++j) {
        mean_[j] /= static_cast<double>(n);
    }
    for (size_t j = 0; j < d; ++j) {
        double var = 0.0;
        for (const auto& row : features) {
            double diff = row[j] - mean_[j];
            var += diff * diff;
        }
        double sd = std::sqrt(var / static_cast<double>(n));
        scale_[j] = sd > 1e-12 ? sd : 1.0;
    }

    size_t positives = 0;
    for (int y : outcomes) {
        if (y != 0 && y != 1) {
            throw std::invalid_argument("LogisticEstimator: outcomes must be 0 or 1");
        }
        positives += static_cast<size_t>(y);
    }

    coef_.assign(d + 1, 0.0);
    if (positives == 0 || positives == n) {
        constant_ = positives == 0 ? 0.0 : 1.0;
        fitted_ = true;
        return;
    }

    const Eigen::Index p = static_cast<Eigen::Index>(d + 1);
    Eigen::MatrixXd design(static_cast<Eigen::Index>(n), p);
    Eigen::VectorXd y(static_cast<Eigen::Index>(n));
    for (size_t i = 0; i < n; ++i) {
        std::vector<double> row = DesignRow(features[i]);
        for (Eigen::Index k = 0; k < p; ++k) {
            design(static_cast<Eigen::Index>(i), k) = row[static_cast<size_t>(k)];
        }
        y(static_cast<Eigen::Index>(i)) = static_cast<double>(outcomes[i]);
    }

    // Intercept is not penalised
    Eigen::VectorXd penalty = Eigen::VectorXd::Constant(p, config_.l2_penalty);
    penalty(0) = 0.0;

    Eigen::VectorXd coef = Eigen::VectorXd::Zero(p);
    Eigen::VectorXd a(static_cast<Eigen::Index>(n));
    Eigen::VectorXd az(static_cast<Eigen::Index>(n));
    Eigen::MatrixXd xtax(p, p);
    Eigen::VectorXd xtaz(p);

    for (int iter = 0; iter < config_.max_iterations; ++iter) {
        Eigen::VectorXd xc = design * coef;
        for (Eigen::Index i = 0; i < xc.size(); ++i) {
            double prob = Sigmoid(xc(i));
            a(i) = std::max(prob * (1.0 - prob), 1e-10);
            // a * z computed directly to avoid dividing by a small a
            az(i) = a(i) * xc(i) + (y(i) - prob);
        }

        xtax.noalias() = design.transpose() * a.asDiagonal() * design;
        xtax.diagonal() += penalty;
        xtaz.noalias() = design.transpose() * az;

        Eigen::LDLT<Eigen::MatrixXd> ldlt(xtax);
        if (ldlt.info() != Eigen::Success || !ldlt.isPositive()) {
            throw std::runtime_error("Logistic regression: singular Newton system");
        }
        Eigen::VectorXd next = ldlt.solve(xtaz);
        if (!next.allFinite()) {
            throw std::runtime_error("Logistic regression: overflow in Newton step");
        }

        double max_step = (next - coef).cwiseAbs().maxCoeff();
        coef = next;
        iterations_ = iter + 1;

        if (max_step < config_.tolerance) {
            break;
        }
    }

    coef_.assign(coef.data(), coef.data() + coef.size());
    fitted_ = true;
}

double LogisticEstimator::PredictProbability(const FeatureVector& x) const {
    if (!fitted_) {
        throw std::runtime_error("LogisticEstimator: PredictProbability called before Fit");
    }
    if (constant_) {
        return *constant_;
    }
    if (x.size() != mean_.size()) {
        throw std::invalid_argument("LogisticEstimator: feature dimension mismatch");
    }

    std::vector<double> row = DesignRow(x);
    double xc = 0.0;
    for (size_t k = 0; k < row.size(); ++k) {
        xc += row[k] * coef_[k];
    }
    return Sigmoid(xc);
}

EstimatorFactory MakeLogisticFactory(const LogisticEstimator::Config& config) {
    return [config]() -> std::unique_ptr<OutcomeEstimator> {
        return std::make_unique<LogisticEstimator>(config);
    };
}

} // namespace profitlift
