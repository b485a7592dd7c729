// File: src/causal/causal_estimator.cpp
#include "causal/causal_estimator.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <cmath>
#include <memory>
#include <random>
#include <sstream>

namespace profitlift {

namespace {

TreatmentSimulator::Config SimulatorConfig(const CausalEstimator::Config& config) {
    TreatmentSimulator::Config c;
    c.seed = config.seed;
    return c;
}

double Mean(const std::vector<int>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = 0.0;
    for (int v : values) {
        sum += v;
    }
    return sum / static_cast<double>(values.size());
}

// Linear-interpolated percentile of sorted values, q in [0, 1]
double Percentile(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) {
        return 0.0;
    }
    double position = q * static_cast<double>(sorted.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(position));
    size_t upper = std::min(lower + 1, sorted.size() - 1);
    double fraction = position - static_cast<double>(lower);
    return sorted[lower] + (sorted[upper] - sorted[lower]) * fraction;
}

std::vector<FeatureVector> ExtractAll(const std::vector<const TransactionRecord*>& records,
                                      const FeatureExtractor& extractor) {
    std::vector<FeatureVector> features;
    features.reserve(records.size());
    for (const auto* record : records) {
        features.push_back(extractor(*record));
    }
    return features;
}

} // namespace

CausalEstimator::CausalEstimator()
    : CausalEstimator(Config()) {}

CausalEstimator::CausalEstimator(const Config& config)
    : CausalEstimator(config, MakeLogisticFactory(config.estimator)) {}

CausalEstimator::CausalEstimator(const Config& config, EstimatorFactory factory)
    : config_(config),
      factory_(std::move(factory)),
      simulator_(SimulatorConfig(config)),
      profit_calculator_(config.profit) {
    if (config_.min_group_size == 0) {
        throw ConfigurationError("uplift.min_group_size must be at least 1");
    }
    if (!factory_) {
        throw ConfigurationError("CausalEstimator requires an estimator factory");
    }
}

void CausalEstimator::SetFeatureExtractor(FeatureExtractor extractor) {
    extractor_ = std::move(extractor);
}

std::pair<double, double> CausalEstimator::BootstrapInterval(const std::vector<int>& control,
                                                             const std::vector<int>& treatment,
                                                             size_t samples,
                                                             uint64_t seed) {
    if (samples == 0 || control.empty() || treatment.empty()) {
        return {0.0, 0.0};
    }

    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<size_t> pick_control(0, control.size() - 1);
    std::uniform_int_distribution<size_t> pick_treatment(0, treatment.size() - 1);

    std::vector<double> differences;
    differences.reserve(samples);
    for (size_t b = 0; b < samples; ++b) {
        double control_sum = 0.0;
        for (size_t i = 0; i < control.size(); ++i) {
            control_sum += control[pick_control(rng)];
        }
        double treatment_sum = 0.0;
        for (size_t i = 0; i < treatment.size(); ++i) {
            treatment_sum += treatment[pick_treatment(rng)];
        }
        differences.push_back(treatment_sum / static_cast<double>(treatment.size()) -
                              control_sum / static_cast<double>(control.size()));
    }

    std::sort(differences.begin(), differences.end());
    return {Percentile(differences, 0.025), Percentile(differences, 0.975)};
}

UpliftResult CausalEstimator::Estimate(const ContextualRule& rule,
                                       const std::vector<TransactionRecord>& transactions) const {
    UpliftResult result;
    result.rule_signature = rule.Signature();
    result.status = UpliftStatus::ESTIMATING;

    auto& log = Logger::Instance();

    SimulatedExperiment experiment = simulator_.Simulate(rule, transactions);

    if (experiment.control.size() < config_.min_group_size ||
        experiment.treatment.size() < config_.min_group_size) {
        DataInsufficientError reason(
            result.rule_signature,
            "control=" + std::to_string(experiment.control.size()) +
            ", treatment=" + std::to_string(experiment.treatment.size()) +
            " (need " + std::to_string(config_.min_group_size) + " each)");
        log.Info("CausalEstimator", reason.what());

        result.status = UpliftStatus::INSUFFICIENT_DATA;
        result.control_size = experiment.control.size();
        result.treatment_size = experiment.treatment.size();
        return result;
    }

    FeatureExtractor extractor = extractor_;
    if (!extractor) {
        extractor = BasketFeatureExtractor(transactions);
    }

    std::vector<FeatureVector> control_features = ExtractAll(experiment.control, extractor);
    std::vector<FeatureVector> treatment_features = ExtractAll(experiment.treatment, extractor);

    // Two independent estimators, no shared parameters
    std::unique_ptr<OutcomeEstimator> control_model = factory_();
    std::unique_ptr<OutcomeEstimator> treatment_model = factory_();
    control_model->Fit(control_features, experiment.control_outcomes);
    treatment_model->Fit(treatment_features, experiment.treatment_outcomes);

    double uplift_sum = 0.0;
    size_t evaluated = 0;
    for (const auto* group : {&control_features, &treatment_features}) {
        for (const auto& x : *group) {
            uplift_sum += treatment_model->PredictProbability(x) - control_model->PredictProbability(x);
            ++evaluated;
        }
    }

    result.control_size = experiment.control.size();
    result.treatment_size = experiment.treatment.size();
    result.control_rate = Mean(experiment.control_outcomes);
    result.treatment_rate = Mean(experiment.treatment_outcomes);
    result.incremental_attach_rate = evaluated > 0 ? uplift_sum / static_cast<double>(evaluated) : 0.0;

    double mean_price = 0.0;
    double mean_margin = 0.0;
    if (!profit_calculator_.ConsequentEconomics(rule.consequent, transactions, mean_price, mean_margin)) {
        mean_margin = profit_calculator_.GetConfig().default_margin;
    }
    result.incremental_revenue = result.incremental_attach_rate * mean_price;
    result.incremental_margin = result.incremental_revenue * mean_margin;

    if (config_.bootstrap_samples > 0) {
        result.confidence_interval = BootstrapInterval(experiment.control_outcomes,
                                                       experiment.treatment_outcomes,
                                                       config_.bootstrap_samples,
                                                       experiment.seed);
    }

    result.actionable = result.incremental_attach_rate >= config_.min_incremental_lift;
    result.status = UpliftStatus::ESTIMATED;

    std::ostringstream oss;
    oss << "Uplift for " << rule.ToString() << ": " << result.incremental_attach_rate
        << (result.actionable ? "" : " (not actionable)");
    log.Debug("CausalEstimator", oss.str());

    return result;
}

} // namespace profitlift
