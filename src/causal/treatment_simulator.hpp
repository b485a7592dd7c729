// File: src/causal/treatment_simulator.hpp
#pragma once

#include "causal/outcome_estimator.hpp"
#include "core/contextual_rule.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace profitlift {

/// Maps a basket to its numeric feature vector
using FeatureExtractor = std::function<FeatureVector(const TransactionRecord&)>;

/// BasketFeatureExtractor: Default per-basket features
///
///   {hour, day_of_week, weekend flag, store ordinal, basket size}
///
/// Store ordinals are the positions of store ids in the sorted list of
/// stores seen in the population; unknown stores map to -1.
class BasketFeatureExtractor {
public:
    explicit BasketFeatureExtractor(const std::vector<TransactionRecord>& population);

    FeatureVector operator()(const TransactionRecord& record) const;

    /// Number of features produced
    static constexpr size_t kDimension = 5;

private:
    std::map<std::string, double> store_ordinal_;
};

/// Control/treatment split of the baskets containing a rule's antecedent
struct SimulatedExperiment {
    std::vector<const TransactionRecord*> control;
    std::vector<const TransactionRecord*> treatment;

    /// 1 if the basket contains the full consequent
    std::vector<int> control_outcomes;
    std::vector<int> treatment_outcomes;

    /// Baskets containing the full antecedent (before the split)
    size_t selected{0};

    /// Seed used for the shuffle
    uint64_t seed{0};
};

/// TreatmentSimulator: Deterministic simulated A/B split for one rule
///
/// Baskets containing the full antecedent are shuffled with an mt19937_64
/// seeded from RuleSeed(signature, run seed) and cut into two equal halves.
/// With an odd count the last shuffled basket is left out.
class TreatmentSimulator {
public:
    struct Config {
        Config() = default;

        /// Run seed combined with each rule's signature
        uint64_t seed{42};
    };

    TreatmentSimulator();
    explicit TreatmentSimulator(const Config& config);

    /// Build the experiment for a rule
    /// @param transactions Must outlive the returned experiment
    SimulatedExperiment Simulate(const ContextualRule& rule,
                                 const std::vector<TransactionRecord>& transactions) const;

    /// Per-(rule, run) seed: FNV-1a hash of the signature XOR the run seed
    static uint64_t RuleSeed(const std::string& signature, uint64_t run_seed);

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

} // namespace profitlift
