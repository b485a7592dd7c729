// File: src/score/multi_objective_scorer.hpp
#pragma once

#include "core/contextual_rule.hpp"
#include "score/profit_calculator.hpp"
#include <vector>

namespace profitlift {

/// Weights of the four scoring objectives. Must be non-negative and sum
/// to 1 within kWeightTolerance.
struct ScoringWeights {
    double lift{0.30};
    double profit{0.40};
    double diversity{0.15};
    double confidence{0.15};

    double Sum() const { return lift + profit + diversity + confidence; }

    /// @throws ConfigurationError on a negative weight or a bad sum
    void Validate() const;
};

/// Allowed deviation of ScoringWeights::Sum() from 1
constexpr double kWeightTolerance = 0.001;

/// Denominator substituted when a context's lift or profit range is zero
constexpr double kNormalizationEpsilon = 1e-9;

/// MultiObjectiveScorer: Profit-aware scoring of a context's rules
///
///   overall = w_lift * norm(lift) + w_profit * norm(profit)
///           + w_diversity * diversity + w_confidence * confidence
///
/// norm() is min-max normalisation within the rule's own context group.
/// Scores are therefore relative to same-context peers even though
/// RankGlobally() orders rules of every context in one list.
class MultiObjectiveScorer {
public:
    MultiObjectiveScorer();

    /// @throws ConfigurationError if the weights are invalid
    explicit MultiObjectiveScorer(const ScoringWeights& weights,
                                  const ProfitCalculator::Config& profit_config = {});

    /// Score the rules of one context in place
    /// @param rules Rules sharing a single context
    /// @param transactions Source transactions of that context
    void ScoreContext(std::vector<ContextualRule>& rules,
                      const std::vector<TransactionRecord>& transactions) const;

    /// Score rules of any number of contexts. Each group is scored against
    /// the transactions matching its context.
    /// @return Scored rules in global rank order
    std::vector<ContextualRule> ScoreRules(std::vector<ContextualRule> rules,
                                           const std::vector<TransactionRecord>& transactions) const;

    /// Sort by overall_score descending, ties broken by signature
    static void RankGlobally(std::vector<ContextualRule>& rules);

    /// Min-max normalise `value` into [0, 1] given the group's range
    static double Normalize(double value, double min_value, double max_value);

    const ScoringWeights& GetWeights() const { return weights_; }

private:
    ScoringWeights weights_;
    ProfitCalculator profit_calculator_;
};

} // namespace profitlift
