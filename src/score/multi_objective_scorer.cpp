// File: src/score/multi_objective_scorer.cpp
#include "score/multi_objective_scorer.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "score/diversity_scorer.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <sstream>
#include <string>
#include <utility>

namespace profitlift {

// ============================================================================
// ScoringWeights
// ============================================================================

void ScoringWeights::Validate() const {
    const std::pair<const char*, double> entries[] = {
        {"lift", lift}, {"profit", profit}, {"diversity", diversity}, {"confidence", confidence}};
    for (const auto& [name, value] : entries) {
        if (!(value >= 0.0)) {
            throw ConfigurationError(std::string("scoring weight '") + name +
                                     "' must be non-negative (got " + std::to_string(value) + ")");
        }
    }

    if (std::fabs(Sum() - 1.0) > kWeightTolerance) {
        std::ostringstream oss;
        oss << "scoring weights must sum to 1.0 (got " << Sum() << ")";
        throw ConfigurationError(oss.str());
    }
}

// ============================================================================
// MultiObjectiveScorer
// ============================================================================

MultiObjectiveScorer::MultiObjectiveScorer()
    : MultiObjectiveScorer(ScoringWeights()) {}

MultiObjectiveScorer::MultiObjectiveScorer(const ScoringWeights& weights,
                                           const ProfitCalculator::Config& profit_config)
    : weights_(weights),
      profit_calculator_(profit_config) {
    weights_.Validate();
}

double MultiObjectiveScorer::Normalize(double value, double min_value, double max_value) {
    double range = max_value - min_value;
    if (range < kNormalizationEpsilon) {
        range = kNormalizationEpsilon;
    }
    return (value - min_value) / range;
}

void MultiObjectiveScorer::ScoreContext(std::vector<ContextualRule>& rules,
                                        const std::vector<TransactionRecord>& transactions) const {
    if (rules.empty()) {
        return;
    }

    for (auto& rule : rules) {
        rule.profit_score = profit_calculator_.CalculateRuleProfit(rule, transactions);
    }

    std::vector<double> diversity = DiversityScorer::ScoreGroup(rules);
    for (size_t i = 0; i < rules.size(); ++i) {
        rules[i].diversity_score = diversity[i];
    }

    double lift_min = rules.front().lift;
    double lift_max = lift_min;
    double profit_min = *rules.front().profit_score;
    double profit_max = profit_min;
    for (const auto& rule : rules) {
        lift_min = std::min(lift_min, rule.lift);
        lift_max = std::max(lift_max, rule.lift);
        profit_min = std::min(profit_min, *rule.profit_score);
        profit_max = std::max(profit_max, *rule.profit_score);
    }

    for (auto& rule : rules) {
        double norm_lift = Normalize(rule.lift, lift_min, lift_max);
        double norm_profit = Normalize(*rule.profit_score, profit_min, profit_max);

        rule.overall_score = weights_.lift * norm_lift +
                             weights_.profit * norm_profit +
                             weights_.diversity * *rule.diversity_score +
                             weights_.confidence * rule.confidence;
    }
}

std::vector<ContextualRule> MultiObjectiveScorer::ScoreRules(
    std::vector<ContextualRule> rules,
    const std::vector<TransactionRecord>& transactions) const {

    std::map<Context, std::vector<ContextualRule>> groups;
    for (auto& rule : rules) {
        groups[rule.context].push_back(std::move(rule));
    }

    Logger::Instance().Debug("MultiObjectiveScorer",
                             "Scoring rules across " + std::to_string(groups.size()) + " contexts");

    std::vector<ContextualRule> scored;
    for (auto& [context, group] : groups) {
        std::vector<TransactionRecord> matching;
        for (const auto& record : transactions) {
            if (context.Matches(record)) {
                matching.push_back(record);
            }
        }
        ScoreContext(group, matching);
        for (auto& rule : group) {
            scored.push_back(std::move(rule));
        }
    }

    RankGlobally(scored);
    return scored;
}

void MultiObjectiveScorer::RankGlobally(std::vector<ContextualRule>& rules) {
    // Precomputed signatures for the tie-break
    std::vector<std::pair<std::string, size_t>> keys;
    keys.reserve(rules.size());
    for (size_t i = 0; i < rules.size(); ++i) {
        keys.emplace_back(rules[i].Signature(), i);
    }

    std::sort(keys.begin(), keys.end(), [&rules](const auto& a, const auto& b) {
        double score_a = rules[a.second].overall_score.value_or(0.0);
        double score_b = rules[b.second].overall_score.value_or(0.0);
        if (score_a != score_b) {
            return score_a > score_b;
        }
        return a.first < b.first;
    });

    std::vector<ContextualRule> ranked;
    ranked.reserve(rules.size());
    for (const auto& key : keys) {
        ranked.push_back(std::move(rules[key.second]));
    }
    rules = std::move(ranked);
}

} // namespace profitlift
