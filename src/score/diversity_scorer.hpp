// File: src/score/diversity_scorer.hpp
#pragma once

#include "core/contextual_rule.hpp"
#include <vector>

namespace profitlift {

/// Diversity summary of one context's rule set
struct ContextDiversityStats {
    Context context;
    double avg_diversity{1.0};
    double min_diversity{1.0};
    double max_diversity{1.0};
    size_t rules_count{0};
};

/// DiversityScorer: Penalises items over-represented within a context
///
/// For a rule R in a context with N rules:
///
///   diversity(R) = 1 - mean over items i of R of
///                      |{other same-context rules containing i}| / (N - 1)
///
/// clamped to [0, 1]. Only rules of R's own context are considered, so the
/// same items recurring in other contexts are never penalised. A rule whose
/// items occur in no other same-context rule, or the only rule of its
/// context, scores 1.0.
namespace DiversityScorer {

    /// Diversity of one rule against a rule list (other contexts ignored)
    double CalculateDiversity(const ContextualRule& rule,
                              const std::vector<ContextualRule>& rules);

    /// Diversity of every rule of a single-context group, in group order.
    /// Equivalent to CalculateDiversity per rule, in linear passes.
    std::vector<double> ScoreGroup(const std::vector<ContextualRule>& group);

    /// Per-context diversity statistics, ordered by context
    std::vector<ContextDiversityStats> ComputeContextStats(const std::vector<ContextualRule>& rules);

} // namespace DiversityScorer

} // namespace profitlift
