// File: src/score/diversity_scorer.cpp
#include "score/diversity_scorer.hpp"
#include <algorithm>
#include <map>
#include <unordered_map>

namespace profitlift {
namespace DiversityScorer {

namespace {

using ItemRuleCounts = std::unordered_map<ItemID, size_t>;

// Number of rules containing each item
ItemRuleCounts CountItems(const std::vector<const ContextualRule*>& rules) {
    ItemRuleCounts counts;
    for (const auto* rule : rules) {
        for (const auto& item : rule->Items()) {
            ++counts[item];
        }
    }
    return counts;
}

double Score(const ContextualRule& rule, const ItemRuleCounts& counts, size_t group_size) {
    if (group_size <= 1) {
        return 1.0;
    }

    const ItemSet items = rule.Items();
    if (items.empty()) {
        return 1.0;
    }

    const double others = static_cast<double>(group_size - 1);
    double frequency_sum = 0.0;
    for (const auto& item : items) {
        auto it = counts.find(item);
        size_t containing = (it == counts.end()) ? 0 : it->second;
        // The rule itself is one of the containing rules
        size_t other_rules = containing > 0 ? containing - 1 : 0;
        frequency_sum += static_cast<double>(other_rules) / others;
    }

    double diversity = 1.0 - frequency_sum / static_cast<double>(items.size());
    return std::clamp(diversity, 0.0, 1.0);
}

} // namespace

double CalculateDiversity(const ContextualRule& rule,
                          const std::vector<ContextualRule>& rules) {
    std::vector<const ContextualRule*> same_context;
    bool contains_self = false;
    for (const auto& other : rules) {
        if (other.context == rule.context) {
            same_context.push_back(&other);
            if (other.Key() == rule.Key()) {
                contains_self = true;
            }
        }
    }
    if (!contains_self) {
        same_context.push_back(&rule);
    }

    return Score(rule, CountItems(same_context), same_context.size());
}

std::vector<double> ScoreGroup(const std::vector<ContextualRule>& group) {
    std::vector<const ContextualRule*> pointers;
    pointers.reserve(group.size());
    for (const auto& rule : group) {
        pointers.push_back(&rule);
    }

    ItemRuleCounts counts = CountItems(pointers);

    std::vector<double> scores;
    scores.reserve(group.size());
    for (const auto& rule : group) {
        scores.push_back(Score(rule, counts, group.size()));
    }
    return scores;
}

std::vector<ContextDiversityStats> ComputeContextStats(const std::vector<ContextualRule>& rules) {
    std::map<Context, std::vector<ContextualRule>> groups;
    for (const auto& rule : rules) {
        groups[rule.context].push_back(rule);
    }

    std::vector<ContextDiversityStats> stats;
    stats.reserve(groups.size());
    for (const auto& [context, group] : groups) {
        ContextDiversityStats s;
        s.context = context;
        s.rules_count = group.size();

        std::vector<double> scores = ScoreGroup(group);
        if (!scores.empty()) {
            double sum = 0.0;
            for (double score : scores) {
                sum += score;
            }
            s.avg_diversity = sum / static_cast<double>(scores.size());
            s.min_diversity = *std::min_element(scores.begin(), scores.end());
            s.max_diversity = *std::max_element(scores.begin(), scores.end());
        }
        stats.push_back(std::move(s));
    }
    return stats;
}

} // namespace DiversityScorer
} // namespace profitlift
