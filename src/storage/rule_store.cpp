// File: src/storage/rule_store.cpp
#include "storage/rule_store.hpp"

namespace profitlift {

bool MatchesQuery(const ContextualRule& rule, const RuleQuery& query) {
    if (query.store_id && rule.context.store_id != query.store_id) {
        return false;
    }
    if (query.time_bin && rule.context.time_bin != query.time_bin) {
        return false;
    }
    if (query.min_score && (!rule.overall_score || *rule.overall_score < *query.min_score)) {
        return false;
    }
    return true;
}

bool RankedBefore(const ContextualRule& a, const ContextualRule& b) {
    if (a.overall_score.has_value() != b.overall_score.has_value()) {
        return a.overall_score.has_value();
    }
    if (a.overall_score && *a.overall_score != *b.overall_score) {
        return *a.overall_score > *b.overall_score;
    }
    return a.Signature() < b.Signature();
}

} // namespace profitlift
