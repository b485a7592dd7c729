// File: src/storage/memory_rule_store.cpp
#include "storage/memory_rule_store.hpp"
#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace profitlift {

// ============================================================================
// Rules
// ============================================================================

void MemoryRuleStore::ReplaceContextRules(const Context& context,
                                          const std::vector<ContextualRule>& rules) {
    for (const auto& rule : rules) {
        if (rule.context != context) {
            throw std::invalid_argument("Rule " + rule.Signature() +
                                        " does not belong to context " + context.ToString());
        }
    }

    std::vector<ContextualRule> merged = MergeDuplicateRules(rules);
    std::sort(merged.begin(), merged.end(), RankedBefore);

    // Exclusive lock for writing
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (merged.empty()) {
        rules_.erase(context);
    } else {
        rules_[context] = std::move(merged);
    }
    replace_count_.fetch_add(1, std::memory_order_relaxed);
}

std::vector<ContextualRule> MemoryRuleStore::QueryRules(const RuleQuery& query) const {
    std::vector<ContextualRule> result;
    {
        // Shared lock for reading
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [context, rules] : rules_) {
            for (const auto& rule : rules) {
                if (MatchesQuery(rule, query)) {
                    result.push_back(rule);
                }
            }
        }
    }

    std::sort(result.begin(), result.end(), RankedBefore);
    if (query.limit > 0 && result.size() > query.limit) {
        result.resize(query.limit);
    }
    return result;
}

std::vector<ContextualRule> MemoryRuleStore::GetContextRules(const Context& context) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = rules_.find(context);
    if (it == rules_.end()) {
        return {};
    }
    return it->second;
}

std::vector<Context> MemoryRuleStore::ListContexts() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Context> contexts;
    contexts.reserve(rules_.size());
    for (const auto& entry : rules_) {
        contexts.push_back(entry.first);
    }
    return contexts;
}

size_t MemoryRuleStore::RuleCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& entry : rules_) {
        count += entry.second.size();
    }
    return count;
}

// ============================================================================
// Uplift
// ============================================================================

void MemoryRuleStore::StoreUplift(const UpliftResult& result) {
    if (result.rule_signature.empty()) {
        throw std::invalid_argument("UpliftResult has an empty rule signature");
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    uplifts_[result.rule_signature] = result;
}

std::optional<UpliftResult> MemoryRuleStore::GetUplift(const std::string& rule_signature) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = uplifts_.find(rule_signature);
    if (it == uplifts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<UpliftResult> MemoryRuleStore::ListUplifts() const {
    std::vector<UpliftResult> results;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        results.reserve(uplifts_.size());
        for (const auto& entry : uplifts_) {
            results.push_back(entry.second);
        }
    }
    std::sort(results.begin(), results.end(),
              [](const UpliftResult& a, const UpliftResult& b) {
                  return a.rule_signature < b.rule_signature;
              });
    return results;
}

size_t MemoryRuleStore::UpliftCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return uplifts_.size();
}

// ============================================================================
// Maintenance
// ============================================================================

RuleStoreStats MemoryRuleStore::GetStats() const {
    RuleStoreStats stats;
    stats.total_rules = RuleCount();

    std::shared_lock<std::shared_mutex> lock(mutex_);
    stats.total_uplifts = uplifts_.size();
    stats.context_count = rules_.size();
    return stats;
}

void MemoryRuleStore::Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    rules_.clear();
    uplifts_.clear();
    replace_count_.store(0, std::memory_order_relaxed);
}

} // namespace profitlift
