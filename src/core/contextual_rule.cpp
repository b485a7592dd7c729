// File: src/core/contextual_rule.cpp
#include "core/contextual_rule.hpp"
#include <sstream>
#include <stdexcept>
#include <tuple>

namespace profitlift {

// ============================================================================
// RuleKey
// ============================================================================

std::string RuleKey::Signature() const {
    return JoinItems(antecedent) + "=>" + JoinItems(consequent) + "|" + context.Canonical();
}

bool RuleKey::operator==(const RuleKey& other) const {
    return antecedent == other.antecedent &&
           consequent == other.consequent &&
           context == other.context;
}

bool RuleKey::operator<(const RuleKey& other) const {
    return std::tie(antecedent, consequent, context) <
           std::tie(other.antecedent, other.consequent, other.context);
}

size_t RuleKey::Hash::operator()(const RuleKey& key) const {
    size_t seed = ItemSetHash()(key.antecedent);
    HashCombine(seed, ItemSetHash()(key.consequent));
    HashCombine(seed, Context::Hash()(key.context));
    return seed;
}

// ============================================================================
// ContextualRule
// ============================================================================

ItemSet ContextualRule::Items() const {
    ItemSet items = antecedent;
    items.insert(consequent.begin(), consequent.end());
    return items;
}

bool ContextualRule::IsValid() const {
    if (antecedent.empty() || consequent.empty()) {
        return false;
    }
    if (Intersects(antecedent, consequent)) {
        return false;
    }
    if (support < 0.0 || support > 1.0) {
        return false;
    }
    if (confidence < 0.0 || confidence > 1.0) {
        return false;
    }
    return lift >= 0.0;
}

std::string ContextualRule::ToString() const {
    std::ostringstream oss;
    oss << JoinItems(antecedent, " + ") << " -> " << JoinItems(consequent, " + ")
        << " (context: " << context.ToString() << ")";
    return oss.str();
}

std::vector<ContextualRule> MergeDuplicateRules(std::vector<ContextualRule> rules) {
    std::vector<ContextualRule> merged;
    merged.reserve(rules.size());
    std::unordered_map<RuleKey, size_t, RuleKey::Hash> index;

    for (auto& rule : rules) {
        RuleKey key = rule.Key();
        auto it = index.find(key);
        if (it == index.end()) {
            index.emplace(std::move(key), merged.size());
            merged.push_back(std::move(rule));
        } else {
            merged[it->second] = std::move(rule);
        }
    }

    return merged;
}

std::unordered_map<Context, std::vector<ContextualRule>, Context::Hash>
GroupByContext(const std::vector<ContextualRule>& rules) {
    std::unordered_map<Context, std::vector<ContextualRule>, Context::Hash> groups;
    for (const auto& rule : rules) {
        groups[rule.context].push_back(rule);
    }
    return groups;
}

// ============================================================================
// UpliftStatus
// ============================================================================

const char* ToString(UpliftStatus status) {
    switch (status) {
        case UpliftStatus::NOT_ESTIMATED: return "not_estimated";
        case UpliftStatus::ESTIMATING: return "estimating";
        case UpliftStatus::ESTIMATED: return "estimated";
        case UpliftStatus::INSUFFICIENT_DATA: return "insufficient_data";
        default: return "unknown";
    }
}

UpliftStatus ParseUpliftStatus(const std::string& str) {
    if (str == "not_estimated") return UpliftStatus::NOT_ESTIMATED;
    if (str == "estimating") return UpliftStatus::ESTIMATING;
    if (str == "estimated") return UpliftStatus::ESTIMATED;
    if (str == "insufficient_data") return UpliftStatus::INSUFFICIENT_DATA;
    throw std::invalid_argument("Unknown UpliftStatus: " + str);
}

} // namespace profitlift
