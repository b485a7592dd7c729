// File: src/core/contextual_rule.hpp
#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace profitlift {

/// RuleKey: Identity of a rule, (antecedent, consequent, context)
struct RuleKey {
    ItemSet antecedent;
    ItemSet consequent;
    Context context;

    /// Canonical string form: "a,b=>c|store=*;time=morning;..."
    std::string Signature() const;

    bool operator==(const RuleKey& other) const;
    bool operator!=(const RuleKey& other) const { return !(*this == other); }
    bool operator<(const RuleKey& other) const;

    struct Hash {
        size_t operator()(const RuleKey& key) const;
    };
};

/// ContextualRule: Association rule mined within one context
///
/// Invariants: antecedent and consequent are non-empty and disjoint,
/// support and confidence lie in [0,1], lift >= 0.
struct ContextualRule {
    ItemSet antecedent;
    ItemSet consequent;
    double support{0.0};
    double confidence{0.0};
    double lift{0.0};
    Context context;

    // Derived scores, filled by the scorers
    std::optional<double> profit_score;
    std::optional<double> diversity_score;
    std::optional<double> overall_score;

    RuleKey Key() const { return RuleKey{antecedent, consequent, context}; }
    std::string Signature() const { return Key().Signature(); }

    /// All items of the rule (antecedent ∪ consequent)
    ItemSet Items() const;

    /// Check the structural invariants listed above
    bool IsValid() const;

    /// Human-readable form, e.g. "bread + milk -> butter (context: Overall)"
    std::string ToString() const;
};

/// Merge duplicate rules by key, keeping the first-seen position.
/// Metric values of a later duplicate replace the earlier ones.
std::vector<ContextualRule> MergeDuplicateRules(std::vector<ContextualRule> rules);

/// Group rules by context, preserving rule order within each group
std::unordered_map<Context, std::vector<ContextualRule>, Context::Hash>
GroupByContext(const std::vector<ContextualRule>& rules);

// ============================================================================
// Uplift
// ============================================================================

/// Estimation lifecycle of one rule's uplift
enum class UpliftStatus : uint8_t {
    NOT_ESTIMATED = 0,
    ESTIMATING = 1,
    ESTIMATED = 2,
    INSUFFICIENT_DATA = 3,
};

const char* ToString(UpliftStatus status);

/// @throws std::invalid_argument for unknown names
UpliftStatus ParseUpliftStatus(const std::string& str);

/// UpliftResult: Causal estimate for one rule (one-to-one, keyed by signature)
struct UpliftResult {
    std::string rule_signature;
    UpliftStatus status{UpliftStatus::NOT_ESTIMATED};

    double incremental_attach_rate{0.0};
    double incremental_revenue{0.0};
    double incremental_margin{0.0};

    /// Empirical outcome means of the two groups, in [0,1]
    double control_rate{0.0};
    double treatment_rate{0.0};

    size_t control_size{0};
    size_t treatment_size{0};

    /// Bootstrap interval of (treatment_rate - control_rate)
    std::optional<std::pair<double, double>> confidence_interval;

    /// False when the incremental attach rate is below the configured
    /// threshold. Non-actionable results are still stored.
    bool actionable{false};

    size_t SampleSize() const { return control_size + treatment_size; }
};

} // namespace profitlift
