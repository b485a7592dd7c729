// File: src/storage/rule_store.hpp
#pragma once

#include "core/contextual_rule.hpp"
#include <optional>
#include <string>
#include <vector>

namespace profitlift {

/// Filter for rule queries
struct RuleQuery {
    /// Only rules whose context is constrained to this store
    std::optional<std::string> store_id;

    /// Only rules whose context is constrained to this time bin
    std::optional<std::string> time_bin;

    /// Only rules with overall_score >= min_score
    std::optional<double> min_score;

    /// Maximum number of results (0 = unlimited)
    size_t limit{100};
};

/// True if a rule passes every filter of the query (limit not applied)
bool MatchesQuery(const ContextualRule& rule, const RuleQuery& query);

/// Query result order: overall_score descending (unscored last), then
/// signature ascending
bool RankedBefore(const ContextualRule& a, const ContextualRule& b);

/// Store statistics for monitoring
struct RuleStoreStats {
    size_t total_rules{0};
    size_t total_uplifts{0};
    size_t context_count{0};

    /// On-disk size in bytes (persistent backends only)
    size_t disk_usage_bytes{0};
};

/// Abstract interface for rule and uplift storage backends
///
/// Rules are owned per context: each mining run replaces the full rule set
/// of a context. Uplift results are keyed by rule signature and outlive
/// rule replacement.
///
/// Thread Safety: All methods must be thread-safe.
/// Errors: Storage failures throw PersistenceError.
class RuleStore {
public:
    virtual ~RuleStore() = default;

    // ========================================================================
    // Rules
    // ========================================================================

    /// Atomically replace every rule of `context` with `rules`.
    /// Rules of other contexts are untouched. Duplicate keys in `rules`
    /// are merged, later values winning.
    /// @throws std::invalid_argument if a rule belongs to another context
    virtual void ReplaceContextRules(const Context& context,
                                     const std::vector<ContextualRule>& rules) = 0;

    /// Rules matching the query, in RankedBefore order
    virtual std::vector<ContextualRule> QueryRules(const RuleQuery& query) const = 0;

    /// Every rule of one context, in RankedBefore order
    virtual std::vector<ContextualRule> GetContextRules(const Context& context) const = 0;

    /// Contexts that currently hold rules, in Context order
    virtual std::vector<Context> ListContexts() const = 0;

    virtual size_t RuleCount() const = 0;

    // ========================================================================
    // Uplift
    // ========================================================================

    /// Insert or replace the result for result.rule_signature
    virtual void StoreUplift(const UpliftResult& result) = 0;

    virtual std::optional<UpliftResult> GetUplift(const std::string& rule_signature) const = 0;

    /// All stored results ordered by signature
    virtual std::vector<UpliftResult> ListUplifts() const = 0;

    virtual size_t UpliftCount() const = 0;

    // ========================================================================
    // Maintenance
    // ========================================================================

    virtual RuleStoreStats GetStats() const = 0;

    /// Make pending writes durable
    virtual void Flush() = 0;

    /// Remove all rules and uplift results
    virtual void Clear() = 0;
};

} // namespace profitlift
