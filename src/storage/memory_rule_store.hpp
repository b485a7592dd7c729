// File: src/storage/memory_rule_store.hpp
#pragma once

#include "storage/rule_store.hpp"
#include <atomic>
#include <map>
#include <shared_mutex>
#include <unordered_map>

namespace profitlift {

/// In-memory rule and uplift storage
///
/// Rules are held per context in an ordered map; uplift results in a hash
/// map keyed by signature. Thread-safe with shared_mutex (multiple readers,
/// single writer). Nothing survives the process.
class MemoryRuleStore : public RuleStore {
public:
    MemoryRuleStore() = default;
    ~MemoryRuleStore() override = default;

    // ========================================================================
    // RuleStore Interface Implementation
    // ========================================================================

    void ReplaceContextRules(const Context& context,
                             const std::vector<ContextualRule>& rules) override;
    std::vector<ContextualRule> QueryRules(const RuleQuery& query) const override;
    std::vector<ContextualRule> GetContextRules(const Context& context) const override;
    std::vector<Context> ListContexts() const override;
    size_t RuleCount() const override;

    void StoreUplift(const UpliftResult& result) override;
    std::optional<UpliftResult> GetUplift(const std::string& rule_signature) const override;
    std::vector<UpliftResult> ListUplifts() const override;
    size_t UpliftCount() const override;

    RuleStoreStats GetStats() const override;
    void Flush() override {}
    void Clear() override;

    /// Number of ReplaceContextRules calls served
    uint64_t GetReplaceCount() const { return replace_count_.load(std::memory_order_relaxed); }

private:
    mutable std::shared_mutex mutex_;

    std::map<Context, std::vector<ContextualRule>> rules_;
    std::unordered_map<std::string, UpliftResult> uplifts_;

    std::atomic<uint64_t> replace_count_{0};
};

} // namespace profitlift
