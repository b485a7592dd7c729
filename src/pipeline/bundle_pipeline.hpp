// File: src/pipeline/bundle_pipeline.hpp
#pragma once

#include "causal/outcome_estimator.hpp"
#include "config/pipeline_config.hpp"
#include "core/contextual_rule.hpp"
#include "mining/context_aware_miner.hpp"
#include "mining/context_segmenter.hpp"
#include "score/multi_objective_scorer.hpp"
#include "storage/rule_store.hpp"
#include <string>
#include <vector>

namespace profitlift {

/// Outcome of one mining run
struct RunReport {
    size_t contexts_emitted{0};
    size_t contexts_mined{0};

    /// Contexts rejected as data-insufficient
    size_t contexts_skipped{0};

    /// Contexts that still threw after max_context_attempts
    size_t contexts_failed{0};

    size_t rule_count{0};

    /// Scored rules of every mined context, in global rank order
    std::vector<ContextualRule> ranked_rules;
};

/// BundlePipeline: Orchestrates segmentation, mining, scoring, persistence
/// and uplift estimation
///
/// Run():
///   1. Validate the configuration
///   2. Segment transactions into context buckets
///   3. Mine and score each bucket on a fixed pool of worker threads; a
///      worker writes only to the slot of the context it claimed
///   4. Join, merge the slots in emission order and rank globally
///   5. Replace each mined context's rules in the store and drop stored
///      contexts this run did not mine
///
/// A context that throws is recomputed from scratch up to
/// max_context_attempts times, then counted as failed. Data-insufficient
/// contexts are logged and skipped. PersistenceError propagates.
///
/// Thread-safety: a pipeline instance runs one operation at a time.
class BundlePipeline {
public:
    /// @param store Rule store; must outlive the pipeline
    BundlePipeline(const PipelineConfig& config, RuleStore& store);

    /// Use `factory` instead of the configured logistic estimator for uplift
    BundlePipeline(const PipelineConfig& config, RuleStore& store, EstimatorFactory factory);

    virtual ~BundlePipeline() = default;

    /// Mine, score and persist rules for every context
    /// @throws ConfigurationError for an invalid configuration
    /// @throws PersistenceError if the store fails
    RunReport Run(const std::vector<TransactionRecord>& transactions);

    /// Estimate uplift for the first uplift.top_k rules of `ranked_rules`.
    /// Each rule is evaluated on the transactions matching its context.
    /// Every result is stored, including insufficient_data and
    /// non-actionable ones. A rule whose estimation throws keeps its
    /// previously stored result.
    /// @return Results in the order of `ranked_rules`
    /// @throws ConfigurationError for an invalid configuration
    /// @throws PersistenceError if the store fails
    std::vector<UpliftResult> EstimateTopUplift(const std::vector<TransactionRecord>& transactions,
                                                const std::vector<ContextualRule>& ranked_rules);

    const PipelineConfig& GetConfig() const { return config_; }

protected:
    /// Mine and score one context. Called concurrently from worker threads.
    virtual std::vector<ContextualRule> MineAndScore(const Segment& segment,
                                                     const ContextAwareMiner& miner,
                                                     const MultiObjectiveScorer& scorer) const;

private:
    PipelineConfig config_;
    RuleStore& store_;
    EstimatorFactory factory_;

    /// Worker count for `tasks` independent jobs
    size_t WorkerCount(size_t tasks) const;

    /// Write mined contexts and remove the stale ones
    void PersistRules(const std::vector<Segment>& segments,
                      const std::vector<std::vector<ContextualRule>*>& mined);
};

} // namespace profitlift
