// File: src/pipeline/bundle_pipeline.cpp
#include "pipeline/bundle_pipeline.hpp"
#include "causal/causal_estimator.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <memory>
#include <set>
#include <thread>
#include <utility>

namespace profitlift {

namespace {

constexpr const char* kComponent = "BundlePipeline";

enum class SlotState {
    PENDING,
    MINED,
    SKIPPED,
    FAILED,
};

/// Output of one context, written by exactly one worker
struct ContextSlot {
    SlotState state{SlotState::PENDING};
    std::vector<ContextualRule> rules;
};

/// Run task(i) for i in [0, tasks) on `workers` threads. Each index is
/// claimed by exactly one thread. `task` must not throw.
template <typename Task>
void RunOnWorkers(size_t tasks, size_t workers, Task task) {
    std::atomic<size_t> next{0};
    std::vector<std::thread> threads;
    threads.reserve(workers);

    for (size_t t = 0; t < workers; ++t) {
        threads.emplace_back([&]() {
            for (size_t i = next++; i < tasks; i = next++) {
                task(i);
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }
}

std::vector<TransactionRecord> FilterByContext(const Context& context,
                                               const std::vector<TransactionRecord>& transactions) {
    if (context.IsOverall()) {
        return transactions;
    }
    std::vector<TransactionRecord> matched;
    for (const auto& txn : transactions) {
        if (context.Matches(txn)) {
            matched.push_back(txn);
        }
    }
    return matched;
}

} // namespace

BundlePipeline::BundlePipeline(const PipelineConfig& config, RuleStore& store)
    : config_(config),
      store_(store) {}

BundlePipeline::BundlePipeline(const PipelineConfig& config, RuleStore& store,
                               EstimatorFactory factory)
    : config_(config),
      store_(store),
      factory_(std::move(factory)) {}

size_t BundlePipeline::WorkerCount(size_t tasks) const {
    return std::max<size_t>(1, std::min(config_.runtime.worker_threads, tasks));
}

std::vector<ContextualRule> BundlePipeline::MineAndScore(const Segment& segment,
                                                         const ContextAwareMiner& miner,
                                                         const MultiObjectiveScorer& scorer) const {
    std::vector<ContextualRule> rules = miner.MineContext(segment);
    scorer.ScoreContext(rules, segment.transactions);
    return rules;
}

void BundlePipeline::PersistRules(const std::vector<Segment>& segments,
                                  const std::vector<std::vector<ContextualRule>*>& mined) {
    try {
        std::set<Context> current;
        for (size_t i = 0; i < segments.size(); ++i) {
            if (mined[i] != nullptr) {
                store_.ReplaceContextRules(segments[i].context, *mined[i]);
                current.insert(segments[i].context);
            }
        }

        // Contexts skipped or failed this run must not keep older rules
        size_t removed = 0;
        for (const auto& context : store_.ListContexts()) {
            if (current.count(context) == 0) {
                store_.ReplaceContextRules(context, {});
                ++removed;
            }
        }
        if (removed > 0) {
            Logger::Instance().Info(kComponent, "Removed rules of " + std::to_string(removed) +
                                    " contexts not mined in this run");
        }
    } catch (const PersistenceError&) {
        throw;
    } catch (const std::exception& e) {
        throw PersistenceError(std::string("rule store failed: ") + e.what());
    }
}

// ============================================================================
// Mining Run
// ============================================================================

RunReport BundlePipeline::Run(const std::vector<TransactionRecord>& transactions) {
    config_.ValidateOrThrow();

    ContextSegmenter segmenter(config_.ToSegmenterConfig());
    ContextAwareMiner miner(config_.ToMinerConfig());
    MultiObjectiveScorer scorer(config_.ToScoringWeights(), config_.ToProfitConfig());

    std::vector<Segment> segments = segmenter.SegmentTransactions(transactions);
    Logger::Instance().Info(kComponent, "Segmented " + std::to_string(transactions.size()) +
                            " transactions into " + std::to_string(segments.size()) + " contexts");

    std::vector<ContextSlot> slots(segments.size());
    const size_t max_attempts = config_.runtime.max_context_attempts;

    auto process = [&](size_t index) {
        const Segment& segment = segments[index];
        ContextSlot& slot = slots[index];
        const std::string label = segment.context.ToString();

        for (size_t attempt = 1; attempt <= max_attempts; ++attempt) {
            try {
                slot.rules = MineAndScore(segment, miner, scorer);
                slot.state = SlotState::MINED;
                return;
            } catch (const DataInsufficientError& e) {
                Logger::Instance().Info(kComponent, "Skipping context: " + std::string(e.what()));
                slot.state = SlotState::SKIPPED;
                return;
            } catch (const std::exception& e) {
                // Partial output of a failed attempt is discarded
                slot.rules.clear();
                Logger::Instance().Warn(kComponent, "Context " + label + " attempt " +
                                        std::to_string(attempt) + "/" + std::to_string(max_attempts) +
                                        " failed: " + e.what());
            }
        }

        Logger::Instance().Error(kComponent, "Giving up on context " + label);
        slot.state = SlotState::FAILED;
    };

    RunOnWorkers(segments.size(), WorkerCount(segments.size()), process);

    // Merge
    RunReport report;
    report.contexts_emitted = segments.size();
    for (auto& slot : slots) {
        switch (slot.state) {
            case SlotState::MINED:
                ++report.contexts_mined;
                report.ranked_rules.insert(report.ranked_rules.end(),
                                           slot.rules.begin(), slot.rules.end());
                break;
            case SlotState::SKIPPED:
                ++report.contexts_skipped;
                break;
            case SlotState::FAILED:
            case SlotState::PENDING:
                ++report.contexts_failed;
                break;
        }
    }
    MultiObjectiveScorer::RankGlobally(report.ranked_rules);
    report.rule_count = report.ranked_rules.size();

    // Persist one context at a time
    std::vector<std::vector<ContextualRule>*> mined(segments.size(), nullptr);
    for (size_t i = 0; i < segments.size(); ++i) {
        if (slots[i].state == SlotState::MINED) {
            mined[i] = &slots[i].rules;
        }
    }
    PersistRules(segments, mined);

    Logger::Instance().Info(kComponent, "Mined " + std::to_string(report.contexts_mined) +
                            " contexts (" + std::to_string(report.contexts_skipped) + " skipped, " +
                            std::to_string(report.contexts_failed) + " failed), " +
                            std::to_string(report.rule_count) + " rules");
    return report;
}

// ============================================================================
// Uplift
// ============================================================================

std::vector<UpliftResult> BundlePipeline::EstimateTopUplift(
    const std::vector<TransactionRecord>& transactions,
    const std::vector<ContextualRule>& ranked_rules) {

    config_.ValidateOrThrow();

    const size_t count = std::min(config_.uplift.top_k, ranked_rules.size());
    if (count == 0) {
        return {};
    }

    std::unique_ptr<CausalEstimator> estimator =
        factory_ ? std::make_unique<CausalEstimator>(config_.ToCausalConfig(), factory_)
                 : std::make_unique<CausalEstimator>(config_.ToCausalConfig());

    // Mark every selected rule as in progress before any work starts. An
    // earlier result keeps its figures while it is re-estimated.
    std::vector<std::optional<UpliftResult>> previous(count);
    try {
        for (size_t i = 0; i < count; ++i) {
            const std::string signature = ranked_rules[i].Signature();
            previous[i] = store_.GetUplift(signature);

            UpliftResult pending = previous[i] ? *previous[i] : UpliftResult{};
            pending.rule_signature = signature;
            pending.status = UpliftStatus::ESTIMATING;
            store_.StoreUplift(pending);
        }
    } catch (const PersistenceError&) {
        throw;
    } catch (const std::exception& e) {
        throw PersistenceError(std::string("uplift store failed: ") + e.what());
    }

    std::vector<UpliftResult> results(count);

    auto process = [&](size_t index) {
        const ContextualRule& rule = ranked_rules[index];
        try {
            std::vector<TransactionRecord> context_txns = FilterByContext(rule.context, transactions);
            results[index] = estimator->Estimate(rule, context_txns);
        } catch (const std::exception& e) {
            Logger::Instance().Error(kComponent, "Uplift estimation failed for " +
                                     rule.Signature() + ": " + e.what());
            if (previous[index]) {
                results[index] = *previous[index];
            } else {
                UpliftResult failed;
                failed.rule_signature = rule.Signature();
                failed.status = UpliftStatus::NOT_ESTIMATED;
                results[index] = failed;
            }
        }
    };

    RunOnWorkers(count, WorkerCount(count), process);

    size_t actionable = 0;
    try {
        for (const auto& result : results) {
            store_.StoreUplift(result);
            if (result.actionable) {
                ++actionable;
            }
        }
    } catch (const PersistenceError&) {
        throw;
    } catch (const std::exception& e) {
        throw PersistenceError(std::string("uplift store failed: ") + e.what());
    }

    Logger::Instance().Info(kComponent, "Estimated uplift for " + std::to_string(count) +
                            " rules, " + std::to_string(actionable) + " actionable");
    return results;
}

} // namespace profitlift
