// File: include/config/pipeline_config.hpp
//
// YAML Configuration Support for the ProfitLift pipeline
// Loads mining, scoring, uplift and storage settings from YAML files

#ifndef PROFITLIFT_CONFIG_PIPELINE_CONFIG_HPP
#define PROFITLIFT_CONFIG_PIPELINE_CONFIG_HPP

#include "causal/causal_estimator.hpp"
#include "core/logging.hpp"
#include "mining/context_aware_miner.hpp"
#include "mining/context_segmenter.hpp"
#include "score/multi_objective_scorer.hpp"
#include "score/profit_calculator.hpp"
#include "storage/sqlite_rule_store.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace profitlift {

/// Configuration structure for a ProfitLift run
struct PipelineConfig {
    // === Context Segmentation ===
    struct Segmentation {
        size_t min_transactions = 100;
        int max_depth = 2;
    } segmentation;

    // === Frequent Pattern Mining ===
    struct Mining {
        double min_support = 0.01;
        double min_confidence = 0.3;
        size_t max_itemset_size = 4;
        size_t min_baskets = 5;
        bool validate_with_eclat = false;
    } mining;

    // === Multi-Objective Scoring ===
    struct Scoring {
        double weight_lift = 0.30;
        double weight_profit = 0.40;
        double weight_diversity = 0.15;
        double weight_confidence = 0.15;
    } scoring;

    // === Margin Resolution ===
    struct Profit {
        double default_margin = 0.25;
        std::map<std::string, double> category_margins;
    } profit;

    // === Causal Uplift ===
    struct Uplift {
        size_t top_k = 10;
        size_t min_group_size = 20;
        double min_incremental_lift = 0.05;
        uint64_t seed = 42;
        size_t bootstrap_samples = 20;
        double l2_penalty = 1.0;
        int max_iterations = 50;
    } uplift;

    // === Rule Storage ===
    struct Storage {
        std::string backend = "sqlite";  // "sqlite" or "memory"
        std::string db_path = "profitlift.db";
    } storage;

    // === Worker Pool ===
    struct Runtime {
        size_t worker_threads = 4;
        size_t max_context_attempts = 2;
    } runtime;

    // === Logging ===
    struct Logging {
        std::string level = "info";
        bool debug_logging = false;
    } logging;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return PipelineConfig if successful, std::nullopt on error
    static std::optional<PipelineConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return PipelineConfig if successful, std::nullopt on error
    static std::optional<PipelineConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// Convert to YAML string
    std::string ToYamlString() const;

    /// Validate configuration values
    bool Validate() const;

    /// Get validation errors (if any)
    std::vector<std::string> GetValidationErrors() const;

    /// @throws ConfigurationError listing every validation error
    void ValidateOrThrow() const;

    /// Create default configuration
    static PipelineConfig Default();

    // === Component Configs ===
    ContextSegmenter::Config ToSegmenterConfig() const;
    ContextAwareMiner::Config ToMinerConfig() const;
    ScoringWeights ToScoringWeights() const;
    ProfitCalculator::Config ToProfitConfig() const;
    CausalEstimator::Config ToCausalConfig() const;
    SqliteRuleStore::Config ToSqliteConfig() const;

    /// DEBUG when debug_logging is set, otherwise the parsed level
    /// @throws std::invalid_argument for an unknown level name
    LogLevel ResolveLogLevel() const;
};

} // namespace profitlift

#endif // PROFITLIFT_CONFIG_PIPELINE_CONFIG_HPP
