// File: src/config/pipeline_config.cpp
//
// YAML Configuration Implementation for the ProfitLift pipeline

#include "config/pipeline_config.hpp"
#include "core/errors.hpp"
#include <yaml.h>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace profitlift {

namespace {

// Helper function to read string from YAML scalar
std::string GetScalarValue(const yaml_event_t* event) {
    return std::string(reinterpret_cast<const char*>(event->data.scalar.value),
                       event->data.scalar.length);
}

// Helper to convert string to bool
bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

const char* BoolString(bool value) {
    return value ? "true" : "false";
}

// Strict numeric parsing: the whole scalar must be consumed.
// @throws std::invalid_argument or std::out_of_range
double ParseDouble(const std::string& value) {
    size_t pos = 0;
    double result = std::stod(value, &pos);
    if (pos != value.size() || !std::isfinite(result)) {
        throw std::invalid_argument("not a finite number: " + value);
    }
    return result;
}

int ParseInt(const std::string& value) {
    size_t pos = 0;
    int result = std::stoi(value, &pos);
    if (pos != value.size()) {
        throw std::invalid_argument("not an integer: " + value);
    }
    return result;
}

// std::stoull wraps negative input instead of rejecting it
uint64_t ParseUnsigned(const std::string& value) {
    size_t first = value.find_first_not_of(" \t");
    if (first == std::string::npos || value[first] == '-') {
        throw std::invalid_argument("not a non-negative integer: " + value);
    }
    size_t pos = 0;
    unsigned long long result = std::stoull(value, &pos);
    if (pos != value.size()) {
        throw std::invalid_argument("not a non-negative integer: " + value);
    }
    return static_cast<uint64_t>(result);
}

size_t ParseSize(const std::string& value) {
    return static_cast<size_t>(ParseUnsigned(value));
}

// Apply one `section.key: value` pair. Unknown keys are ignored.
// @throws std::logic_error (invalid_argument / out_of_range) for bad numbers
void ApplyValue(PipelineConfig& config, const std::string& section,
                const std::string& key, const std::string& value) {
    if (section == "segmentation") {
        if (key == "min_transactions") config.segmentation.min_transactions = ParseSize(value);
        else if (key == "max_depth") config.segmentation.max_depth = ParseInt(value);
    }
    else if (section == "mining") {
        if (key == "min_support") config.mining.min_support = ParseDouble(value);
        else if (key == "min_confidence") config.mining.min_confidence = ParseDouble(value);
        else if (key == "max_itemset_size") config.mining.max_itemset_size = ParseSize(value);
        else if (key == "min_baskets") config.mining.min_baskets = ParseSize(value);
        else if (key == "validate_with_eclat") config.mining.validate_with_eclat = ParseBool(value);
    }
    else if (section == "scoring") {
        if (key == "weight_lift") config.scoring.weight_lift = ParseDouble(value);
        else if (key == "weight_profit") config.scoring.weight_profit = ParseDouble(value);
        else if (key == "weight_diversity") config.scoring.weight_diversity = ParseDouble(value);
        else if (key == "weight_confidence") config.scoring.weight_confidence = ParseDouble(value);
    }
    else if (section == "profit") {
        if (key == "default_margin") config.profit.default_margin = ParseDouble(value);
    }
    else if (section == "uplift") {
        if (key == "top_k") config.uplift.top_k = ParseSize(value);
        else if (key == "min_group_size") config.uplift.min_group_size = ParseSize(value);
        else if (key == "min_incremental_lift") config.uplift.min_incremental_lift = ParseDouble(value);
        else if (key == "seed") config.uplift.seed = ParseUnsigned(value);
        else if (key == "bootstrap_samples") config.uplift.bootstrap_samples = ParseSize(value);
        else if (key == "l2_penalty") config.uplift.l2_penalty = ParseDouble(value);
        else if (key == "max_iterations") config.uplift.max_iterations = ParseInt(value);
    }
    else if (section == "storage") {
        if (key == "backend") config.storage.backend = value;
        else if (key == "db_path") config.storage.db_path = value;
    }
    else if (section == "runtime") {
        if (key == "worker_threads") config.runtime.worker_threads = ParseSize(value);
        else if (key == "max_context_attempts") config.runtime.max_context_attempts = ParseSize(value);
    }
    else if (section == "logging") {
        if (key == "level") config.logging.level = value;
        else if (key == "debug_logging") config.logging.debug_logging = ParseBool(value);
    }
}

} // namespace

std::optional<PipelineConfig> PipelineConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<PipelineConfig> PipelineConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    // Set input string
    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    PipelineConfig config = Default();
    std::string current_section;
    std::string current_subsection;
    std::string current_key;
    int depth = 0;
    bool failed = false;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error";
            if (parser.problem) {
                std::cerr << ": " << parser.problem << " at line "
                          << parser.problem_mark.line + 1;
            }
            std::cerr << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_STREAM_START_EVENT:
            case YAML_DOCUMENT_START_EVENT:
                break;

            case YAML_MAPPING_START_EVENT:
                depth++;
                if (depth == 3) {
                    // Nested mapping value, e.g. profit.category_margins
                    current_subsection = current_key;
                    current_key.clear();
                }
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                } else if (depth == 2) {
                    current_subsection.clear();
                }
                break;

            case YAML_SEQUENCE_START_EVENT:
                std::cerr << "YAML sequences are not supported in the pipeline config" << std::endl;
                failed = true;
                done = true;
                break;

            case YAML_SCALAR_EVENT: {
                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    // Top-level key (section name); a scalar in value
                    // position closes the section
                    if (current_section.empty()) {
                        current_section = value;
                    } else {
                        current_section.clear();
                    }
                } else if (depth >= 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        try {
                            if (depth == 2) {
                                ApplyValue(config, current_section, current_key, value);
                            } else if (depth == 3 && current_section == "profit" &&
                                       current_subsection == "category_margins") {
                                config.profit.category_margins[current_key] = ParseDouble(value);
                            }
                        } catch (const std::logic_error&) {
                            std::cerr << "Invalid value for " << current_section << "."
                                      << current_key << ": " << value << std::endl;
                            failed = true;
                            done = true;
                        }
                        current_key.clear();
                    }
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    if (failed) {
        return std::nullopt;
    }

    // Validate configuration
    if (!config.Validate()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.GetValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool PipelineConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return static_cast<bool>(file);
}

std::string PipelineConfig::ToYamlString() const {
    std::ostringstream ss;
    ss << std::setprecision(std::numeric_limits<double>::max_digits10);

    ss << "# ProfitLift Configuration\n";
    ss << "# Auto-generated configuration file\n\n";

    ss << "segmentation:\n";
    ss << "  min_transactions: " << segmentation.min_transactions << "\n";
    ss << "  max_depth: " << segmentation.max_depth << "\n\n";

    ss << "mining:\n";
    ss << "  min_support: " << mining.min_support << "\n";
    ss << "  min_confidence: " << mining.min_confidence << "\n";
    ss << "  max_itemset_size: " << mining.max_itemset_size << "\n";
    ss << "  min_baskets: " << mining.min_baskets << "\n";
    ss << "  validate_with_eclat: " << BoolString(mining.validate_with_eclat) << "\n\n";

    ss << "scoring:\n";
    ss << "  weight_lift: " << scoring.weight_lift << "\n";
    ss << "  weight_profit: " << scoring.weight_profit << "\n";
    ss << "  weight_diversity: " << scoring.weight_diversity << "\n";
    ss << "  weight_confidence: " << scoring.weight_confidence << "\n\n";

    ss << "profit:\n";
    ss << "  default_margin: " << profit.default_margin << "\n";
    if (profit.category_margins.empty()) {
        ss << "  category_margins: {}\n\n";
    } else {
        ss << "  category_margins:\n";
        for (const auto& [category, margin] : profit.category_margins) {
            ss << "    \"" << category << "\": " << margin << "\n";
        }
        ss << "\n";
    }

    ss << "uplift:\n";
    ss << "  top_k: " << uplift.top_k << "\n";
    ss << "  min_group_size: " << uplift.min_group_size << "\n";
    ss << "  min_incremental_lift: " << uplift.min_incremental_lift << "\n";
    ss << "  seed: " << uplift.seed << "\n";
    ss << "  bootstrap_samples: " << uplift.bootstrap_samples << "\n";
    ss << "  l2_penalty: " << uplift.l2_penalty << "\n";
    ss << "  max_iterations: " << uplift.max_iterations << "\n\n";

    ss << "storage:\n";
    ss << "  backend: \"" << storage.backend << "\"\n";
    ss << "  db_path: \"" << storage.db_path << "\"\n\n";

    ss << "runtime:\n";
    ss << "  worker_threads: " << runtime.worker_threads << "\n";
    ss << "  max_context_attempts: " << runtime.max_context_attempts << "\n\n";

    ss << "logging:\n";
    ss << "  level: \"" << logging.level << "\"\n";
    ss << "  debug_logging: " << BoolString(logging.debug_logging) << "\n";

    return ss.str();
}

bool PipelineConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> PipelineConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    // NaN and infinity
    const std::pair<const char*, double> numeric_fields[] = {
        {"min_support", mining.min_support},
        {"min_confidence", mining.min_confidence},
        {"weight_lift", scoring.weight_lift},
        {"weight_profit", scoring.weight_profit},
        {"weight_diversity", scoring.weight_diversity},
        {"weight_confidence", scoring.weight_confidence},
        {"default_margin", profit.default_margin},
        {"min_incremental_lift", uplift.min_incremental_lift},
        {"l2_penalty", uplift.l2_penalty},
    };
    for (const auto& [name, field] : numeric_fields) {
        if (!std::isfinite(field)) {
            errors.push_back(std::string(name) + " must be a finite number");
        }
    }

    // Segmentation
    if (segmentation.max_depth < 0 || segmentation.max_depth > 2) {
        errors.push_back("segmentation max_depth must be between 0 and 2");
    }

    // Mining thresholds
    if (!(mining.min_support > 0.0 && mining.min_support <= 1.0)) {
        errors.push_back("min_support must be in (0.0, 1.0]");
    }
    if (!(mining.min_confidence >= 0.0 && mining.min_confidence <= 1.0)) {
        errors.push_back("min_confidence must be between 0.0 and 1.0");
    }
    if (mining.max_itemset_size == 1) {
        errors.push_back("max_itemset_size must be 0 (unbounded) or at least 2");
    }

    // Scoring weights
    if (scoring.weight_lift < 0.0 || scoring.weight_profit < 0.0 ||
        scoring.weight_diversity < 0.0 || scoring.weight_confidence < 0.0) {
        errors.push_back("scoring weights must be non-negative");
    }
    double weight_sum = scoring.weight_lift + scoring.weight_profit +
                        scoring.weight_diversity + scoring.weight_confidence;
    if (std::fabs(weight_sum - 1.0) > kWeightTolerance) {
        errors.push_back("scoring weights must sum to 1.0 (got " + std::to_string(weight_sum) + ")");
    }

    // Margins
    if (!(profit.default_margin >= 0.0 && profit.default_margin <= 1.0)) {
        errors.push_back("default_margin must be between 0.0 and 1.0");
    }
    for (const auto& [category, margin] : profit.category_margins) {
        if (!(margin >= 0.0 && margin <= 1.0)) {
            errors.push_back("category margin for '" + category + "' must be between 0.0 and 1.0");
        }
    }

    // Uplift
    if (uplift.top_k == 0) {
        errors.push_back("uplift top_k must be greater than 0");
    }
    if (uplift.min_group_size == 0) {
        errors.push_back("uplift min_group_size must be greater than 0");
    }
    if (!(uplift.min_incremental_lift >= 0.0)) {
        errors.push_back("min_incremental_lift must be non-negative");
    }
    if (!(uplift.l2_penalty >= 0.0)) {
        errors.push_back("l2_penalty must be non-negative");
    }
    if (uplift.max_iterations <= 0) {
        errors.push_back("max_iterations must be greater than 0");
    }

    // Storage
    if (storage.backend != "sqlite" && storage.backend != "memory") {
        errors.push_back("storage backend must be one of: sqlite, memory");
    }
    if (storage.backend == "sqlite" && storage.db_path.empty()) {
        errors.push_back("storage db_path must not be empty for the sqlite backend");
    }

    // Runtime
    if (runtime.worker_threads == 0) {
        errors.push_back("worker_threads must be greater than 0");
    }
    if (runtime.max_context_attempts == 0) {
        errors.push_back("max_context_attempts must be greater than 0");
    }

    // Logging
    try {
        ParseLogLevel(logging.level);
    } catch (const std::invalid_argument&) {
        errors.push_back("logging level must be one of: debug, info, warn, error, off");
    }

    return errors;
}

void PipelineConfig::ValidateOrThrow() const {
    std::vector<std::string> errors = GetValidationErrors();
    if (errors.empty()) {
        return;
    }

    std::ostringstream joined;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) {
            joined << "; ";
        }
        joined << errors[i];
    }
    throw ConfigurationError(joined.str());
}

PipelineConfig PipelineConfig::Default() {
    return PipelineConfig{};  // Uses default member initializers
}

// ============================================================================
// Component Configs
// ============================================================================

ContextSegmenter::Config PipelineConfig::ToSegmenterConfig() const {
    ContextSegmenter::Config result;
    result.min_transactions = segmentation.min_transactions;
    result.max_depth = segmentation.max_depth;
    return result;
}

ContextAwareMiner::Config PipelineConfig::ToMinerConfig() const {
    ContextAwareMiner::Config result;
    result.min_support = mining.min_support;
    result.min_confidence = mining.min_confidence;
    result.max_itemset_size = mining.max_itemset_size;
    result.min_baskets = mining.min_baskets;
    result.validate_with_eclat = mining.validate_with_eclat;
    return result;
}

ScoringWeights PipelineConfig::ToScoringWeights() const {
    ScoringWeights weights;
    weights.lift = scoring.weight_lift;
    weights.profit = scoring.weight_profit;
    weights.diversity = scoring.weight_diversity;
    weights.confidence = scoring.weight_confidence;
    return weights;
}

ProfitCalculator::Config PipelineConfig::ToProfitConfig() const {
    ProfitCalculator::Config result;
    result.default_margin = profit.default_margin;
    result.category_margins.insert(profit.category_margins.begin(),
                                   profit.category_margins.end());
    return result;
}

CausalEstimator::Config PipelineConfig::ToCausalConfig() const {
    CausalEstimator::Config result;
    result.min_group_size = uplift.min_group_size;
    result.min_incremental_lift = uplift.min_incremental_lift;
    result.seed = uplift.seed;
    result.bootstrap_samples = uplift.bootstrap_samples;
    result.estimator.l2_penalty = uplift.l2_penalty;
    result.estimator.max_iterations = uplift.max_iterations;
    result.profit = ToProfitConfig();
    return result;
}

SqliteRuleStore::Config PipelineConfig::ToSqliteConfig() const {
    SqliteRuleStore::Config result;
    result.db_path = storage.db_path;
    return result;
}

LogLevel PipelineConfig::ResolveLogLevel() const {
    if (logging.debug_logging) {
        return LogLevel::DEBUG;
    }
    return ParseLogLevel(logging.level);
}

} // namespace profitlift
