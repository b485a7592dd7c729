// File: src/cli/profitlift_cli.hpp
//
// ProfitLift command-line driver
// Extracted from main() for testability

#ifndef PROFITLIFT_CLI_HPP
#define PROFITLIFT_CLI_HPP

#include "config/pipeline_config.hpp"
#include "pipeline/bundle_pipeline.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace profitlift {

/// Process exit codes
enum ExitCode : int {
    kExitOk = 0,
    kExitConfigError = 1,
    kExitPersistenceError = 2,
    kExitInputError = 3,
};

/// Parsed command line
struct CliOptions {
    std::string input_path;
    std::optional<std::string> config_path;
    std::optional<std::string> db_path;
    bool use_memory_store = false;
    bool estimate_uplift = false;
    std::optional<size_t> top;
    bool show_help = false;
};

/// Batch CLI: load config and transactions, run the pipeline, print the
/// top rules and optionally their uplift.
///
///   profitlift <transactions.csv> [--config FILE] [--db FILE] [--memory]
///              [--uplift] [--top N]
class ProfitLiftCli {
public:
    ProfitLiftCli();
    ProfitLiftCli(std::ostream& out, std::ostream& err);

    /// Run with arguments (argv without the program name)
    /// @return ExitCode
    int Run(const std::vector<std::string>& args);

    /// Parse arguments
    /// @throws std::invalid_argument describing the first bad argument
    static CliOptions ParseArguments(const std::vector<std::string>& args);

    /// Load the config file (or defaults) and apply command-line overrides
    /// @return std::nullopt if the file cannot be loaded or is invalid
    static std::optional<PipelineConfig> ResolveConfig(const CliOptions& options);

    static std::string Usage();

private:
    std::ostream& out_;
    std::ostream& err_;

    void PrintRules(const RunReport& report, size_t limit) const;
    void PrintUplift(const std::vector<UpliftResult>& results) const;
};

} // namespace profitlift

#endif // PROFITLIFT_CLI_HPP
