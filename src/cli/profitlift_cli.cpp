// File: src/cli/profitlift_cli.cpp
//
// ProfitLift command-line driver

#include "cli/profitlift_cli.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "ingest/transaction_table.hpp"
#include "storage/memory_rule_store.hpp"
#include "storage/sqlite_rule_store.hpp"
#include <algorithm>
#include <iomanip>
#include <memory>
#include <stdexcept>

namespace profitlift {

ProfitLiftCli::ProfitLiftCli()
    : ProfitLiftCli(std::cout, std::cerr) {}

ProfitLiftCli::ProfitLiftCli(std::ostream& out, std::ostream& err)
    : out_(out),
      err_(err) {}

std::string ProfitLiftCli::Usage() {
    return "Usage: profitlift <transactions.csv> [--config FILE] [--db FILE] [--memory]\n"
           "                  [--uplift] [--top N]\n"
           "\n"
           "  --config FILE  YAML pipeline configuration\n"
           "  --db FILE      SQLite database path (overrides storage.db_path)\n"
           "  --memory       Keep rules in memory instead of SQLite\n"
           "  --uplift       Estimate causal uplift for the top rules\n"
           "  --top N        Number of rules to print and estimate (overrides uplift.top_k)\n";
}

CliOptions ProfitLiftCli::ParseArguments(const std::vector<std::string>& args) {
    CliOptions options;

    auto next_value = [&](size_t& i, const std::string& flag) -> const std::string& {
        if (i + 1 >= args.size()) {
            throw std::invalid_argument(flag + " requires a value");
        }
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--config") {
            options.config_path = next_value(i, arg);
        } else if (arg == "--db") {
            options.db_path = next_value(i, arg);
        } else if (arg == "--memory") {
            options.use_memory_store = true;
        } else if (arg == "--uplift") {
            options.estimate_uplift = true;
        } else if (arg == "--top") {
            const std::string& value = next_value(i, arg);
            size_t parsed = 0;
            unsigned long top = 0;
            try {
                top = std::stoul(value, &parsed);
            } catch (const std::logic_error&) {
                parsed = 0;
            }
            if (parsed != value.size() || top == 0 || value[0] == '-') {
                throw std::invalid_argument("--top expects a positive integer, got '" + value + "'");
            }
            options.top = static_cast<size_t>(top);
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else if (options.input_path.empty()) {
            options.input_path = arg;
        } else {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }

    if (options.input_path.empty() && !options.show_help) {
        throw std::invalid_argument("Missing transactions file");
    }
    if (options.db_path && options.use_memory_store) {
        throw std::invalid_argument("--db and --memory cannot be combined");
    }
    return options;
}

std::optional<PipelineConfig> ProfitLiftCli::ResolveConfig(const CliOptions& options) {
    std::optional<PipelineConfig> config = PipelineConfig::Default();
    if (options.config_path) {
        config = PipelineConfig::LoadFromFile(*options.config_path);
        if (!config) {
            return std::nullopt;
        }
    }

    if (options.db_path) {
        config->storage.backend = "sqlite";
        config->storage.db_path = *options.db_path;
    }
    if (options.use_memory_store) {
        config->storage.backend = "memory";
    }
    if (options.top) {
        config->uplift.top_k = *options.top;
    }
    return config;
}

int ProfitLiftCli::Run(const std::vector<std::string>& args) {
    // === Arguments and configuration ===
    CliOptions options;
    try {
        options = ParseArguments(args);
    } catch (const std::invalid_argument& e) {
        err_ << "Error: " << e.what() << "\n\n" << Usage();
        return kExitConfigError;
    }
    if (options.show_help) {
        out_ << Usage();
        return kExitOk;
    }

    std::optional<PipelineConfig> config = ResolveConfig(options);
    if (!config) {
        err_ << "Error: could not load configuration from " << *options.config_path << "\n";
        return kExitConfigError;
    }
    try {
        config->ValidateOrThrow();
        Logger::Instance().SetLevel(config->ResolveLogLevel());
    } catch (const std::invalid_argument& e) {
        err_ << "Error: " << e.what() << "\n";
        return kExitConfigError;
    }

    // === Input ===
    std::vector<TransactionRecord> transactions;
    try {
        transactions = TransactionTable::ReadFile(options.input_path);
    } catch (const std::runtime_error& e) {
        err_ << "Error: " << e.what() << "\n";
        return kExitInputError;
    }

    // === Storage and pipeline ===
    try {
        std::unique_ptr<RuleStore> store;
        if (config->storage.backend == "memory") {
            store = std::make_unique<MemoryRuleStore>();
        } else {
            store = std::make_unique<SqliteRuleStore>(config->ToSqliteConfig());
        }

        BundlePipeline pipeline(*config, *store);
        RunReport report = pipeline.Run(transactions);

        out_ << "Transactions: " << transactions.size() << "\n";
        out_ << "Contexts: " << report.contexts_emitted << " emitted, "
             << report.contexts_mined << " mined, "
             << report.contexts_skipped << " skipped, "
             << report.contexts_failed << " failed\n";
        out_ << "Rules: " << report.rule_count << "\n";

        PrintRules(report, config->uplift.top_k);

        if (options.estimate_uplift && !report.ranked_rules.empty()) {
            PrintUplift(pipeline.EstimateTopUplift(transactions, report.ranked_rules));
        }

        store->Flush();
    } catch (const ConfigurationError& e) {
        err_ << "Error: " << e.what() << "\n";
        return kExitConfigError;
    } catch (const PersistenceError& e) {
        err_ << "Error: " << e.what() << "\n";
        return kExitPersistenceError;
    }

    return kExitOk;
}

void ProfitLiftCli::PrintRules(const RunReport& report, size_t limit) const {
    if (report.ranked_rules.empty()) {
        out_ << "No rules found.\n";
        return;
    }

    out_ << "\nTop rules:\n";
    size_t shown = std::min(limit, report.ranked_rules.size());
    for (size_t i = 0; i < shown; ++i) {
        const ContextualRule& rule = report.ranked_rules[i];
        out_ << std::setw(3) << (i + 1) << ". " << rule.ToString() << "\n"
             << std::fixed << std::setprecision(3)
             << "     score " << rule.overall_score.value_or(0.0)
             << "  lift " << rule.lift
             << "  confidence " << rule.confidence
             << "  support " << rule.support
             << "  profit " << std::setprecision(2) << rule.profit_score.value_or(0.0)
             << "\n";
        out_.unsetf(std::ios::floatfield);
        out_ << std::setprecision(6);
    }
}

void ProfitLiftCli::PrintUplift(const std::vector<UpliftResult>& results) const {
    out_ << "\nUplift:\n";
    for (const auto& result : results) {
        out_ << "  " << result.rule_signature << "\n"
             << "     status " << ToString(result.status);
        if (result.status == UpliftStatus::ESTIMATED) {
            out_ << std::fixed << std::setprecision(3)
                 << "  incremental attach " << result.incremental_attach_rate
                 << "  revenue " << result.incremental_revenue
                 << "  margin " << result.incremental_margin
                 << (result.actionable ? "  actionable" : "  not actionable");
            if (result.confidence_interval) {
                out_ << "  CI [" << result.confidence_interval->first << ", "
                     << result.confidence_interval->second << "]";
            }
            out_.unsetf(std::ios::floatfield);
            out_ << std::setprecision(6);
        } else {
            out_ << "  (control " << result.control_size
                 << ", treatment " << result.treatment_size << ")";
        }
        out_ << "\n";
    }
}

} // namespace profitlift
