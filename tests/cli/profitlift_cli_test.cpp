// File: tests/cli/profitlift_cli_test.cpp
//
// Tests for the ProfitLift batch command line

#include "cli/profitlift_cli.hpp"
#include "fixtures/transaction_fixtures.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace profitlift {
namespace {

class ProfitLiftCliTest : public ::testing::Test {
protected:
    void SetUp() override {
        const std::string stamp = std::to_string(
            std::chrono::system_clock::now().time_since_epoch().count());
        csv_path_ = "/tmp/test_profitlift_" + stamp + ".csv";
        config_path_ = "/tmp/test_profitlift_" + stamp + ".yaml";
        db_path_ = "/tmp/test_profitlift_" + stamp + ".db";

        WriteTransactions(testing::GenerateRetailTransactions(400));
    }

    void TearDown() override {
        std::filesystem::remove(csv_path_);
        std::filesystem::remove(config_path_);
        std::filesystem::remove(db_path_);
        std::filesystem::remove(db_path_ + "-wal");
        std::filesystem::remove(db_path_ + "-shm");
    }

    void WriteTransactions(const std::vector<TransactionRecord>& records) {
        std::ofstream file(csv_path_);
        file << "transaction_id,timestamp,store_id,item_id,price,margin_pct,category\n";
        for (const auto& record : records) {
            for (const auto& line : record.items) {
                file << record.transaction_id << "," << record.timestamp << "," << record.store_id << ","
                     << line.item_id << "," << line.price << "," << line.margin_pct.value_or(0.25) << ","
                     << line.category.value_or("") << "\n";
            }
        }
    }

    void WriteConfig(const std::string& yaml) {
        std::ofstream file(config_path_);
        file << yaml;
    }

    int RunCli(const std::vector<std::string>& args) {
        ProfitLiftCli cli(out_, err_);
        return cli.Run(args);
    }

    std::string csv_path_;
    std::string config_path_;
    std::string db_path_;
    std::ostringstream out_;
    std::ostringstream err_;
};

// ============================================================================
// Argument Parsing
// ============================================================================

TEST_F(ProfitLiftCliTest, ParseArguments) {
    CliOptions options = ProfitLiftCli::ParseArguments(
        {"data.csv", "--config", "cfg.yaml", "--db", "rules.db", "--uplift", "--top", "7"});

    EXPECT_EQ("data.csv", options.input_path);
    EXPECT_EQ("cfg.yaml", options.config_path.value_or(""));
    EXPECT_EQ("rules.db", options.db_path.value_or(""));
    EXPECT_TRUE(options.estimate_uplift);
    EXPECT_FALSE(options.use_memory_store);
    EXPECT_EQ(7u, options.top.value_or(0));
}

TEST_F(ProfitLiftCliTest, ParseArgumentsRejectsBadInput) {
    EXPECT_THROW(ProfitLiftCli::ParseArguments({}), std::invalid_argument);
    EXPECT_THROW(ProfitLiftCli::ParseArguments({"a.csv", "--bogus"}), std::invalid_argument);
    EXPECT_THROW(ProfitLiftCli::ParseArguments({"a.csv", "b.csv"}), std::invalid_argument);
    EXPECT_THROW(ProfitLiftCli::ParseArguments({"a.csv", "--top", "0"}), std::invalid_argument);
    EXPECT_THROW(ProfitLiftCli::ParseArguments({"a.csv", "--top", "-3"}), std::invalid_argument);
    EXPECT_THROW(ProfitLiftCli::ParseArguments({"a.csv", "--top", "5x"}), std::invalid_argument);
    EXPECT_THROW(ProfitLiftCli::ParseArguments({"a.csv", "--config"}), std::invalid_argument);
    EXPECT_THROW(ProfitLiftCli::ParseArguments({"a.csv", "--db", "x.db", "--memory"}),
                 std::invalid_argument);
}

TEST_F(ProfitLiftCliTest, HelpNeedsNoInput) {
    CliOptions options = ProfitLiftCli::ParseArguments({"--help"});
    EXPECT_TRUE(options.show_help);

    EXPECT_EQ(kExitOk, RunCli({"--help"}));
    EXPECT_NE(std::string::npos, out_.str().find("profitlift"));
}

TEST_F(ProfitLiftCliTest, ResolveConfigAppliesOverrides) {
    CliOptions options;
    options.input_path = "data.csv";
    options.db_path = "/tmp/override.db";
    options.top = 4;

    auto config = ProfitLiftCli::ResolveConfig(options);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ("sqlite", config->storage.backend);
    EXPECT_EQ("/tmp/override.db", config->storage.db_path);
    EXPECT_EQ(4u, config->uplift.top_k);

    options.db_path.reset();
    options.use_memory_store = true;
    config = ProfitLiftCli::ResolveConfig(options);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ("memory", config->storage.backend);
}

// ============================================================================
// Exit Codes
// ============================================================================

TEST_F(ProfitLiftCliTest, UsageErrorExitsWithConfigError) {
    EXPECT_EQ(kExitConfigError, RunCli({"--unknown"}));
    EXPECT_NE(std::string::npos, err_.str().find("Unknown option"));
}

TEST_F(ProfitLiftCliTest, MissingInputFile) {
    EXPECT_EQ(kExitInputError, RunCli({"/tmp/no_such_profitlift_input.csv", "--memory"}));
}

TEST_F(ProfitLiftCliTest, InvalidConfigFile) {
    WriteConfig("scoring:\n  weight_lift: 0.9\n");
    EXPECT_EQ(kExitConfigError, RunCli({csv_path_, "--config", config_path_, "--memory"}));
}

TEST_F(ProfitLiftCliTest, UnopenableDatabase) {
    EXPECT_EQ(kExitPersistenceError,
              RunCli({csv_path_, "--db", "/nonexistent_dir_profitlift/rules.db"}));
}

TEST_F(ProfitLiftCliTest, RunWithMemoryStore) {
    WriteConfig("segmentation:\n  min_transactions: 100\nmining:\n  min_support: 0.05\n");

    EXPECT_EQ(kExitOk, RunCli({csv_path_, "--config", config_path_, "--memory", "--top", "3"}));

    const std::string output = out_.str();
    EXPECT_NE(std::string::npos, output.find("Transactions: 400"));
    EXPECT_NE(std::string::npos, output.find("Top rules:"));
    EXPECT_NE(std::string::npos, output.find("  1. "));
    EXPECT_EQ(std::string::npos, output.find("  4. "));
}

TEST_F(ProfitLiftCliTest, RunWithUpliftAndSqlite) {
    WriteConfig("mining:\n  min_support: 0.05\nuplift:\n  top_k: 2\n");

    EXPECT_EQ(kExitOk, RunCli({csv_path_, "--config", config_path_, "--db", db_path_, "--uplift"}));
    EXPECT_NE(std::string::npos, out_.str().find("Uplift:"));
    EXPECT_TRUE(std::filesystem::exists(db_path_));

    SqliteRuleStore::Config config;
    config.db_path = db_path_;
    SqliteRuleStore store(config);
    EXPECT_GT(store.RuleCount(), 0u);
    EXPECT_EQ(2u, store.UpliftCount());
}

TEST_F(ProfitLiftCliTest, NoRulesMessage) {
    WriteTransactions({testing::MakeTransaction("T1", {"a"}), testing::MakeTransaction("T2", {"b"})});

    EXPECT_EQ(kExitOk, RunCli({csv_path_, "--memory"}));
    EXPECT_NE(std::string::npos, out_.str().find("No rules found."));
}

} // namespace
} // namespace profitlift
