// File: tests/storage/sqlite_rule_store_test.cpp
#include "storage/sqlite_rule_store.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <ctime>
#include <filesystem>
#include <stdexcept>
#include <thread>

namespace profitlift {
namespace {

// ============================================================================
// Helper Functions
// ============================================================================

std::string GetTempDbPath() {
    static int counter = 0;
    return "/tmp/test_sqlite_rules_" + std::to_string(std::time(nullptr)) +
           "_" + std::to_string(counter++) + ".db";
}

void RemoveDb(const std::string& path) {
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
}

Context MakeContext(std::optional<std::string> store, std::optional<std::string> time_bin = std::nullopt) {
    Context context;
    context.store_id = std::move(store);
    context.time_bin = std::move(time_bin);
    return context;
}

ContextualRule Rule(ItemSet antecedent, ItemSet consequent, const Context& context,
                    std::optional<double> score) {
    ContextualRule rule;
    rule.antecedent = std::move(antecedent);
    rule.consequent = std::move(consequent);
    rule.support = 0.25;
    rule.confidence = 0.75;
    rule.lift = 1.8;
    rule.context = context;
    rule.overall_score = score;
    if (score) {
        rule.profit_score = 2.5;
        rule.diversity_score = 0.5;
    }
    return rule;
}

class SqliteRuleStoreTest : public ::testing::Test {
protected:
    std::string db_path;
    std::unique_ptr<SqliteRuleStore> store;

    Context overall = Context::Overall();
    Context s1 = MakeContext(std::string("S1"));
    Context s1_evening = MakeContext(std::string("S1"), std::string("evening"));

    void SetUp() override {
        db_path = GetTempDbPath();
        store = Open();

        store->ReplaceContextRules(overall, {Rule({"bread"}, {"butter"}, overall, 0.8),
                                             Rule({"chips"}, {"soda"}, overall, 0.6)});
        store->ReplaceContextRules(s1, {Rule({"bread", "milk"}, {"butter"}, s1, 0.9)});
        store->ReplaceContextRules(s1_evening, {Rule({"chips"}, {"soda"}, s1_evening, std::nullopt)});
    }

    void TearDown() override {
        store.reset();
        RemoveDb(db_path);
    }

    std::unique_ptr<SqliteRuleStore> Open() const {
        SqliteRuleStore::Config config;
        config.db_path = db_path;
        return std::make_unique<SqliteRuleStore>(config);
    }
};

// ============================================================================
// Rules
// ============================================================================

TEST_F(SqliteRuleStoreTest, RulesRoundTripEveryField) {
    auto rules = store->GetContextRules(s1);
    ASSERT_EQ(1u, rules.size());

    const ContextualRule& rule = rules[0];
    EXPECT_EQ(ItemSet({"bread", "milk"}), rule.antecedent);
    EXPECT_EQ(ItemSet({"butter"}), rule.consequent);
    EXPECT_EQ(s1, rule.context);
    EXPECT_DOUBLE_EQ(0.25, rule.support);
    EXPECT_DOUBLE_EQ(0.75, rule.confidence);
    EXPECT_DOUBLE_EQ(1.8, rule.lift);
    EXPECT_DOUBLE_EQ(2.5, rule.profit_score.value_or(0.0));
    EXPECT_DOUBLE_EQ(0.5, rule.diversity_score.value_or(0.0));
    EXPECT_DOUBLE_EQ(0.9, rule.overall_score.value_or(0.0));

    auto unscored = store->GetContextRules(s1_evening);
    ASSERT_EQ(1u, unscored.size());
    EXPECT_FALSE(unscored[0].overall_score.has_value());
    EXPECT_FALSE(unscored[0].profit_score.has_value());
}

TEST_F(SqliteRuleStoreTest, ReplaceIsPerContext) {
    store->ReplaceContextRules(overall, {Rule({"eggs"}, {"milk"}, overall, 0.4)});

    auto rules = store->GetContextRules(overall);
    ASSERT_EQ(1u, rules.size());
    EXPECT_EQ(ItemSet({"eggs"}), rules[0].antecedent);
    EXPECT_EQ(1u, store->GetContextRules(s1).size());
    EXPECT_EQ(3u, store->RuleCount());
}

TEST_F(SqliteRuleStoreTest, ReplaceIsIdempotent) {
    std::vector<ContextualRule> rules = {Rule({"bread"}, {"butter"}, overall, 0.8),
                                         Rule({"chips"}, {"soda"}, overall, 0.6)};
    store->ReplaceContextRules(overall, rules);
    auto first = store->GetContextRules(overall);
    store->ReplaceContextRules(overall, rules);
    auto second = store->GetContextRules(overall);

    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].Signature(), second[i].Signature());
        EXPECT_EQ(first[i].overall_score, second[i].overall_score);
    }
}

TEST_F(SqliteRuleStoreTest, ForeignContextRuleIsRejected) {
    EXPECT_THROW(store->ReplaceContextRules(s1, {Rule({"a"}, {"b"}, overall, 0.1)}),
                 std::invalid_argument);
    EXPECT_EQ(1u, store->GetContextRules(s1).size());
}

TEST_F(SqliteRuleStoreTest, ListContexts) {
    auto contexts = store->ListContexts();
    ASSERT_EQ(3u, contexts.size());
    EXPECT_TRUE(contexts[0].IsOverall());
    EXPECT_EQ(s1, contexts[1]);
    EXPECT_EQ(s1_evening, contexts[2]);

    store->ReplaceContextRules(s1_evening, {});
    EXPECT_EQ(2u, store->ListContexts().size());
}

TEST_F(SqliteRuleStoreTest, QueryFiltersAndOrder) {
    RuleQuery all;
    auto ranked = store->QueryRules(all);
    ASSERT_EQ(4u, ranked.size());
    EXPECT_DOUBLE_EQ(0.9, *ranked[0].overall_score);
    EXPECT_DOUBLE_EQ(0.8, *ranked[1].overall_score);
    EXPECT_DOUBLE_EQ(0.6, *ranked[2].overall_score);
    EXPECT_FALSE(ranked[3].overall_score.has_value());

    RuleQuery by_store;
    by_store.store_id = "S1";
    EXPECT_EQ(2u, store->QueryRules(by_store).size());

    RuleQuery by_time;
    by_time.time_bin = "evening";
    EXPECT_EQ(1u, store->QueryRules(by_time).size());

    RuleQuery by_score;
    by_score.min_score = 0.7;
    EXPECT_EQ(2u, store->QueryRules(by_score).size());

    RuleQuery limited;
    limited.limit = 2;
    EXPECT_EQ(2u, store->QueryRules(limited).size());

    RuleQuery unlimited;
    unlimited.limit = 0;
    EXPECT_EQ(4u, store->QueryRules(unlimited).size());
}

// ============================================================================
// Uplift
// ============================================================================

TEST_F(SqliteRuleStoreTest, UpliftRoundTripAndSurvivesReplace) {
    UpliftResult result;
    result.rule_signature = Rule({"bread"}, {"butter"}, overall, 0.8).Signature();
    result.status = UpliftStatus::ESTIMATED;
    result.incremental_attach_rate = 0.14;
    result.incremental_revenue = 0.56;
    result.incremental_margin = 0.168;
    result.control_rate = 0.5;
    result.treatment_rate = 0.64;
    result.control_size = 90;
    result.treatment_size = 90;
    result.confidence_interval = std::make_pair(0.02, 0.25);
    result.actionable = true;
    store->StoreUplift(result);

    store->ReplaceContextRules(overall, {});

    auto loaded = store->GetUplift(result.rule_signature);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(UpliftStatus::ESTIMATED, loaded->status);
    EXPECT_DOUBLE_EQ(0.14, loaded->incremental_attach_rate);
    EXPECT_DOUBLE_EQ(0.168, loaded->incremental_margin);
    EXPECT_EQ(90u, loaded->control_size);
    ASSERT_TRUE(loaded->confidence_interval.has_value());
    EXPECT_DOUBLE_EQ(0.02, loaded->confidence_interval->first);
    EXPECT_DOUBLE_EQ(0.25, loaded->confidence_interval->second);
    EXPECT_TRUE(loaded->actionable);
}

TEST_F(SqliteRuleStoreTest, UpliftIsReplacedBySignature) {
    UpliftResult pending;
    pending.rule_signature = "x=>y|*";
    pending.status = UpliftStatus::ESTIMATING;
    store->StoreUplift(pending);

    UpliftResult done = pending;
    done.status = UpliftStatus::INSUFFICIENT_DATA;
    done.control_size = 3;
    store->StoreUplift(done);

    EXPECT_EQ(1u, store->UpliftCount());
    auto loaded = store->GetUplift("x=>y|*");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(UpliftStatus::INSUFFICIENT_DATA, loaded->status);
    EXPECT_FALSE(loaded->confidence_interval.has_value());
    EXPECT_FALSE(store->GetUplift("nope").has_value());
    EXPECT_EQ(1u, store->ListUplifts().size());
}

// ============================================================================
// Persistence and maintenance
// ============================================================================

TEST_F(SqliteRuleStoreTest, DataSurvivesReopen) {
    UpliftResult result;
    result.rule_signature = "keep";
    store->StoreUplift(result);
    store->Flush();
    store.reset();

    store = Open();
    EXPECT_EQ(4u, store->RuleCount());
    EXPECT_EQ(1u, store->UpliftCount());
    EXPECT_EQ(3u, store->ListContexts().size());
}

TEST_F(SqliteRuleStoreTest, StatsAndClear) {
    store->Flush();
    RuleStoreStats stats = store->GetStats();
    EXPECT_EQ(4u, stats.total_rules);
    EXPECT_EQ(3u, stats.context_count);
    EXPECT_GT(stats.disk_usage_bytes, 0u);

    store->Clear();
    EXPECT_EQ(0u, store->RuleCount());
    EXPECT_EQ(0u, store->UpliftCount());
}

TEST_F(SqliteRuleStoreTest, Snapshot) {
    std::string snapshot_path = GetTempDbPath();
    ASSERT_TRUE(store->CreateSnapshot(snapshot_path));

    {
        SqliteRuleStore::Config config;
        config.db_path = snapshot_path;
        SqliteRuleStore snapshot(config);
        EXPECT_EQ(4u, snapshot.RuleCount());
    }
    RemoveDb(snapshot_path);
}

TEST_F(SqliteRuleStoreTest, ConcurrentReadersAndWriter) {
    std::vector<std::thread> threads;
    threads.emplace_back([this]() {
        for (int round = 0; round < 20; ++round) {
            store->ReplaceContextRules(s1, {Rule({"bread", "milk"}, {"butter"}, s1, 0.9),
                                            Rule({"tea"}, {"sugar"}, s1, round * 0.01)});
        }
    });
    for (int t = 0; t < 3; ++t) {
        threads.emplace_back([this]() {
            for (int round = 0; round < 20; ++round) {
                auto rules = store->GetContextRules(s1);
                EXPECT_TRUE(rules.size() == 1u || rules.size() == 2u);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(2u, store->GetContextRules(s1).size());
}

TEST(SqliteRuleStoreOpenTest, InvalidPathThrowsPersistenceError) {
    SqliteRuleStore::Config config;
    config.db_path = "/nonexistent_dir_profitlift/rules.db";
    EXPECT_THROW(SqliteRuleStore store(config), PersistenceError);
}

TEST(SqliteRuleStoreOpenTest, InMemoryDatabase) {
    SqliteRuleStore::Config config;
    config.db_path = ":memory:";
    config.enable_wal = false;
    SqliteRuleStore store(config);

    Context context = Context::Overall();
    store.ReplaceContextRules(context, {Rule({"a"}, {"b"}, context, 0.3)});
    EXPECT_EQ(1u, store.RuleCount());
}

} // namespace
} // namespace profitlift
