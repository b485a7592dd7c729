// File: tests/causal/treatment_simulator_test.cpp
#include "causal/treatment_simulator.hpp"
#include "fixtures/transaction_fixtures.hpp"
#include <gtest/gtest.h>
#include <set>

namespace profitlift {
namespace {

ContextualRule Rule(ItemSet antecedent, ItemSet consequent) {
    ContextualRule rule;
    rule.antecedent = std::move(antecedent);
    rule.consequent = std::move(consequent);
    return rule;
}

class TreatmentSimulatorTest : public ::testing::Test {
protected:
    std::vector<TransactionRecord> transactions;

    void SetUp() override {
        for (int i = 0; i < 21; ++i) {
            std::vector<std::string> items = {"a"};
            if (i % 3 == 0) {
                items.push_back("b");
            }
            transactions.push_back(testing::MakeTransaction("A" + std::to_string(i), items));
        }
        transactions.push_back(testing::MakeTransaction("X1", {"c"}));
        transactions.push_back(testing::MakeTransaction("X2", {}));
    }
};

TEST_F(TreatmentSimulatorTest, SplitsAntecedentBasketsIntoEqualHalves) {
    TreatmentSimulator simulator;
    SimulatedExperiment experiment = simulator.Simulate(Rule({"a"}, {"b"}), transactions);

    EXPECT_EQ(21u, experiment.selected);
    EXPECT_EQ(10u, experiment.control.size());
    EXPECT_EQ(10u, experiment.treatment.size());
    EXPECT_EQ(experiment.control.size(), experiment.control_outcomes.size());
    EXPECT_EQ(experiment.treatment.size(), experiment.treatment_outcomes.size());

    std::set<std::string> seen;
    for (const auto* group : {&experiment.control, &experiment.treatment}) {
        for (const auto* record : *group) {
            EXPECT_TRUE(record->Basket().count("a") > 0);
            EXPECT_TRUE(seen.insert(record->transaction_id).second);
        }
    }
}

TEST_F(TreatmentSimulatorTest, OutcomesFlagConsequentPresence) {
    TreatmentSimulator simulator;
    SimulatedExperiment experiment = simulator.Simulate(Rule({"a"}, {"b"}), transactions);

    for (size_t i = 0; i < experiment.control.size(); ++i) {
        int expected = experiment.control[i]->Basket().count("b") > 0 ? 1 : 0;
        EXPECT_EQ(expected, experiment.control_outcomes[i]);
    }
    for (size_t i = 0; i < experiment.treatment.size(); ++i) {
        int expected = experiment.treatment[i]->Basket().count("b") > 0 ? 1 : 0;
        EXPECT_EQ(expected, experiment.treatment_outcomes[i]);
    }
}

TEST_F(TreatmentSimulatorTest, SplitIsDeterministic) {
    TreatmentSimulator simulator;
    ContextualRule rule = Rule({"a"}, {"b"});
    SimulatedExperiment first = simulator.Simulate(rule, transactions);
    SimulatedExperiment second = simulator.Simulate(rule, transactions);

    EXPECT_EQ(first.seed, second.seed);
    EXPECT_EQ(first.control, second.control);
    EXPECT_EQ(first.treatment, second.treatment);
}

TEST_F(TreatmentSimulatorTest, NoMatchingBaskets) {
    TreatmentSimulator simulator;
    SimulatedExperiment experiment = simulator.Simulate(Rule({"zzz"}, {"b"}), transactions);

    EXPECT_EQ(0u, experiment.selected);
    EXPECT_TRUE(experiment.control.empty());
    EXPECT_TRUE(experiment.treatment.empty());
}

TEST(TreatmentSimulatorSeedTest, RuleSeedDependsOnSignatureAndRunSeed) {
    uint64_t base = TreatmentSimulator::RuleSeed("a=>b|Overall", 42);
    EXPECT_EQ(base, TreatmentSimulator::RuleSeed("a=>b|Overall", 42));
    EXPECT_NE(base, TreatmentSimulator::RuleSeed("a=>c|Overall", 42));
    EXPECT_NE(base, TreatmentSimulator::RuleSeed("a=>b|Overall", 43));
    EXPECT_EQ(base ^ 42ULL, TreatmentSimulator::RuleSeed("a=>b|Overall", 0));
}

TEST(BasketFeatureExtractorTest, ExtractsCalendarStoreAndSize) {
    std::vector<TransactionRecord> population = {
        testing::MakeTransaction("T1", {"a", "b", "c"}, "S2"),
        testing::MakeTransaction("T2", {"a"}, "S1"),
    };
    // Saturday 2024-01-13 20:00
    population[1].timestamp = ContextEnricher::FromCalendar(2024, 1, 13, 20);

    BasketFeatureExtractor extractor(population);

    FeatureVector first = extractor(population[0]);
    ASSERT_EQ(BasketFeatureExtractor::kDimension, first.size());
    EXPECT_DOUBLE_EQ(9.0, first[0]);
    EXPECT_DOUBLE_EQ(0.0, first[1]);
    EXPECT_DOUBLE_EQ(0.0, first[2]);
    EXPECT_DOUBLE_EQ(1.0, first[3]);
    EXPECT_DOUBLE_EQ(3.0, first[4]);

    FeatureVector second = extractor(population[1]);
    EXPECT_DOUBLE_EQ(20.0, second[0]);
    EXPECT_DOUBLE_EQ(5.0, second[1]);
    EXPECT_DOUBLE_EQ(1.0, second[2]);
    EXPECT_DOUBLE_EQ(0.0, second[3]);

    TransactionRecord stranger = testing::MakeTransaction("T3", {"a"}, "S9");
    EXPECT_DOUBLE_EQ(-1.0, extractor(stranger)[3]);
}

} // namespace
} // namespace profitlift
