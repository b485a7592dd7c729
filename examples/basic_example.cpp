// File: examples/basic_example.cpp
//
// Basic bundle discovery example using ProfitLift.
// Demonstrates:
// - Building enriched transactions in code
// - Running the mining pipeline against an in-memory rule store
// - Querying the ranked rules of one store
// - Estimating uplift for the top rules
// - Projecting a discounted bundle with the what-if simulator

#include "causal/what_if_simulator.hpp"
#include "ingest/context_enricher.hpp"
#include "pipeline/bundle_pipeline.hpp"
#include "storage/memory_rule_store.hpp"
#include <iomanip>
#include <iostream>
#include <random>
#include <vector>

using namespace profitlift;

/// Line item with a known margin and category
LineItem MakeLine(const std::string& id, double price, double margin, const std::string& category) {
    LineItem line;
    line.item_id = id;
    line.price = price;
    line.margin_pct = margin;
    line.category = category;
    return line;
}

/// Two weeks of synthetic baskets from two stores. Pasta and sauce sell
/// together everywhere; coffee and croissants mostly in the morning.
std::vector<TransactionRecord> GenerateBaskets(size_t count) {
    std::mt19937_64 rng(2024);
    std::uniform_real_distribution<double> coin(0.0, 1.0);
    const int64_t start = ContextEnricher::FromCalendar(2024, 3, 4, 7);

    std::vector<TransactionRecord> records;
    for (size_t i = 0; i < count; ++i) {
        TransactionRecord record;
        record.transaction_id = "B" + std::to_string(i);
        record.timestamp = start + static_cast<int64_t>(i) * 47 * 60;
        record.store_id = (i % 4 == 0) ? "downtown" : "suburb";

        ContextEnricher::EnrichTransaction(record);
        bool morning = record.time_bin == "morning";

        if (coin(rng) < 0.45) {
            record.items.push_back(MakeLine("pasta", 2.0, 0.30, "grocery"));
            if (coin(rng) < 0.65) {
                record.items.push_back(MakeLine("sauce", 3.5, 0.40, "grocery"));
            }
        }
        if (coin(rng) < (morning ? 0.7 : 0.2)) {
            record.items.push_back(MakeLine("coffee", 4.0, 0.60, "beverages"));
            if (coin(rng) < (morning ? 0.6 : 0.1)) {
                record.items.push_back(MakeLine("croissant", 2.5, 0.55, "bakery"));
            }
        }
        if (record.items.empty() || coin(rng) < 0.3) {
            record.items.push_back(MakeLine("water", 1.0, 0.20, "beverages"));
        }
        records.push_back(std::move(record));
    }
    return records;
}

int main() {
    std::cout << "=== ProfitLift Basic Bundle Discovery Example ===\n\n";

    // Step 1: Configure the pipeline
    std::cout << "Step 1: Configuring pipeline...\n";

    PipelineConfig config = PipelineConfig::Default();
    config.segmentation.min_transactions = 80;
    config.mining.min_support = 0.05;
    config.storage.backend = "memory";
    config.uplift.top_k = 3;
    config.profit.category_margins["bakery"] = 0.5;
    Logger::Instance().SetLevel(LogLevel::WARN);

    MemoryRuleStore store;
    BundlePipeline pipeline(config, store);
    std::cout << "  Pipeline ready (" << config.runtime.worker_threads << " workers)\n\n";

    // Step 2: Mine
    std::cout << "Step 2: Mining 800 baskets...\n";
    std::vector<TransactionRecord> transactions = GenerateBaskets(800);
    RunReport report = pipeline.Run(transactions);

    std::cout << "  Contexts mined:   " << report.contexts_mined << " of "
              << report.contexts_emitted << "\n";
    std::cout << "  Rules discovered: " << report.rule_count << "\n\n";

    // Step 3: Query the downtown store
    std::cout << "Step 3: Top rules for the downtown store...\n";
    RuleQuery query;
    query.store_id = "downtown";
    query.limit = 5;
    for (const auto& rule : store.QueryRules(query)) {
        std::cout << "  " << rule.ToString() << "\n"
                  << std::fixed << std::setprecision(3)
                  << "    score " << rule.overall_score.value_or(0.0)
                  << "  lift " << rule.lift
                  << "  confidence " << rule.confidence << "\n";
    }
    std::cout << "\n";

    // Step 4: Uplift for the global top rules
    std::cout << "Step 4: Estimating uplift...\n";
    for (const auto& result : pipeline.EstimateTopUplift(transactions, report.ranked_rules)) {
        std::cout << "  " << result.rule_signature << "\n"
                  << "    " << ToString(result.status)
                  << "  incremental attach " << result.incremental_attach_rate
                  << (result.actionable ? "  (actionable)" : "") << "\n";
    }
    std::cout << "\n";

    // Step 5: What-if
    std::cout << "Step 5: What if croissants were 15% off with a coffee?\n";
    WhatIfSimulator simulator(config.ToCausalConfig());
    WhatIfScenario scenario;
    scenario.antecedent = {"coffee"};
    scenario.consequent = {"croissant"};
    scenario.context.time_bin = "morning";
    scenario.discount = 0.15;
    scenario.expected_traffic = 500.0;

    WhatIfResult what_if = simulator.Simulate(scenario, transactions);
    std::cout << "  Context baskets:        " << what_if.context_transactions << "\n";
    std::cout << "  Status:                 " << ToString(what_if.uplift.status) << "\n";
    std::cout << "  Projected attach rate:  " << what_if.projected_attach_rate << "\n";
    std::cout << "  Discounted margin:      " << what_if.discounted_margin << " per basket\n";
    std::cout << "  Margin over 500 baskets: " << what_if.total_margin.value_or(0.0) << "\n";

    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
