// File: src/causal/treatment_simulator.cpp
#include "causal/treatment_simulator.hpp"
#include "ingest/context_enricher.hpp"
#include <algorithm>
#include <random>

namespace profitlift {

// ============================================================================
// BasketFeatureExtractor
// ============================================================================

BasketFeatureExtractor::BasketFeatureExtractor(const std::vector<TransactionRecord>& population) {
    for (const auto& record : population) {
        store_ordinal_.emplace(record.store_id, 0.0);
    }
    double ordinal = 0.0;
    for (auto& entry : store_ordinal_) {
        entry.second = ordinal++;
    }
}

FeatureVector BasketFeatureExtractor::operator()(const TransactionRecord& record) const {
    ContextEnricher::CalendarFields calendar = ContextEnricher::ToCalendar(record.timestamp);

    auto store = store_ordinal_.find(record.store_id);
    double ordinal = store == store_ordinal_.end() ? -1.0 : store->second;

    return FeatureVector{
        static_cast<double>(calendar.hour),
        static_cast<double>(calendar.day_of_week),
        calendar.day_of_week >= 5 ? 1.0 : 0.0,
        ordinal,
        static_cast<double>(record.BasketSize()),
    };
}

// ============================================================================
// TreatmentSimulator
// ============================================================================

TreatmentSimulator::TreatmentSimulator()
    : TreatmentSimulator(Config()) {}

TreatmentSimulator::TreatmentSimulator(const Config& config)
    : config_(config) {}

uint64_t TreatmentSimulator::RuleSeed(const std::string& signature, uint64_t run_seed) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : signature) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash ^ run_seed;
}

SimulatedExperiment TreatmentSimulator::Simulate(const ContextualRule& rule,
                                                 const std::vector<TransactionRecord>& transactions) const {
    SimulatedExperiment experiment;
    experiment.seed = RuleSeed(rule.Signature(), config_.seed);

    std::vector<const TransactionRecord*> selected;
    for (const auto& record : transactions) {
        ItemSet basket = record.Basket();
        if (!basket.empty() && ContainsAll(basket, rule.antecedent)) {
            selected.push_back(&record);
        }
    }
    experiment.selected = selected.size();

    std::mt19937_64 rng(experiment.seed);
    std::shuffle(selected.begin(), selected.end(), rng);

    const size_t half = selected.size() / 2;
    experiment.control.assign(selected.begin(), selected.begin() + half);
    experiment.treatment.assign(selected.begin() + half, selected.begin() + 2 * half);

    auto outcome = [&rule](const TransactionRecord* record) {
        return ContainsAll(record->Basket(), rule.consequent) ? 1 : 0;
    };
    for (const auto* record : experiment.control) {
        experiment.control_outcomes.push_back(outcome(record));
    }
    for (const auto* record : experiment.treatment) {
        experiment.treatment_outcomes.push_back(outcome(record));
    }

    return experiment;
}

} // namespace profitlift
