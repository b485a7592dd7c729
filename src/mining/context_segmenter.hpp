// File: src/mining/context_segmenter.hpp
#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace profitlift {

/// One context bucket and the transactions it matches
struct Segment {
    Context context;
    std::vector<TransactionRecord> transactions;
};

/// Descriptive statistics of an emitted segment
struct SegmentStats {
    Context context;
    size_t transaction_count{0};
    size_t unique_stores{0};
    size_t unique_customers{0};
    double avg_basket_size{0.0};
    bool is_festival{false};
};

/// ContextSegmenter: Partitions transactions into context buckets
///
/// Emission order is fixed:
///   1. Overall (always emitted, even for an empty input)
///   2. Single dimensions: store, time bin, weekday/weekend, quarter, festival
///   3. Pairs: store x time, weekday x time, festival x time, store x quarter
///
/// Within each dimension, values are visited in sorted order. A bucket is
/// emitted only when it reaches its size threshold; transactions of a dropped
/// bucket stay covered by the broader buckets (at least Overall).
///
/// Festivals are short, so their thresholds are lowered:
///   festival:        max(min_transactions / 2, 20)
///   festival x time: max(min_transactions / 3, 15)
class ContextSegmenter {
public:
    struct Config {
        Config() = default;

        /// Minimum transactions for a bucket to be emitted
        size_t min_transactions{100};

        /// 0 = Overall only, 1 = add single dimensions, 2 = add pairs
        int max_depth{2};
    };

    ContextSegmenter();

    /// @throws ConfigurationError if max_depth is outside 0..2
    explicit ContextSegmenter(const Config& config);

    /// Segment transactions by context
    /// @param transactions Enriched transactions
    /// @return Buckets in emission order
    std::vector<Segment> SegmentTransactions(const std::vector<TransactionRecord>& transactions) const;

    /// Per-bucket statistics, in the order of `segments`
    static std::vector<SegmentStats> ComputeSegmentStats(const std::vector<Segment>& segments);

    /// Threshold applied to single-dimension festival buckets
    size_t FestivalThreshold() const;

    /// Threshold applied to festival x time buckets
    size_t FestivalTimeThreshold() const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    void AddSingleDimensionSegments(const std::vector<TransactionRecord>& transactions,
                                    std::vector<Segment>& segments) const;

    void AddPairSegments(const std::vector<TransactionRecord>& transactions,
                         std::vector<Segment>& segments) const;

    /// Filter by context and append if the bucket reaches `threshold`
    static void TryEmit(const Context& context,
                        const std::vector<TransactionRecord>& transactions,
                        size_t threshold,
                        std::vector<Segment>& segments);
};

} // namespace profitlift
