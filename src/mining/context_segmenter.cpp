// File: src/mining/context_segmenter.cpp
#include "mining/context_segmenter.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <optional>
#include <set>
#include <string>
#include <type_traits>

namespace profitlift {

namespace {

// Distinct non-empty values of one record field, sorted
template <typename Getter>
auto DistinctValues(const std::vector<TransactionRecord>& transactions, Getter getter) {
    using Value = std::decay_t<decltype(*getter(transactions.front()))>;
    std::set<Value> values;
    for (const auto& record : transactions) {
        auto value = getter(record);
        if (value) {
            values.insert(*value);
        }
    }
    return values;
}

std::optional<std::string> StoreOf(const TransactionRecord& r) {
    return r.store_id.empty() ? std::nullopt : std::optional<std::string>(r.store_id);
}

std::optional<std::string> TimeBinOf(const TransactionRecord& r) {
    return r.time_bin.empty() ? std::nullopt : std::optional<std::string>(r.time_bin);
}

std::optional<std::string> WeekdayOf(const TransactionRecord& r) {
    return r.weekday_weekend.empty() ? std::nullopt : std::optional<std::string>(r.weekday_weekend);
}

std::optional<int> QuarterOf(const TransactionRecord& r) {
    return r.quarter == 0 ? std::nullopt : std::optional<int>(r.quarter);
}

std::optional<std::string> FestivalOf(const TransactionRecord& r) {
    if (!r.festival || r.festival->empty()) {
        return std::nullopt;
    }
    return r.festival;
}

} // namespace

ContextSegmenter::ContextSegmenter()
    : ContextSegmenter(Config()) {}

ContextSegmenter::ContextSegmenter(const Config& config)
    : config_(config) {
    if (config_.max_depth < 0 || config_.max_depth > 2) {
        throw ConfigurationError("segmentation.max_depth must be 0, 1 or 2 (got " +
                                 std::to_string(config_.max_depth) + ")");
    }
}

size_t ContextSegmenter::FestivalThreshold() const {
    return std::max<size_t>(config_.min_transactions / 2, 20);
}

size_t ContextSegmenter::FestivalTimeThreshold() const {
    return std::max<size_t>(config_.min_transactions / 3, 15);
}

std::vector<Segment> ContextSegmenter::SegmentTransactions(
    const std::vector<TransactionRecord>& transactions) const {

    std::vector<Segment> segments;

    // Level 0: Overall is always present
    segments.push_back(Segment{Context::Overall(), transactions});

    if (transactions.empty()) {
        return segments;
    }

    if (config_.max_depth >= 1) {
        AddSingleDimensionSegments(transactions, segments);
    }
    if (config_.max_depth >= 2) {
        AddPairSegments(transactions, segments);
    }

    return segments;
}

void ContextSegmenter::TryEmit(const Context& context,
                               const std::vector<TransactionRecord>& transactions,
                               size_t threshold,
                               std::vector<Segment>& segments) {
    Segment segment;
    segment.context = context;
    for (const auto& record : transactions) {
        if (context.Matches(record)) {
            segment.transactions.push_back(record);
        }
    }
    if (!segment.transactions.empty() && segment.transactions.size() >= threshold) {
        segments.push_back(std::move(segment));
    }
}

void ContextSegmenter::AddSingleDimensionSegments(
    const std::vector<TransactionRecord>& transactions,
    std::vector<Segment>& segments) const {

    const size_t min_rows = config_.min_transactions;

    for (const auto& store : DistinctValues(transactions, StoreOf)) {
        Context ctx;
        ctx.store_id = store;
        TryEmit(ctx, transactions, min_rows, segments);
    }

    for (const auto& time_bin : DistinctValues(transactions, TimeBinOf)) {
        Context ctx;
        ctx.time_bin = time_bin;
        TryEmit(ctx, transactions, min_rows, segments);
    }

    for (const auto& day : DistinctValues(transactions, WeekdayOf)) {
        Context ctx;
        ctx.weekday_weekend = day;
        TryEmit(ctx, transactions, min_rows, segments);
    }

    for (int quarter : DistinctValues(transactions, QuarterOf)) {
        Context ctx;
        ctx.quarter = quarter;
        TryEmit(ctx, transactions, min_rows, segments);
    }

    for (const auto& festival : DistinctValues(transactions, FestivalOf)) {
        Context ctx;
        ctx.festival_period = festival;
        TryEmit(ctx, transactions, FestivalThreshold(), segments);
    }
}

void ContextSegmenter::AddPairSegments(
    const std::vector<TransactionRecord>& transactions,
    std::vector<Segment>& segments) const {

    const size_t min_rows = config_.min_transactions;
    const auto stores = DistinctValues(transactions, StoreOf);
    const auto time_bins = DistinctValues(transactions, TimeBinOf);
    const auto days = DistinctValues(transactions, WeekdayOf);
    const auto quarters = DistinctValues(transactions, QuarterOf);
    const auto festivals = DistinctValues(transactions, FestivalOf);

    // Store x Time
    for (const auto& store : stores) {
        for (const auto& time_bin : time_bins) {
            Context ctx;
            ctx.store_id = store;
            ctx.time_bin = time_bin;
            TryEmit(ctx, transactions, min_rows, segments);
        }
    }

    // Weekday/Weekend x Time
    for (const auto& day : days) {
        for (const auto& time_bin : time_bins) {
            Context ctx;
            ctx.weekday_weekend = day;
            ctx.time_bin = time_bin;
            TryEmit(ctx, transactions, min_rows, segments);
        }
    }

    // Festival x Time, e.g. "Diwali + Morning"
    for (const auto& festival : festivals) {
        for (const auto& time_bin : time_bins) {
            Context ctx;
            ctx.festival_period = festival;
            ctx.time_bin = time_bin;
            TryEmit(ctx, transactions, FestivalTimeThreshold(), segments);
        }
    }

    // Store x Quarter
    for (const auto& store : stores) {
        for (int quarter : quarters) {
            Context ctx;
            ctx.store_id = store;
            ctx.quarter = quarter;
            TryEmit(ctx, transactions, min_rows, segments);
        }
    }
}

std::vector<SegmentStats> ContextSegmenter::ComputeSegmentStats(const std::vector<Segment>& segments) {
    std::vector<SegmentStats> stats;
    stats.reserve(segments.size());

    for (const auto& segment : segments) {
        SegmentStats s;
        s.context = segment.context;
        s.transaction_count = segment.transactions.size();
        s.is_festival = segment.context.festival_period.has_value();

        std::set<std::string> stores;
        std::set<std::string> customers;
        size_t line_items = 0;
        for (const auto& record : segment.transactions) {
            if (!record.store_id.empty()) {
                stores.insert(record.store_id);
            }
            if (record.customer_hash) {
                customers.insert(*record.customer_hash);
            }
            line_items += record.BasketSize();
        }

        s.unique_stores = stores.size();
        s.unique_customers = customers.size();
        if (s.transaction_count > 0) {
            s.avg_basket_size = static_cast<double>(line_items) /
                                static_cast<double>(s.transaction_count);
        }
        stats.push_back(std::move(s));
    }

    return stats;
}

} // namespace profitlift
