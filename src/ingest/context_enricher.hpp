// File: src/ingest/context_enricher.hpp
#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace profitlift {

/// ContextEnricher: Derives context fields from a transaction timestamp
///
/// The ingestion layer normally supplies time_bin / weekday_weekend /
/// quarter already; these helpers fill them in when a table arrives without
/// them, and give tests a single definition of the bins.
///
/// All calendar computations are in UTC.
namespace ContextEnricher {

    /// Broken-down UTC calendar fields of a timestamp
    struct CalendarFields {
        int year{1970};
        int month{1};        // 1..12
        int day{1};          // 1..31
        int hour{0};         // 0..23
        int minute{0};
        int second{0};
        int day_of_week{4};  // 0 = Monday .. 6 = Sunday
    };

    /// Convert Unix seconds to UTC calendar fields
    CalendarFields ToCalendar(int64_t unix_seconds);

    /// Convert UTC calendar fields back to Unix seconds
    int64_t FromCalendar(int year, int month, int day,
                         int hour = 0, int minute = 0, int second = 0);

    /// Parse "YYYY-MM-DD HH:MM:SS", "YYYY-MM-DDTHH:MM:SS", "YYYY-MM-DD" or
    /// plain Unix seconds
    /// @return Unix seconds, std::nullopt if the text is not a timestamp
    std::optional<int64_t> ParseTimestamp(const std::string& text);

    /// morning (6-10), midday (11-13), afternoon (14-17), evening (18-21),
    /// night otherwise
    std::string TimeBinForHour(int hour);

    /// "weekend" for Saturday/Sunday, "weekday" otherwise
    /// @param day_of_week 0 = Monday .. 6 = Sunday
    std::string WeekdayWeekend(int day_of_week);

    /// Calendar quarter 1..4 of a month 1..12
    int QuarterForMonth(int month);

    /// Major festival window containing the date, if any
    std::optional<std::string> FestivalForDate(int month, int day);

    /// All time bins, in day order
    const std::vector<std::string>& TimeBins();

    /// Names of the festivals FestivalForDate can return
    const std::vector<std::string>& MajorFestivals();

    /// Fill the derived context fields of a record from its timestamp.
    /// Fields that are already set are left untouched.
    void EnrichTransaction(TransactionRecord& record);

    /// Enrich every record in place
    void EnrichTransactions(std::vector<TransactionRecord>& records);

} // namespace ContextEnricher

} // namespace profitlift
