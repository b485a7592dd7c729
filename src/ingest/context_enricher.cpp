// File: src/ingest/context_enricher.cpp
#include "ingest/context_enricher.hpp"
#include <cctype>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <tuple>

namespace profitlift {
namespace ContextEnricher {

namespace {

constexpr int64_t kSecondsPerDay = 86400;

// Days since 1970-01-01 for a proleptic Gregorian date
// (Howard Hinnant's days_from_civil)
int64_t DaysFromCivil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

// Inverse of DaysFromCivil
std::tuple<int64_t, unsigned, unsigned> CivilFromDays(int64_t z) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return {y + (m <= 2), m, d};
}

struct FestivalWindow {
    const char* name;
    int month;
    int start_day;
    int end_day;
};

// Approximate windows; lunar festivals shift every year
const FestivalWindow kFestivalWindows[] = {
    {"holi", 3, 6, 10},
    {"eid_ul_fitr", 4, 20, 24},
    {"navratri", 10, 15, 24},
    {"diwali", 11, 10, 16},
    {"christmas", 12, 23, 27},
    {"new_year", 12, 29, 31},
    {"new_year", 1, 1, 3},
};

bool AllDigits(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    size_t start = (text[0] == '-') ? 1 : 0;
    if (start == text.size()) {
        return false;
    }
    for (size_t i = start; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

CalendarFields ToCalendar(int64_t unix_seconds) {
    int64_t days = unix_seconds / kSecondsPerDay;
    int64_t rem = unix_seconds % kSecondsPerDay;
    if (rem < 0) {
        rem += kSecondsPerDay;
        --days;
    }

    auto [year, month, day] = CivilFromDays(days);

    CalendarFields fields;
    fields.year = static_cast<int>(year);
    fields.month = static_cast<int>(month);
    fields.day = static_cast<int>(day);
    fields.hour = static_cast<int>(rem / 3600);
    fields.minute = static_cast<int>((rem % 3600) / 60);
    fields.second = static_cast<int>(rem % 60);

    // 1970-01-01 was a Thursday (index 3 with Monday = 0)
    int64_t dow = (days + 3) % 7;
    if (dow < 0) {
        dow += 7;
    }
    fields.day_of_week = static_cast<int>(dow);
    return fields;
}

int64_t FromCalendar(int year, int month, int day, int hour, int minute, int second) {
    return DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * kSecondsPerDay +
           hour * 3600 + minute * 60 + second;
}

std::optional<int64_t> ParseTimestamp(const std::string& text) {
    if (AllDigits(text)) {
        try {
            return std::stoll(text);
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    char sep = ' ';
    int matched = std::sscanf(text.c_str(), "%d-%d-%d%c%d:%d:%d",
                              &year, &month, &day, &sep, &hour, &minute, &second);
    if (matched == 3) {
        hour = minute = second = 0;
    } else if (matched < 6 || (sep != ' ' && sep != 'T')) {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) {
        return std::nullopt;
    }

    return FromCalendar(year, month, day, hour, minute, second);
}

std::string TimeBinForHour(int hour) {
    if (hour >= 6 && hour < 11) return "morning";
    if (hour >= 11 && hour < 14) return "midday";
    if (hour >= 14 && hour < 18) return "afternoon";
    if (hour >= 18 && hour < 22) return "evening";
    return "night";
}

std::string WeekdayWeekend(int day_of_week) {
    return day_of_week >= 5 ? "weekend" : "weekday";
}

int QuarterForMonth(int month) {
    return (month - 1) / 3 + 1;
}

std::optional<std::string> FestivalForDate(int month, int day) {
    for (const auto& window : kFestivalWindows) {
        if (month == window.month && day >= window.start_day && day <= window.end_day) {
            return std::string(window.name);
        }
    }
    return std::nullopt;
}

const std::vector<std::string>& TimeBins() {
    static const std::vector<std::string> bins = {
        "morning", "midday", "afternoon", "evening", "night"
    };
    return bins;
}

const std::vector<std::string>& MajorFestivals() {
    static const std::vector<std::string> festivals = {
        "diwali", "holi", "navratri", "eid_ul_fitr", "christmas", "new_year"
    };
    return festivals;
}

void EnrichTransaction(TransactionRecord& record) {
    CalendarFields fields = ToCalendar(record.timestamp);

    if (record.time_bin.empty()) {
        record.time_bin = TimeBinForHour(fields.hour);
    }
    if (record.weekday_weekend.empty()) {
        record.weekday_weekend = WeekdayWeekend(fields.day_of_week);
    }
    if (record.quarter == 0) {
        record.quarter = QuarterForMonth(fields.month);
    }
    if (!record.festival) {
        record.festival = FestivalForDate(fields.month, fields.day);
    }
}

void EnrichTransactions(std::vector<TransactionRecord>& records) {
    for (auto& record : records) {
        EnrichTransaction(record);
    }
}

} // namespace ContextEnricher
} // namespace profitlift
