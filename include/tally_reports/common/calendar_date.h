#pragma once

#include <cstdint>
#include <string>

namespace tally_reports {

// Proleptic Gregorian calendar day stored as days since 1970-01-01.
class CalendarDate {
public:
    CalendarDate() = default;

    static bool FromYmd(int year, int month, int day, CalendarDate* out);
    static CalendarDate FromDayNumber(std::int64_t days) { return CalendarDate(days); }

    // Accepts YYYY-MM-DD, DD-MM-YYYY, DD/MM/YYYY, YYYY/MM/DD, YYYYMMDD and
    // D-Mon-YY[YY]. A trailing time part separated by ' ' or 'T' is ignored.
    static bool Parse(const std::string& text, CalendarDate* out);

    int Year() const;
    int Month() const;
    int Day() const;

    std::int64_t DayNumber() const { return days_; }
    std::string ToIso() const;
    CalendarDate AddDays(std::int64_t days) const { return CalendarDate(days_ + days); }

    // Whole days from `from` to `to`; negative when `to` precedes `from`.
    static std::int64_t DaysBetween(const CalendarDate& from, const CalendarDate& to) {
        return to.days_ - from.days_;
    }

    bool operator==(const CalendarDate& other) const { return days_ == other.days_; }
    bool operator!=(const CalendarDate& other) const { return days_ != other.days_; }
    bool operator<(const CalendarDate& other) const { return days_ < other.days_; }
    bool operator<=(const CalendarDate& other) const { return days_ <= other.days_; }
    bool operator>(const CalendarDate& other) const { return days_ > other.days_; }
    bool operator>=(const CalendarDate& other) const { return days_ >= other.days_; }

private:
    explicit CalendarDate(std::int64_t days) : days_(days) {}

    std::int64_t days_{0};
};

}  // namespace tally_reports
