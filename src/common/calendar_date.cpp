#include "tally_reports/common/calendar_date.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <vector>

namespace tally_reports {
namespace {

constexpr std::array<const char*, 12> kMonthNames = {
    "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"};
constexpr std::array<const char*, 12> kFullMonthNames = {
    "january", "february", "march",     "april",   "may",      "june",
    "july",    "august",   "september", "october", "november", "december"};

std::int64_t DaysFromCivil(std::int64_t year, int month, int day) {
    year -= month <= 2 ? 1 : 0;
    const std::int64_t era = (year >= 0 ? year : year - 399) / 400;
    const std::int64_t yoe = year - era * 400;
    const std::int64_t doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void CivilFromDays(std::int64_t days, int* year, int* month, int* day) {
    days += 719468;
    const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const std::int64_t doe = days - era * 146097;
    const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const std::int64_t mp = (5 * doy + 2) / 153;
    const int d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    const int m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    *year = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
    *month = m;
    *day = d;
}

bool IsLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month) {
    static constexpr std::array<int, 12> kDays = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && IsLeapYear(year)) {
        return 29;
    }
    return kDays[static_cast<std::size_t>(month - 1)];
}

bool ParseDigits(const std::string& text, std::size_t min_len, std::size_t max_len, int* out) {
    if (text.size() < min_len || text.size() > max_len) {
        return false;
    }
    int value = 0;
    for (const char ch : text) {
        if (std::isdigit(static_cast<unsigned char>(ch)) == 0) {
            return false;
        }
        value = value * 10 + (ch - '0');
    }
    *out = value;
    return true;
}

bool ParseMonthName(const std::string& text, int* out) {
    if (text.size() < 3) {
        return false;
    }
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    for (std::size_t i = 0; i < kMonthNames.size(); ++i) {
        if (lowered == kMonthNames[i] || lowered == kFullMonthNames[i]) {
            *out = static_cast<int>(i) + 1;
            return true;
        }
    }
    return false;
}

std::string StripTimePart(std::string text) {
    const auto space = text.find(' ');
    if (space != std::string::npos) {
        text.erase(space);
    }
    if (text.size() > 10 && text[10] == 'T') {
        text.erase(10);
    }
    return text;
}

std::vector<std::string> SplitDateParts(const std::string& text, char separator) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        const auto pos = text.find(separator, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

}  // namespace

bool CalendarDate::FromYmd(int year, int month, int day, CalendarDate* out) {
    if (out == nullptr) {
        return false;
    }
    if (year < 1 || year > 9999 || month < 1 || month > 12 || day < 1 ||
        day > DaysInMonth(year, month)) {
        return false;
    }
    *out = CalendarDate(DaysFromCivil(year, month, day));
    return true;
}

bool CalendarDate::Parse(const std::string& raw, CalendarDate* out) {
    if (out == nullptr) {
        return false;
    }
    const auto begin = raw.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return false;
    }
    const auto end = raw.find_last_not_of(" \t\r\n");
    const std::string text = StripTimePart(raw.substr(begin, end - begin + 1));

    int year = 0;
    int month = 0;
    int day = 0;
    if (text.size() == 8 && ParseDigits(text, 8, 8, &year)) {
        return FromYmd(year / 10000, (year / 100) % 100, year % 100, out);
    }

    const char separator = text.find('-') != std::string::npos ? '-' : '/';
    const auto parts = SplitDateParts(text, separator);
    if (parts.size() != 3) {
        return false;
    }

    if (parts[0].size() == 4) {
        if (!ParseDigits(parts[0], 4, 4, &year) || !ParseDigits(parts[1], 1, 2, &month) ||
            !ParseDigits(parts[2], 1, 2, &day)) {
            return false;
        }
        return FromYmd(year, month, day, out);
    }

    if (!ParseDigits(parts[0], 1, 2, &day)) {
        return false;
    }
    if (ParseDigits(parts[1], 1, 2, &month)) {
        if (!ParseDigits(parts[2], 4, 4, &year)) {
            return false;
        }
        return FromYmd(year, month, day, out);
    }
    if (separator != '-' || !ParseMonthName(parts[1], &month)) {
        return false;
    }
    if (ParseDigits(parts[2], 2, 2, &year)) {
        year += 2000;
    } else if (!ParseDigits(parts[2], 4, 4, &year)) {
        return false;
    }
    return FromYmd(year, month, day, out);
}

int CalendarDate::Year() const {
    int year = 0;
    int month = 0;
    int day = 0;
    CivilFromDays(days_, &year, &month, &day);
    return year;
}

int CalendarDate::Month() const {
    int year = 0;
    int month = 0;
    int day = 0;
    CivilFromDays(days_, &year, &month, &day);
    return month;
}

int CalendarDate::Day() const {
    int year = 0;
    int month = 0;
    int day = 0;
    CivilFromDays(days_, &year, &month, &day);
    return day;
}

std::string CalendarDate::ToIso() const {
    int year = 0;
    int month = 0;
    int day = 0;
    CivilFromDays(days_, &year, &month, &day);
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return std::string(buffer);
}

}  // namespace tally_reports
