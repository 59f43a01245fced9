#include "leaguesched/core/util/CalendarDate.h"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace leaguesched::core::util {

namespace {

// Proleptic Gregorian day count relative to 1970-01-01.
long long DaysFromCivil(int year, int month, int day) {
    year -= month <= 2 ? 1 : 0;
    const long long era = (year >= 0 ? year : year - 399) / 400;
    const long long yoe = year - era * 400;
    const long long doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CalendarDate CivilFromDays(long long days) {
    days += 719468;
    const long long era = (days >= 0 ? days : days - 146096) / 146097;
    const long long doe = days - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;
    CalendarDate date;
    date.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    date.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    date.year = static_cast<int>(yoe + era * 400 + (date.month <= 2 ? 1 : 0));
    return date;
}

bool IsLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int DaysInMonth(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && IsLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

bool ParseDigits(const std::string& text, size_t begin, size_t count, int& value) {
    if (begin + count > text.size()) {
        return false;
    }
    value = 0;
    for (size_t i = begin; i < begin + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    return true;
}

}  // namespace

CalendarDate CalendarDate::AddDays(int days) const {
    return CivilFromDays(DaysFromCivil(year, month, day) + days);
}

std::string CalendarDate::ToString() const {
    std::ostringstream out;
    out << std::setfill('0') << std::setw(4) << year << '-'
        << std::setw(2) << month << '-'
        << std::setw(2) << day;
    return out.str();
}

std::optional<CalendarDate> CalendarDate::Parse(const std::string& text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    CalendarDate date;
    if (!ParseDigits(text, 0, 4, date.year) ||
        !ParseDigits(text, 5, 2, date.month) ||
        !ParseDigits(text, 8, 2, date.day)) {
        return std::nullopt;
    }
    if (date.month < 1 || date.month > 12) {
        return std::nullopt;
    }
    if (date.day < 1 || date.day > DaysInMonth(date.year, date.month)) {
        return std::nullopt;
    }
    return date;
}

bool CalendarDate::operator<(const CalendarDate& other) const {
    return DaysFromCivil(year, month, day) < DaysFromCivil(other.year, other.month, other.day);
}

ClockTime ClockTime::AddMinutes(int minutes) const {
    int total = (minutes_since_midnight() + minutes) % (24 * 60);
    if (total < 0) {
        total += 24 * 60;
    }
    return {total / 60, total % 60};
}

std::string ClockTime::ToString() const {
    std::ostringstream out;
    out << std::setfill('0') << std::setw(2) << hour << ':' << std::setw(2) << minute;
    return out.str();
}

std::optional<ClockTime> ClockTime::Parse(const std::string& text) {
    const auto colon = text.find(':');
    if (colon == std::string::npos || colon == 0 || colon > 2 || text.size() != colon + 3) {
        return std::nullopt;
    }
    ClockTime time;
    if (!ParseDigits(text, 0, colon, time.hour) || !ParseDigits(text, colon + 1, 2, time.minute)) {
        return std::nullopt;
    }
    if (time.hour > 23 || time.minute > 59) {
        return std::nullopt;
    }
    return time;
}

}  // namespace leaguesched::core::util
