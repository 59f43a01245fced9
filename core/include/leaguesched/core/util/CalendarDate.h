#pragma once

#include <optional>
#include <string>

namespace leaguesched::core::util {

struct CalendarDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    CalendarDate AddDays(int days) const;
    std::string ToString() const;

    // Accepts YYYY-MM-DD only.
    static std::optional<CalendarDate> Parse(const std::string& text);

    bool operator==(const CalendarDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const CalendarDate& other) const { return !(*this == other); }
    bool operator<(const CalendarDate& other) const;
};

struct ClockTime {
    int hour = 0;
    int minute = 0;

    int minutes_since_midnight() const { return hour * 60 + minute; }
    ClockTime AddMinutes(int minutes) const;
    std::string ToString() const;

    // Accepts H:MM or HH:MM.
    static std::optional<ClockTime> Parse(const std::string& text);

    bool operator==(const ClockTime& other) const {
        return hour == other.hour && minute == other.minute;
    }
    bool operator!=(const ClockTime& other) const { return !(*this == other); }
    bool operator<(const ClockTime& other) const {
        return minutes_since_midnight() < other.minutes_since_midnight();
    }
};

}  // namespace leaguesched::core::util
