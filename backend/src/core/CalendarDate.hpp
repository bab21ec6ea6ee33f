#pragma once
#include <ctime>
#include <optional>
#include <string>

// Civil date without time of day. Used for streaks, where only the
// calendar day a session was recorded on matters.
struct CalendarDate {
    int year = 1970;
    int month = 1;  // 1-12
    int day = 1;    // 1-31

    // Days since 1970-01-01 (proleptic Gregorian)
    long toDays() const;
    static CalendarDate fromDays(long days);

    // Calendar day of `t` in the process local time zone
    static CalendarDate fromLocalTime(std::time_t t);

    CalendarDate addDays(long n) const { return fromDays(toDays() + n); }

    std::string toString() const; // YYYY-MM-DD
    static std::optional<CalendarDate> parse(const std::string& text);

    bool operator==(const CalendarDate& o) const {
        return year == o.year && month == o.month && day == o.day;
    }
    bool operator!=(const CalendarDate& o) const { return !(*this == o); }
    bool operator<(const CalendarDate& o) const { return toDays() < o.toDays(); }
    bool operator<=(const CalendarDate& o) const { return toDays() <= o.toDays(); }
};
