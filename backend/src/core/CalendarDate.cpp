#include "CalendarDate.hpp"
#include <cstdio>
#include <iomanip>
#include <sstream>

/*
  days_from_civil / civil_from_days after Howard Hinnant's algorithms.
  Eras are 400-year blocks so the arithmetic stays in plain integers.
*/
long CalendarDate::toDays() const {
    long y = static_cast<long>(year) - (month <= 2 ? 1 : 0);
    long era = (y >= 0 ? y : y - 399) / 400;
    long yoe = y - era * 400;
    long m = month;
    long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CalendarDate CalendarDate::fromDays(long days) {
    days += 719468;
    long era = (days >= 0 ? days : days - 146096) / 146097;
    long doe = days - era * 146097;
    long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    long y = yoe + era * 400;
    long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    long mp = (5 * doy + 2) / 153;
    long d = doy - (153 * mp + 2) / 5 + 1;
    long m = mp + (mp < 10 ? 3 : -9);

    CalendarDate out;
    out.year = static_cast<int>(y + (m <= 2 ? 1 : 0));
    out.month = static_cast<int>(m);
    out.day = static_cast<int>(d);
    return out;
}

CalendarDate CalendarDate::fromLocalTime(std::time_t t) {
    std::tm local{};
    localtime_r(&t, &local);

    CalendarDate out;
    out.year = local.tm_year + 1900;
    out.month = local.tm_mon + 1;
    out.day = local.tm_mday;
    return out;
}

std::string CalendarDate::toString() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year << "-"
        << std::setw(2) << month << "-"
        << std::setw(2) << day;
    return oss.str();
}

std::optional<CalendarDate> CalendarDate::parse(const std::string& text) {
    int y = 0, m = 0, d = 0;
    char tail = 0;
    if (std::sscanf(text.c_str(), "%d-%d-%d%c", &y, &m, &d, &tail) != 3) {
        return std::nullopt;
    }
    if (m < 1 || m > 12 || d < 1 || d > 31) {
        return std::nullopt;
    }

    CalendarDate out{ y, m, d };
    // rejects 2023-02-30 and friends
    if (fromDays(out.toDays()) != out) {
        return std::nullopt;
    }
    return out;
}
