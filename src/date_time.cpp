#include "date_time.hpp"

#include <cmath>
#include <cstdio>

namespace tripscope {

namespace {
constexpr double kSecondsPerDay = 86400.0;
}

// Proleptic Gregorian day count relative to 1970-01-01.
std::int64_t daysFromCivil(int year, int month, int day) {
    std::int64_t y = static_cast<std::int64_t>(year) - (month <= 2 ? 1 : 0);
    std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    std::int64_t yoe = y - era * 400;
    std::int64_t mp = (month + 9) % 12;
    std::int64_t doy = (153 * mp + 2) / 5 + day - 1;
    std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

CivilDate civilFromDays(std::int64_t days) {
    days += 719468;
    std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    std::int64_t doe = days - era * 146097;
    std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    std::int64_t mp = (5 * doy + 2) / 153;
    CivilDate date;
    date.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    date.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    date.year = static_cast<int>(yoe + era * 400 + (date.month <= 2 ? 1 : 0));
    return date;
}

bool isValidDate(int year, int month, int day) {
    if (year < 1 || year > 9999 || month < 1 || month > 12 || day < 1) {
        return false;
    }
    static const int kDaysInMonth[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    int limit = kDaysInMonth[month - 1];
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (month == 2 && leap) {
        limit = 29;
    }
    return day <= limit;
}

DateTime DateTime::fromCivil(const CivilDate& date, const TimeOfDay& time) {
    double days = static_cast<double>(daysFromCivil(date.year, date.month, date.day));
    double seconds = time.hour * 3600.0 + time.minute * 60.0 + time.second;
    return DateTime(days * kSecondsPerDay + seconds);
}

CivilDate DateTime::date() const {
    auto days = static_cast<std::int64_t>(std::floor(epochSeconds_ / kSecondsPerDay));
    return civilFromDays(days);
}

TimeOfDay DateTime::timeOfDay() const {
    double days = std::floor(epochSeconds_ / kSecondsPerDay);
    // Round to the microsecond so 12:00:00 does not print as 11:59:59.
    double secondsOfDay = std::round((epochSeconds_ - days * kSecondsPerDay) * 1e6) / 1e6;
    if (secondsOfDay >= kSecondsPerDay) {
        secondsOfDay = 0.0;
    }
    TimeOfDay time;
    time.hour = static_cast<int>(secondsOfDay / 3600.0);
    secondsOfDay -= time.hour * 3600.0;
    time.minute = static_cast<int>(secondsOfDay / 60.0);
    time.second = secondsOfDay - time.minute * 60.0;
    return time;
}

std::string DateTime::formatClock() const {
    TimeOfDay time = timeOfDay();
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d", time.hour, time.minute,
                  static_cast<int>(std::floor(time.second)));
    return buffer;
}

std::string DateTime::formatIso() const {
    CivilDate d = date();
    char buffer[40];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%s", d.year, d.month, d.day, formatClock().c_str());
    return buffer;
}

}  // namespace tripscope
