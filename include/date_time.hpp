#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tripscope {

struct CivilDate {
    int year{1970};
    int month{1};
    int day{1};
};

struct TimeOfDay {
    int hour{0};
    int minute{0};
    double second{0.0};  // [0, 60)
};

// Zone-less civil timestamp, seconds since 1970-01-01T00:00:00.
class DateTime {
public:
    DateTime() = default;
    explicit DateTime(double epochSeconds) : epochSeconds_(epochSeconds) {}

    static DateTime fromCivil(const CivilDate& date, const TimeOfDay& time = TimeOfDay{});

    double epochSeconds() const { return epochSeconds_; }

    CivilDate date() const;
    TimeOfDay timeOfDay() const;

    std::string formatClock() const;  // HH:MM:SS
    std::string formatIso() const;    // YYYY-MM-DDTHH:MM:SS

    friend bool operator==(const DateTime& a, const DateTime& b) { return a.epochSeconds_ == b.epochSeconds_; }
    friend bool operator!=(const DateTime& a, const DateTime& b) { return !(a == b); }
    friend bool operator<(const DateTime& a, const DateTime& b) { return a.epochSeconds_ < b.epochSeconds_; }

private:
    double epochSeconds_{0.0};
};

std::int64_t daysFromCivil(int year, int month, int day);
CivilDate civilFromDays(std::int64_t days);
bool isValidDate(int year, int month, int day);

}  // namespace tripscope
