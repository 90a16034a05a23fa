#pragma once

#include "data_types.hpp"

#include <optional>
#include <string>

namespace tripscope {

enum class DateOrder {
    DayFirst,
    MonthFirst,
};

// Parses the date and time columns of a telemetry export. The field order is
// injected; nothing depends on the process locale or timezone.
class DateParser {
public:
    struct Rules {
        DateOrder order{DateOrder::DayFirst};
        int twoDigitYearPivot{70};  // yy < pivot -> 20yy, otherwise 19yy
    };

    DateParser();
    explicit DateParser(Rules rules);

    std::optional<CivilDate> parseDate(const RawCell& cell) const;
    std::optional<TimeOfDay> parseTime(const RawCell& cell) const;
    std::optional<DateTime> parseDateTime(const RawCell& dateCell, const RawCell& timeCell) const;

    std::optional<CivilDate> parseDateText(const std::string& text) const;
    std::optional<TimeOfDay> parseTimeText(const std::string& text) const;

    const Rules& rules() const { return rules_; }

private:
    std::optional<CivilDate> resolveNumeric(long a, long b, long c, std::size_t yearDigits) const;
    int expandYear(long year, std::size_t digits) const;

    Rules rules_;
};

}  // namespace tripscope
