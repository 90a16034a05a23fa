#pragma once

#include "data_types.hpp"
#include "date_parser.hpp"
#include "series_builder.hpp"

#include <cmath>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace tripscope_test {

inline bool near(double a, double b, double tol = 1e-9) {
    return std::fabs(a - b) <= tol;
}

inline tripscope::RawRow makeRow(const std::string& date, const std::string& time, double distance, double speed) {
    return tripscope::RawRow{date, time, distance, speed};
}

inline std::string clockAt(int secondsOfDay) {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d", secondsOfDay / 3600, (secondsOfDay / 60) % 60,
                  secondsOfDay % 60);
    return buffer;
}

// One row per second starting 08:00:00 on 01/02/2024 (1 February).
inline tripscope::RawTable makeTable(const std::vector<double>& increments, const std::vector<double>& speeds) {
    tripscope::RawTable table;
    for (std::size_t i = 0; i < increments.size() && i < speeds.size(); ++i) {
        table.push_back(makeRow("01/02/2024", clockAt(8 * 3600 + static_cast<int>(i)), increments[i], speeds[i]));
    }
    return table;
}

inline tripscope::TelemetrySeries makeSeries(const std::vector<double>& increments, const std::vector<double>& speeds) {
    tripscope::DateParser parser;
    auto series = tripscope::buildSeries(makeTable(increments, speeds), 0, parser);
    return series ? *series : tripscope::TelemetrySeries{};
}

}  // namespace tripscope_test
