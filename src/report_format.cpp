#include "report_format.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <sstream>

namespace tripscope {

namespace {

std::string fixed2(double value) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    return buffer;
}

}  // namespace

std::string formatSpeed(double speed) {
    if (!std::isfinite(speed)) {
        std::ostringstream out;
        out << speed;
        return out.str();
    }

    // Fewest significant digits that read back to the same double.
    char scientific[64];
    int digits = 1;
    for (; digits <= 17; ++digits) {
        std::snprintf(scientific, sizeof(scientific), "%.*e", digits - 1, speed);
        if (std::strtod(scientific, nullptr) == speed) {
            break;
        }
    }
    const char* mark = std::strchr(scientific, 'e');
    int exponent = mark ? std::atoi(mark + 1) : 0;
    if (exponent < -5 || exponent >= 16) {
        return scientific;
    }

    char plain[400];
    int decimals = std::max(0, digits - 1 - exponent);
    std::snprintf(plain, sizeof(plain), "%.*f", decimals, speed);
    return plain;
}

DisplayMetrics formatMetrics(const TripMetrics& metrics) {
    DisplayMetrics display;
    display.totalDistance = fixed2(metrics.totalDistanceKm) + " km";
    display.maxSpeed = formatSpeed(metrics.maxSpeed) + " Kmph";
    display.maxSpeedDetails = "(at " + fixed2(metrics.maxSpeedDistanceKm) + " km, time " +
                              metrics.maxSpeedTimestamp.formatClock() + ")";
    return display;
}

std::vector<std::string> formatStopAnalysis(const std::vector<StopReport>& stops) {
    std::vector<std::string> lines;
    for (const auto& report : stops) {
        lines.push_back("Stop detected at " + fixed2(report.stop.distanceKm) + " km.");
        for (const auto& sample : report.proximity) {
            lines.push_back("  - Speed ~" + std::to_string(sample.offsetMeters) + "m before: " +
                            formatSpeed(sample.matchedSpeed) + " Kmph (at " + fixed2(sample.matchedDistanceKm) +
                            " km)");
        }
    }
    return lines;
}

std::string profileName(const DecelerationProfile& profile) {
    return "Stop at " + profile.stop.timestamp.formatClock();
}

}  // namespace tripscope
