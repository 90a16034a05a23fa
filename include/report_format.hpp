#pragma once

#include "analysis_pipeline.hpp"

#include <string>
#include <vector>

namespace tripscope {

struct DisplayMetrics {
    std::string totalDistance;    // "12.34 km"
    std::string maxSpeed;         // "56 Kmph"
    std::string maxSpeedDetails;  // "(at 3.21 km, time 08:15:42)"
};

// Shortest decimal form that round-trips: 10 -> "10", 10.5 -> "10.5",
// 1234567 -> "1234567". Exponent form only outside [1e-5, 1e16).
std::string formatSpeed(double speed);

DisplayMetrics formatMetrics(const TripMetrics& metrics);

// "Stop detected at X.XX km." per stop, each followed by its
// "  - Speed ~Nm before: S Kmph (at X.XX km)" lines.
std::vector<std::string> formatStopAnalysis(const std::vector<StopReport>& stops);

std::string profileName(const DecelerationProfile& profile);

}  // namespace tripscope
