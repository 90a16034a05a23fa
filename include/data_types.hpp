#pragma once

#include "date_time.hpp"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace tripscope {

// Cell as handed over by a table decoder: empty, number, text or date.
using RawCell = std::variant<std::monostate, double, std::string, DateTime>;
using RawRow = std::vector<RawCell>;
using RawTable = std::vector<RawRow>;

struct TelemetrySample {
    DateTime timestamp;
    double distanceIncrement{0.0};     // meters since previous reading
    double speed{0.0};                 // km/h
    double cumulativeDistanceKm{0.0};  // running sum of increments / 1000
    std::size_t sourceRow{0};          // row index in the raw table
};

struct StopEvent {
    std::size_t index{0};  // position in the sample sequence
    double distanceKm{0.0};
    DateTime timestamp;
};

struct ProximitySample {
    StopEvent stop;
    int offsetMeters{0};
    std::size_t matchedIndex{0};
    double matchedDistanceKm{0.0};
    double matchedSpeed{0.0};
    DateTime matchedTimestamp;
};

struct ProfilePoint {
    double relativeDistanceM{0.0};
    double speed{0.0};
};

struct DecelerationProfile {
    StopEvent stop;
    std::size_t startIndex{0};
    std::vector<ProfilePoint> points;
};

struct TripMetrics {
    double totalDistanceKm{0.0};
    double maxSpeed{0.0};
    std::size_t maxSpeedIndex{0};
    double maxSpeedDistanceKm{0.0};
    DateTime maxSpeedTimestamp;
    std::size_t sampleCount{0};
};

struct Point2D {
    double x{0.0};
    double y{0.0};
};

struct ResampledPoint {
    DateTime bucketStart;
    double meanDistanceIncrement{0.0};
    double meanSpeed{0.0};
    double meanCumulativeDistanceKm{0.0};
    std::size_t sampleCount{0};
};

}  // namespace tripscope
