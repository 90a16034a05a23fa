// tests/unit/test_stop_analysis.cpp
#include <vector>

#include "stop_analysis.hpp"
#include "trip_metrics.hpp"
#include "util/test_tables.hpp"

using namespace tripscope;
using tripscope_test::near;

int main() {
    // Case 1: speeds [10,10,0,0,5], increments [100,100,0,0,50] m
    {
        auto series = tripscope_test::makeSeries({100, 100, 0, 0, 50}, {10, 10, 0, 0, 5});
        if (series.size() != 5) return 1;
        const double expected[5] = {0.10, 0.20, 0.20, 0.20, 0.25};
        for (std::size_t i = 0; i < 5; ++i) {
            if (!near(series[i].cumulativeDistanceKm, expected[i])) return 2;
        }

        auto stops = detectStops(series);
        if (stops.size() != 1) return 3;
        if (stops[0].index != 2 || !near(stops[0].distanceKm, 0.20)) return 4;
        if (stops[0].timestamp.formatClock() != "08:00:02") return 5;

        TripMetrics metrics = summarizeTrip(series);
        if (!near(metrics.totalDistanceKm, 0.25)) return 6;
        if (metrics.maxSpeed != 10.0 || metrics.maxSpeedIndex != 0) return 7;
        if (!near(metrics.maxSpeedDistanceKm, 0.10)) return 8;

        // 50 m -> target 0.15 sits halfway between 0.10 and 0.20
        // 100 m -> target 0.10: exact hit at index 0
        auto proximity = sampleBeforeStop(series, stops[0], {100, 50});
        if (proximity.size() != 2) return 9;
        if (proximity[0].offsetMeters != 50 || proximity[1].offsetMeters != 100) return 10;
        if (proximity[0].matchedIndex > 1) return 11;
        if (proximity[1].matchedIndex != 0 || !near(proximity[1].matchedDistanceKm, 0.10)) return 12;
        if (proximity[1].matchedSpeed != 10.0) return 13;

        // 200 m and more reach back to or before the trip start
        auto early = sampleBeforeStop(series, stops[0], {1, 10, 200, 500});
        if (early.size() != 2) return 14;
        if (early[0].offsetMeters != 1 || early[1].offsetMeters != 10) return 15;
        if (early[0].matchedIndex != 1) return 16;

        auto profiles = extractDecelerationProfiles(series, stops);
        if (profiles.size() != 1) return 17;
        const auto& profile = profiles[0];
        if (profile.startIndex != 0 || profile.points.size() != 3) return 18;
        if (!near(profile.points[0].relativeDistanceM, 0.0, 1e-6)) return 19;
        if (!near(profile.points[1].relativeDistanceM, 100.0, 1e-6)) return 20;
        if (!near(profile.points[2].relativeDistanceM, 100.0, 1e-6)) return 21;
        if (profile.points[2].speed != 0.0) return 22;
    }

    // Case 2: no motion-to-stop transition
    {
        auto idle = tripscope_test::makeSeries({0, 0, 0}, {0, 0, 0});
        if (!detectStops(idle).empty()) return 23;
        auto cruising = tripscope_test::makeSeries({10, 10, 10}, {30, 31, 32});
        if (!detectStops(cruising).empty()) return 24;
        if (!extractDecelerationProfiles(cruising, {}).empty()) return 25;
    }

    // Case 3: several stops; zero runs give a single event each
    {
        auto series = tripscope_test::makeSeries({50, 50, 0, 0, 0, 40, 40, 0, 30, 0},
                                                 {20, 15, 0, 0, 0, 10, 12, 0, 5, 0});
        auto stops = detectStops(series);
        if (stops.size() != 3) return 26;
        if (stops[0].index != 2 || stops[1].index != 7 || stops[2].index != 9) return 27;
    }

    // Case 4: 2 km at 20 m spacing, one stop at the end; 1 km window
    {
        std::vector<double> increments(101, 20.0);
        std::vector<double> speeds(101, 40.0);
        speeds.back() = 0.0;
        auto series = tripscope_test::makeSeries(increments, speeds);
        auto stops = detectStops(series);
        if (stops.size() != 1 || stops[0].index != 100) return 28;
        auto profiles = extractDecelerationProfiles(series, stops, 1.0);
        if (profiles.size() != 1) return 29;
        const auto& pts = profiles[0].points;
        if (pts.size() != 51) return 30;
        if (!near(pts.front().relativeDistanceM, 0.0, 1e-6)) return 31;
        if (!near(pts.back().relativeDistanceM, 1000.0, 1e-6)) return 32;

        auto proximity = sampleBeforeStop(series, stops[0], {1, 10, 50, 100});
        if (proximity.size() != 4) return 33;
        if (proximity[0].matchedIndex != 100) return 34;
        if (proximity[1].matchedIndex != 99 && proximity[1].matchedIndex != 100) return 37;
        if (proximity[2].matchedIndex != 97 && proximity[2].matchedIndex != 98) return 35;
        if (proximity[3].matchedIndex != 95) return 36;
    }

    return 0;
}
