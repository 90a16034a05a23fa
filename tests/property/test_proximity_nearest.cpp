// tests/property/test_proximity_nearest.cpp
#include <cmath>
#include <random>
#include <vector>

#include "distance_search.hpp"
#include "stop_analysis.hpp"
#include "util/test_tables.hpp"

using namespace tripscope;

static std::size_t bruteNearest(const TelemetrySeries& series, std::size_t lastIndex, double targetKm) {
    std::size_t best = 0;
    for (std::size_t i = 1; i <= lastIndex; ++i) {
        if (std::fabs(series[i].cumulativeDistanceKm - targetKm) <
            std::fabs(series[best].cumulativeDistanceKm - targetKm)) {
            best = i;
        }
    }
    return best;
}

int main() {
    std::mt19937 rng(1234u);
    std::uniform_int_distribution<int> step(0, 40);  // whole meters, repeats are common
    std::uniform_real_distribution<double> target(-0.05, 2.0);

    for (int trial = 0; trial < 60; ++trial) {
        std::vector<double> increments(80);
        std::vector<double> speeds(80, 20.0);
        for (auto& d : increments) {
            d = static_cast<double>(step(rng));
        }
        auto series = tripscope_test::makeSeries(increments, speeds);
        if (!series.distanceMonotonic()) return 1;

        for (int q = 0; q < 40; ++q) {
            std::size_t last = static_cast<std::size_t>(rng() % series.size());
            double t = target(rng);
            if (nearestDistanceIndex(series, last, t) != bruteNearest(series, last, t)) return 2;
            // exact hits on stored keys resolve to the first occurrence
            double key = series[last].cumulativeDistanceKm;
            if (nearestDistanceIndex(series, last, key) != bruteNearest(series, last, key)) return 3;
        }
    }

    // non-monotonic series falls back to a scan with the same tie rule
    {
        std::mt19937 glitch(99u);
        std::uniform_real_distribution<double> step2(-30.0, 60.0);
        std::vector<double> increments(60);
        std::vector<double> speeds(60, 15.0);
        for (auto& d : increments) {
            d = step2(glitch);
        }
        increments[10] = -200.0;
        auto series = tripscope_test::makeSeries(increments, speeds);
        if (series.distanceMonotonic()) return 4;
        for (int q = 0; q < 200; ++q) {
            std::size_t last = static_cast<std::size_t>(glitch() % series.size());
            double t = target(glitch);
            if (nearestDistanceIndex(series, last, t) != bruteNearest(series, last, t)) return 5;
        }
    }

    // proximity samples never look past the stop
    {
        std::vector<double> increments(50, 20.0);
        std::vector<double> speeds(50, 30.0);
        speeds[40] = 0.0;
        auto series = tripscope_test::makeSeries(increments, speeds);
        auto stops = detectStops(series);
        if (stops.size() != 1) return 6;
        for (const auto& sample : sampleBeforeStop(series, stops[0], {1, 10, 50, 100, 500, 5000})) {
            if (sample.matchedIndex > stops[0].index) return 7;
            double t = stops[0].distanceKm - sample.offsetMeters / 1000.0;
            if (sample.matchedIndex != bruteNearest(series, stops[0].index, t)) return 8;
        }
    }
    return 0;
}
