// tests/unit/test_trip_metrics.cpp
#include <string>

#include "analysis_pipeline.hpp"
#include "trip_metrics.hpp"
#include "util/test_tables.hpp"

using namespace tripscope;
using tripscope_test::near;

int main() {
    // Case 1: stable argmax picks the first maximum
    {
        auto series = tripscope_test::makeSeries({10, 20, 30, 40, 50}, {12, 48, 30, 48, 7});
        TripMetrics m = summarizeTrip(series);
        if (m.maxSpeed != 48.0 || m.maxSpeedIndex != 1) return 1;
        if (!near(m.maxSpeedDistanceKm, 0.03)) return 2;
        if (m.maxSpeedTimestamp.formatClock() != "08:00:01") return 3;
        if (!near(m.totalDistanceKm, 0.15)) return 4;
        if (m.sampleCount != 5) return 5;
    }

    // Case 2: empty series
    {
        TripMetrics m = summarizeTrip(TelemetrySeries{});
        if (m.sampleCount != 0 || m.totalDistanceKm != 0.0) return 6;
        if (!resampleByTime(TelemetrySeries{}).empty()) return 7;
    }

    // Case 3: 10 s buckets, one sample per second from 08:00:00
    {
        std::vector<double> increments;
        std::vector<double> speeds;
        for (int i = 0; i < 25; ++i) {
            increments.push_back(10.0);
            speeds.push_back(static_cast<double>(i));
        }
        auto series = tripscope_test::makeSeries(increments, speeds);
        auto points = resampleByTime(series, 10.0);
        if (points.size() != 3) return 8;
        if (points[0].bucketStart.formatClock() != "08:00:00") return 9;
        if (points[1].bucketStart.formatClock() != "08:00:10") return 10;
        if (points[2].bucketStart.formatClock() != "08:00:20") return 11;
        if (!near(points[0].meanSpeed, 4.5) || points[0].sampleCount != 10) return 12;
        if (!near(points[2].meanSpeed, 22.0) || points[2].sampleCount != 5) return 13;
        if (!near(points[0].meanDistanceIncrement, 10.0)) return 14;
        // cumulative 0.01 .. 0.10 km
        if (!near(points[0].meanCumulativeDistanceKm, 0.055)) return 15;
    }

    // Case 4: gaps leave no empty buckets and out-of-order rows are bucketed by time
    {
        RawTable table;
        table.push_back(tripscope_test::makeRow("01/02/2024", "08:01:05", 10.0, 30.0));
        table.push_back(tripscope_test::makeRow("01/02/2024", "08:00:01", 10.0, 10.0));
        table.push_back(tripscope_test::makeRow("01/02/2024", "08:00:03", 10.0, 20.0));
        DateParser parser;
        auto series = buildSeries(table, 0, parser);
        if (!series) return 16;
        auto points = resampleByTime(*series, 10.0);
        if (points.size() != 2) return 17;
        if (!(points[0].bucketStart < points[1].bucketStart)) return 18;
        if (!near(points[0].meanSpeed, 15.0)) return 19;
        if (points[1].bucketStart.formatClock() != "08:01:00") return 20;

        if (!resampleByTime(*series, 0.0).empty()) return 21;
        auto minute = resampleByTime(*series, 60.0);
        if (minute.size() != 2) return 22;
    }

    // Case 5: sub-millisecond widths are widened, never collapsed into one bucket
    {
        auto series = tripscope_test::makeSeries({10, 10, 10}, {1, 2, 3});
        auto points = resampleByTime(series, 1e-12);
        if (points.size() != 3) return 23;
        for (std::size_t i = 0; i < points.size(); ++i) {
            if (points[i].sampleCount != 1) return 24;
            double gap = series[i].timestamp.epochSeconds() - points[i].bucketStart.epochSeconds();
            if (gap < -1e-6 || gap > kMinResampleIntervalSeconds + 1e-6) return 25;
            if (points[i].meanSpeed != series[i].speed) return 26;
        }
        if (points[0].bucketStart.date().year != 2024) return 27;

        AnalysisConfig config;
        config.resampleIntervalSeconds = 1e-12;
        if (config.sanitized().resampleIntervalSeconds != kMinResampleIntervalSeconds) return 28;
        config.resampleIntervalSeconds = 0.5;
        if (config.sanitized().resampleIntervalSeconds != 0.5) return 29;
    }

    return 0;
}
