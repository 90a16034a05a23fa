#include "trip_metrics.hpp"

#include <cmath>
#include <algorithm>
#include <cstdint>
#include <map>

namespace tripscope {

TripMetrics summarizeTrip(const TelemetrySeries& series) {
    TripMetrics metrics;
    if (series.empty()) {
        return metrics;
    }

    std::size_t best = 0;
    for (std::size_t i = 1; i < series.size(); ++i) {
        if (series[i].speed > series[best].speed) {
            best = i;
        }
    }

    metrics.totalDistanceKm = series.back().cumulativeDistanceKm;
    metrics.maxSpeed = series[best].speed;
    metrics.maxSpeedIndex = best;
    metrics.maxSpeedDistanceKm = series[best].cumulativeDistanceKm;
    metrics.maxSpeedTimestamp = series[best].timestamp;
    metrics.sampleCount = series.size();
    return metrics;
}

std::vector<ResampledPoint> resampleByTime(const TelemetrySeries& series, double intervalSeconds) {
    std::vector<ResampledPoint> points;
    if (series.empty() || !(intervalSeconds > 0.0)) {
        return points;
    }
    const double width = std::max(intervalSeconds, kMinResampleIntervalSeconds);
    // 2^62
    constexpr double kMaxBucketKey = 4611686018427387904.0;

    struct Accumulator {
        double distance{0.0};
        double speed{0.0};
        double cumulative{0.0};
        std::size_t count{0};
    };

    // Samples are not guaranteed to be time ordered, hence the ordered map.
    std::map<std::int64_t, Accumulator> buckets;
    for (const auto& sample : series.samples()) {
        double slot = std::floor(sample.timestamp.epochSeconds() / width);
        if (!(std::fabs(slot) < kMaxBucketKey)) {
            continue;
        }
        auto key = static_cast<std::int64_t>(slot);
        Accumulator& acc = buckets[key];
        acc.distance += sample.distanceIncrement;
        acc.speed += sample.speed;
        acc.cumulative += sample.cumulativeDistanceKm;
        ++acc.count;
    }

    points.reserve(buckets.size());
    for (const auto& [key, acc] : buckets) {
        double n = static_cast<double>(acc.count);
        ResampledPoint point;
        point.bucketStart = DateTime(static_cast<double>(key) * width);
        point.meanDistanceIncrement = acc.distance / n;
        point.meanSpeed = acc.speed / n;
        point.meanCumulativeDistanceKm = acc.cumulative / n;
        point.sampleCount = acc.count;
        points.push_back(point);
    }
    return points;
}

}  // namespace tripscope
