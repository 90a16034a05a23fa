#include "stop_analysis.hpp"

#include "distance_search.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace tripscope {

std::vector<StopEvent> detectStops(const TelemetrySeries& series) {
    std::vector<StopEvent> stops;
    for (std::size_t i = 1; i < series.size(); ++i) {
        if (series[i].speed == 0.0 && series[i - 1].speed > 0.0) {
            stops.push_back(StopEvent{i, series[i].cumulativeDistanceKm, series[i].timestamp});
        }
    }
    return stops;
}

std::vector<ProximitySample> sampleBeforeStop(const TelemetrySeries& series,
                                              const StopEvent& stop,
                                              const std::vector<int>& offsetsMeters) {
    std::vector<ProximitySample> result;
    if (stop.index >= series.size()) {
        return result;
    }

    std::vector<int> offsets = offsetsMeters;
    std::sort(offsets.begin(), offsets.end());
    offsets.erase(std::unique(offsets.begin(), offsets.end()), offsets.end());

    for (int offset : offsets) {
        double targetKm = stop.distanceKm - static_cast<double>(offset) / 1000.0;
        if (targetKm <= 0.0) {
            continue;
        }
        std::size_t idx = nearestDistanceIndex(series, stop.index, targetKm);
        const TelemetrySample& match = series[idx];
        ProximitySample sample;
        sample.stop = stop;
        sample.offsetMeters = offset;
        sample.matchedIndex = idx;
        sample.matchedDistanceKm = match.cumulativeDistanceKm;
        sample.matchedSpeed = match.speed;
        sample.matchedTimestamp = match.timestamp;
        result.push_back(sample);
    }
    return result;
}

std::vector<DecelerationProfile> extractDecelerationProfiles(const TelemetrySeries& series,
                                                             const std::vector<StopEvent>& stops,
                                                             double windowKm) {
    std::vector<DecelerationProfile> profiles;
    profiles.reserve(stops.size());

    for (const auto& stop : stops) {
        if (stop.index >= series.size()) {
            continue;
        }
        std::size_t start = nearestDistanceIndex(series, stop.index, stop.distanceKm - windowKm);

        double minDistance = std::numeric_limits<double>::max();
        for (std::size_t i = start; i <= stop.index; ++i) {
            minDistance = std::min(minDistance, series[i].cumulativeDistanceKm);
        }

        DecelerationProfile profile;
        profile.stop = stop;
        profile.startIndex = start;
        profile.points.reserve(stop.index - start + 1);
        for (std::size_t i = start; i <= stop.index; ++i) {
            profile.points.push_back(
                ProfilePoint{(series[i].cumulativeDistanceKm - minDistance) * 1000.0, series[i].speed});
        }
        if (profile.points.empty()) {
            continue;
        }
        profiles.push_back(std::move(profile));
    }
    return profiles;
}

}  // namespace tripscope
