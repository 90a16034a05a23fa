#include "distance_search.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace tripscope {

namespace {

std::size_t linearNearest(const TelemetrySeries& series, std::size_t lastIndex, double targetKm) {
    std::size_t best = 0;
    double bestDiff = std::fabs(series[0].cumulativeDistanceKm - targetKm);
    for (std::size_t i = 1; i <= lastIndex; ++i) {
        double diff = std::fabs(series[i].cumulativeDistanceKm - targetKm);
        if (diff < bestDiff) {
            bestDiff = diff;
            best = i;
        }
    }
    return best;
}

}  // namespace

std::size_t nearestDistanceIndex(const TelemetrySeries& series, std::size_t lastIndex, double targetKm) {
    if (!series.distanceMonotonic()) {
        return linearNearest(series, lastIndex, targetKm);
    }

    const auto& samples = series.samples();
    auto begin = samples.begin();
    auto end = begin + static_cast<std::ptrdiff_t>(lastIndex) + 1;
    auto byDistance = [](const TelemetrySample& s, double value) { return s.cumulativeDistanceKm < value; };

    auto upper = std::lower_bound(begin, end, targetKm, byDistance);
    if (upper == begin) {
        return 0;
    }
    // First sample carrying the largest distance below the target.
    auto lower = std::lower_bound(begin, upper, std::prev(upper)->cumulativeDistanceKm, byDistance);
    std::size_t lowerIndex = static_cast<std::size_t>(lower - begin);
    if (upper == end) {
        return lowerIndex;
    }
    double lowerDiff = std::fabs(lower->cumulativeDistanceKm - targetKm);
    double upperDiff = std::fabs(upper->cumulativeDistanceKm - targetKm);
    return lowerDiff <= upperDiff ? lowerIndex : static_cast<std::size_t>(upper - begin);
}

}  // namespace tripscope
