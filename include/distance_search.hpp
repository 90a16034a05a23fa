#pragma once

#include "series_builder.hpp"

#include <cstddef>

namespace tripscope {

// Index in [0, lastIndex] minimizing |cumulativeDistanceKm - targetKm|; the
// earliest index wins ties. Binary search on a monotonic series, linear scan
// otherwise. The series must not be empty and lastIndex must be in range.
std::size_t nearestDistanceIndex(const TelemetrySeries& series, std::size_t lastIndex, double targetKm);

}  // namespace tripscope
