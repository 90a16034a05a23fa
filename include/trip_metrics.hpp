#pragma once

#include "data_types.hpp"
#include "series_builder.hpp"

#include <vector>

namespace tripscope {

// Narrowest resampling bucket. Keeps epoch / width well inside int64.
inline constexpr double kMinResampleIntervalSeconds = 1e-3;

// Total distance and the first sample reaching the top speed. An empty
// series yields zeroed metrics.
TripMetrics summarizeTrip(const TelemetrySeries& series);

// Mean of each numeric field over fixed-width time buckets. Buckets are
// aligned to multiples of the width and ordered by start time; empty ones are
// left out. Widths below kMinResampleIntervalSeconds are widened to it;
// non-positive widths give an empty result. Display only.
std::vector<ResampledPoint> resampleByTime(const TelemetrySeries& series, double intervalSeconds = 10.0);

}  // namespace tripscope
