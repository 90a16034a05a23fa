#pragma once

#include "data_types.hpp"
#include "series_builder.hpp"

#include <vector>

namespace tripscope {

// Falling edges only: speed[i] == 0 while speed[i - 1] > 0.
std::vector<StopEvent> detectStops(const TelemetrySeries& series);

// For every stop and every offset (meters, ascending) whose target distance
// stop.distanceKm - offset / 1000 is still positive, the sample at or before
// the stop that lies closest to that target.
std::vector<ProximitySample> sampleBeforeStop(const TelemetrySeries& series,
                                              const StopEvent& stop,
                                              const std::vector<int>& offsetsMeters);

// Samples from the one nearest to stop.distanceKm - windowKm up to the stop,
// re-based so the smallest cumulative distance in the window is 0 m.
std::vector<DecelerationProfile> extractDecelerationProfiles(const TelemetrySeries& series,
                                                             const std::vector<StopEvent>& stops,
                                                             double windowKm = 1.0);

}  // namespace tripscope
