#pragma once

#include "data_types.hpp"
#include "date_parser.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tripscope {

// Immutable, row-ordered telemetry samples. Built once by buildSeries and
// only read afterwards.
class TelemetrySeries {
public:
    TelemetrySeries() = default;
    TelemetrySeries(std::vector<TelemetrySample> samples, std::size_t droppedRows);

    const std::vector<TelemetrySample>& samples() const { return samples_; }
    const TelemetrySample& operator[](std::size_t index) const { return samples_[index]; }
    const TelemetrySample& back() const { return samples_.back(); }
    std::size_t size() const { return samples_.size(); }
    bool empty() const { return samples_.empty(); }

    // False when a negative increment made the cumulative distance go down.
    bool distanceMonotonic() const { return distanceMonotonic_; }
    std::size_t droppedRows() const { return droppedRows_; }

private:
    std::vector<TelemetrySample> samples_;
    bool distanceMonotonic_{true};
    std::size_t droppedRows_{0};
};

// Numeric coercion used for the distance and speed columns. Text must parse
// completely after trimming; NaN and infinities count as missing.
std::optional<double> coerceNumber(const RawCell& cell);

bool isMissing(const RawCell& cell);

// Rows from dataStartRow on, first four columns (date, time, distance, speed).
// Rows with any missing or unparseable field are dropped. Returns nullopt when
// nothing survives.
std::optional<TelemetrySeries> buildSeries(const RawTable& table,
                                           std::size_t dataStartRow,
                                           const DateParser& parser);

}  // namespace tripscope
