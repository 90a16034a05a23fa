#include "series_builder.hpp"

#include "text_utils.hpp"

#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace tripscope {

namespace {

constexpr std::size_t kDateColumn = 0;
constexpr std::size_t kTimeColumn = 1;
constexpr std::size_t kDistanceColumn = 2;
constexpr std::size_t kSpeedColumn = 3;

const RawCell kEmptyCell{};

const RawCell& cellAt(const RawRow& row, std::size_t column) {
    return column < row.size() ? row[column] : kEmptyCell;
}

struct CleanRow {
    const RawCell* date;
    const RawCell* time;
    double distance;
    double speed;
    std::size_t sourceRow;
};

}  // namespace

TelemetrySeries::TelemetrySeries(std::vector<TelemetrySample> samples, std::size_t droppedRows)
    : samples_(std::move(samples)), droppedRows_(droppedRows) {
    for (std::size_t i = 1; i < samples_.size(); ++i) {
        if (samples_[i].cumulativeDistanceKm < samples_[i - 1].cumulativeDistanceKm) {
            distanceMonotonic_ = false;
            break;
        }
    }
}

bool isMissing(const RawCell& cell) {
    if (std::holds_alternative<std::monostate>(cell)) {
        return true;
    }
    if (const auto* text = std::get_if<std::string>(&cell)) {
        return trim(*text).empty();
    }
    if (const auto* number = std::get_if<double>(&cell)) {
        return std::isnan(*number);
    }
    return false;
}

std::optional<double> coerceNumber(const RawCell& cell) {
    double value = 0.0;
    if (const auto* number = std::get_if<double>(&cell)) {
        value = *number;
    } else if (const auto* text = std::get_if<std::string>(&cell)) {
        std::string token = trim(*text);
        if (token.empty() || !parseDouble(token, value)) {
            return std::nullopt;
        }
    } else {
        return std::nullopt;
    }
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<TelemetrySeries> buildSeries(const RawTable& table,
                                           std::size_t dataStartRow,
                                           const DateParser& parser) {
    std::vector<CleanRow> kept;
    std::size_t dropped = 0;
    for (std::size_t r = dataStartRow; r < table.size(); ++r) {
        const RawRow& row = table[r];
        const RawCell& date = cellAt(row, kDateColumn);
        const RawCell& time = cellAt(row, kTimeColumn);
        auto distance = coerceNumber(cellAt(row, kDistanceColumn));
        auto speed = coerceNumber(cellAt(row, kSpeedColumn));
        if (isMissing(date) || isMissing(time) || !distance || !speed) {
            ++dropped;
            continue;
        }
        kept.push_back(CleanRow{&date, &time, *distance, *speed, r});
    }
    if (kept.empty()) {
        return std::nullopt;
    }

    std::vector<TelemetrySample> samples;
    samples.reserve(kept.size());
    double runningMeters = 0.0;
    for (const auto& row : kept) {
        auto timestamp = parser.parseDateTime(*row.date, *row.time);
        if (!timestamp) {
            ++dropped;
            continue;
        }
        runningMeters += row.distance;
        TelemetrySample sample;
        sample.timestamp = *timestamp;
        sample.distanceIncrement = row.distance;
        sample.speed = row.speed;
        sample.cumulativeDistanceKm = runningMeters / 1000.0;
        sample.sourceRow = row.sourceRow;
        samples.push_back(sample);
    }
    if (samples.empty()) {
        return std::nullopt;
    }
    return TelemetrySeries(std::move(samples), dropped);
}

}  // namespace tripscope
