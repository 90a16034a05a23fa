#include "TripSession.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace tripscope::gui {

TripSession::TripSession()
    : config_(AnalysisConfig::summaryPreset()) {}

bool TripSession::load(const std::string& path) {
    clear();
    path_ = path;
    try {
        table_ = readDelimitedTable(path, readOptions_);
    } catch (const std::exception& ex) {
        outcome_.error = AnalysisError{AnalysisErrorKind::UnreadableTable, ex.what()};
        status_ = ex.what();
        return false;
    }
    tableLoaded_ = true;
    analyze();
    return hasResult();
}

void TripSession::clear() {
    path_.clear();
    status_.clear();
    table_.clear();
    tableLoaded_ = false;
    outcome_ = AnalysisOutcome{};
    speedOverTime_.clear();
    speedOverDistance_.clear();
    proximityMarkers_.clear();
}

void TripSession::setConfig(const AnalysisConfig& config) {
    config_ = config.sanitized();
    if (tableLoaded_) {
        analyze();
    }
}

void TripSession::analyze() {
    outcome_ = analyzeTable(table_, config_);
    if (!outcome_.ok()) {
        status_ = outcome_.error->message;
        speedOverTime_.clear();
        speedOverDistance_.clear();
        proximityMarkers_.clear();
        return;
    }
    const auto& r = *outcome_.result;
    status_ = "Loaded " + std::to_string(r.series.size()) + " samples, " + std::to_string(r.stops.size()) +
              " stops (" + std::to_string(r.series.droppedRows()) + " rows dropped)";
    rebuildSeries();
}

void TripSession::rebuildSeries() {
    speedOverTime_.clear();
    speedOverDistance_.clear();
    proximityMarkers_.clear();

    const auto& r = *outcome_.result;
    if (!r.resampled.empty()) {
        double origin = r.resampled.front().bucketStart.epochSeconds();
        speedOverTime_.reserve(r.resampled.size());
        for (const auto& p : r.resampled) {
            speedOverTime_.push_back(Point2D{p.bucketStart.epochSeconds() - origin, p.meanSpeed});
        }
    }

    speedOverDistance_.reserve(r.series.size());
    for (const auto& s : r.series.samples()) {
        speedOverDistance_.push_back(Point2D{s.cumulativeDistanceKm, s.speed});
    }

    for (const auto& report : r.stops) {
        for (const auto& p : report.proximity) {
            proximityMarkers_.push_back(Point2D{p.matchedDistanceKm, p.matchedSpeed});
        }
    }
}

std::vector<Point2D> TripSession::profilePoints(std::size_t profileIndex) const {
    std::vector<Point2D> points;
    if (!hasResult() || profileIndex >= result().decelerationProfiles.size()) {
        return points;
    }
    for (const auto& p : result().decelerationProfiles[profileIndex].points) {
        points.push_back(Point2D{p.relativeDistanceM, p.speed});
    }
    return points;
}

PlotBounds TripSession::boundsOf(const std::vector<Point2D>& points) {
    PlotBounds bounds;
    if (points.empty()) {
        return bounds;
    }
    bounds.minX = bounds.maxX = points.front().x;
    bounds.minY = bounds.maxY = points.front().y;
    for (const auto& p : points) {
        bounds.minX = std::min(bounds.minX, p.x);
        bounds.maxX = std::max(bounds.maxX, p.x);
        bounds.minY = std::min(bounds.minY, p.y);
        bounds.maxY = std::max(bounds.maxY, p.y);
    }
    bounds.minY = std::min(bounds.minY, 0.0);
    if (bounds.maxX - bounds.minX < 1e-9) {
        bounds.maxX = bounds.minX + 1.0;
    }
    if (bounds.maxY - bounds.minY < 1e-9) {
        bounds.maxY = bounds.minY + 1.0;
    }
    return bounds;
}

}  // namespace tripscope::gui
