#pragma once

#include "analysis_pipeline.hpp"

#include <string>
#include <vector>

namespace tripscope::gui {

struct PlotBounds {
    double minX{0.0};
    double maxX{1.0};
    double minY{0.0};
    double maxY{1.0};
};

// Holds one loaded trip and the series the viewer plots. Reloading or
// changing parameters re-runs the whole analysis on the cached table.
class TripSession {
public:
    TripSession();

    bool load(const std::string& path);
    void clear();

    bool hasResult() const { return outcome_.ok(); }
    const AnalysisResult& result() const { return *outcome_.result; }
    const std::string& status() const { return status_; }
    const std::string& path() const { return path_; }

    const AnalysisConfig& config() const { return config_; }
    void setConfig(const AnalysisConfig& config);

    const TableReadOptions& readOptions() const { return readOptions_; }
    void setReadOptions(const TableReadOptions& options) { readOptions_ = options; }

    // x = seconds since the first bucket, y = mean speed.
    const std::vector<Point2D>& speedOverTime() const { return speedOverTime_; }
    // x = cumulative distance [km], y = speed.
    const std::vector<Point2D>& speedOverDistance() const { return speedOverDistance_; }
    const std::vector<Point2D>& proximityMarkers() const { return proximityMarkers_; }

    std::vector<Point2D> profilePoints(std::size_t profileIndex) const;

    static PlotBounds boundsOf(const std::vector<Point2D>& points);

private:
    void analyze();
    void rebuildSeries();

    std::string path_;
    std::string status_;
    RawTable table_;
    bool tableLoaded_{false};

    AnalysisConfig config_;
    TableReadOptions readOptions_;
    AnalysisOutcome outcome_;

    std::vector<Point2D> speedOverTime_;
    std::vector<Point2D> speedOverDistance_;
    std::vector<Point2D> proximityMarkers_;
};

}  // namespace tripscope::gui
