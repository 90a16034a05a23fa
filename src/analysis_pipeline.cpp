#include "analysis_pipeline.hpp"

#include "stop_analysis.hpp"
#include "table_sniffer.hpp"
#include "trip_metrics.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace tripscope {

namespace {

AnalysisOutcome failure(AnalysisErrorKind kind, std::string message) {
    AnalysisOutcome outcome;
    outcome.error = AnalysisError{kind, std::move(message)};
    return outcome;
}

}  // namespace

AnalysisConfig AnalysisConfig::summaryPreset() {
    AnalysisConfig config;
    config.proximityOffsetsMeters = {50, 100};
    return config;
}

AnalysisConfig AnalysisConfig::decelerationPreset() {
    AnalysisConfig config;
    config.proximityOffsetsMeters = {1, 10, 50, 100};
    return config;
}

AnalysisConfig AnalysisConfig::sanitized() const {
    AnalysisConfig defaults;
    AnalysisConfig clean = *this;
    clean.proximityOffsetsMeters.erase(
        std::remove_if(clean.proximityOffsetsMeters.begin(), clean.proximityOffsetsMeters.end(),
                       [](int offset) { return offset <= 0; }),
        clean.proximityOffsetsMeters.end());
    std::sort(clean.proximityOffsetsMeters.begin(), clean.proximityOffsetsMeters.end());
    clean.proximityOffsetsMeters.erase(
        std::unique(clean.proximityOffsetsMeters.begin(), clean.proximityOffsetsMeters.end()),
        clean.proximityOffsetsMeters.end());
    if (!std::isfinite(clean.decelerationWindowKm) || clean.decelerationWindowKm <= 0.0) {
        clean.decelerationWindowKm = defaults.decelerationWindowKm;
    }
    if (!std::isfinite(clean.resampleIntervalSeconds) || clean.resampleIntervalSeconds <= 0.0) {
        clean.resampleIntervalSeconds = defaults.resampleIntervalSeconds;
    } else if (clean.resampleIntervalSeconds < kMinResampleIntervalSeconds) {
        clean.resampleIntervalSeconds = kMinResampleIntervalSeconds;
    }
    return clean;
}

const char* toString(AnalysisErrorKind kind) {
    switch (kind) {
        case AnalysisErrorKind::UnreadableTable:
            return "UnreadableTable";
        case AnalysisErrorKind::NoDataStartFound:
            return "NoDataStartFound";
        case AnalysisErrorKind::EmptyAfterCleaning:
            return "EmptyAfterCleaning";
    }
    return "Unknown";
}

AnalysisOutcome analyzeTable(const RawTable& table, const AnalysisConfig& rawConfig) {
    AnalysisConfig config = rawConfig.sanitized();
    DateParser parser(config.dateRules);

    auto start = findDataStartRow(table, parser);
    if (!start) {
        return failure(AnalysisErrorKind::NoDataStartFound,
                       "Could not find a valid data start row (with a date) in the file.");
    }

    auto series = buildSeries(table, *start, parser);
    if (!series) {
        return failure(AnalysisErrorKind::EmptyAfterCleaning, "No valid data rows found after cleaning.");
    }

    AnalysisResult result;
    result.dataStartRow = *start;
    result.metrics = summarizeTrip(*series);

    std::vector<StopEvent> stops = detectStops(*series);
    result.stops.reserve(stops.size());
    for (const auto& stop : stops) {
        result.stops.push_back(StopReport{stop, sampleBeforeStop(*series, stop, config.proximityOffsetsMeters)});
    }
    result.decelerationProfiles = extractDecelerationProfiles(*series, stops, config.decelerationWindowKm);
    result.resampled = resampleByTime(*series, config.resampleIntervalSeconds);
    result.series = std::move(*series);

    AnalysisOutcome outcome;
    outcome.result = std::move(result);
    return outcome;
}

AnalysisOutcome analyzeFile(const std::string& path,
                            const AnalysisConfig& config,
                            const TableReadOptions& readOptions) {
    RawTable table;
    try {
        table = readDelimitedTable(path, readOptions);
    } catch (const std::exception& ex) {
        return failure(AnalysisErrorKind::UnreadableTable, ex.what());
    }
    return analyzeTable(table, config);
}

}  // namespace tripscope
