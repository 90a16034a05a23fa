#pragma once

#include "data_types.hpp"
#include "date_parser.hpp"
#include "series_builder.hpp"
#include "table_reader.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tripscope {

struct AnalysisConfig {
    std::vector<int> proximityOffsetsMeters{50, 100};
    double decelerationWindowKm{1.0};
    double resampleIntervalSeconds{10.0};
    DateParser::Rules dateRules;

    static AnalysisConfig summaryPreset();
    static AnalysisConfig decelerationPreset();

    // Positive offsets only, ascending and unique; window and bucket width
    // fall back to their defaults when not positive and finite, and the
    // bucket width is raised to kMinResampleIntervalSeconds.
    AnalysisConfig sanitized() const;
};

enum class AnalysisErrorKind {
    UnreadableTable,
    NoDataStartFound,
    EmptyAfterCleaning,
};

struct AnalysisError {
    AnalysisErrorKind kind{AnalysisErrorKind::UnreadableTable};
    std::string message;
};

const char* toString(AnalysisErrorKind kind);

struct StopReport {
    StopEvent stop;
    std::vector<ProximitySample> proximity;
};

struct AnalysisResult {
    TripMetrics metrics;
    std::vector<StopReport> stops;
    std::vector<DecelerationProfile> decelerationProfiles;
    std::vector<ResampledPoint> resampled;
    TelemetrySeries series;
    std::size_t dataStartRow{0};
};

// Either a result or the error that ended the run; never both.
struct AnalysisOutcome {
    std::optional<AnalysisResult> result;
    std::optional<AnalysisError> error;

    bool ok() const { return result.has_value(); }
};

AnalysisOutcome analyzeTable(const RawTable& table, const AnalysisConfig& config = AnalysisConfig{});

// Reads the file with readDelimitedTable first; read failures come back as
// UnreadableTable carrying the reader's message.
AnalysisOutcome analyzeFile(const std::string& path,
                            const AnalysisConfig& config = AnalysisConfig{},
                            const TableReadOptions& readOptions = TableReadOptions{});

}  // namespace tripscope
