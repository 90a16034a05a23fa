#include "analysis_pipeline.hpp"
#include "report_format.hpp"
#include "text_utils.hpp"
#include "trip_metrics.hpp"

#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using tripscope::jsonEscape;
using tripscope::parseDouble;

struct Options {
    std::string inputPath;
    std::string outputJson{"results.json"};
    std::string profilesCsv;
    std::string resampledCsv;
    std::string samplesCsv;
    tripscope::AnalysisConfig config;
    tripscope::TableReadOptions readOptions;
    bool quiet{false};
};

void printUsage() {
    std::cerr << "Usage: tripscope_cli --input log.csv [options]\n"
              << "Options:\n"
              << "  --output-json path          Output JSON summary (default results.json)\n"
              << "  --profiles-csv path         Deceleration profiles (stop,distance_m,speed)\n"
              << "  --resampled-csv path        Time-bucketed mean speed series\n"
              << "  --samples-csv path          Cleaned sample series with cumulative distance\n"
              << "  --preset summary|deceleration\n"
              << "                              Proximity offsets 50,100 or 1,10,50,100 m\n"
              << "  --offsets a,b,...           Proximity offsets before each stop [m]\n"
              << "  --window-km value           Deceleration window before each stop (default 1.0)\n"
              << "  --resample-seconds value    Resampling bucket width (default 10)\n"
              << "  --month-first               Read ambiguous dates as month/day\n"
              << "  --delimiter c               Field delimiter (default: detect ',', ';' or tab)\n"
              << "  --quiet                     Do not print the summary\n";
}

std::vector<int> parseOffsets(const std::string& text) {
    auto offsets = tripscope::parseOffsetList(text);
    if (!offsets) {
        throw std::runtime_error("Invalid --offsets value (whole positive meters expected): " + text);
    }
    return *offsets;
}

char parseDelimiter(const std::string& text) {
    if (text == "tab" || text == "\\t") {
        return '\t';
    }
    if (text.size() != 1) {
        throw std::runtime_error("Invalid --delimiter value: " + text);
    }
    return text[0];
}

Options parseOptions(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--input" && i + 1 < argc) {
            opts.inputPath = argv[++i];
        } else if (arg == "--output-json" && i + 1 < argc) {
            opts.outputJson = argv[++i];
        } else if (arg == "--profiles-csv" && i + 1 < argc) {
            opts.profilesCsv = argv[++i];
        } else if (arg == "--resampled-csv" && i + 1 < argc) {
            opts.resampledCsv = argv[++i];
        } else if (arg == "--samples-csv" && i + 1 < argc) {
            opts.samplesCsv = argv[++i];
        } else if (arg == "--preset" && i + 1 < argc) {
            std::string preset = argv[++i];
            if (preset == "summary") {
                opts.config.proximityOffsetsMeters = tripscope::AnalysisConfig::summaryPreset().proximityOffsetsMeters;
            } else if (preset == "deceleration") {
                opts.config.proximityOffsetsMeters =
                    tripscope::AnalysisConfig::decelerationPreset().proximityOffsetsMeters;
            } else {
                throw std::runtime_error("Unknown --preset: " + preset);
            }
        } else if (arg == "--offsets" && i + 1 < argc) {
            opts.config.proximityOffsetsMeters = parseOffsets(argv[++i]);
        } else if (arg == "--window-km" && i + 1 < argc) {
            if (!parseDouble(argv[++i], opts.config.decelerationWindowKm) ||
                !(opts.config.decelerationWindowKm > 0.0)) {
                throw std::runtime_error("Invalid --window-km value");
            }
        } else if (arg == "--resample-seconds" && i + 1 < argc) {
            if (!parseDouble(argv[++i], opts.config.resampleIntervalSeconds) ||
                !(opts.config.resampleIntervalSeconds >= tripscope::kMinResampleIntervalSeconds)) {
                throw std::runtime_error("Invalid --resample-seconds value (minimum 0.001)");
            }
        } else if (arg == "--month-first") {
            opts.config.dateRules.order = tripscope::DateOrder::MonthFirst;
        } else if (arg == "--delimiter" && i + 1 < argc) {
            opts.readOptions.delimiter = parseDelimiter(argv[++i]);
        } else if (arg == "--quiet") {
            opts.quiet = true;
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << "\n";
            printUsage();
            throw std::runtime_error("Invalid arguments");
        }
    }

    if (opts.inputPath.empty()) {
        printUsage();
        throw std::runtime_error("--input is required");
    }

    return opts;
}

std::ofstream openOutput(const std::string& path) {
    std::ofstream out(path);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open output file: " + path);
    }
    out << std::setprecision(10);
    return out;
}

void writeProfilesCsv(const std::string& path, const tripscope::AnalysisResult& result) {
    std::ofstream out = openOutput(path);
    out << "stop,stop_index,distance_m,speed\n";
    for (const auto& profile : result.decelerationProfiles) {
        std::string name = tripscope::profileName(profile);
        for (const auto& p : profile.points) {
            out << name << ',' << profile.stop.index << ',' << p.relativeDistanceM << ',' << p.speed << '\n';
        }
    }
}

void writeResampledCsv(const std::string& path, const tripscope::AnalysisResult& result) {
    std::ofstream out = openOutput(path);
    out << "bucket_start,mean_speed,mean_distance_increment,mean_cumulative_km,samples\n";
    for (const auto& p : result.resampled) {
        out << p.bucketStart.formatIso() << ',' << p.meanSpeed << ',' << p.meanDistanceIncrement << ','
            << p.meanCumulativeDistanceKm << ',' << p.sampleCount << '\n';
    }
}

void writeSamplesCsv(const std::string& path, const tripscope::AnalysisResult& result) {
    std::ofstream out = openOutput(path);
    out << "timestamp,distance_increment,speed,cumulative_km,source_row\n";
    for (const auto& s : result.series.samples()) {
        out << s.timestamp.formatIso() << ',' << s.distanceIncrement << ',' << s.speed << ','
            << s.cumulativeDistanceKm << ',' << s.sourceRow << '\n';
    }
}

std::string toJson(const Options& opts, const tripscope::AnalysisResult& result) {
    const auto& m = result.metrics;
    tripscope::DisplayMetrics display = tripscope::formatMetrics(m);
    std::vector<std::string> lines = tripscope::formatStopAnalysis(result.stops);

    std::ostringstream json;
    json << std::setprecision(10);
    json << "{\n";
    json << "  \"input\": \"" << jsonEscape(opts.inputPath) << "\",\n";
    json << "  \"data_start_row\": " << result.dataStartRow << ",\n";
    json << "  \"sample_count\": " << result.series.size() << ",\n";
    json << "  \"dropped_rows\": " << result.series.droppedRows() << ",\n";
    json << "  \"metrics\": {\n"
         << "    \"total_distance_km\": " << m.totalDistanceKm << ",\n"
         << "    \"max_speed\": " << m.maxSpeed << ",\n"
         << "    \"max_speed_index\": " << m.maxSpeedIndex << ",\n"
         << "    \"max_speed_distance_km\": " << m.maxSpeedDistanceKm << ",\n"
         << "    \"max_speed_time\": \"" << m.maxSpeedTimestamp.formatIso() << "\",\n"
         << "    \"display\": {\n"
         << "      \"total_distance\": \"" << jsonEscape(display.totalDistance) << "\",\n"
         << "      \"max_speed\": \"" << jsonEscape(display.maxSpeed) << "\",\n"
         << "      \"max_speed_details\": \"" << jsonEscape(display.maxSpeedDetails) << "\"\n"
         << "    }\n"
         << "  },\n";

    json << "  \"stop_analysis\": [";
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) json << ',';
        json << "\n    \"" << jsonEscape(lines[i]) << '"';
    }
    json << (lines.empty() ? "],\n" : "\n  ],\n");

    json << "  \"stops\": [";
    for (std::size_t i = 0; i < result.stops.size(); ++i) {
        const auto& report = result.stops[i];
        if (i > 0) json << ',';
        json << "\n    {\"index\": " << report.stop.index
             << ", \"distance_km\": " << report.stop.distanceKm
             << ", \"time\": \"" << report.stop.timestamp.formatIso() << "\", \"proximity\": [";
        for (std::size_t j = 0; j < report.proximity.size(); ++j) {
            const auto& p = report.proximity[j];
            if (j > 0) json << ", ";
            json << "{\"offset_m\": " << p.offsetMeters << ", \"index\": " << p.matchedIndex
                 << ", \"distance_km\": " << p.matchedDistanceKm << ", \"speed\": " << p.matchedSpeed
                 << ", \"time\": \"" << p.matchedTimestamp.formatIso() << "\"}";
        }
        json << "]}";
    }
    json << (result.stops.empty() ? "],\n" : "\n  ],\n");

    json << "  \"deceleration_profiles\": [";
    for (std::size_t i = 0; i < result.decelerationProfiles.size(); ++i) {
        const auto& profile = result.decelerationProfiles[i];
        if (i > 0) json << ',';
        json << "\n    {\"name\": \"" << jsonEscape(tripscope::profileName(profile)) << "\", \"distance_m\": [";
        for (std::size_t j = 0; j < profile.points.size(); ++j) {
            if (j > 0) json << ',';
            json << profile.points[j].relativeDistanceM;
        }
        json << "], \"speed\": [";
        for (std::size_t j = 0; j < profile.points.size(); ++j) {
            if (j > 0) json << ',';
            json << profile.points[j].speed;
        }
        json << "]}";
    }
    json << (result.decelerationProfiles.empty() ? "],\n" : "\n  ],\n");

    json << "  \"resampled\": {\n    \"time\": [";
    for (std::size_t i = 0; i < result.resampled.size(); ++i) {
        if (i > 0) json << ',';
        json << '"' << result.resampled[i].bucketStart.formatIso() << '"';
    }
    json << "],\n    \"mean_speed\": [";
    for (std::size_t i = 0; i < result.resampled.size(); ++i) {
        if (i > 0) json << ',';
        json << result.resampled[i].meanSpeed;
    }
    json << "]\n  }\n";
    json << "}\n";
    return json.str();
}

}  // namespace

int main(int argc, char** argv) {
    try {
        Options opts = parseOptions(argc, argv);

        tripscope::AnalysisOutcome outcome = tripscope::analyzeFile(opts.inputPath, opts.config, opts.readOptions);
        if (!outcome.ok()) {
            const auto& error = *outcome.error;
            std::cerr << "Error (" << tripscope::toString(error.kind) << "): " << error.message << '\n';
            return EXIT_FAILURE;
        }
        const tripscope::AnalysisResult& result = *outcome.result;

        std::ofstream out = openOutput(opts.outputJson);
        out << toJson(opts, result);
        out.close();

        if (!opts.profilesCsv.empty()) {
            writeProfilesCsv(opts.profilesCsv, result);
        }
        if (!opts.resampledCsv.empty()) {
            writeResampledCsv(opts.resampledCsv, result);
        }
        if (!opts.samplesCsv.empty()) {
            writeSamplesCsv(opts.samplesCsv, result);
        }

        if (!opts.quiet) {
            tripscope::DisplayMetrics display = tripscope::formatMetrics(result.metrics);
            std::cout << "Processed " << result.series.size() << " samples (data starts at row "
                      << result.dataStartRow << ", " << result.series.droppedRows() << " rows dropped)" << std::endl;
            std::cout << "Total distance: " << display.totalDistance << std::endl;
            std::cout << "Max speed: " << display.maxSpeed << ' ' << display.maxSpeedDetails << std::endl;
            for (const auto& line : tripscope::formatStopAnalysis(result.stops)) {
                std::cout << line << std::endl;
            }
        }

        return EXIT_SUCCESS;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << '\n';
        return EXIT_FAILURE;
    }
}
