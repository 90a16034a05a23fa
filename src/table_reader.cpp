#include "table_reader.hpp"

#include "text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace tripscope {

namespace {

constexpr std::size_t kSniffLines = 20;

// Splits one record, honoring quoted fields with doubled-quote escapes.
std::vector<std::string> splitRecord(const std::string& line, char delimiter, char quote) {
    std::vector<std::string> tokens;
    std::string token;
    bool quoted = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        char ch = line[i];
        if (quoted) {
            if (ch == quote) {
                if (i + 1 < line.size() && line[i + 1] == quote) {
                    token.push_back(quote);
                    ++i;
                } else {
                    quoted = false;
                }
            } else {
                token.push_back(ch);
            }
        } else if (ch == quote) {
            quoted = true;
        } else if (ch == delimiter) {
            tokens.push_back(token);
            token.clear();
        } else {
            token.push_back(ch);
        }
    }
    tokens.push_back(token);
    return tokens;
}

RawCell toCell(const std::string& token) {
    std::string text = trim(token);
    if (text.empty()) {
        return RawCell{};
    }
    double value = 0.0;
    if (parseDouble(text, value) && std::isfinite(value)) {
        return RawCell{value};
    }
    return RawCell{text};
}

}  // namespace

char detectDelimiter(const std::string& sample) {
    const char candidates[] = {',', ';', '\t'};
    char best = ',';
    std::size_t bestCount = 0;
    for (char candidate : candidates) {
        auto count = static_cast<std::size_t>(std::count(sample.begin(), sample.end(), candidate));
        if (count > bestCount) {
            bestCount = count;
            best = candidate;
        }
    }
    return best;
}

RawTable readDelimitedTable(std::istream& input, const TableReadOptions& options) {
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    if (lines.empty()) {
        throw std::runtime_error("Table is empty");
    }

    char delimiter = options.delimiter;
    if (delimiter == '\0') {
        std::string sample;
        for (std::size_t i = 0; i < lines.size() && i < kSniffLines; ++i) {
            sample += lines[i];
            sample.push_back('\n');
        }
        delimiter = detectDelimiter(sample);
    }

    RawTable table;
    table.reserve(lines.size());
    for (const auto& text : lines) {
        RawRow row;
        for (const auto& token : splitRecord(text, delimiter, options.quote)) {
            row.push_back(toCell(token));
        }
        table.push_back(std::move(row));
    }
    return table;
}

RawTable readDelimitedTable(const std::string& path, const TableReadOptions& options) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open input file: " + path);
    }
    try {
        return readDelimitedTable(file, options);
    } catch (const std::runtime_error& ex) {
        throw std::runtime_error(std::string(ex.what()) + ": " + path);
    }
}

}  // namespace tripscope
