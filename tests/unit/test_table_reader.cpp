// tests/unit/test_table_reader.cpp
#include <sstream>
#include <stdexcept>
#include <string>

#include "table_reader.hpp"

using namespace tripscope;

static bool isText(const RawCell& cell, const std::string& expected) {
    const auto* text = std::get_if<std::string>(&cell);
    return text && *text == expected;
}

static bool isNumber(const RawCell& cell, double expected) {
    const auto* number = std::get_if<double>(&cell);
    return number && *number == expected;
}

int main() {
    // Case 1: comma separated with header block and quoted field
    {
        std::istringstream in(
            "Vehicle Report,,,\r\n"
            "\"Owner, Fleet\",\"said \"\"hi\"\"\",,\n"
            "DATE,TIME,DISTANCE,SPEED\n"
            "01/02/2024,08:00:00, 12.5 ,40\n");
        RawTable table = readDelimitedTable(in);
        if (table.size() != 4) return 1;
        if (!isText(table[0][0], "Vehicle Report")) return 2;
        if (table[0].size() != 4 || !std::holds_alternative<std::monostate>(table[0][1])) return 3;
        if (!isText(table[1][0], "Owner, Fleet")) return 4;
        if (!isText(table[1][1], "said \"hi\"")) return 5;
        if (!isText(table[3][0], "01/02/2024") || !isText(table[3][1], "08:00:00")) return 6;
        if (!isNumber(table[3][2], 12.5) || !isNumber(table[3][3], 40.0)) return 7;
    }

    // Case 2: semicolon and tab detection
    {
        std::istringstream semi("DATE;TIME;DISTANCE;SPEED\n01/02/2024;08:00:00;10;5\n");
        RawTable table = readDelimitedTable(semi);
        if (table[1].size() != 4 || !isNumber(table[1][2], 10.0)) return 8;

        std::istringstream tab("01/02/2024\t08:00:00\t10\t5\n");
        table = readDelimitedTable(tab);
        if (table[0].size() != 4 || !isNumber(table[0][3], 5.0)) return 9;

        if (detectDelimiter("a;b;c,d") != ';') return 10;
        if (detectDelimiter("nothing") != ',') return 11;
    }

    // Case 3: explicit delimiter wins over detection
    {
        TableReadOptions options;
        options.delimiter = '|';
        std::istringstream in("01/02/2024|08:00:00|1,5|5\n");
        RawTable table = readDelimitedTable(in, options);
        if (table[0].size() != 4 || !isText(table[0][2], "1,5")) return 12;
    }

    // Case 4: empty input and missing file throw
    {
        std::istringstream empty("");
        bool threw = false;
        try {
            readDelimitedTable(empty);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        if (!threw) return 13;

        threw = false;
        try {
            readDelimitedTable(std::string("/nonexistent/trip_log.csv"));
        } catch (const std::runtime_error& ex) {
            threw = std::string(ex.what()).find("/nonexistent/trip_log.csv") != std::string::npos;
        }
        if (!threw) return 14;
    }

    return 0;
}
