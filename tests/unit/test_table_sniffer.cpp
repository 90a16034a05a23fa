// tests/unit/test_table_sniffer.cpp
#include <string>

#include "table_sniffer.hpp"
#include "util/test_tables.hpp"

using namespace tripscope;

int main() {
    DateParser parser;

    // Case 1: metadata block, blank row and column header before the readings
    {
        RawTable table;
        table.push_back(RawRow{std::string("Vehicle Report"), RawCell{}, RawCell{}, RawCell{}});
        table.push_back(RawRow{std::string("Registration"), std::string("KA01AB1234")});
        table.push_back(RawRow{});
        table.push_back(RawRow{std::string("DATE"), std::string("TIME"), std::string("DISTANCE"), std::string("SPEED")});
        table.push_back(tripscope_test::makeRow("01/02/2024", "08:00:00", 0.0, 0.0));
        table.push_back(tripscope_test::makeRow("01/02/2024", "08:00:01", 10.0, 12.0));

        auto start = findDataStartRow(table, parser);
        if (!start || *start != 4) return 1;

        // Idempotent on the truncated table
        RawTable truncated(table.begin() + static_cast<std::ptrdiff_t>(*start), table.end());
        auto again = findDataStartRow(truncated, parser);
        if (!again || *again != 0) return 2;
    }

    // Case 2: no date anywhere in column 1
    {
        RawTable table;
        table.push_back(RawRow{std::string("DATE"), std::string("TIME")});
        table.push_back(RawRow{std::string("n/a"), std::string("08:00:00"), 10.0, 5.0});
        table.push_back(RawRow{RawCell{}, std::string("08:00:01"), 10.0, 5.0});
        if (findDataStartRow(table, parser)) return 3;
        if (findDataStartRow(RawTable{}, parser)) return 4;
    }

    // Case 3: a date-typed cell counts as a data row
    {
        RawTable table;
        table.push_back(RawRow{std::string("header")});
        table.push_back(RawRow{DateTime::fromCivil(CivilDate{2024, 2, 1}), 0.25, 10.0, 5.0});
        auto start = findDataStartRow(table, parser);
        if (!start || *start != 1) return 5;
    }

    // Case 4: a stray numeric header cell is taken as a start (known heuristic limit)
    {
        RawTable table;
        table.push_back(RawRow{42.0, std::string("items")});
        table.push_back(tripscope_test::makeRow("01/02/2024", "08:00:00", 0.0, 0.0));
        auto start = findDataStartRow(table, parser);
        if (!start || *start != 0) return 6;
    }

    return 0;
}
