// tests/unit/test_text_utils.cpp
#include <string>
#include <vector>

#include "text_utils.hpp"

using namespace tripscope;

int main() {
    // Case 1: trimming, case folding and strict number parsing
    {
        if (trim("  12.5\t ") != "12.5") return 1;
        if (trim(" \t\r\n ") != "") return 2;
        if (toLower("Sept") != "sept") return 3;

        double value = 0.0;
        if (!parseDouble("12.5", value) || value != 12.5) return 4;
        if (parseDouble("12.5 km", value)) return 5;
        if (parseDouble("", value)) return 6;
        if (parseDouble("1e999", value)) return 7;
    }

    // Case 2: offset lists take whole positive meters only
    {
        auto offsets = parseOffsetList("100, 1,10 ,50");
        if (!offsets || *offsets != std::vector<int>{100, 1, 10, 50}) return 8;
        if (parseOffsetList("0.5")) return 9;
        if (parseOffsetList("1e12")) return 10;
        if (parseOffsetList("10,-5")) return 11;
        if (parseOffsetList("0")) return 12;
        if (parseOffsetList("10,,20")) return 13;
        if (parseOffsetList("")) return 14;
        if (parseOffsetList("99999999999")) return 15;
        auto big = parseOffsetList("999999999");
        if (!big || big->front() != 999999999) return 16;
    }

    // Case 3: JSON escaping covers every control byte
    {
        if (jsonEscape("a\"b\\c") != "a\\\"b\\\\c") return 17;
        if (jsonEscape("line\r\nnext\t") != "line\\r\\nnext\\t") return 18;
        if (jsonEscape(std::string("x\x01y\x1f", 4)) != "x\\u0001y\\u001f") return 19;
        std::string escaped = jsonEscape(std::string("\x00\x7f", 2));
        if (escaped != std::string("\\u0000\x7f")) return 20;
        if (jsonEscape("Stop at 08:00:02") != "Stop at 08:00:02") return 21;
    }

    return 0;
}
