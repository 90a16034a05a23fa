#pragma once

#include "data_types.hpp"

#include <istream>
#include <string>

namespace tripscope {

struct TableReadOptions {
    char delimiter{'\0'};  // '\0' = detect from the first lines (',', ';' or tab)
    char quote{'"'};
};

// Decodes a delimited text export into raw cells. Cells that are empty stay
// empty, cells that read fully as a number become numbers, the rest is text.
// Throws std::runtime_error when the file cannot be opened or holds nothing.
RawTable readDelimitedTable(const std::string& path, const TableReadOptions& options = TableReadOptions{});
RawTable readDelimitedTable(std::istream& input, const TableReadOptions& options = TableReadOptions{});

char detectDelimiter(const std::string& sample);

}  // namespace tripscope
