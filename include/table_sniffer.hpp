#pragma once

#include "data_types.hpp"
#include "date_parser.hpp"

#include <cstddef>
#include <optional>

namespace tripscope {

// Index of the first row whose first cell parses as a date, or nullopt when
// no row does. Leading metadata blocks in exported logs never carry a date in
// the first column; a stray date-like header cell is a known false positive.
std::optional<std::size_t> findDataStartRow(const RawTable& table, const DateParser& parser);

}  // namespace tripscope
