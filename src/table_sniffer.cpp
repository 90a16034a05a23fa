#include "table_sniffer.hpp"

namespace tripscope {

std::optional<std::size_t> findDataStartRow(const RawTable& table, const DateParser& parser) {
    for (std::size_t i = 0; i < table.size(); ++i) {
        const RawRow& row = table[i];
        if (row.empty()) {
            continue;
        }
        if (parser.parseDate(row.front())) {
            return i;
        }
    }
    return std::nullopt;
}

}  // namespace tripscope
