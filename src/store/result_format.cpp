#include "store/result_format.hpp"

std::string format_result(const ResultTable& table) {
    if (table.rows.empty()) {
        return std::string(kNoResultsMessage);
    }

    // 1행 1열: 값 그대로
    if (table.rows.size() == 1 && table.rows.front().size() == 1) {
        const ResultCell& cell = table.rows.front().front();
        return cell ? *cell : std::string(kNoDataMessage);
    }

    std::string out;
    for (std::size_t r = 0; r < table.rows.size(); ++r) {
        if (r > 0) {
            out.push_back('\n');
        }
        const ResultRow& row = table.rows[r];
        for (std::size_t c = 0; c < row.size(); ++c) {
            if (c > 0) {
                out += kColumnDelimiter;
            }
            out += row[c] ? *row[c] : std::string(kNullPlaceholder);
        }
    }
    return out;
}
