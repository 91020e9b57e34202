#pragma once

// ---------------------------------------------------------------------------
// result_format.hpp
//
// 실행 결과 → 텍스트 변환 규칙.
//   - 빈 결과              → kNoResultsMessage
//   - 1행 1열              → 값 그대로 (NULL 이면 kNoDataMessage)
//   - 그 외                → 행은 '\n', 열은 kColumnDelimiter 로 연결
//   - 다중 열의 NULL 값    → kNullPlaceholder
// ---------------------------------------------------------------------------

#include <optional>
#include <string>
#include <string_view>
#include <vector>

inline constexpr std::string_view kNoResultsMessage = "No results found.";
inline constexpr std::string_view kNoDataMessage    = "No data available";
inline constexpr std::string_view kNullPlaceholder  = "N/A";
inline constexpr std::string_view kColumnDelimiter  = " | ";

using ResultCell = std::optional<std::string>;  // nullopt = SQL NULL
using ResultRow  = std::vector<ResultCell>;

struct ResultTable {
    std::vector<std::string> column_names{};
    std::vector<ResultRow>   rows{};
};

[[nodiscard]] std::string format_result(const ResultTable& table);
