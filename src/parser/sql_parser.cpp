// ---------------------------------------------------------------------------
// sql_parser.cpp
//
// 후보 쿼리 분류 및 구조 추출 구현.
// "첫 번째 키워드 기반 분류 + 깊이(depth) 추적 스캔" 수준의 경량 파서.
//
// [파서 설계 한계]
// 1. 주석 제거는 문자열 리터럴을 구분하지 않는다. '--' 를 포함한 리터럴은
//    잘려 나가며, 그 결과 구조가 어긋나면 정책 엔진에서 차단된다.
// 2. 괄호 깊이 0 에서만 WHERE / FROM / 꼬리절 키워드를 인식한다.
//    서브쿼리 내부 절은 has_subquery 로만 드러난다.
// 3. Multi-statement: 끝의 세미콜론 하나를 제외한 모든 세미콜론은 오류.
// ---------------------------------------------------------------------------

#include "parser/sql_parser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

// SQL 에서 주석을 제거한다.
//   1. /* ... */ 블록 주석 (중첩 미지원) → 공백 1칸
//   2. -- 인라인 주석 (줄 끝까지)
std::string remove_comments(std::string_view sql) {
    std::string result;
    result.reserve(sql.size());

    std::size_t i = 0;
    const std::size_t len = sql.size();

    while (i < len) {
        if (i + 1 < len && sql[i] == '/' && sql[i + 1] == '*') {
            i += 2;
            while (i + 1 < len) {
                if (sql[i] == '*' && sql[i + 1] == '/') {
                    i += 2;
                    break;
                }
                ++i;
            }
            if (i + 1 >= len) {
                i = len;  // 닫히지 않은 주석은 끝까지
            }
            result.push_back(' ');
            continue;
        }

        if (i + 1 < len && sql[i] == '-' && sql[i + 1] == '-') {
            while (i < len && sql[i] != '\n') {
                ++i;
            }
            continue;
        }

        result.push_back(sql[i]);
        ++i;
    }

    return result;
}

std::string to_upper(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string_view trim(std::string_view s) {
    const auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
    const auto begin = std::find_if(s.begin(), s.end(), not_space);
    if (begin == s.end()) {
        return {};
    }
    const auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return s.substr(
        static_cast<std::size_t>(begin - s.begin()),
        static_cast<std::size_t>(end - begin)
    );
}

// 연속 공백(탭/개행 포함)을 스페이스 1칸으로 접는다.
std::string collapse_whitespace(std::string_view s) {
    std::string result;
    result.reserve(s.size());
    bool in_space = false;
    for (const char c : s) {
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            if (!in_space) {
                result.push_back(' ');
                in_space = true;
            }
            continue;
        }
        in_space = false;
        result.push_back(c);
    }
    return std::string(trim(result));
}

std::string extract_first_keyword(std::string_view normalized_sql) {
    const auto trimmed = trim(normalized_sql);
    if (trimmed.empty()) {
        return {};
    }
    const auto end_pos = trimmed.find_first_of(" (\t\r\n");
    if (end_pos == std::string_view::npos) {
        return std::string(trimmed);
    }
    return std::string(trimmed.substr(0, end_pos));
}

SqlCommand keyword_to_command(const std::string& keyword) {
    static const std::unordered_map<std::string, SqlCommand> kKeywordMap = {
        {"SELECT",  SqlCommand::kSelect},
        {"INSERT",  SqlCommand::kInsert},
        {"UPDATE",  SqlCommand::kUpdate},
        {"DELETE",  SqlCommand::kDelete},
        {"REPLACE", SqlCommand::kReplace},
        {"DROP",    SqlCommand::kDrop},
        {"ALTER",   SqlCommand::kAlter},
        {"CREATE",  SqlCommand::kCreate},
        {"PRAGMA",  SqlCommand::kPragma},
        {"ATTACH",  SqlCommand::kAttach},
        {"DETACH",  SqlCommand::kDetach},
        {"WITH",    SqlCommand::kWith},
        {"VACUUM",  SqlCommand::kVacuum},
    };

    const auto it = kKeywordMap.find(keyword);
    if (it != kKeywordMap.end()) {
        return it->second;
    }
    return SqlCommand::kUnknown;
}

bool is_identifier_char(char c) {
    return (std::isalnum(static_cast<unsigned char>(c)) != 0) || c == '_';
}

// 괄호 깊이 0, 문자열/식별자 따옴표 밖에서 keyword 가 단어 경계로 시작하는
// 첫 위치를 반환한다. keyword 는 대문자, 단어 사이 공백 1칸 (예: "ORDER BY").
std::size_t find_keyword_at_depth0(const std::string& normalized,
                                   std::string_view   keyword,
                                   std::size_t        start) {
    int  depth = 0;
    char quote = '\0';
    for (std::size_t i = start; i < normalized.size(); ++i) {
        const char c = normalized[i];
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            }
            continue;
        }
        if (c == '\'' || c == '"' || c == '`') {
            quote = c;
            continue;
        }
        if (c == '(') {
            ++depth;
            continue;
        }
        if (c == ')') {
            depth = std::max(0, depth - 1);
            continue;
        }
        if (depth != 0) {
            continue;
        }
        if (normalized.compare(i, keyword.size(), keyword) != 0) {
            continue;
        }
        const bool valid_start = (i == 0) || !is_identifier_char(normalized[i - 1]);
        const std::size_t after = i + keyword.size();
        const bool valid_end = (after >= normalized.size()) || !is_identifier_char(normalized[after]);
        if (valid_start && valid_end) {
            return i;
        }
    }
    return std::string::npos;
}

// 괄호 깊이 0 의 쉼표로 분리한다.
std::vector<std::string> split_top_level(std::string_view s) {
    std::vector<std::string> parts;
    int         depth = 0;
    char        quote = '\0';
    std::size_t begin = 0;
    for (std::size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            }
            continue;
        }
        if (c == '\'' || c == '"' || c == '`') {
            quote = c;
        } else if (c == '(') {
            ++depth;
        } else if (c == ')') {
            depth = std::max(0, depth - 1);
        } else if (c == ',' && depth == 0) {
            parts.emplace_back(trim(s.substr(begin, i - begin)));
            begin = i + 1;
        }
    }
    parts.emplace_back(trim(s.substr(begin)));
    return parts;
}

std::string strip_identifier_quotes(std::string token) {
    if (token.size() >= 2) {
        const char f = token.front();
        const char b = token.back();
        if ((f == '"' && b == '"') || (f == '`' && b == '`') || (f == '[' && b == ']')) {
            token = token.substr(1, token.size() - 2);
        }
    }
    return token;
}

// keyword 뒤에 오는 테이블명(들)을 out_tables 에 추가한다 (소문자, 중복 유지).
// "FROM (SELECT ...)" 처럼 괄호로 시작하는 토큰은 건너뛴다.
void extract_tables_for_keyword(const std::string&        normalized_sql,
                                const std::string&        keyword,
                                std::vector<std::string>& out_tables) {
    const std::string pattern =
        "\\b" + keyword + "\\s+([\"`]?[\\w.]+[\"`]?(?:\\s*,\\s*[\"`]?[\\w.]+[\"`]?)*)";

    try {
        const std::regex re(pattern, std::regex_constants::ECMAScript);

        auto it = std::sregex_iterator(normalized_sql.begin(), normalized_sql.end(), re);
        const auto end_it = std::sregex_iterator();

        for (; it != end_it; ++it) {
            const std::smatch& m = *it;
            if (m.size() < 2) {
                continue;
            }
            for (auto& token : split_top_level(m[1].str())) {
                std::string name = to_lower(strip_identifier_quotes(std::move(token)));
                if (name.empty() || name.front() == '(') {
                    continue;
                }
                // 중복도 그대로 둔다. FROM users, users 는 자기 조인이다.
                out_tables.push_back(std::move(name));
            }
        }
    } catch (const std::regex_error& e) {
        spdlog::warn("sql_parser: regex error for keyword '{}': {}", keyword, e.what());
    }
}

// "SELECT [DISTINCT] a, b FROM ..." 에서 컬럼 목록을 추출한다.
std::vector<std::string> extract_select_columns(const std::string& normalized_sql) {
    std::vector<std::string> columns;
    constexpr std::string_view kSelect = "SELECT ";
    if (normalized_sql.compare(0, kSelect.size(), kSelect) != 0) {
        return columns;
    }
    const auto from_pos = find_keyword_at_depth0(normalized_sql, "FROM", kSelect.size());
    if (from_pos == std::string::npos) {
        return columns;
    }

    std::string_view list = trim(std::string_view(normalized_sql)
                                     .substr(kSelect.size(), from_pos - kSelect.size()));
    constexpr std::string_view kDistinct = "DISTINCT ";
    if (list.substr(0, kDistinct.size()) == kDistinct) {
        list = trim(list.substr(kDistinct.size()));
    }
    if (list.empty()) {
        return columns;
    }

    for (auto& token : split_top_level(list)) {
        columns.push_back(to_lower(strip_identifier_quotes(std::move(token))));
    }
    return columns;
}

// WHERE 이후 꼬리절의 시작 위치 (가장 앞선 것)
std::size_t find_tail_start(const std::string& normalized_sql, std::size_t from) {
    static constexpr std::array<std::string_view, 4> kTailKeywords = {
        "ORDER BY", "GROUP BY", "HAVING", "LIMIT",
    };
    std::size_t best = std::string::npos;
    for (const auto kw : kTailKeywords) {
        const auto pos = find_keyword_at_depth0(normalized_sql, kw, from);
        if (pos != std::string::npos && (best == std::string::npos || pos < best)) {
            best = pos;
        }
    }
    return best;
}

// FROM 다음부터 WHERE / 꼬리절 / 끝 중 가장 앞선 위치까지.
std::string extract_from_clause(const std::string& normalized_sql, std::size_t where_pos) {
    const auto from_pos = find_keyword_at_depth0(normalized_sql, "FROM", 0);
    if (from_pos == std::string::npos) {
        return {};
    }
    const std::size_t begin = from_pos + 4;
    std::size_t end = find_tail_start(normalized_sql, begin);
    if (where_pos != std::string::npos && where_pos > begin &&
        (end == std::string::npos || where_pos < end)) {
        end = where_pos;
    }
    const std::string_view rest(normalized_sql);
    return std::string(trim(end == std::string::npos ? rest.substr(begin)
                                                     : rest.substr(begin, end - begin)));
}

std::size_t count_select_keywords(const std::string& normalized_sql) {
    static const std::regex select_re("\\bSELECT\\b", std::regex_constants::ECMAScript);
    return static_cast<std::size_t>(std::distance(
        std::sregex_iterator(normalized_sql.begin(), normalized_sql.end(), select_re),
        std::sregex_iterator()));
}

// ---------------------------------------------------------------------------
// has_semicolon_outside_string_or_comment
//   원문에서 문자열 리터럴(' 또는 ")과 주석(/* */, --) 밖의 세미콜론을 찾는다.
//   주석 제거 전 원문을 상태 머신으로 스캔한다.
// ---------------------------------------------------------------------------
bool has_semicolon_outside_string_or_comment(std::string_view sql) {
    enum class State : std::uint8_t {
        kNormal,
        kSingleQuote,
        kDoubleQuote,
        kBlockComment,
        kLineComment,
    };

    State state = State::kNormal;
    const std::size_t len = sql.size();

    for (std::size_t i = 0; i < len; ++i) {
        const char c = sql[i];
        const char next = (i + 1 < len) ? sql[i + 1] : '\0';

        switch (state) {
            case State::kNormal:
                if (c == '\'') {
                    state = State::kSingleQuote;
                } else if (c == '"') {
                    state = State::kDoubleQuote;
                } else if (c == '/' && next == '*') {
                    state = State::kBlockComment;
                    ++i;
                } else if (c == '-' && next == '-') {
                    state = State::kLineComment;
                    ++i;
                } else if (c == ';') {
                    return true;
                }
                break;

            case State::kSingleQuote:
                if (c == '\'') {
                    if (next == '\'') {
                        ++i;  // '' 이스케이프
                    } else {
                        state = State::kNormal;
                    }
                }
                break;

            case State::kDoubleQuote:
                if (c == '"') {
                    if (next == '"') {
                        ++i;
                    } else {
                        state = State::kNormal;
                    }
                }
                break;

            case State::kBlockComment:
                if (c == '*' && next == '/') {
                    state = State::kNormal;
                    ++i;
                }
                break;

            case State::kLineComment:
                if (c == '\n') {
                    state = State::kNormal;
                }
                break;
        }
    }

    return false;
}

}  // namespace

std::string_view command_to_string(SqlCommand cmd) noexcept {
    switch (cmd) {
        case SqlCommand::kSelect:  return "SELECT";
        case SqlCommand::kInsert:  return "INSERT";
        case SqlCommand::kUpdate:  return "UPDATE";
        case SqlCommand::kDelete:  return "DELETE";
        case SqlCommand::kReplace: return "REPLACE";
        case SqlCommand::kDrop:    return "DROP";
        case SqlCommand::kAlter:   return "ALTER";
        case SqlCommand::kCreate:  return "CREATE";
        case SqlCommand::kPragma:  return "PRAGMA";
        case SqlCommand::kAttach:  return "ATTACH";
        case SqlCommand::kDetach:  return "DETACH";
        case SqlCommand::kWith:    return "WITH";
        case SqlCommand::kVacuum:  return "VACUUM";
        case SqlCommand::kUnknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// SqlParser::parse 구현
// ---------------------------------------------------------------------------
std::expected<ParsedQuery, ParseError>
SqlParser::parse(std::string_view sql) const {
    // 1. 빈 입력 검사
    std::string_view body = trim(sql);
    if (body.empty()) {
        return std::unexpected(ParseError{
            ParseErrorCode::kInvalidSql,
            "Empty SQL input",
            std::string(sql)
        });
    }

    // 2. 끝의 세미콜론 하나는 허용
    if (body.back() == ';') {
        body = trim(body.substr(0, body.size() - 1));
    }

    // 3. 멀티 스테이트먼트 감지 (주석 제거 전 원문에서 수행)
    if (has_semicolon_outside_string_or_comment(body)) {
        spdlog::warn("sql_parser: multi-statement detected, fail-close applied. sql_prefix='{}'",
                     std::string(body.substr(0, 80)));
        return std::unexpected(ParseError{
            ParseErrorCode::kMultiStatement,
            "Multi-statement SQL detected: semicolon outside string or comment",
            std::string(sql)
        });
    }

    // 4. 주석 제거 + 대문자/공백 정규화
    const std::string normalized = collapse_whitespace(to_upper(remove_comments(body)));
    if (normalized.empty()) {
        return std::unexpected(ParseError{
            ParseErrorCode::kInvalidSql,
            "SQL is empty after comment removal",
            std::string(sql)
        });
    }

    // 5. 첫 번째 키워드로 분류
    ParsedQuery result;
    result.command = keyword_to_command(extract_first_keyword(normalized));
    result.raw_sql = std::string(sql);

    // 6. 테이블명 추출
    switch (result.command) {
        case SqlCommand::kSelect:
        case SqlCommand::kDelete:
        case SqlCommand::kWith:
            extract_tables_for_keyword(normalized, "FROM", result.tables);
            extract_tables_for_keyword(normalized, "JOIN", result.tables);
            break;

        case SqlCommand::kInsert:
        case SqlCommand::kReplace:
            extract_tables_for_keyword(normalized, "INTO", result.tables);
            break;

        case SqlCommand::kUpdate:
            extract_tables_for_keyword(normalized, "UPDATE", result.tables);
            break;

        case SqlCommand::kDrop:
        case SqlCommand::kAlter:
        case SqlCommand::kCreate:
            extract_tables_for_keyword(normalized, "TABLE", result.tables);
            break;

        default:
            break;
    }

    // 7. SELECT 컬럼 / 서브쿼리
    result.columns      = extract_select_columns(normalized);
    result.has_subquery = count_select_keywords(normalized) > 1;

    // 8. WHERE 본문과 꼬리절
    const auto where_pos = find_keyword_at_depth0(normalized, "WHERE", 0);

    // 9. 최상위 FROM 목록 원문 (별칭, 쉼표 포함)
    if (result.command == SqlCommand::kSelect) {
        result.from_clause = extract_from_clause(normalized, where_pos);
    }
    if (where_pos != std::string::npos) {
        result.has_where_clause = true;
        const std::size_t body_start = where_pos + 5;
        const auto tail_pos = find_tail_start(normalized, body_start);
        if (tail_pos == std::string::npos) {
            result.where_clause = std::string(trim(std::string_view(normalized).substr(body_start)));
        } else {
            result.where_clause = std::string(trim(
                std::string_view(normalized).substr(body_start, tail_pos - body_start)));
            result.tail = std::string(trim(std::string_view(normalized).substr(tail_pos)));
        }
    } else {
        const auto tail_pos = find_tail_start(normalized, 0);
        if (tail_pos != std::string::npos) {
            result.tail = std::string(trim(std::string_view(normalized).substr(tail_pos)));
        }
    }

    return result;
}
