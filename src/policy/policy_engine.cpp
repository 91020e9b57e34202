// ---------------------------------------------------------------------------
// policy_engine.cpp
//
// 기계적 scope gate 구현.
//
// [Fail-close 원칙]
// 1. config_ == nullptr → kBlock
// 2. 정규식/파싱 내부 예외 → kBlock
// 3. 모든 조건 충족 시에만 kAllow
//
// [정규화 전제]
// ParsedQuery::where_clause / tail 은 파서가 대문자 + 공백 1칸으로
// 정규화한 문자열이다. 아래 정규식은 그 형태를 전제로 작성되었다.
//
// [알려진 한계]
// - BETWEEN x AND y 는 AND 분할에서 깨져 "단순 비교식 아님" 으로 차단된다.
// - 따옴표로 감싼 식별자("id")는 식별자 술어로 인식하지 않아 차단된다.
// ---------------------------------------------------------------------------

#include "policy/policy_engine.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>

// ---------------------------------------------------------------------------
// 내부 헬퍼
// ---------------------------------------------------------------------------
static std::string to_upper_copy(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

static std::string to_lower_copy(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

static std::string regex_escape(std::string_view s) {
    static constexpr std::string_view kSpecial = R"(\^$.|?*+()[]{})";
    std::string out;
    out.reserve(s.size() * 2);
    for (const char c : s) {
        if (kSpecial.find(c) != std::string_view::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

// "users.first_name" → "first_name" (설정된 테이블 접두어만 제거)
static std::string strip_table_prefix(const std::string& column, const std::string& table_lower) {
    const std::string prefix = table_lower + ".";
    if (column.size() > prefix.size() && column.compare(0, prefix.size(), prefix) == 0) {
        return column.substr(prefix.size());
    }
    return column;
}

static std::string strip_outer_parens(std::string s) {
    while (s.size() >= 2 && s.front() == '(' && s.back() == ')') {
        // 바깥 괄호 한 쌍이 전체를 감싸는지 확인
        int  depth = 0;
        bool wraps = true;
        for (std::size_t i = 0; i < s.size(); ++i) {
            if (s[i] == '(') {
                ++depth;
            } else if (s[i] == ')') {
                --depth;
                if (depth == 0 && i + 1 < s.size()) {
                    wraps = false;
                    break;
                }
            }
        }
        if (!wraps) {
            break;
        }
        s = s.substr(1, s.size() - 2);
        const auto b = s.find_first_not_of(' ');
        const auto e = s.find_last_not_of(' ');
        s = (b == std::string::npos) ? std::string{} : s.substr(b, e - b + 1);
    }
    return s;
}

static std::vector<std::string> split_conjuncts(const std::string& where_clause) {
    static const std::regex and_re(R"(\s+AND\s+)", std::regex_constants::ECMAScript);
    std::vector<std::string> out;
    std::sregex_token_iterator it(where_clause.begin(), where_clause.end(), and_re, -1);
    const std::sregex_token_iterator end{};
    for (; it != end; ++it) {
        out.push_back(strip_outer_parens(it->str()));
    }
    return out;
}

static bool parse_id_value(const std::string& digits, std::int64_t& out) {
    const auto* first = digits.data();
    const auto* last  = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

static PolicyResult block(std::string rule, std::string reason) {
    return PolicyResult{PolicyAction::kBlock, std::move(rule), std::move(reason)};
}

// 설정된 id 컬럼에 대한 정규식 조각: (?:\bUSERS\.)?\bID\b
static std::string id_column_fragment(const GuardConfig& cfg) {
    return "(?:\\b" + regex_escape(to_upper_copy(cfg.store.table)) + "\\.)?\\b"
         + regex_escape(to_upper_copy(cfg.store.id_column)) + "\\b";
}

// ---------------------------------------------------------------------------
// PolicyEngine
// ---------------------------------------------------------------------------
PolicyEngine::PolicyEngine(std::shared_ptr<const GuardConfig> config)
    : config_(std::move(config))
    , detector_(config_ ? config_->block_patterns : std::vector<EscapePattern>{})
{
    if (!config_) {
        spdlog::error("policy_engine: no config supplied, every query will be blocked");
    }
}

PolicyResult PolicyEngine::evaluate(const ParsedQuery& query, const Principal& principal) const {
    if (!config_) {
        return block("default-deny", "scope gate has no configuration");
    }
    const GuardConfig& cfg = *config_;

    try {
        // 1. 읽기 전용
        if (query.command != SqlCommand::kSelect) {
            return block("read-only",
                "only read-only SELECT queries are allowed, got "
                + std::string(command_to_string(query.command)));
        }

        // 2. set-escape 패턴
        const InjectionResult escape = detector_.check(query.raw_sql);
        if (escape.detected) {
            spdlog::debug("policy_engine: escape pattern '{}' matched", escape.matched_pattern);
            return block("set-escape", escape.reason);
        }
        if (query.has_subquery) {
            return block("set-escape", "nested SELECT can reference other rows");
        }

        // 3. 테이블
        const std::string table_lower = to_lower_copy(cfg.store.table);
        if (query.tables.size() != 1 || query.tables.front() != table_lower) {
            return block("table-scope", "query must read only the " + cfg.store.table + " table");
        }
        // FROM 목록은 테이블 이름 하나뿐이어야 한다. 별칭/쉼표는 자기 조인 통로.
        std::string from_list = query.from_clause;
        if (from_list.size() >= 2 && (from_list.front() == '"' || from_list.front() == '`') &&
            from_list.back() == from_list.front()) {
            from_list = from_list.substr(1, from_list.size() - 2);
        }
        if (from_list != to_upper_copy(cfg.store.table)) {
            return block("table-scope",
                "FROM must name the " + cfg.store.table + " table alone, without aliases or joins");
        }

        // 4. 컬럼
        if (query.columns.empty()) {
            return block("column-scope", "select list could not be determined");
        }
        for (const auto& raw_column : query.columns) {
            const std::string column = strip_table_prefix(raw_column, table_lower);
            if (column == "*") {
                continue;
            }
            const bool allowed = std::any_of(
                cfg.store.allowed_columns.begin(), cfg.store.allowed_columns.end(),
                [&column](const std::string& a) { return to_lower_copy(a) == column; });
            if (!allowed) {
                return block("column-scope", "column '" + raw_column + "' is not allowed");
            }
        }

        // 5. WHERE 존재
        if (!query.has_where_clause || query.where_clause.empty()) {
            return block("row-scope", "query has no predicate scoping it to the current user");
        }

        // 6~7. 술어 검사
        const std::string id_frag = id_column_fragment(cfg);
        const std::regex scope_re("^" + id_frag + R"(\s*==?\s*'?(\d+)'?$)",
                                  std::regex_constants::ECMAScript);
        const std::regex id_mention_re(id_frag, std::regex_constants::ECMAScript);
        static const std::regex simple_re(
            R"(^[A-Z_][A-Z0-9_.]*\s*(=|==|!=|<>|<=|>=|<|>)\s*('[^']*'|-?\d+(\.\d+)?)$)"
            R"(|^[A-Z_][A-Z0-9_.]*\s+IS(\s+NOT)?\s+NULL$)",
            std::regex_constants::ECMAScript);

        std::size_t scope_predicates = 0;
        for (const auto& conjunct : split_conjuncts(query.where_clause)) {
            std::smatch m;
            if (std::regex_match(conjunct, m, scope_re)) {
                std::int64_t value = 0;
                if (!parse_id_value(m[1].str(), value) || value != principal.id) {
                    return block("row-scope", "query targets another user's record");
                }
                ++scope_predicates;
                continue;
            }
            if (std::regex_search(conjunct, id_mention_re)) {
                return block("row-scope",
                    "predicate on " + cfg.store.id_column + " other than the current user's id");
            }
            if (!std::regex_match(conjunct, simple_re)) {
                return block("predicate-form", "predicate '" + conjunct + "' is not a simple comparison");
            }
        }
        if (scope_predicates == 0) {
            return block("row-scope", "query has no predicate scoping it to the current user");
        }
        if (scope_predicates > 1) {
            return block("row-scope",
                "predicate on " + cfg.store.id_column + " must appear exactly once");
        }

        // 8. 꼬리절
        static const std::regex tail_re(
            R"(^(ORDER BY [A-Z_][A-Z0-9_.]*( ASC| DESC)?)?\s*(LIMIT \d+)?$)",
            std::regex_constants::ECMAScript);
        if (!query.tail.empty() && !std::regex_match(query.tail, tail_re)) {
            return block("query-tail", "only ORDER BY and LIMIT may follow the WHERE clause");
        }

    } catch (const std::regex_error& e) {
        spdlog::error("policy_engine: regex error during evaluation: {}", e.what());
        return block("default-deny", "scope gate internal error");
    }

    return PolicyResult{
        PolicyAction::kAllow,
        "principal-scope",
        "query is scoped to user " + std::to_string(principal.id)
    };
}

PolicyResult PolicyEngine::evaluate_sql(std::string_view sql, const Principal& principal) const {
    auto parsed = parser_.parse(sql);
    if (!parsed) {
        return evaluate_error(parsed.error(), principal);
    }
    return evaluate(*parsed, principal);
}

PolicyResult PolicyEngine::evaluate_error(const ParseError& error,
                                          const Principal&  principal) const noexcept {
    try {
        spdlog::warn("policy_engine: parse error for principal {}, blocking: {}",
                     principal.id, error.message);
        return PolicyResult{PolicyAction::kBlock, "parse-error", error.message};
    } catch (const std::exception&) {
        // 문자열 할당 실패 등. 판정은 여전히 kBlock.
        return PolicyResult{};
    }
}

ScopeCheck PolicyEngine::check_scope(std::string_view sql, const Principal& principal) const {
    if (!config_) {
        return ScopeCheck::kMissing;
    }

    const std::string upper = to_upper_copy(sql);
    const std::string id_frag = id_column_fragment(*config_);

    // 등호 술어: id = 7, id == '7'
    const std::regex eq_re(id_frag + R"(\s*==?\s*'?(\d+)'?)", std::regex_constants::ECMAScript);
    // 그 밖의 비교/집합 술어: id != 7, id > 0, id IN (...), id BETWEEN ...
    const std::regex other_re(id_frag + R"(\s*(!=|<>|<=|>=|<|>|\bIN\b|\bBETWEEN\b|\bLIKE\b|\bGLOB\b))",
                              std::regex_constants::ECMAScript);

    if (std::regex_search(upper, other_re)) {
        return ScopeCheck::kForeign;
    }

    bool scoped = false;
    for (auto it = std::sregex_iterator(upper.begin(), upper.end(), eq_re);
         it != std::sregex_iterator(); ++it) {
        std::int64_t value = 0;
        if (!parse_id_value((*it)[1].str(), value) || value != principal.id) {
            return ScopeCheck::kForeign;
        }
        scoped = true;
    }
    return scoped ? ScopeCheck::kScoped : ScopeCheck::kMissing;
}

std::string PolicyEngine::suggest(std::string_view sql, const Principal& principal) const {
    const GuardConfig fallback{};
    const GuardConfig& cfg = config_ ? *config_ : fallback;
    const std::string table_lower = to_lower_copy(cfg.store.table);

    std::vector<std::string> columns;
    if (auto parsed = parser_.parse(sql); parsed && parsed->command == SqlCommand::kSelect) {
        for (const auto& raw_column : parsed->columns) {
            const std::string column = strip_table_prefix(raw_column, table_lower);
            const bool allowed = std::any_of(
                cfg.store.allowed_columns.begin(), cfg.store.allowed_columns.end(),
                [&column](const std::string& a) { return to_lower_copy(a) == column; });
            if (allowed && std::find(columns.begin(), columns.end(), column) == columns.end()) {
                columns.push_back(column);
            }
        }
    }

    std::string select_list;
    for (const auto& c : columns) {
        if (!select_list.empty()) {
            select_list += ", ";
        }
        select_list += c;
    }
    if (select_list.empty()) {
        select_list = "*";
    }

    return "SELECT " + select_list + " FROM " + cfg.store.table
         + " WHERE " + cfg.store.id_column + " = " + std::to_string(principal.id);
}
