// ---------------------------------------------------------------------------
// verdict_parser.cpp
//
// 범용 관용 파서 구현과 단계별 스키마.
//
// [오탐/미탐 트레이드오프]
// - "authorized: true (but ... false ...)" 처럼 두 토큰이 모두 있으면 false.
//   oracle 이 망설인 응답은 거부 쪽으로 해석한다.
// - 여러 줄에 걸친 값(줄바꿈된 SQL 등)은 첫 줄만 사용한다. 나머지 줄은
//   키가 없으므로 무시되고, 잘린 SQL 은 scope gate 에서 걸러진다.
//
// [직렬화 왕복]
// - 키가 있으면 빈 값도 값이다. 기본값은 키가 없을 때만 쓴다.
// - nullable 값은 감싼 따옴표를 한 겹만 벗긴다. 직렬화는 따옴표로 시작하고
//   끝나는 값을 한 겹 더 감싸서 되돌린다.
// - 집합 원소의 대소문자는 보존한다. 분류 체계 비교는 단계에서 한다.
// ---------------------------------------------------------------------------

#include "verdict/verdict_parser.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <sstream>

#include <spdlog/spdlog.h>

namespace {

std::string_view trim(std::string_view s) {
    const auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string_view::npos) {
        return {};
    }
    const auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// "**Sensitive Fields**" → "sensitive_fields"
std::string normalize_key(std::string_view raw) {
    static constexpr std::string_view kDecoration = " \t*-`#>";
    const auto b = raw.find_first_not_of(kDecoration);
    if (b == std::string_view::npos) {
        return {};
    }
    const auto e = raw.find_last_not_of(kDecoration);
    std::string key = to_lower(raw.substr(b, e - b + 1));
    std::replace(key.begin(), key.end(), ' ', '_');
    return key;
}

// 값에서 true/false 토큰 판정
bool parse_boolean_value(std::string_view value) {
    const std::string lower = to_lower(value);
    bool has_true  = false;
    bool has_false = false;

    std::string token;
    const auto flush = [&] {
        if (token == "true") {
            has_true = true;
        } else if (token == "false") {
            has_false = true;
        }
        token.clear();
    };
    for (const char c : lower) {
        if (std::isalnum(static_cast<unsigned char>(c)) != 0) {
            token.push_back(c);
        } else {
            flush();
        }
    }
    flush();
    return has_true && !has_false;
}

bool is_quoted(std::string_view s) {
    return s.size() >= 2 &&
           ((s.front() == '\'' && s.back() == '\'') ||
            (s.front() == '"' && s.back() == '"') ||
            (s.front() == '`' && s.back() == '`'));
}

// 한 겹만 벗긴다.
std::string strip_quotes(std::string_view s) {
    s = trim(s);
    if (is_quoted(s)) {
        s = s.substr(1, s.size() - 2);
    }
    return std::string(s);
}

std::set<std::string> parse_string_set(std::string_view value) {
    std::set<std::string> items;
    value = trim(value);

    const auto open = value.find('[');
    if (open != std::string_view::npos) {
        const auto close = value.find(']', open + 1);
        value = (close == std::string_view::npos)
            ? value.substr(open + 1)
            : value.substr(open + 1, close - open - 1);
    }

    std::size_t begin = 0;
    while (begin <= value.size()) {
        auto end = value.find(',', begin);
        if (end == std::string_view::npos) {
            end = value.size();
        }
        std::string item = std::string(trim(strip_quotes(value.substr(begin, end - begin))));
        const std::string lower = to_lower(item);
        if (!item.empty() && lower != "none" && lower != "null") {
            items.insert(std::move(item));
        }
        begin = end + 1;
    }
    return items;
}

std::optional<std::string> parse_nullable(std::string_view value) {
    std::string v = strip_quotes(value);
    if (v.empty() || to_lower(v) == "null") {
        return std::nullopt;
    }
    return v;
}

// parse_nullable 이 벗길 따옴표를 미리 한 겹 더한다.
std::string quote_if_needed(std::string v) {
    return is_quoted(v) ? "\"" + v + "\"" : v;
}

std::string single_line(std::string_view s) {
    std::string out(s);
    std::replace(out.begin(), out.end(), '\n', ' ');
    std::replace(out.begin(), out.end(), '\r', ' ');
    return out;
}

std::string format_set(const std::set<std::string>& items) {
    std::string out = "[";
    bool first = true;
    for (const auto& item : items) {
        if (!first) {
            out += ", ";
        }
        out += item;
        first = false;
    }
    out += "]";
    return out;
}

std::string format_nullable(const std::optional<std::string>& v) {
    return v ? quote_if_needed(single_line(*v)) : std::string("null");
}

std::string format_bool(bool b) {
    return b ? "true" : "false";
}

std::string parse_failure_reason(const char* what) {
    return std::string("verdict parse failure: ") + what;
}

}  // namespace

// ---------------------------------------------------------------------------
// FieldValues
// ---------------------------------------------------------------------------
bool FieldValues::boolean(const std::string& name) const {
    const auto it = values_.find(name);
    return it != values_.end() && it->second.seen && it->second.flag;
}

std::string FieldValues::text(const std::string& name) const {
    const auto it = values_.find(name);
    return it == values_.end() ? std::string{} : it->second.text;
}

std::set<std::string> FieldValues::string_set(const std::string& name) const {
    const auto it = values_.find(name);
    return it == values_.end() ? std::set<std::string>{} : it->second.items;
}

std::optional<std::string> FieldValues::nullable(const std::string& name) const {
    const auto it = values_.find(name);
    return it == values_.end() ? std::nullopt : it->second.nullable;
}

bool FieldValues::seen(const std::string& name) const {
    const auto it = values_.find(name);
    return it != values_.end() && it->second.seen;
}

// ---------------------------------------------------------------------------
// parse_fields
// ---------------------------------------------------------------------------
FieldValues parse_fields(std::string_view text, const VerdictSchema& schema) {
    FieldValues out;
    for (const auto& field : schema) {
        FieldValues::Value v{};
        if (field.kind == FieldKind::kText) {
            v.text = field.default_text;
        }
        out.values_.emplace(field.name, std::move(v));
    }

    std::istringstream stream{std::string(text)};
    std::string line;
    while (std::getline(stream, line)) {
        const std::string_view view = trim(line);
        if (view.empty()) {
            continue;
        }
        const auto colon = view.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        const std::string key = normalize_key(view.substr(0, colon));
        const std::string_view value = trim(view.substr(colon + 1));

        // 스키마 순서대로 비교, 첫 번째 일치 필드가 줄을 소비한다.
        const auto match = std::find_if(schema.begin(), schema.end(),
                                       [&key](const FieldSpec& f) { return f.name == key; });
        if (match == schema.end()) {
            continue;
        }

        auto& slot = out.values_[match->name];
        const bool first = !slot.seen;

        switch (match->kind) {
            case FieldKind::kBoolean: {
                const bool parsed = parse_boolean_value(value);
                slot.flag = first ? parsed : (slot.flag && parsed);
                break;
            }
            case FieldKind::kText:
                if (first) {
                    slot.text = std::string(value);
                }
                break;
            case FieldKind::kStringSet:
                if (first) {
                    slot.items = parse_string_set(value);
                }
                break;
            case FieldKind::kNullableString:
                if (first) {
                    slot.nullable = parse_nullable(value);
                }
                break;
        }
        slot.seen = true;
    }
    return out;
}

// ---------------------------------------------------------------------------
// 스키마
// ---------------------------------------------------------------------------
const VerdictSchema& authorization_schema() {
    static const VerdictSchema schema = {
        {"authorized",       FieldKind::kBoolean,        ""},
        {"reason",           FieldKind::kText,           std::string(kInvalidFormatReason)},
        {"sensitive_fields", FieldKind::kStringSet,      ""},
        {"sql_query",        FieldKind::kNullableString, ""},
    };
    return schema;
}

const VerdictSchema& safety_schema() {
    static const VerdictSchema schema = {
        {"safe",            FieldKind::kBoolean,        ""},
        {"reason",          FieldKind::kText,           std::string(kInvalidFormatReason)},
        {"suggested_query", FieldKind::kNullableString, ""},
    };
    return schema;
}

const VerdictSchema& sanitization_schema() {
    static const VerdictSchema schema = {
        {"safe",               FieldKind::kBoolean,        ""},
        {"reason",             FieldKind::kText,           std::string(kInvalidFormatReason)},
        {"sanitized_response", FieldKind::kNullableString, ""},
        {"original_response",  FieldKind::kNullableString, ""},
    };
    return schema;
}

const VerdictSchema& combined_schema() {
    static const VerdictSchema schema = {
        {"authorized",       FieldKind::kBoolean,        ""},
        {"reason",           FieldKind::kText,           std::string(kInvalidFormatReason)},
        {"sensitive_fields", FieldKind::kStringSet,      ""},
        {"sql_query",        FieldKind::kNullableString, ""},
        {"safe",             FieldKind::kBoolean,        ""},
        {"sql_reason",       FieldKind::kText,           std::string(kInvalidFormatReason)},
        {"suggested_query",  FieldKind::kNullableString, ""},
    };
    return schema;
}

// ---------------------------------------------------------------------------
// typed 파서
// ---------------------------------------------------------------------------
AuthorizationVerdict parse_authorization(std::string_view text) noexcept {
    try {
        const FieldValues f = parse_fields(text, authorization_schema());
        AuthorizationVerdict v;
        v.authorized       = f.boolean("authorized");
        v.reason           = f.text("reason");
        v.sensitive_fields = f.string_set("sensitive_fields");
        v.candidate_query  = f.nullable("sql_query");
        return v;
    } catch (const std::exception& e) {
        spdlog::warn("verdict_parser: authorization verdict parse failure: {}", e.what());
        AuthorizationVerdict v;
        v.reason = parse_failure_reason(e.what());
        return v;
    }
}

SafetyVerdict parse_safety(std::string_view text) noexcept {
    try {
        const FieldValues f = parse_fields(text, safety_schema());
        SafetyVerdict v;
        v.safe            = f.boolean("safe");
        v.reason          = f.text("reason");
        v.suggested_query = f.nullable("suggested_query");
        return v;
    } catch (const std::exception& e) {
        spdlog::warn("verdict_parser: safety verdict parse failure: {}", e.what());
        SafetyVerdict v;
        v.reason = parse_failure_reason(e.what());
        return v;
    }
}

SanitizationVerdict parse_sanitization(std::string_view text) noexcept {
    try {
        const FieldValues f = parse_fields(text, sanitization_schema());
        SanitizationVerdict v;
        v.safe               = f.boolean("safe");
        v.reason             = f.text("reason");
        v.sanitized_response = f.nullable("sanitized_response");
        v.original_response  = f.nullable("original_response");
        return v;
    } catch (const std::exception& e) {
        spdlog::warn("verdict_parser: sanitization verdict parse failure: {}", e.what());
        SanitizationVerdict v;
        v.reason = parse_failure_reason(e.what());
        return v;
    }
}

CombinedVerdict parse_combined(std::string_view text) noexcept {
    try {
        const FieldValues f = parse_fields(text, combined_schema());
        CombinedVerdict v;
        v.authorization.authorized       = f.boolean("authorized");
        v.authorization.reason           = f.text("reason");
        v.authorization.sensitive_fields = f.string_set("sensitive_fields");
        v.authorization.candidate_query  = f.nullable("sql_query");
        v.safety.safe                    = f.boolean("safe");
        v.safety.reason                  = f.text("sql_reason");
        v.safety.suggested_query         = f.nullable("suggested_query");
        return v;
    } catch (const std::exception& e) {
        spdlog::warn("verdict_parser: combined verdict parse failure: {}", e.what());
        CombinedVerdict v;
        v.authorization.reason = parse_failure_reason(e.what());
        v.safety.reason        = v.authorization.reason;
        return v;
    }
}

// ---------------------------------------------------------------------------
// 직렬화
// ---------------------------------------------------------------------------
std::string serialize(const AuthorizationVerdict& v) {
    return "authorized: " + format_bool(v.authorized) + "\n"
         + "reason: " + single_line(v.reason) + "\n"
         + "sensitive_fields: " + format_set(v.sensitive_fields) + "\n"
         + "sql_query: " + format_nullable(v.candidate_query) + "\n";
}

std::string serialize(const SafetyVerdict& v) {
    return "safe: " + format_bool(v.safe) + "\n"
         + "reason: " + single_line(v.reason) + "\n"
         + "suggested_query: " + format_nullable(v.suggested_query) + "\n";
}

std::string serialize(const SanitizationVerdict& v) {
    return "safe: " + format_bool(v.safe) + "\n"
         + "reason: " + single_line(v.reason) + "\n"
         + "sanitized_response: " + format_nullable(v.sanitized_response) + "\n"
         + "original_response: " + format_nullable(v.original_response) + "\n";
}

std::string serialize(const CombinedVerdict& v) {
    return serialize(v.authorization)
         + "safe: " + format_bool(v.safety.safe) + "\n"
         + "sql_reason: " + single_line(v.safety.reason) + "\n"
         + "suggested_query: " + format_nullable(v.safety.suggested_query) + "\n";
}
