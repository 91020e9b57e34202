#pragma once

// ---------------------------------------------------------------------------
// verdict_parser.hpp
//
// oracle 의 줄 단위 "key: value" 텍스트를 타입이 있는 판정으로 변환하는
// 범용 관용 파서(tolerant line parser).
//
// [파싱 규칙]
// - 줄마다 첫 ':' 앞을 키로 본다. 키는 소문자화, 앞뒤 공백과 마크다운
//   장식(* - ` #)을 제거하고, 내부 공백은 '_' 로 바꾼다.
// - 스키마에 없는 키, ':' 없는 줄은 무시한다 (오류 아님).
// - kBoolean      : 값에 토큰 "true" 가 있고 "false" 가 없을 때만 true.
//                   같은 키가 여러 번 나오면 AND.
// - kText         : 앞뒤 공백 제거. 첫 번째 값 사용. 키가 없을 때만
//                   default_text, 빈 값은 빈 문자열로 남는다.
// - kStringSet    : [ ] 안을 ',' 로 분리, 토큰은 공백과 따옴표 한 겹 제거.
//                   대소문자 정규화는 호출자 몫. "[]" 또는 빈 값은 빈 집합.
// - kNullableString: "null"(대소문자 무관) 또는 빈 값은 nullopt.
//                   감싼 따옴표는 한 겹만 벗긴다.
// - 값의 대소문자는 보존한다. 키만 정규화한다.
//
// [fail-close 원칙: 절대 위반 금지]
// - parse_* 함수는 예외를 던지지 않는다. 내부 예외는 스키마의 완전한
//   안전 기본값(모든 bool false, optional 비어 있음)으로 변환된다.
// - 잘린/조작된 oracle 출력이 우연히 bool 을 true 로 뒤집을 수 없다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "verdict/verdict.hpp"

enum class FieldKind : std::uint8_t {
    kBoolean        = 0,
    kText           = 1,
    kStringSet      = 2,
    kNullableString = 3,
};

// ---------------------------------------------------------------------------
// FieldSpec / VerdictSchema
//   스키마는 순서가 있는 필드 목록이다. 줄은 이 순서대로 키를 비교한다.
// ---------------------------------------------------------------------------
struct FieldSpec {
    std::string name{};
    FieldKind   kind{FieldKind::kText};
    std::string default_text{};  // kText 전용
};

using VerdictSchema = std::vector<FieldSpec>;

// ---------------------------------------------------------------------------
// FieldValues
//   스키마 파싱 결과. 존재하지 않는 이름을 조회하면 안전 기본값을 돌려준다.
// ---------------------------------------------------------------------------
class FieldValues {
public:
    [[nodiscard]] bool boolean(const std::string& name) const;
    [[nodiscard]] std::string text(const std::string& name) const;
    [[nodiscard]] std::set<std::string> string_set(const std::string& name) const;
    [[nodiscard]] std::optional<std::string> nullable(const std::string& name) const;

    [[nodiscard]] bool seen(const std::string& name) const;

private:
    friend FieldValues parse_fields(std::string_view, const VerdictSchema&);

    struct Value {
        bool                       seen{false};
        bool                       flag{false};
        std::string                text{};
        std::set<std::string>      items{};
        std::optional<std::string> nullable{};
    };
    std::map<std::string, Value> values_;
};

// parse_fields
//   범용 파서. 예외를 던질 수 있으므로 단독으로 쓰지 말고
//   아래 typed 함수를 사용할 것.
[[nodiscard]] FieldValues parse_fields(std::string_view text, const VerdictSchema& schema);

// 스키마 정의
[[nodiscard]] const VerdictSchema& authorization_schema();
[[nodiscard]] const VerdictSchema& safety_schema();
[[nodiscard]] const VerdictSchema& sanitization_schema();
[[nodiscard]] const VerdictSchema& combined_schema();

// typed 파서. noexcept: 실패는 안전 기본값 + 사유로 표현된다.
[[nodiscard]] AuthorizationVerdict parse_authorization(std::string_view text) noexcept;
[[nodiscard]] SafetyVerdict        parse_safety(std::string_view text) noexcept;
[[nodiscard]] SanitizationVerdict  parse_sanitization(std::string_view text) noexcept;
[[nodiscard]] CombinedVerdict      parse_combined(std::string_view text) noexcept;

// 직렬화: 같은 스키마로 다시 파싱하면 동일한 판정이 나온다.
[[nodiscard]] std::string serialize(const AuthorizationVerdict& v);
[[nodiscard]] std::string serialize(const SafetyVerdict& v);
[[nodiscard]] std::string serialize(const SanitizationVerdict& v);
[[nodiscard]] std::string serialize(const CombinedVerdict& v);

// 파싱 실패/누락 시 reason 기본값
inline constexpr std::string_view kInvalidFormatReason = "invalid response format";
