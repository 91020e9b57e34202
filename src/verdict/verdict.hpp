#pragma once

// ---------------------------------------------------------------------------
// verdict.hpp
//
// oracle 자유 텍스트를 파싱한 결과로 만들어지는 판정(verdict) 레코드.
// 모든 판정은 요청마다 새로 만들어지며, 요청이 끝나면 버려진다.
//
// [기본값 원칙]
// - 모든 bool 은 false, optional 은 nullopt 로 초기화한다.
//   기본 생성된 판정은 항상 가장 제한적인 판정(deny/unsafe)이다.
// ---------------------------------------------------------------------------

#include <optional>
#include <set>
#include <string>

// ---------------------------------------------------------------------------
// AuthorizationVerdict
//   candidate_query 는 authorized == true 일 때만 존재할 수 있다.
//   (AuthorizationStage 가 강제한다. 파서는 스키마대로만 채운다.)
// ---------------------------------------------------------------------------
struct AuthorizationVerdict {
    bool                       authorized{false};
    std::string                reason{};
    std::set<std::string>      sensitive_fields{};
    std::optional<std::string> candidate_query{};

    bool operator==(const AuthorizationVerdict&) const = default;
};

// ---------------------------------------------------------------------------
// SafetyVerdict
//   suggested_query 는 제안일 뿐이며 자동 실행되지 않는다.
// ---------------------------------------------------------------------------
struct SafetyVerdict {
    bool                       safe{false};
    std::string                reason{};
    std::optional<std::string> suggested_query{};

    bool operator==(const SafetyVerdict&) const = default;
};

// ---------------------------------------------------------------------------
// SanitizationVerdict
//   safe == false 이면 sanitized_response 는 반드시 존재하며, 호출자는
//   어떤 원문보다도 sanitized_response 를 우선해야 한다.
//   safe == true 이면 원문을 그대로 사용할 수 있다.
// ---------------------------------------------------------------------------
struct SanitizationVerdict {
    bool                       safe{false};
    std::string                reason{};
    std::optional<std::string> sanitized_response{};
    std::optional<std::string> original_response{};

    bool operator==(const SanitizationVerdict&) const = default;
};

// ---------------------------------------------------------------------------
// CombinedVerdict
//   단일 oracle 호출로 받은 권한 + SQL 안전성 판정.
//   키: authorized, reason, sensitive_fields, sql_query, safe, sql_reason,
//       suggested_query
// ---------------------------------------------------------------------------
struct CombinedVerdict {
    AuthorizationVerdict authorization{};
    SafetyVerdict        safety{};

    bool operator==(const CombinedVerdict&) const = default;
};
