#pragma once

// ---------------------------------------------------------------------------
// instructions.hpp
//
// 단계별 oracle 시스템 지시문 템플릿.
//
// [보안 원칙: 지시문 주입 방지]
// - 템플릿은 주체(Principal) 필드로만 매개변수화된다.
// - 신뢰할 수 없는 요청 텍스트, 후보 쿼리, 실행 결과는 절대 시스템 지시문에
//   치환하지 않는다. 그런 텍스트는 *_message() 로 user 메시지에만 담는다.
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>

#include "common/types.hpp"  // Principal

// 권한 판정: authorized / reason / sensitive_fields / sql_query
[[nodiscard]] std::string authorization_instruction(const Principal& principal);

// 권한 + SQL 안전성 단일 판정: 위 4개 + safe / sql_reason / suggested_query
[[nodiscard]] std::string combined_instruction(const Principal& principal);

// SQL 안전성 판정: safe / reason / suggested_query
[[nodiscard]] std::string safety_instruction(const Principal& principal);

// 출력 정제 판정: safe / reason / sanitized_response / original_response
[[nodiscard]] std::string sanitization_instruction(const Principal& principal);

// 후보 쿼리 없는 요청에 대한 일반 응답 (데이터 조회 권한 없음)
[[nodiscard]] std::string fallback_instruction(const Principal& principal);

// user 메시지 포장
[[nodiscard]] std::string request_message(std::string_view request);
[[nodiscard]] std::string query_message(std::string_view candidate_query);
[[nodiscard]] std::string response_message(std::string_view raw_response);
