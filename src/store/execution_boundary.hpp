#pragma once

// ---------------------------------------------------------------------------
// execution_boundary.hpp
//
// 레코드 저장소 협력자 인터페이스.
//
// [계약]
// - execute(): 승인된 쿼리 하나를 실행하고 결과를 텍스트로 돌려준다.
//   형식은 result_format.hpp 의 format_result() 규칙을 따른다.
//   실패/기한 초과는 CollaboratorError 로 보고하며 부분 결과는 없다.
// - 모든 쿼리는 자율적인 단일 읽기다. 요청 간 트랜잭션을 공유하지 않는다.
// - get_principal(): 세션 시작 시 한 번 호출된다. id 가 없으면 임의의 주체.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "common/types.hpp"  // CollaboratorError, Principal

class ExecutionBoundary {
public:
    virtual ~ExecutionBoundary() = default;

    [[nodiscard]] virtual std::expected<std::string, CollaboratorError>
    execute(std::string_view query) = 0;
};

class PrincipalDirectory {
public:
    virtual ~PrincipalDirectory() = default;

    // 반환: 주체, 없으면 std::nullopt, 조회 실패는 CollaboratorError
    [[nodiscard]] virtual std::expected<std::optional<Principal>, CollaboratorError>
    get_principal(std::optional<std::int64_t> id) = 0;
};
