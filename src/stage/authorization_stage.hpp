#pragma once

// ---------------------------------------------------------------------------
// authorization_stage.hpp
//
// 자연어 요청 + 현재 주체 → AuthorizationVerdict.
//
// [계약]
// - 요청 해석은 고정 지시문 아래 TextOracle 에 위임하고, 그 출력은
//   verdict_parser 의 권한 스키마로만 해석한다.
// - oracle 이 허가했더라도 다음 경우는 거부로 바꾼다 (기계적 보정):
//     1. candidate_query 에 주체 id 등호 술어가 없음
//     2. candidate_query 에 다른 주체 id / id 범위 술어가 있음
//     3. authorized == true 인데 candidate_query 가 없고 fallback 도 불가
//        (이 판단은 Orchestrator 가 한다)
// - authorized == false 이면 candidate_query 는 항상 비운다.
// - sensitive_fields 는 민감 필드 분류 체계(taxonomy)의 원소만 남기고,
//   후보 쿼리가 실제로 읽는 민감 컬럼을 추가한다. 민감 필드 포함은
//   거부 사유가 아니다.
//
// [오류 전파]
// - oracle 호출 실패(CollaboratorError)는 그대로 반환한다.
// - 파싱 실패는 이 단계 밖으로 나가지 않는다 (안전 기본값 = 거부).
// ---------------------------------------------------------------------------

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "oracle/text_oracle.hpp"
#include "parser/sql_parser.hpp"
#include "policy/policy_engine.hpp"
#include "verdict/verdict.hpp"

class AuthorizationStage {
public:
    AuthorizationStage(std::shared_ptr<TextOracle>         oracle,
                       std::shared_ptr<const PolicyEngine> policy,
                       std::vector<std::string>            sensitive_taxonomy);

    ~AuthorizationStage() = default;

    AuthorizationStage(const AuthorizationStage&)            = delete;
    AuthorizationStage& operator=(const AuthorizationStage&) = delete;
    AuthorizationStage(AuthorizationStage&&)                 = default;
    AuthorizationStage& operator=(AuthorizationStage&&)      = default;

    [[nodiscard]] std::expected<AuthorizationVerdict, CollaboratorError>
    authorize(std::string_view request, const Principal& principal) const;

    // 단일 호출 모드: 권한 + SQL 안전성 판정을 함께 받는다.
    // 안전성 부분은 SafetyStage 에 넘겨져 scope gate 뒤에 사용된다.
    [[nodiscard]] std::expected<CombinedVerdict, CollaboratorError>
    authorize_combined(std::string_view request, const Principal& principal) const;

    // oracle 판정에 기계적 보정을 적용한다 (oracle 호출 없음).
    [[nodiscard]] AuthorizationVerdict enforce(AuthorizationVerdict verdict,
                                               const Principal&     principal) const;

private:
    std::shared_ptr<TextOracle>         oracle_;
    std::shared_ptr<const PolicyEngine> policy_;
    std::vector<std::string>            sensitive_taxonomy_;
    SqlParser                           parser_;
};
