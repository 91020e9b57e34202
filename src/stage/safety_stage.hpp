#pragma once

// ---------------------------------------------------------------------------
// safety_stage.hpp
//
// 후보 쿼리 + 현재 주체 → SafetyVerdict.
//
// [판정 순서]
// 1. scope gate (PolicyEngine::evaluate_sql)
//    - 주체 행 한정, 단일 SELECT, 허용 컬럼, 단순 술어만 통과.
//    - 차단 시 oracle 을 호출하지 않는다. oracle 판정으로 뒤집을 수 없다.
// 2. oracle 검토 (pipeline.oracle_sql_review 가 켜져 있을 때)
//    - 단일 호출 모드에서는 권한 단계가 받은 안전성 판정을 그대로 쓴다.
//    - oracle 이 unsafe 라고 하면 그 판정을 따른다 (더 엄격한 쪽).
//
// [suggested_query]
// - safe == false 일 때만 채운다.
// - oracle 이 준 제안은 scope gate 를 통과할 때만 노출한다.
//   통과하지 못하면 PolicyEngine::suggest() 의 제안으로 바꾼다.
// - 제안은 실행하지 않는다.
// ---------------------------------------------------------------------------

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "common/types.hpp"
#include "oracle/text_oracle.hpp"
#include "policy/policy_engine.hpp"
#include "verdict/verdict.hpp"

class SafetyStage {
public:
    // oracle 이 nullptr 이면 oracle_review 와 무관하게 scope gate 만 수행한다.
    SafetyStage(std::shared_ptr<TextOracle>         oracle,
                std::shared_ptr<const PolicyEngine> policy,
                bool                                oracle_review);

    ~SafetyStage() = default;

    SafetyStage(const SafetyStage&)            = delete;
    SafetyStage& operator=(const SafetyStage&) = delete;
    SafetyStage(SafetyStage&&)                 = default;
    SafetyStage& operator=(SafetyStage&&)      = default;

    // precomputed: 단일 호출 모드에서 이미 받은 oracle 안전성 판정
    [[nodiscard]] std::expected<SafetyVerdict, CollaboratorError>
    verify(std::string_view                    candidate_query,
           const Principal&                    principal,
           const std::optional<SafetyVerdict>& precomputed = std::nullopt) const;

private:
    [[nodiscard]] SafetyVerdict finish_oracle_verdict(SafetyVerdict    verdict,
                                                      std::string_view candidate_query,
                                                      const Principal& principal) const;

    std::shared_ptr<TextOracle>         oracle_;
    std::shared_ptr<const PolicyEngine> policy_;
    bool                                oracle_review_{true};
};
