#pragma once

// ---------------------------------------------------------------------------
// policy_engine.hpp
//
// 후보 쿼리에 대한 기계적 scope gate.
// oracle 의견과 무관하게 항상 먼저 평가되며, 우회할 수 없다.
//
// [fail-close 원칙: 절대 위반 금지]
// 1. 파서 오류 → evaluate_error() → 반드시 PolicyAction::kBlock
// 2. 아래 조건 중 하나라도 불확실 → kBlock
// 3. kAllow 는 모든 조건을 명시적으로 만족할 때만 반환
//
// [허용 조건]
// - SELECT 문, 설정된 테이블 하나만 조회
// - SELECT 컬럼은 allowed_columns 또는 '*'
// - set-escape 패턴 미탐지, 서브쿼리 없음
// - WHERE 절은 AND 로 연결된 단순 비교식
// - 식별자 컬럼 술어는 "<id_column> = <주체 id>" 정확히 하나
// - FROM 목록은 테이블 이름 하나 (별칭, 쉼표 없음)
// - WHERE 뒤에는 ORDER BY <col> [ASC|DESC], LIMIT <n> 만 허용
//
// [순환 의존성: 무순환 구조]
// policy_engine.hpp → sql_parser.hpp / injection_detector.hpp / rule.hpp
// ❌ rule.hpp → policy_engine.hpp 금지
// ---------------------------------------------------------------------------

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "common/types.hpp"              // Principal, ParseError
#include "parser/injection_detector.hpp"  // InjectionDetector
#include "parser/sql_parser.hpp"          // ParsedQuery
#include "policy/rule.hpp"                // GuardConfig

// ---------------------------------------------------------------------------
// PolicyAction
// ---------------------------------------------------------------------------
enum class PolicyAction : std::uint8_t {
    kAllow = 0,
    kBlock = 1,
};

// ---------------------------------------------------------------------------
// PolicyResult
//   matched_rule: 판정 근거 규칙 식별자 (감사 로그용).
//     "read-only" | "set-escape" | "table-scope" | "column-scope" |
//     "row-scope" | "predicate-form" | "query-tail" | "parse-error" |
//     "principal-scope"(허용)
//   reason: 사람이 읽을 수 있는 판정 이유. SafetyVerdict::reason 으로 노출된다.
// ---------------------------------------------------------------------------
struct PolicyResult {
    PolicyAction action{PolicyAction::kBlock};
    std::string  matched_rule{};
    std::string  reason{};
};

// ---------------------------------------------------------------------------
// ScopeCheck
//   권한 단계에서 쓰는 약한 검사 결과.
//   kScoped : 주체 id 등호 술어가 있고 다른 id 술어가 없음
//   kMissing: 주체 id 술어가 없음
//   kForeign: 다른 주체의 id 또는 id 범위 술어가 있음
// ---------------------------------------------------------------------------
enum class ScopeCheck : std::uint8_t {
    kScoped  = 0,
    kMissing = 1,
    kForeign = 2,
};

// ---------------------------------------------------------------------------
// PolicyEngine
//   읽기 전용. evaluate 계열은 concurrent 호출에 안전하다.
// ---------------------------------------------------------------------------
class PolicyEngine {
public:
    // config 가 nullptr 이면 모든 evaluate() 가 kBlock 을 반환한다.
    explicit PolicyEngine(std::shared_ptr<const GuardConfig> config);

    ~PolicyEngine() = default;

    PolicyEngine(const PolicyEngine&)            = delete;
    PolicyEngine& operator=(const PolicyEngine&) = delete;
    PolicyEngine(PolicyEngine&&)                 = default;
    PolicyEngine& operator=(PolicyEngine&&)      = default;

    // evaluate
    //   파싱된 쿼리가 principal 의 행으로 한정되는지 검사한다.
    //   평가 순서는 헤더 상단 [허용 조건] 순서를 따른다.
    [[nodiscard]] PolicyResult evaluate(
        const ParsedQuery& query,
        const Principal&   principal) const;

    // evaluate_sql
    //   parse + evaluate. 파싱 실패는 evaluate_error 로 넘긴다.
    [[nodiscard]] PolicyResult evaluate_sql(
        std::string_view sql,
        const Principal& principal) const;

    // evaluate_error
    //   파서 오류 시 호출. 어떤 경우에도 kBlock 을 반환한다.
    [[nodiscard]] PolicyResult evaluate_error(
        const ParseError& error,
        const Principal&  principal) const noexcept;

    // check_scope
    //   식별자 술어만 보는 약한 검사. 파싱에 실패하면 kMissing.
    [[nodiscard]] ScopeCheck check_scope(
        std::string_view sql,
        const Principal& principal) const;

    // suggest
    //   gate 를 통과하는 대체 쿼리:
    //   "SELECT <요청 컬럼 중 허용된 것 | *> FROM <table> WHERE <id_column> = <id>"
    //   제안만 하며, 실행은 하지 않는다.
    [[nodiscard]] std::string suggest(
        std::string_view sql,
        const Principal& principal) const;

private:
    std::shared_ptr<const GuardConfig> config_;
    InjectionDetector                  detector_;
    SqlParser                          parser_;
};
