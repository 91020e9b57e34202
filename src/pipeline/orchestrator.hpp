#pragma once

// ---------------------------------------------------------------------------
// orchestrator.hpp
//
// 요청 하나를 단계별로 진행시키는 파이프라인 상태 기계.
//
// [상태 전이]
//   RECEIVED → AUTHORIZING → (DENIED | AUTHORIZED)
//            → VERIFYING_SAFETY → (BLOCKED | VERIFIED)
//            → EXECUTING → SANITIZING → RESPONDED
//   후보 쿼리 없이 허가된 경우:
//            AUTHORIZED → EXECUTING(fallback) → SANITIZING → RESPONDED
//   협력자 실패/예외는 어느 상태에서든 ERRORED 로 바로 간다.
//
// [불변식]
// - SANITIZING 은 RESPONDED 앞에서 항상 실행된다 (fallback 포함).
// - 사용자에게 보이는 문구는 이 클래스에서만 만든다.
// - SessionState 는 RESPONDED 일 때만 갱신된다.
// - 자동 재시도 없음. ERRORED 는 재시도 안내 문구만 돌려준다.
//
// [동시성]
// - Orchestrator 하나 = 세션 하나. handle() 은 동시에 호출하지 않는다.
// - 서로 다른 세션의 Orchestrator 는 가변 상태를 공유하지 않는다
//   (StatsCollector 는 atomic, StructuredLogger 는 spdlog _mt 싱크).
// ---------------------------------------------------------------------------

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "logger/structured_logger.hpp"
#include "oracle/text_oracle.hpp"
#include "pipeline/session_state.hpp"
#include "policy/policy_engine.hpp"
#include "policy/rule.hpp"
#include "sanitize/redactor.hpp"
#include "stage/authorization_stage.hpp"
#include "stage/fallback_responder.hpp"
#include "stage/safety_stage.hpp"
#include "stage/sanitization_stage.hpp"
#include "stats/stats_collector.hpp"
#include "store/execution_boundary.hpp"

enum class PipelineState : std::uint8_t {
    kReceived        = 0,
    kAuthorizing     = 1,
    kDenied          = 2,
    kAuthorized      = 3,
    kVerifyingSafety = 4,
    kBlocked         = 5,
    kVerified        = 6,
    kExecuting       = 7,
    kSanitizing      = 8,
    kResponded       = 9,
    kErrored         = 10,
};

[[nodiscard]] const char* pipeline_state_name(PipelineState state) noexcept;

// ERRORED 시 사용자에게 보여 주는 재시도 안내
inline constexpr std::string_view kRetryMessage =
    "Something went wrong while processing your request. Please try again.";

// ---------------------------------------------------------------------------
// PipelineResult
//   state           : 터미널 상태 (DENIED | BLOCKED | RESPONDED | ERRORED)
//   reason          : 판정 사유. ERRORED 에서는 내부 오류 설명 (로그용)
//   response        : 사용자에게 보여 줄 문구 / 최종 (정제된) 답변
//   sensitive_fields: 권한 단계가 표시한 민감 필드
//   suggested_query : BLOCKED 일 때의 대체 쿼리 (실행하지 않음)
//   output_sanitized: 출력 정제 단계가 응답을 바꿨으면 true
//   trace           : 거쳐 간 상태 순서
// ---------------------------------------------------------------------------
struct PipelineResult {
    PipelineState              state{PipelineState::kReceived};
    std::string                reason{};
    std::string                response{};
    std::set<std::string>      sensitive_fields{};
    std::optional<std::string> candidate_query{};
    std::optional<std::string> suggested_query{};
    bool                       output_sanitized{false};
    std::vector<PipelineState> trace{};
};

class Orchestrator {
public:
    // oracle / store 는 필수 (nullptr 이면 std::invalid_argument).
    // config 가 nullptr 이면 내장 기본값을 사용한다.
    // fallback / logger / stats 는 nullptr 허용.
    Orchestrator(Principal                          principal,
                 std::shared_ptr<const GuardConfig> config,
                 std::shared_ptr<TextOracle>        oracle,
                 std::shared_ptr<ExecutionBoundary> store,
                 std::shared_ptr<FallbackResponder> fallback,
                 std::shared_ptr<StructuredLogger>  logger,
                 std::shared_ptr<StatsCollector>    stats,
                 std::uint64_t                      session_id = 0);

    ~Orchestrator();

    Orchestrator(const Orchestrator&)            = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    Orchestrator(Orchestrator&&)                 = delete;
    Orchestrator& operator=(Orchestrator&&)      = delete;

    // 요청 하나를 터미널 상태까지 진행시킨다. 예외를 던지지 않는다.
    [[nodiscard]] PipelineResult handle(std::string_view request);

    [[nodiscard]] const SessionState& session() const noexcept { return session_; }
    [[nodiscard]] const Principal&    principal() const noexcept { return principal_; }
    [[nodiscard]] std::uint64_t       session_id() const noexcept { return session_id_; }

private:
    void run(std::string_view request, PipelineResult& result);

    // 후보 쿼리가 없을 때: fallback 응답 또는 DENIED
    void answer_without_query(std::string_view request, PipelineResult& result);

    // 원시 응답 → SANITIZING → RESPONDED
    void sanitize_and_respond(std::string_view request,
                              std::string_view raw,
                              PipelineResult&  result);

    void deny(PipelineResult& result, std::string reason);
    void fail(PipelineResult& result, const CollaboratorError& error);

    Principal                          principal_;
    std::shared_ptr<const GuardConfig> config_;
    std::shared_ptr<TextOracle>        oracle_;
    std::shared_ptr<ExecutionBoundary> store_;
    std::shared_ptr<FallbackResponder> fallback_;
    std::shared_ptr<StructuredLogger>  logger_;
    std::shared_ptr<StatsCollector>    stats_;
    std::uint64_t                      session_id_{0};

    std::shared_ptr<const PolicyEngine> policy_;
    AuthorizationStage                  authorization_;
    SafetyStage                         safety_;
    SanitizationStage                   sanitization_;
    SessionState                        session_;
};
