#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 감사 로그 이벤트 타입 정의.
//
// [순환 의존성 방지 설계]
// - PipelineState 를 직접 include 하지 않는다.
// - terminal_state 는 호출자가 pipeline_state_name() 으로 변환한 문자열이다.
//
// [민감정보 취급 주의]
// - request_text / candidate_query 는 사용자 입력과 oracle 생성 SQL 원문이다.
//   응답 본문(실행 결과)은 어떤 로그에도 기록하지 않는다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 의 global.log_level 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// SessionLog
//   세션 시작/종료 이벤트.
//   event: "session_start" | "session_end"
// ---------------------------------------------------------------------------
struct SessionLog {
    std::uint64_t                              session_id{0};
    std::string                                event{};
    std::int64_t                               principal_id{0};
    std::string                                identity{};
    std::chrono::system_clock::time_point      timestamp{};
};

// ---------------------------------------------------------------------------
// RequestLog
//   요청 하나의 처리 결과.
//   terminal_state: "responded" | "denied" | "blocked" | "errored"
// ---------------------------------------------------------------------------
struct RequestLog {
    std::uint64_t                              session_id{0};
    std::int64_t                               principal_id{0};
    std::string                                request_text{};
    std::string                                terminal_state{};
    std::string                                candidate_query{};  // 없으면 빈 문자열
    std::vector<std::string>                   sensitive_fields{};
    bool                                       output_sanitized{false};
    std::chrono::system_clock::time_point      timestamp{};
    std::chrono::microseconds                  duration{0};        // 파이프라인 전체 소요 시간
};

// ---------------------------------------------------------------------------
// BlockLog
//   요청이 중간 단계에서 멈춘 이벤트.
//   stage : "authorization" | "sql_safety" | "output" | "pipeline"
//   reason: 판정 사유 (errored 의 경우 협력자 오류 설명)
// ---------------------------------------------------------------------------
struct BlockLog {
    std::uint64_t                              session_id{0};
    std::int64_t                               principal_id{0};
    std::string                                stage{};
    std::string                                reason{};
    std::string                                request_text{};
    std::string                                candidate_query{};
    std::chrono::system_clock::time_point      timestamp{};
};
