#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 감사(audit) JSON 로거.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 한 이벤트 = 한 줄 JSON. 필드명은 snake_case.
// - 싱크: rotating file (100MB x 3) + 선택적 stderr 에코.
//   stdout 은 CLI 대화 출력 전용이므로 감사 로그를 쓰지 않는다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

#include <spdlog/logger.h>

// ---------------------------------------------------------------------------
// StructuredLogger
//   SessionLog / RequestLog / BlockLog 를 JSON 포맷으로 기록한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level    : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path     : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   echo_stderr  : true 이면 같은 줄을 stderr 에도 쓴다.
    // 싱크 생성 실패 시 std::runtime_error.
    StructuredLogger(LogLevel                     min_level,
                     const std::filesystem::path& log_path,
                     bool                         echo_stderr = false);

    ~StructuredLogger() = default;

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // 이동 허용
    StructuredLogger(StructuredLogger&&)            = default;
    StructuredLogger& operator=(StructuredLogger&&) = default;

    void log_session(const SessionLog& entry);

    // log_request
    //   요청마다 한 번, 터미널 상태에 도달한 뒤 호출된다.
    void log_request(const RequestLog& entry);

    // log_block
    //   denied / blocked / errored 요청에 대해 추가로 기록한다 (warn 레벨).
    void log_block(const BlockLog& entry);

    // 버퍼에 남은 줄을 파일로 내보낸다.
    void flush();

    // "debug" | "info" | "warn" | "error" → LogLevel. 그 외는 kInfo.
    [[nodiscard]] static LogLevel parse_level(std::string_view text) noexcept;

private:
    [[nodiscard]] static int to_spdlog_level(LogLevel level) noexcept;

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
