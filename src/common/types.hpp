#pragma once

#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// CapabilityLevel
//   주체(principal)의 권한 수준. 현재 모든 주체는 kBasic 으로 생성된다.
// ---------------------------------------------------------------------------
enum class CapabilityLevel : std::uint8_t {
    kUnauthorized = 0,
    kBasic        = 1,
    kAdmin        = 2,
};

// ---------------------------------------------------------------------------
// Principal
//   요청 파이프라인이 대행하는 인증된 주체.
//   세션 시작 시 레코드 저장소에서 한 번 생성되고, 세션 동안 변경되지 않는다.
//   stage/policy/logger 레이어에 const-ref 로 전달한다.
// ---------------------------------------------------------------------------
struct Principal {
    std::int64_t    id{0};                              // 레코드 행 식별자
    std::string     identity_string{};                  // 로그인 식별자 (이메일)
    std::string     display_name{};                     // "이름 성"
    CapabilityLevel capability_level{CapabilityLevel::kBasic};
};

// ---------------------------------------------------------------------------
// CollaboratorErrorCode
//   외부 협력자(oracle, store) 호출 실패 분류.
//   모든 코드가 재시도 가능한 오류로 사용자에게 노출된다.
// ---------------------------------------------------------------------------
enum class CollaboratorErrorCode : std::uint8_t {
    kOracleUnavailable = 0,  // 연결 실패 / 비정상 HTTP 상태
    kOracleTimeout     = 1,  // oracle 응답 기한 초과
    kOracleMalformed   = 2,  // 응답 본문에서 completion 을 꺼낼 수 없음
    kStoreUnavailable  = 3,  // DB 열기 실패
    kStoreTimeout      = 4,  // SQLITE_BUSY 등 기한 초과
    kQueryFailed       = 5,  // 쿼리 준비/실행 오류
    kInternalError     = 6,  // 협력자 내부 오류 (예: 예외)
};

// ---------------------------------------------------------------------------
// CollaboratorError
//   협력자 호출 실패 시 반환되는 오류 정보.
//   std::expected<T, CollaboratorError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
struct CollaboratorError {
    CollaboratorErrorCode code{CollaboratorErrorCode::kInternalError};
    std::string           message{};  // 사람이 읽을 수 있는 오류 설명
    std::string           context{};  // 오류 발생 위치/입력 단편 (로깅용)
};

// ---------------------------------------------------------------------------
// ParseErrorCode / ParseError
//   후보 SQL 파싱 단계에서 발생 가능한 오류.
//   파싱 오류는 항상 fail-close(unsafe) 로 처리된다.
// ---------------------------------------------------------------------------
enum class ParseErrorCode : std::uint8_t {
    kInvalidSql     = 0,  // 빈 입력 / 주석만 존재
    kMultiStatement = 1,  // 문자열/주석 밖 세미콜론
    kInternalError  = 2,
};

struct ParseError {
    ParseErrorCode code{ParseErrorCode::kInternalError};
    std::string    message{};
    std::string    context{};
};

// collaborator_error_name
//   로그/테스트 출력용 코드 이름.
[[nodiscard]] inline const char* collaborator_error_name(CollaboratorErrorCode code) noexcept {
    switch (code) {
        case CollaboratorErrorCode::kOracleUnavailable: return "oracle_unavailable";
        case CollaboratorErrorCode::kOracleTimeout:     return "oracle_timeout";
        case CollaboratorErrorCode::kOracleMalformed:   return "oracle_malformed";
        case CollaboratorErrorCode::kStoreUnavailable:  return "store_unavailable";
        case CollaboratorErrorCode::kStoreTimeout:      return "store_timeout";
        case CollaboratorErrorCode::kQueryFailed:       return "query_failed";
        case CollaboratorErrorCode::kInternalError:     return "internal_error";
    }
    return "internal_error";
}
