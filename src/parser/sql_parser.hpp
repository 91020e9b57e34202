#pragma once

// ---------------------------------------------------------------------------
// sql_parser.hpp
//
// oracle 이 제안한 후보 쿼리(candidate query)를 분류하고 구조를 추출하는
// "첫 번째 키워드 기반 분류 + 정규식 패턴 매칭" 수준의 경량 파서.
// SQLite 방언 기준.
//
// [설계 한계 / 알려진 우회 가능성]
// 1. 문법 검증기가 아니다. 구조 추출 결과는 scope gate(PolicyEngine)와
//    set-escape 탐지기(InjectionDetector)가 보수적으로 해석한다.
// 2. 복잡한 서브쿼리: 내부 SELECT 의 테이블/컬럼은 추출하지 않고
//    has_subquery 플래그로만 표시한다.
// 3. 문자열 리터럴도 대문자로 정규화되므로 where_clause 의 리터럴 값은
//    원문과 대소문자가 다를 수 있다 (판정 용도로만 사용).
//
// [오탐/미탐 트레이드오프]
// - 구조 추출이 불확실하면 빈 값으로 남기고, 정책 엔진이 이를 차단으로
//   해석한다 (차단 우선).
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"  // ParseError, ParseErrorCode

// ---------------------------------------------------------------------------
// SqlCommand
//   SQL 문의 첫 번째 키워드 기반 분류.
//   kSelect 이외는 모두 scope gate 에서 차단된다.
// ---------------------------------------------------------------------------
enum class SqlCommand : std::uint8_t {
    kSelect  = 0,
    kInsert  = 1,
    kUpdate  = 2,
    kDelete  = 3,
    kReplace = 4,
    kDrop    = 5,
    kAlter   = 6,
    kCreate  = 7,
    kPragma  = 8,
    kAttach  = 9,
    kDetach  = 10,
    kWith    = 11,  // CTE, 중첩 조회로 간주
    kVacuum  = 12,
    kUnknown = 13,  // 분류 불가, 정책 엔진에서 차단
};

// ---------------------------------------------------------------------------
// ParsedQuery
//   파싱 성공 시 반환되는 구조 분석 결과.
//
//   columns      : SELECT 목록 (소문자, 공백 제거). 비-SELECT 이면 비어 있음.
//   where_clause : 정규화(대문자, 공백 1칸)된 WHERE 본문. 꼬리절 제외.
//   tail         : WHERE 뒤 ORDER BY / GROUP BY / HAVING / LIMIT 절 (정규화).
//   from_clause  : SELECT 의 최상위 FROM 목록 (정규화, 별칭/쉼표 포함).
//   raw_sql      : 원문 그대로 (로깅/제안 쿼리 생성용).
// ---------------------------------------------------------------------------
struct ParsedQuery {
    SqlCommand               command{SqlCommand::kUnknown};
    std::vector<std::string> tables{};            // FROM/JOIN/INTO/UPDATE 뒤 테이블명 (중복 유지)
    std::vector<std::string> columns{};           // SELECT 컬럼 목록
    std::string              where_clause{};
    std::string              tail{};
    std::string              from_clause{};
    std::string              raw_sql{};
    bool                     has_where_clause{false};
    bool                     has_subquery{false};  // 두 번째 SELECT 존재
};

// ---------------------------------------------------------------------------
// SqlParser
//   후보 쿼리 문자열을 ParsedQuery 로 변환한다. stateless.
//
//   [파서 보안 원칙]
//   - 파싱 실패는 절대 safe 판정으로 이어지지 않는다. 호출자는 error path 를
//     PolicyEngine::evaluate_error 로 넘겨 차단해야 한다.
// ---------------------------------------------------------------------------
class SqlParser {
public:
    SqlParser()  = default;
    ~SqlParser() = default;

    SqlParser(const SqlParser&)            = default;
    SqlParser& operator=(const SqlParser&) = default;
    SqlParser(SqlParser&&)                 = default;
    SqlParser& operator=(SqlParser&&)      = default;

    // parse
    //   sql: 후보 쿼리 원문
    //   반환: ParsedQuery 또는 ParseError
    //
    //   끝의 세미콜론 하나는 허용한다 (oracle 출력에 흔함).
    //   그 외 문자열/주석 밖 세미콜론은 kMultiStatement 오류.
    [[nodiscard]] std::expected<ParsedQuery, ParseError>
    parse(std::string_view sql) const;
};

// command_to_string
//   로그/사유 메시지용 SqlCommand 이름.
[[nodiscard]] std::string_view command_to_string(SqlCommand cmd) noexcept;
