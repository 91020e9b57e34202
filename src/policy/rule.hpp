#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 가드 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/guard.yaml 에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 다른 헤더에 의존하지 않는다 (독립적).
// - 모든 멤버는 기본값을 명시한다. GuardConfig{} 는 배포용 guard.yaml 과
//   동일한 내용으로 바로 사용할 수 있다 (테스트/라이브러리 용도).
// - 판정 로직은 포함하지 않는다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// GlobalConfig
//   log_level: "debug"|"info"|"warn"|"error"
//   log_path : 감사 로그 파일 경로 (rotating, 100MB x 3)
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string log_level{"info"};
    std::string log_path{"logs/rowguard.log"};
};

// ---------------------------------------------------------------------------
// StoreSettings
//   레코드 저장소 (SQLite) 설정.
//   allowed_columns 는 scope gate 가 허용하는 SELECT 컬럼 목록이다.
//   "*" 는 항상 허용되며 출력 단계의 redaction 에 맡긴다.
// ---------------------------------------------------------------------------
struct StoreSettings {
    std::string              path{"data/users.db"};
    std::string              table{"users"};
    std::string              id_column{"id"};
    std::vector<std::string> allowed_columns{
        "id", "first_name", "last_name", "email", "phone_number",
        "date_of_birth", "address", "ssn", "created_at",
    };
    std::uint32_t            busy_timeout_ms{5000};
};

// ---------------------------------------------------------------------------
// OracleSettings
//   OpenAI 호환 /v1/chat/completions 엔드포인트 설정 (평문 HTTP).
//   api_key_env: Bearer 토큰을 담은 환경 변수 이름 (키 자체는 파일에 두지 않는다).
//   timeout_ms : 연결+쓰기+읽기 전체를 덮는 단일 기한.
// ---------------------------------------------------------------------------
struct OracleSettings {
    std::string   host{"127.0.0.1"};
    std::uint16_t port{8000};
    std::string   target{"/v1/chat/completions"};
    std::string   model{"gpt-4o-mini"};
    std::string   api_key_env{"OPENAI_API_KEY"};
    std::uint32_t timeout_ms{30000};
    double        temperature{0.0};
};

// ---------------------------------------------------------------------------
// PipelineSettings
//   활성화할 단계 조합. 하나의 Orchestrator 가 이 플래그로 변형을 표현한다.
//
//   combined_single_pass : 권한 + SQL 안전성 판정을 oracle 1회 호출로 받음
//   oracle_sql_review    : scope gate 통과 후 oracle 의 2차 의견을 받음
//   oracle_output_review : 출력 정제 단계에서 oracle 판정을 받음
//                          (false 여도 결정적 redactor 는 항상 적용)
//   fallback_answers     : 후보 쿼리 없는 허가 요청에 일반 응답 경로 사용
// ---------------------------------------------------------------------------
struct PipelineSettings {
    bool combined_single_pass{false};
    bool oracle_sql_review{true};
    bool oracle_output_review{true};
    bool fallback_answers{true};
};

// ---------------------------------------------------------------------------
// EscapePattern
//   set-escape 탐지 정규식 + 사람이 읽을 수 있는 사유.
// ---------------------------------------------------------------------------
struct EscapePattern {
    std::string pattern{};
    std::string reason{};
};

// ---------------------------------------------------------------------------
// RedactionRule
//   출력 정제 규칙. replacement 는 ECMAScript 치환 문법 ($1, $2 ...).
//   name 은 감사 로그와 SanitizationVerdict::reason 에 사용된다.
// ---------------------------------------------------------------------------
struct RedactionRule {
    std::string name{};
    std::string pattern{};
    std::string replacement{};
};

// default_escape_patterns
//   기본 set-escape 패턴 (guard.yaml 의 sql_rules.block_patterns 와 동일).
inline std::vector<EscapePattern> default_escape_patterns() {
    return {
        {R"(\bUNION\b)",                          "UNION combines rows from other queries"},
        {R"(\bJOIN\b)",                           "JOIN pulls rows from additional tables"},
        {R"(\(\s*SELECT\b)",                      "nested SELECT can reference other rows"},
        {R"(\bOR\b)",                             "OR predicate can widen the row scope"},
        {R"(\b(LIKE|GLOB|REGEXP|MATCH)\b)",       "pattern predicate can match many rows"},
        {R"(\|\|)",                               "string concatenation in query"},
        {R"(\b(\d+)\s*(=|==|>=|<=)\s*\1\b)",      "numeric tautology"},
        {R"('([^']*)'\s*(=|==)\s*'\1')",          "string tautology"},
        {R"(\b(SUBSTR|SUBSTRING|INSTR|CHAR|HEX|UNHEX|LOAD_EXTENSION|RANDOMBLOB|ZEROBLOB)\s*\()",
                                                  "function enabling data extraction"},
        {R"(\b(SQLITE_MASTER|SQLITE_SCHEMA|SQLITE_TEMP_MASTER)\b)",
                                                  "schema table access"},
        {R"(--|/\*)",                             "SQL comment in query"},
        {R"(\b(INSERT|UPDATE|DELETE|REPLACE|DROP|ALTER|CREATE|PRAGMA|ATTACH|DETACH|VACUUM)\b)",
                                                  "data or schema modification"},
    };
}

// default_redaction_rules
//   적용 순서가 의미를 가진다: 주소 → 군사 주소 → SSN → 날짜 → 전화 → 이메일.
//   모든 패턴은 컬럼 구분자 '|' 를 넘어가지 않는다.
inline std::vector<RedactionRule> default_redaction_rules() {
    return {
        {"address",
         R"(\b\d+[^,\n|]*[,\n]\s*([A-Za-z][A-Za-z .'-]*?),\s*([A-Z]{2})\s+\d{5}(?:-\d{4})?\b)",
         "$1, $2"},
        {"military_address",
         R"((?:\b(?:USNS|USNV|USS|USCGC|PSC|Unit)\b[^\n|]*[,\n]\s*)?\b(APO|FPO|DPO)\s+(AA|AE|AP)\s+\d{5}(?:-\d{4})?\b)",
         "$1 $2"},
        {"ssn",           R"(\b\d{3}-\d{2}-\d{4}\b)",              "REDACTED"},
        {"date_of_birth", R"(\b(\d{4})-\d{2}-\d{2}\b)",            "$1"},
        {"phone_number",
         R"((?:(?:\+?1|001)[-. ]?)?\(?\b\d{3}\)?[-. ]?\d{3}[-. ]?(\d{4})(?:\s*x\d+)?\b)",
         "***-$1"},
        {"email",         R"(\b([A-Za-z0-9._%+-]+)@[A-Za-z0-9.-]+\.[A-Za-z]{2,}\b)", "$1"},
    };
}

// default_sensitive_fields
//   민감 필드 분류 체계 (식별번호, 연락처, 주소, 생년월일).
inline std::vector<std::string> default_sensitive_fields() {
    return {"ssn", "phone_number", "address", "date_of_birth"};
}

// ---------------------------------------------------------------------------
// GuardConfig
//   전체 설정의 루트 구조체. PolicyLoader::load 가 반환하는 최종 결과물.
// ---------------------------------------------------------------------------
struct GuardConfig {
    GlobalConfig               global{};
    StoreSettings              store{};
    OracleSettings             oracle{};
    PipelineSettings           pipeline{};
    std::vector<EscapePattern> block_patterns{default_escape_patterns()};
    std::vector<RedactionRule> redaction_rules{default_redaction_rules()};
    std::vector<std::string>   sensitive_fields{default_sensitive_fields()};
};
