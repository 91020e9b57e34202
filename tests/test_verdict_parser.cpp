// ---------------------------------------------------------------------------
// test_verdict_parser.cpp
//
// verdict_parser 단위 테스트.
//
// [테스트 범위]
// - 키 정규화 (대소문자, 마크다운 장식, 공백 → '_')
// - boolean: true 토큰만 있을 때 true, 양쪽 토큰/누락/잡음 → false
// - text: 첫 값 우선, 누락 시 "invalid response format"
// - string set: [a, b] / 따옴표 / 빈 목록 / none, 원소 대소문자 보존
// - nullable: null, 빈 값 → nullopt, 값 대소문자 보존
// - 스키마 밖 키, ':' 없는 줄 무시
// - combined 스키마 (sql_reason → safety.reason)
// - serialize 결과 재파싱 시 동일 판정 (기본값, 실패 기본값, 따옴표 값, 대소문자 혼합)
//
// [fail-close]
// - 빈 입력, 쓰레기 입력은 항상 가장 제한적인 판정으로 귀결되어야 한다.
// ---------------------------------------------------------------------------

#include "verdict/verdict_parser.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <set>
#include <string>

// ---------------------------------------------------------------------------
// Authorization
// ---------------------------------------------------------------------------

TEST(VerdictParser, AuthorizationWellFormed) {
    const auto v = parse_authorization(
        "authorized: true\n"
        "reason: request concerns the user's own address\n"
        "sensitive_fields: [address]\n"
        "sql_query: SELECT address FROM users WHERE id = 7\n");

    EXPECT_TRUE(v.authorized);
    EXPECT_EQ(v.reason, "request concerns the user's own address");
    EXPECT_EQ(v.sensitive_fields, (std::set<std::string>{"address"}));
    ASSERT_TRUE(v.candidate_query.has_value());
    EXPECT_EQ(*v.candidate_query, "SELECT address FROM users WHERE id = 7");
}

TEST(VerdictParser, KeysNormalized) {
    const auto v = parse_authorization(
        "**Authorized**: TRUE\n"
        "- Reason: ok\n"
        "`Sensitive Fields`: [SSN, 'Phone_Number']\n"
        "## SQL_Query: null\n");

    EXPECT_TRUE(v.authorized);
    EXPECT_EQ(v.reason, "ok");
    EXPECT_EQ(v.sensitive_fields, (std::set<std::string>{"SSN", "Phone_Number"}));
    EXPECT_FALSE(v.candidate_query.has_value());
}

TEST(VerdictParser, BooleanRequiresTrueToken) {
    EXPECT_FALSE(parse_authorization("authorized: yes\n").authorized);
    EXPECT_FALSE(parse_authorization("authorized: 1\n").authorized);
    EXPECT_FALSE(parse_authorization("authorized: truely\n").authorized);
    EXPECT_TRUE(parse_authorization("authorized: true.\n").authorized);
}

TEST(VerdictParser, HesitantBooleanIsFalse) {
    const auto v = parse_authorization("authorized: true (or maybe false)\n");
    EXPECT_FALSE(v.authorized);
}

TEST(VerdictParser, RepeatedBooleanIsAnded) {
    EXPECT_FALSE(parse_authorization("authorized: true\nauthorized: false\n").authorized);
    EXPECT_FALSE(parse_authorization("authorized: false\nauthorized: true\n").authorized);
    EXPECT_TRUE(parse_authorization("authorized: true\nauthorized: true\n").authorized);
}

TEST(VerdictParser, FirstTextValueWins) {
    const auto v = parse_safety("safe: true\nreason: first\nreason: second\n");
    EXPECT_EQ(v.reason, "first");
}

TEST(VerdictParser, ValueCasePreserved) {
    const auto v = parse_authorization(
        "authorized: true\nsql_query: select Email FROM users WHERE id = 7\n");
    ASSERT_TRUE(v.candidate_query.has_value());
    EXPECT_EQ(*v.candidate_query, "select Email FROM users WHERE id = 7");
}

TEST(VerdictParser, ColonInsideValueKept) {
    const auto v = parse_safety("safe: false\nreason: blocked: UNION found\n");
    EXPECT_EQ(v.reason, "blocked: UNION found");
}

TEST(VerdictParser, UnknownKeysAndProseIgnored) {
    const auto v = parse_authorization(
        "Here is my analysis of the request.\n"
        "confidence: high\n"
        "authorized: true\n"
        "reason: fine\n");
    EXPECT_TRUE(v.authorized);
    EXPECT_EQ(v.reason, "fine");
    EXPECT_TRUE(v.sensitive_fields.empty());
}

TEST(VerdictParser, EmptySetForms) {
    EXPECT_TRUE(parse_authorization("sensitive_fields: []\n").sensitive_fields.empty());
    EXPECT_TRUE(parse_authorization("sensitive_fields:\n").sensitive_fields.empty());
    EXPECT_TRUE(parse_authorization("sensitive_fields: none\n").sensitive_fields.empty());
}

TEST(VerdictParser, SetWithoutBrackets) {
    const auto v = parse_authorization("sensitive_fields: ssn, address\n");
    EXPECT_EQ(v.sensitive_fields, (std::set<std::string>{"ssn", "address"}));
}

TEST(VerdictParser, NullVariants) {
    EXPECT_FALSE(parse_safety("suggested_query: NULL\n").suggested_query.has_value());
    EXPECT_FALSE(parse_safety("suggested_query:\n").suggested_query.has_value());
    EXPECT_FALSE(parse_safety("suggested_query: \"null\"\n").suggested_query.has_value());
}

// ---------------------------------------------------------------------------
// fail-close 기본값
// ---------------------------------------------------------------------------

TEST(VerdictParser, EmptyInputIsMostRestrictive) {
    const auto a = parse_authorization("");
    EXPECT_FALSE(a.authorized);
    EXPECT_EQ(a.reason, kInvalidFormatReason);
    EXPECT_FALSE(a.candidate_query.has_value());

    const auto s = parse_safety("");
    EXPECT_FALSE(s.safe);
    EXPECT_EQ(s.reason, kInvalidFormatReason);

    const auto z = parse_sanitization("");
    EXPECT_FALSE(z.safe);
    EXPECT_FALSE(z.sanitized_response.has_value());
}

TEST(VerdictParser, GarbageInputIsMostRestrictive) {
    const auto v = parse_safety("I think this query is totally safe, go ahead!");
    EXPECT_FALSE(v.safe);
    EXPECT_EQ(v.reason, kInvalidFormatReason);
}

TEST(VerdictParser, TruncatedBooleanIsFalse) {
    const auto v = parse_authorization("authorized: tr");
    EXPECT_FALSE(v.authorized);
}

// ---------------------------------------------------------------------------
// Sanitization / Combined
// ---------------------------------------------------------------------------

TEST(VerdictParser, SanitizationFields) {
    const auto v = parse_sanitization(
        "safe: false\n"
        "reason: contains an SSN\n"
        "sanitized_response: Your SSN is REDACTED\n"
        "original_response: Your SSN is 123-45-6789\n");
    EXPECT_FALSE(v.safe);
    EXPECT_EQ(v.sanitized_response, std::optional<std::string>("Your SSN is REDACTED"));
    EXPECT_EQ(v.original_response, std::optional<std::string>("Your SSN is 123-45-6789"));
}

TEST(VerdictParser, CombinedSplitsReasons) {
    const auto v = parse_combined(
        "authorized: true\n"
        "reason: own record\n"
        "sensitive_fields: [ssn]\n"
        "sql_query: SELECT ssn FROM users WHERE id = 7\n"
        "safe: true\n"
        "sql_reason: scoped to one row\n"
        "suggested_query: null\n");

    EXPECT_TRUE(v.authorization.authorized);
    EXPECT_EQ(v.authorization.reason, "own record");
    EXPECT_EQ(v.authorization.sensitive_fields, (std::set<std::string>{"ssn"}));
    EXPECT_TRUE(v.safety.safe);
    EXPECT_EQ(v.safety.reason, "scoped to one row");
    EXPECT_FALSE(v.safety.suggested_query.has_value());
}

TEST(VerdictParser, CombinedMissingSafetyIsUnsafe) {
    const auto v = parse_combined("authorized: true\nreason: ok\nsql_query: SELECT 1\n");
    EXPECT_TRUE(v.authorization.authorized);
    EXPECT_FALSE(v.safety.safe);
    EXPECT_EQ(v.safety.reason, kInvalidFormatReason);
}

// ---------------------------------------------------------------------------
// serialize
// ---------------------------------------------------------------------------

TEST(VerdictParser, SerializedVerdictReparses) {
    AuthorizationVerdict auth;
    auth.authorized       = true;
    auth.reason           = "own record";
    auth.sensitive_fields = {"address", "ssn"};
    auth.candidate_query  = "SELECT address, ssn FROM users WHERE id = 7";
    EXPECT_EQ(parse_authorization(serialize(auth)), auth);

    CombinedVerdict combined;
    combined.authorization        = auth;
    combined.safety.safe          = false;
    combined.safety.reason        = "OR predicate can widen the row scope";
    combined.safety.suggested_query = "SELECT address FROM users WHERE id = 7";
    EXPECT_EQ(parse_combined(serialize(combined)), combined);
}

TEST(VerdictParser, PresentEmptyReasonStaysEmpty) {
    EXPECT_EQ(parse_safety("safe: false\nreason:\n").reason, "");
    EXPECT_EQ(parse_safety("safe: false\n").reason, kInvalidFormatReason);
}

TEST(VerdictParser, NullableStripsOneQuoteLayer) {
    EXPECT_EQ(parse_sanitization("sanitized_response: 'REDACTED'\n").sanitized_response,
              std::optional<std::string>("REDACTED"));
    EXPECT_EQ(parse_sanitization("sanitized_response: \"'REDACTED'\"\n").sanitized_response,
              std::optional<std::string>("'REDACTED'"));
}

TEST(VerdictParser, DefaultVerdictsReparse) {
    EXPECT_EQ(parse_authorization(serialize(AuthorizationVerdict{})), AuthorizationVerdict{});
    EXPECT_EQ(parse_safety(serialize(SafetyVerdict{})), SafetyVerdict{});
    EXPECT_EQ(parse_sanitization(serialize(SanitizationVerdict{})), SanitizationVerdict{});
    EXPECT_EQ(parse_combined(serialize(CombinedVerdict{})), CombinedVerdict{});
}

TEST(VerdictParser, FailureDefaultsReparse) {
    const auto auth = parse_authorization("");
    EXPECT_EQ(parse_authorization(serialize(auth)), auth);

    const auto combined = parse_combined("garbage without any keys");
    EXPECT_EQ(parse_combined(serialize(combined)), combined);
}

TEST(VerdictParser, QuotedValuesReparse) {
    SanitizationVerdict v;
    v.safe               = false;
    v.reason             = "'quoted' reason";
    v.sanitized_response = "'REDACTED'";
    v.original_response  = "\"123-45-6789\"";
    EXPECT_EQ(parse_sanitization(serialize(v)), v);

    SafetyVerdict s;
    s.suggested_query = "`SELECT email FROM users WHERE id = 7`";
    EXPECT_EQ(parse_safety(serialize(s)), s);
}

TEST(VerdictParser, MixedCaseSetReparses) {
    AuthorizationVerdict v;
    v.authorized       = true;
    v.reason           = "Own Record";
    v.sensitive_fields = {"SSN", "Phone_Number", "address"};
    v.candidate_query  = "SELECT ssn FROM users WHERE id = 7";
    EXPECT_EQ(parse_authorization(serialize(v)), v);
}

TEST(VerdictParser, SerializeFlattensMultilineText) {
    SafetyVerdict v;
    v.safe   = false;
    v.reason = "line one\nline two";
    const auto reparsed = parse_safety(serialize(v));
    EXPECT_EQ(reparsed.reason, "line one line two");
}
