// ---------------------------------------------------------------------------
// instructions.cpp
//
// 지시문 본문. 형식 계약(key: value 줄)은 verdict_parser 의 스키마와
// 일치해야 한다. 키 이름을 바꿀 때는 두 곳을 함께 바꿀 것.
//
// 템플릿 인자: {0}=display_name, {1}=id, {2}=identity_string
// ---------------------------------------------------------------------------

#include "oracle/instructions.hpp"

#include <fmt/format.h>

namespace {

constexpr const char* kAuthorizationRules = R"(Rules:
- The user may ONLY access their own row. Every query must include WHERE id = {1}.
- Sensitive fields are: ssn, phone_number, address, date_of_birth. List every sensitive field the query touches.
- The user may see their own first_name, last_name, email, address, phone_number and date_of_birth.
- Deny any request about another person, by name or in aggregate (for example "show me all users").
- Deny requests about neighbours, people in the same city or similar users.
- When in doubt, deny.

Examples of conversion:
- "What's my address?" -> SELECT address FROM users WHERE id = {1}
- "When was I born?" -> SELECT date_of_birth FROM users WHERE id = {1}
- "What's my name?" -> SELECT first_name, last_name FROM users WHERE id = {1}
)";

constexpr const char* kSafetyRules = R"(Rules for SQL safety:
1. Only SELECT queries are allowed.
2. No UNION, JOIN or subqueries.
3. No string concatenation or dynamic SQL.
4. No OR conditions.
5. No LIKE or GLOB patterns.
6. No functions that can extract data piecewise (substr, instr, char, hex).
7. The WHERE clause must restrict the query to id = {1}.
8. No access to system tables or metadata.
9. No INSERT, UPDATE, DELETE, REPLACE.
10. No CREATE, DROP or ALTER.
)";

}  // namespace

std::string authorization_instruction(const Principal& principal) {
    const std::string tmpl = std::string(
        "You are a security guardrail that converts a user's question into a SQL query over the "
        "'users' table, restricted to that user's own row.\n"
        "Current user: {0} (ID: {1}, Email: {2})\n\n")
        + kAuthorizationRules
        + "\nAnswer in EXACTLY this format, one field per line:\n"
          "authorized: true/false\n"
          "reason: <explanation>\n"
          "sensitive_fields: [field1, field2]\n"
          "sql_query: <SQL query, or null when not authorized>\n\n"
          "Example for \"What's Steven's address?\":\n"
          "authorized: false\n"
          "reason: Cannot access another user's data\n"
          "sensitive_fields: [address]\n"
          "sql_query: null\n";
    return fmt::format(fmt::runtime(tmpl), principal.display_name, principal.id, principal.identity_string);
}

std::string combined_instruction(const Principal& principal) {
    const std::string tmpl = std::string(
        "You are a security guardrail that converts a user's question into a SQL query over the "
        "'users' table and then verifies that query.\n"
        "Current user: {0} (ID: {1}, Email: {2})\n\n")
        + kAuthorizationRules + "\n" + kSafetyRules
        + "\nAnswer in EXACTLY this format, one field per line:\n"
          "authorized: true/false\n"
          "reason: <authorization explanation>\n"
          "sensitive_fields: [field1, field2]\n"
          "sql_query: <SQL query, or null>\n"
          "safe: true/false\n"
          "sql_reason: <SQL safety explanation>\n"
          "suggested_query: <safe alternative query, or null>\n";
    return fmt::format(fmt::runtime(tmpl), principal.display_name, principal.id, principal.identity_string);
}

std::string safety_instruction(const Principal& principal) {
    const std::string tmpl = std::string(
        "You are a SQL security verifier. Check the given query for injection and for anything "
        "that could return rows other than user {1}.\n\n")
        + kSafetyRules
        + "\nAnswer in EXACTLY this format, one field per line:\n"
          "safe: true/false\n"
          "reason: <explanation>\n"
          "suggested_query: <safe alternative query, or null>\n\n"
          "Example for \"SELECT * FROM users WHERE id = {1} OR 1=1\":\n"
          "safe: false\n"
          "reason: Query contains an OR condition that bypasses the WHERE clause\n"
          "suggested_query: SELECT first_name, last_name FROM users WHERE id = {1}\n";
    return fmt::format(fmt::runtime(tmpl), principal.display_name, principal.id, principal.identity_string);
}

std::string sanitization_instruction(const Principal& principal) {
    const std::string tmpl = std::string(
        "You are an output guardrail that checks a response before it is shown to the user.\n"
        "Current user: {0} (ID: {1}, Email: {2})\n\n"
        "Rules for output safety:\n"
        "1. Replace SSNs with REDACTED.\n"
        "2. Never expose other users' data.\n"
        "3. Reduce addresses to city and state.\n"
        "4. Reduce phone numbers to their last 4 digits.\n"
        "5. Reduce dates of birth to the year.\n"
        "6. Reduce email addresses to the username part.\n"
        "7. Make sure the data belongs to the current user.\n\n"
        "Answer in EXACTLY this format, one field per line:\n"
        "safe: true/false\n"
        "reason: <explanation>\n"
        "sanitized_response: <modified response, or null when safe>\n"
        "original_response: <original response>\n");
    return fmt::format(fmt::runtime(tmpl), principal.display_name, principal.id, principal.identity_string);
}

std::string fallback_instruction(const Principal& principal) {
    const std::string tmpl = std::string(
        "You are a helpful assistant talking to {0}.\n"
        "You have no access to any database. Do not invent personal data about this user or any "
        "other person. If the question needs stored personal data, say that you cannot look it up.\n"
        "The conversation so far is given before the current message.\n");
    return fmt::format(fmt::runtime(tmpl), principal.display_name, principal.id, principal.identity_string);
}

std::string request_message(std::string_view request) {
    return "Query: " + std::string(request);
}

std::string query_message(std::string_view candidate_query) {
    return "SQL Query to verify: " + std::string(candidate_query);
}

std::string response_message(std::string_view raw_response) {
    return "Response to verify: " + std::string(raw_response);
}
