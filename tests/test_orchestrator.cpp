// ---------------------------------------------------------------------------
// test_orchestrator.cpp
//
// Orchestrator 상태 기계 통합 테스트. oracle / store 는 스크립트 대역.
//
// [테스트 범위]
// - 본인 주소 조회 → RESPONDED, 결정적 정제 적용, 기록 갱신
// - 다른 사용자 조회 → DENIED, 저장소 미호출
// - OR 주입 → BLOCKED + 제안 쿼리, 제안 미실행
// - 인사 → fallback 경로도 SANITIZING 을 거침
// - fallback 비활성 → DENIED
// - 협력자 오류 / 기한 초과 / 예외 → ERRORED + 재시도 문구, 기록 불변
// - 단일 호출 모드: oracle 1회로 권한 + 안전성
// - 통계 / 감사 로그 연동, 필수 협력자 누락 시 생성 실패
// ---------------------------------------------------------------------------

#include "pipeline/orchestrator.hpp"
#include "store/result_format.hpp"

#include <gtest/gtest.h>

#include <deque>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "scripted_oracle.hpp"

namespace {

// 실행된 쿼리를 기록하고 미리 넣어 둔 결과를 돌려주는 저장소 대역
class ScriptedStore final : public ExecutionBoundary {
public:
    void push(std::string text) { results_.emplace_back(std::move(text)); }

    void push_error(CollaboratorErrorCode code) {
        results_.emplace_back(std::unexpected(CollaboratorError{code, "scripted store failure", "test"}));
    }

    [[nodiscard]] std::expected<std::string, CollaboratorError>
    execute(std::string_view query) override {
        queries_.emplace_back(query);
        if (results_.empty()) {
            return std::string(kNoResultsMessage);
        }
        auto r = std::move(results_.front());
        results_.pop_front();
        return r;
    }

    [[nodiscard]] const std::vector<std::string>& queries() const noexcept { return queries_; }

private:
    std::deque<std::expected<std::string, CollaboratorError>> results_;
    std::vector<std::string>                                  queries_;
};

Principal make_principal() {
    Principal p;
    p.id              = 7;
    p.identity_string = "alice@example.com";
    p.display_name    = "Alice Smith";
    return p;
}

constexpr const char* kAddressAuthorization =
    "authorized: true\n"
    "reason: user asks for their own address\n"
    "sensitive_fields: [address]\n"
    "sql_query: SELECT address FROM users WHERE id = 7\n";

constexpr const char* kSafeQuery = "safe: true\nreason: scoped to one row\nsuggested_query: null\n";
constexpr const char* kSafeOutput = "safe: true\nreason: fine\n";

std::vector<PipelineState> states(std::initializer_list<PipelineState> list) {
    return std::vector<PipelineState>(list);
}

}  // namespace

class OrchestratorTest : public ::testing::Test {
protected:
    std::unique_ptr<Orchestrator> make(std::shared_ptr<const GuardConfig> config = nullptr,
                                       std::shared_ptr<StructuredLogger>  logger = nullptr) {
        return std::make_unique<Orchestrator>(
            make_principal(), std::move(config), oracle_, store_,
            std::make_shared<OracleFallbackResponder>(oracle_), std::move(logger), stats_, 1);
    }

    std::shared_ptr<ScriptedOracle> oracle_ = std::make_shared<ScriptedOracle>();
    std::shared_ptr<ScriptedStore>  store_  = std::make_shared<ScriptedStore>();
    std::shared_ptr<StatsCollector> stats_  = std::make_shared<StatsCollector>();
};

// ---------------------------------------------------------------------------
// 정상 경로
// ---------------------------------------------------------------------------

TEST_F(OrchestratorTest, OwnAddressRespondedAndRedacted) {
    auto orch = make();
    oracle_->push(kAddressAuthorization);
    oracle_->push(kSafeQuery);
    oracle_->push(kSafeOutput);
    store_->push("123 Main St, Springfield, IL 62704");

    const auto r = orch->handle("What's my address?");

    EXPECT_EQ(r.state, PipelineState::kResponded);
    EXPECT_EQ(r.response, "Springfield, IL");
    EXPECT_TRUE(r.output_sanitized);
    EXPECT_EQ(r.reason, "redacted: address");
    EXPECT_EQ(r.sensitive_fields, (std::set<std::string>{"address"}));
    EXPECT_EQ(r.trace, states({PipelineState::kReceived, PipelineState::kAuthorizing,
                               PipelineState::kAuthorized, PipelineState::kVerifyingSafety,
                               PipelineState::kVerified, PipelineState::kExecuting,
                               PipelineState::kSanitizing, PipelineState::kResponded}));

    ASSERT_EQ(store_->queries().size(), 1u);
    EXPECT_EQ(store_->queries()[0], "SELECT address FROM users WHERE id = 7");

    ASSERT_EQ(orch->session().size(), 1u);
    EXPECT_EQ(orch->session().turns()[0].request, "What's my address?");
    EXPECT_EQ(orch->session().turns()[0].response, "Springfield, IL");
}

TEST_F(OrchestratorTest, PlainValueReturnedUnchanged) {
    auto orch = make();
    oracle_->push("authorized: true\nreason: own name\nsensitive_fields: []\n"
                  "sql_query: SELECT first_name, last_name FROM users WHERE id = 7\n");
    oracle_->push(kSafeQuery);
    oracle_->push(kSafeOutput);
    store_->push("Alice | Smith");

    const auto r = orch->handle("What's my name?");
    EXPECT_EQ(r.state, PipelineState::kResponded);
    EXPECT_EQ(r.response, "Alice | Smith");
    EXPECT_FALSE(r.output_sanitized);
}

// ---------------------------------------------------------------------------
// DENIED
// ---------------------------------------------------------------------------

TEST_F(OrchestratorTest, OtherUserDenied) {
    auto orch = make();
    oracle_->push("authorized: false\n"
                  "reason: Cannot access another user's data\n"
                  "sensitive_fields: [address]\n"
                  "sql_query: null\n");

    const auto r = orch->handle("What's Steven's address?");

    EXPECT_EQ(r.state, PipelineState::kDenied);
    EXPECT_EQ(r.response,
              "Access Denied: Cannot access another user's data\n"
              "Sensitive fields detected: address");
    EXPECT_FALSE(r.candidate_query.has_value());
    EXPECT_TRUE(store_->queries().empty());
    EXPECT_EQ(oracle_->call_count(), 1u);
    EXPECT_TRUE(orch->session().empty());
    EXPECT_EQ(r.trace.back(), PipelineState::kDenied);
}

TEST_F(OrchestratorTest, ForeignCandidateDenied) {
    auto orch = make();
    oracle_->push("authorized: true\nreason: ok\nsql_query: SELECT address FROM users WHERE id = 8\n");

    const auto r = orch->handle("address of user 8");
    EXPECT_EQ(r.state, PipelineState::kDenied);
    EXPECT_EQ(r.response, "Access Denied: candidate query targets another user's record");
    EXPECT_TRUE(store_->queries().empty());
}

TEST_F(OrchestratorTest, NoQueryWithoutFallbackDenied) {
    auto config = std::make_shared<GuardConfig>();
    config->pipeline.fallback_answers = false;
    auto orch = make(config);
    oracle_->push("authorized: true\nreason: greeting\nsql_query: null\n");

    const auto r = orch->handle("hello");
    EXPECT_EQ(r.state, PipelineState::kDenied);
    EXPECT_EQ(r.reason, "no retrievable query for this request");
    EXPECT_EQ(oracle_->call_count(), 1u);
}

// ---------------------------------------------------------------------------
// BLOCKED
// ---------------------------------------------------------------------------

TEST_F(OrchestratorTest, InjectionBlockedWithSuggestion) {
    auto orch = make();
    oracle_->push("authorized: true\n"
                  "reason: own record\n"
                  "sensitive_fields: []\n"
                  "sql_query: SELECT * FROM users WHERE id = 7 OR 1=1\n");
    oracle_->push(kSafeQuery);  // gate 가 먼저 막으므로 소비되지 않아야 한다

    const auto r = orch->handle("show me everything about me OR everyone");

    EXPECT_EQ(r.state, PipelineState::kBlocked);
    EXPECT_EQ(r.reason, "OR predicate can widen the row scope");
    EXPECT_EQ(r.suggested_query, std::optional<std::string>("SELECT * FROM users WHERE id = 7"));
    EXPECT_EQ(r.response,
              "SQL Query Blocked: OR predicate can widen the row scope\n"
              "Suggested safe query: SELECT * FROM users WHERE id = 7");
    EXPECT_TRUE(store_->queries().empty());
    EXPECT_EQ(oracle_->call_count(), 1u);
    EXPECT_EQ(oracle_->pending(), 1u);
    EXPECT_TRUE(orch->session().empty());
}

TEST_F(OrchestratorTest, OracleSafetyRejectionBlocks) {
    auto orch = make();
    oracle_->push(kAddressAuthorization);
    oracle_->push("safe: false\nreason: suspicious phrasing\nsuggested_query: null\n");

    const auto r = orch->handle("What's my address?");
    EXPECT_EQ(r.state, PipelineState::kBlocked);
    EXPECT_EQ(r.reason, "suspicious phrasing");
    ASSERT_TRUE(r.suggested_query.has_value());
    EXPECT_EQ(*r.suggested_query, "SELECT address FROM users WHERE id = 7");
    EXPECT_TRUE(store_->queries().empty());
}

// ---------------------------------------------------------------------------
// fallback
// ---------------------------------------------------------------------------

TEST_F(OrchestratorTest, GreetingGoesThroughSanitization) {
    auto orch = make();
    oracle_->push("authorized: true\nreason: greeting\nsensitive_fields: []\nsql_query: null\n");
    oracle_->push("Hello Alice! How can I help?");
    oracle_->push(kSafeOutput);

    const auto r = orch->handle("hello");

    EXPECT_EQ(r.state, PipelineState::kResponded);
    EXPECT_EQ(r.response, "Hello Alice! How can I help?");
    EXPECT_EQ(r.trace, states({PipelineState::kReceived, PipelineState::kAuthorizing,
                               PipelineState::kAuthorized, PipelineState::kExecuting,
                               PipelineState::kSanitizing, PipelineState::kResponded}));
    EXPECT_EQ(oracle_->call_count(), 3u);
    EXPECT_TRUE(store_->queries().empty());
}

TEST_F(OrchestratorTest, FallbackAnswerWithSsnRedacted) {
    auto orch = make();
    oracle_->push("authorized: true\nreason: chat\nsql_query: null\n");
    oracle_->push("Sure, an SSN looks like 123-45-6789.");
    oracle_->push(kSafeOutput);

    const auto r = orch->handle("what does an SSN look like?");
    EXPECT_EQ(r.state, PipelineState::kResponded);
    EXPECT_EQ(r.response, "Sure, an SSN looks like REDACTED.");
    EXPECT_TRUE(r.output_sanitized);
}

TEST_F(OrchestratorTest, FallbackSeesHistory) {
    auto orch = make();
    oracle_->push(kAddressAuthorization);
    oracle_->push(kSafeQuery);
    oracle_->push(kSafeOutput);
    store_->push("123 Main St, Springfield, IL 62704");
    ASSERT_EQ(orch->handle("What's my address?").state, PipelineState::kResponded);

    oracle_->push("authorized: true\nreason: chat\nsql_query: null\n");
    oracle_->push("You're welcome!");
    oracle_->push(kSafeOutput);
    ASSERT_EQ(orch->handle("thanks").state, PipelineState::kResponded);

    // 호출 순서: auth, safety, output, auth, fallback, output
    ASSERT_EQ(oracle_->call_count(), 6u);
    EXPECT_EQ(oracle_->calls()[4].user,
              "Conversation so far:\n"
              "User: What's my address?\nAssistant: Springfield, IL\n"
              "\n"
              "Current message: thanks");
    EXPECT_EQ(orch->session().size(), 2u);
}

// ---------------------------------------------------------------------------
// ERRORED
// ---------------------------------------------------------------------------

TEST_F(OrchestratorTest, AuthorizationTimeoutErrored) {
    auto orch = make();
    oracle_->push_error(CollaboratorErrorCode::kOracleTimeout);

    const auto r = orch->handle("What's my address?");
    EXPECT_EQ(r.state, PipelineState::kErrored);
    EXPECT_EQ(r.response, kRetryMessage);
    EXPECT_EQ(r.reason.rfind("oracle_timeout", 0), 0u);
    EXPECT_EQ(r.trace, states({PipelineState::kReceived, PipelineState::kAuthorizing,
                               PipelineState::kErrored}));
    EXPECT_TRUE(orch->session().empty());
}

TEST_F(OrchestratorTest, StoreFailureErrored) {
    auto orch = make();
    oracle_->push(kAddressAuthorization);
    oracle_->push(kSafeQuery);
    store_->push_error(CollaboratorErrorCode::kStoreUnavailable);

    const auto r = orch->handle("What's my address?");
    EXPECT_EQ(r.state, PipelineState::kErrored);
    EXPECT_EQ(r.response, kRetryMessage);
    EXPECT_EQ(r.reason.rfind("store_unavailable", 0), 0u);
    EXPECT_TRUE(orch->session().empty());
}

TEST_F(OrchestratorTest, SanitizationFailureErrored) {
    auto orch = make();
    oracle_->push(kAddressAuthorization);
    oracle_->push(kSafeQuery);
    oracle_->push_error(CollaboratorErrorCode::kOracleUnavailable);
    store_->push("123 Main St, Springfield, IL 62704");

    const auto r = orch->handle("What's my address?");
    EXPECT_EQ(r.state, PipelineState::kErrored);
    EXPECT_EQ(r.response, kRetryMessage);
    EXPECT_FALSE(r.output_sanitized);
    EXPECT_EQ(r.trace[r.trace.size() - 2], PipelineState::kSanitizing);
    EXPECT_TRUE(orch->session().empty());
}

TEST_F(OrchestratorTest, OracleExceptionErrored) {
    auto orch = make();
    oracle_->throw_next();

    PipelineResult r;
    EXPECT_NO_THROW(r = orch->handle("What's my address?"));
    EXPECT_EQ(r.state, PipelineState::kErrored);
    EXPECT_EQ(r.reason.rfind("internal_error", 0), 0u);
    EXPECT_EQ(r.response, kRetryMessage);
}

TEST_F(OrchestratorTest, MalformedAuthorizationDenied) {
    auto orch = make();
    oracle_->push("I'm not sure what you mean.");

    const auto r = orch->handle("???");
    EXPECT_EQ(r.state, PipelineState::kDenied);
    EXPECT_EQ(r.reason, "invalid response format");
}

// ---------------------------------------------------------------------------
// 단일 호출 모드
// ---------------------------------------------------------------------------

TEST_F(OrchestratorTest, CombinedModeSingleOracleCall) {
    auto config = std::make_shared<GuardConfig>();
    config->pipeline.combined_single_pass = true;
    config->pipeline.oracle_output_review = false;
    auto orch = make(config);

    oracle_->push("authorized: true\n"
                  "reason: own name\n"
                  "sensitive_fields: []\n"
                  "sql_query: SELECT first_name FROM users WHERE id = 7\n"
                  "safe: true\n"
                  "sql_reason: single row\n"
                  "suggested_query: null\n");
    store_->push("Alice");

    const auto r = orch->handle("What's my first name?");
    EXPECT_EQ(r.state, PipelineState::kResponded);
    EXPECT_EQ(r.response, "Alice");
    EXPECT_EQ(oracle_->call_count(), 1u);
}

TEST_F(OrchestratorTest, CombinedModeUnsafeBlocks) {
    auto config = std::make_shared<GuardConfig>();
    config->pipeline.combined_single_pass = true;
    auto orch = make(config);

    oracle_->push("authorized: true\n"
                  "reason: own record\n"
                  "sql_query: SELECT * FROM users WHERE id = 7\n"
                  "safe: false\n"
                  "sql_reason: selects every column\n"
                  "suggested_query: SELECT email FROM users WHERE id = 7\n");

    const auto r = orch->handle("everything about me");
    EXPECT_EQ(r.state, PipelineState::kBlocked);
    EXPECT_EQ(r.reason, "selects every column");
    EXPECT_EQ(r.suggested_query, std::optional<std::string>("SELECT email FROM users WHERE id = 7"));
    EXPECT_EQ(oracle_->call_count(), 1u);
}

// ---------------------------------------------------------------------------
// 통계 / 감사 로그 / 생성
// ---------------------------------------------------------------------------

TEST_F(OrchestratorTest, StatsFollowTerminalStates) {
    {
        auto orch = make();
        EXPECT_EQ(stats_->snapshot().active_sessions, 1u);

        oracle_->push("authorized: false\nreason: no\n");
        (void)orch->handle("someone else");

        oracle_->push("authorized: true\nreason: ok\nsql_query: SELECT email FROM users WHERE id = 7 OR 1=1\n");
        (void)orch->handle("inject");

        oracle_->push(kAddressAuthorization);
        oracle_->push(kSafeQuery);
        oracle_->push(kSafeOutput);
        store_->push("123 Main St, Springfield, IL 62704");
        (void)orch->handle("What's my address?");

        oracle_->push_error(CollaboratorErrorCode::kOracleTimeout);
        (void)orch->handle("again");
    }

    const auto s = stats_->snapshot();
    EXPECT_EQ(s.total_sessions, 1u);
    EXPECT_EQ(s.active_sessions, 0u);
    EXPECT_EQ(s.total_requests, 4u);
    EXPECT_EQ(s.denied_requests, 1u);
    EXPECT_EQ(s.blocked_requests, 1u);
    EXPECT_EQ(s.responded_requests, 1u);
    EXPECT_EQ(s.sanitized_responses, 1u);
    EXPECT_EQ(s.errored_requests, 1u);
    EXPECT_DOUBLE_EQ(s.deny_rate, 0.5);
}

TEST_F(OrchestratorTest, AuditLogRecordsBlock) {
    const auto path = std::filesystem::temp_directory_path() / "rowguard_orchestrator_audit.log";
    std::filesystem::remove(path);
    auto logger = std::make_shared<StructuredLogger>(LogLevel::kDebug, path);

    {
        auto orch = make(nullptr, logger);
        oracle_->push("authorized: true\nreason: ok\nsql_query: SELECT email FROM users WHERE id = 7 OR 1=1\n");
        (void)orch->handle("inject");
    }
    logger->flush();

    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find(R"("event":"request")"), std::string::npos);
    EXPECT_NE(content.find(R"("state":"blocked")"), std::string::npos);
    EXPECT_NE(content.find(R"("event":"request_blocked")"), std::string::npos);
    EXPECT_NE(content.find(R"("stage":"sql_safety")"), std::string::npos);
    // 실행 결과는 기록하지 않는다
    EXPECT_EQ(content.find("Springfield"), std::string::npos);

    std::filesystem::remove(path);
}

TEST_F(OrchestratorTest, NullOracleRejected) {
    EXPECT_THROW(Orchestrator(make_principal(), nullptr, nullptr, store_, nullptr, nullptr, nullptr),
                 std::invalid_argument);
}

TEST_F(OrchestratorTest, NullStoreRejected) {
    EXPECT_THROW(Orchestrator(make_principal(), nullptr, oracle_, nullptr, nullptr, nullptr, nullptr),
                 std::invalid_argument);
}

TEST(PipelineStateName, Names) {
    EXPECT_STREQ(pipeline_state_name(PipelineState::kVerifyingSafety), "verifying_safety");
    EXPECT_STREQ(pipeline_state_name(PipelineState::kResponded), "responded");
    EXPECT_STREQ(pipeline_state_name(PipelineState::kErrored), "errored");
}
