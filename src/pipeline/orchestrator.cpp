#include "pipeline/orchestrator.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

template <typename T>
std::shared_ptr<T> require(std::shared_ptr<T> ptr, const char* what) {
    if (!ptr) {
        throw std::invalid_argument(std::string("orchestrator: ") + what + " must not be null");
    }
    return ptr;
}

std::string join_fields(const std::set<std::string>& fields) {
    std::string out;
    for (const auto& f : fields) {
        if (!out.empty()) {
            out += ", ";
        }
        out += f;
    }
    return out;
}

// ERRORED 직전 상태 → 감사 로그의 stage 이름
const char* stage_of(PipelineState last) noexcept {
    switch (last) {
        case PipelineState::kAuthorizing:     return "authorization";
        case PipelineState::kVerifyingSafety: return "sql_safety";
        case PipelineState::kSanitizing:      return "output";
        default:                              return "pipeline";
    }
}

}  // namespace

const char* pipeline_state_name(PipelineState state) noexcept {
    switch (state) {
        case PipelineState::kReceived:        return "received";
        case PipelineState::kAuthorizing:     return "authorizing";
        case PipelineState::kDenied:          return "denied";
        case PipelineState::kAuthorized:      return "authorized";
        case PipelineState::kVerifyingSafety: return "verifying_safety";
        case PipelineState::kBlocked:         return "blocked";
        case PipelineState::kVerified:        return "verified";
        case PipelineState::kExecuting:       return "executing";
        case PipelineState::kSanitizing:      return "sanitizing";
        case PipelineState::kResponded:       return "responded";
        case PipelineState::kErrored:         return "errored";
    }
    return "unknown";
}

Orchestrator::Orchestrator(Principal                          principal,
                           std::shared_ptr<const GuardConfig> config,
                           std::shared_ptr<TextOracle>        oracle,
                           std::shared_ptr<ExecutionBoundary> store,
                           std::shared_ptr<FallbackResponder> fallback,
                           std::shared_ptr<StructuredLogger>  logger,
                           std::shared_ptr<StatsCollector>    stats,
                           std::uint64_t                      session_id)
    : principal_(std::move(principal))
    , config_(config ? std::move(config) : std::make_shared<const GuardConfig>())
    , oracle_(require(std::move(oracle), "oracle"))
    , store_(require(std::move(store), "execution boundary"))
    , fallback_(std::move(fallback))
    , logger_(std::move(logger))
    , stats_(std::move(stats))
    , session_id_(session_id)
    , policy_(std::make_shared<const PolicyEngine>(config_))
    , authorization_(oracle_, policy_, config_->sensitive_fields)
    , safety_(oracle_, policy_, config_->pipeline.oracle_sql_review)
    , sanitization_(oracle_,
                    std::make_shared<const Redactor>(config_->redaction_rules),
                    config_->pipeline.oracle_output_review)
{
    if (stats_) {
        stats_->on_session_open();
    }
    spdlog::info("orchestrator: session {} started for principal {}", session_id_, principal_.id);
}

Orchestrator::~Orchestrator() {
    if (stats_) {
        stats_->on_session_close();
    }
}

PipelineResult Orchestrator::handle(std::string_view request) {
    const auto started = std::chrono::steady_clock::now();

    PipelineResult result;
    result.trace.push_back(PipelineState::kReceived);
    if (stats_) {
        stats_->on_request();
    }

    try {
        run(request, result);
    } catch (const std::exception& e) {
        fail(result, CollaboratorError{
            CollaboratorErrorCode::kInternalError, e.what(),
            pipeline_state_name(result.trace.back())});
    }

    if (stats_) {
        switch (result.state) {
            case PipelineState::kDenied:    stats_->on_denied(); break;
            case PipelineState::kBlocked:   stats_->on_blocked(); break;
            case PipelineState::kResponded: stats_->on_responded(result.output_sanitized); break;
            default:                        stats_->on_errored(); break;
        }
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    if (logger_) {
        // 감사 로그 실패가 이미 결정된 응답을 바꾸지 않는다.
        try {
            RequestLog entry;
            entry.session_id       = session_id_;
            entry.principal_id     = principal_.id;
            entry.request_text     = std::string(request);
            entry.terminal_state   = pipeline_state_name(result.state);
            entry.candidate_query  = result.candidate_query.value_or("");
            entry.sensitive_fields.assign(result.sensitive_fields.begin(),
                                          result.sensitive_fields.end());
            entry.output_sanitized = result.output_sanitized;
            entry.timestamp        = std::chrono::system_clock::now();
            entry.duration         = elapsed;
            logger_->log_request(entry);

            if (result.state != PipelineState::kResponded) {
                const char* stage = "pipeline";
                if (result.state == PipelineState::kDenied) {
                    stage = "authorization";
                } else if (result.state == PipelineState::kBlocked) {
                    stage = "sql_safety";
                } else if (result.trace.size() >= 2) {
                    stage = stage_of(result.trace[result.trace.size() - 2]);
                }
                logger_->log_block(BlockLog{
                    .session_id      = session_id_,
                    .principal_id    = principal_.id,
                    .stage           = stage,
                    .reason          = result.reason,
                    .request_text    = std::string(request),
                    .candidate_query = result.candidate_query.value_or(""),
                    .timestamp       = std::chrono::system_clock::now(),
                });
            }
        } catch (const std::exception& e) {
            spdlog::error("orchestrator: audit log write failed: {}", e.what());
        }
    }

    spdlog::debug("orchestrator: session={} state={} duration_us={}",
                  session_id_, pipeline_state_name(result.state), elapsed.count());
    return result;
}

void Orchestrator::run(std::string_view request, PipelineResult& result) {
    result.trace.push_back(PipelineState::kAuthorizing);

    AuthorizationVerdict         auth;
    std::optional<SafetyVerdict> precomputed_safety;
    if (config_->pipeline.combined_single_pass) {
        auto combined = authorization_.authorize_combined(request, principal_);
        if (!combined) {
            fail(result, combined.error());
            return;
        }
        auth               = std::move(combined->authorization);
        precomputed_safety = std::move(combined->safety);
    } else {
        auto verdict = authorization_.authorize(request, principal_);
        if (!verdict) {
            fail(result, verdict.error());
            return;
        }
        auth = std::move(*verdict);
    }

    result.sensitive_fields = auth.sensitive_fields;
    if (!auth.authorized) {
        deny(result, auth.reason);
        return;
    }
    result.trace.push_back(PipelineState::kAuthorized);

    if (!auth.candidate_query) {
        answer_without_query(request, result);
        return;
    }
    result.candidate_query = auth.candidate_query;

    // ── SQL 안전성 ───────────────────────────────────────────────────────
    result.trace.push_back(PipelineState::kVerifyingSafety);
    auto safety = safety_.verify(*auth.candidate_query, principal_, precomputed_safety);
    if (!safety) {
        fail(result, safety.error());
        return;
    }
    if (!safety->safe) {
        result.state           = PipelineState::kBlocked;
        result.reason          = safety->reason;
        result.suggested_query = safety->suggested_query;
        result.response        = "SQL Query Blocked: " + safety->reason;
        if (safety->suggested_query) {
            result.response += "\nSuggested safe query: " + *safety->suggested_query;
        }
        result.trace.push_back(PipelineState::kBlocked);
        return;
    }
    result.trace.push_back(PipelineState::kVerified);

    // ── 실행 ─────────────────────────────────────────────────────────────
    result.trace.push_back(PipelineState::kExecuting);
    auto raw = store_->execute(*auth.candidate_query);
    if (!raw) {
        fail(result, raw.error());
        return;
    }

    sanitize_and_respond(request, *raw, result);
}

void Orchestrator::answer_without_query(std::string_view request, PipelineResult& result) {
    if (!config_->pipeline.fallback_answers || !fallback_) {
        deny(result, "no retrievable query for this request");
        return;
    }

    result.trace.push_back(PipelineState::kExecuting);
    auto raw = fallback_->answer(request, principal_, session_.turns());
    if (!raw) {
        fail(result, raw.error());
        return;
    }
    sanitize_and_respond(request, *raw, result);
}

void Orchestrator::sanitize_and_respond(std::string_view request,
                                        std::string_view raw,
                                        PipelineResult&  result) {
    result.trace.push_back(PipelineState::kSanitizing);
    auto verdict = sanitization_.sanitize(raw, principal_);
    if (!verdict) {
        fail(result, verdict.error());
        return;
    }

    if (verdict->safe) {
        result.response = std::string(raw);
    } else {
        result.response         = verdict->sanitized_response.value_or(std::string(kWithheldResponse));
        result.output_sanitized = true;
    }
    result.reason = verdict->reason;
    result.state  = PipelineState::kResponded;
    result.trace.push_back(PipelineState::kResponded);

    session_.append(std::string(request), result.response);
}

void Orchestrator::deny(PipelineResult& result, std::string reason) {
    result.state    = PipelineState::kDenied;
    result.reason   = std::move(reason);
    result.response = "Access Denied: " + result.reason;
    if (!result.sensitive_fields.empty()) {
        result.response += "\nSensitive fields detected: " + join_fields(result.sensitive_fields);
    }
    result.candidate_query.reset();
    result.trace.push_back(PipelineState::kDenied);
}

void Orchestrator::fail(PipelineResult& result, const CollaboratorError& error) {
    spdlog::error("orchestrator: session={} collaborator failure, code={}, message={}",
                  session_id_, collaborator_error_name(error.code), error.message);

    result.state            = PipelineState::kErrored;
    result.reason           = std::string(collaborator_error_name(error.code)) + ": " + error.message;
    result.response         = std::string(kRetryMessage);
    result.suggested_query.reset();
    result.output_sanitized = false;
    result.trace.push_back(PipelineState::kErrored);
}
