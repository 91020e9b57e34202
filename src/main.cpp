#include "logger/structured_logger.hpp"
#include "oracle/http_oracle.hpp"
#include "pipeline/orchestrator.hpp"
#include "policy/policy_loader.hpp"
#include "stage/fallback_responder.hpp"
#include "stats/stats_collector.hpp"
#include "store/sqlite_store.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
namespace {

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

std::optional<std::int64_t> env_i64(const char* name) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr || val[0] == '\0') {
        return std::nullopt;
    }
    const std::string text(val);
    std::int64_t      parsed = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{} || ptr != text.data() + text.size() || parsed <= 0) {
        spdlog::warn("env {}: invalid value '{}', choosing a random principal", name, text);
        return std::nullopt;
    }
    return parsed;
}

spdlog::level::level_enum to_diag_level(std::string_view text) {
    if (text == "debug") {
        return spdlog::level::debug;
    }
    if (text == "warn") {
        return spdlog::level::warn;
    }
    if (text == "error") {
        return spdlog::level::err;
    }
    return spdlog::level::info;
}

void print_banner(const Principal& principal) {
    std::cout << "\n============================================================\n"
              << "Welcome, " << principal.display_name << "!\n"
              << "Logged in as: " << principal.identity_string
              << " (id " << principal.id << ")\n"
              << "Ask about your own account details.\n"
              << "Commands: /history, /stats, quit\n"
              << "============================================================\n";
}

void print_history(const SessionState& session) {
    if (session.empty()) {
        std::cout << "No conversation history yet.\n";
        return;
    }
    std::size_t n = 1;
    for (const auto& turn : session.turns()) {
        std::cout << n++ << ". You: " << turn.request << "\n   AI: " << turn.response << '\n';
    }
}

void print_stats(const StatsCollector& stats) {
    const auto snap = stats.snapshot();
    std::cout << "requests=" << snap.total_requests
              << " responded=" << snap.responded_requests
              << " denied=" << snap.denied_requests
              << " blocked=" << snap.blocked_requests
              << " errored=" << snap.errored_requests
              << " sanitized=" << snap.sanitized_responses
              << " deny_rate=" << snap.deny_rate << '\n';
}

void print_result(const PipelineResult& result) {
    switch (result.state) {
        case PipelineState::kResponded:
            if (result.output_sanitized) {
                std::cout << "Output Sanitized: " << result.reason << '\n';
            }
            std::cout << "AI: " << result.response << '\n';
            break;
        case PipelineState::kDenied:
        case PipelineState::kBlocked:
            std::cout << result.response << '\n';
            break;
        default:
            std::cout << "Error: " << result.response << '\n';
            break;
    }
}

int run() {
    // ── 설정 로드 ───────────────────────────────────────────────────────
    const std::string config_path = env_str("GUARD_CONFIG", "config/guard.yaml");
    auto loaded = PolicyLoader::load(config_path);
    if (!loaded) {
        std::cerr << "failed to load config: " << loaded.error() << '\n';
        return EXIT_FAILURE;
    }
    auto config = std::make_shared<GuardConfig>(std::move(*loaded));
    config->global.log_level = env_str("LOG_LEVEL", config->global.log_level);

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    // 진단 로그는 stderr, 감사 로그는 파일. stdout 은 대화 전용.
    auto diag = spdlog::stderr_color_mt("rowguard-diag");
    spdlog::set_default_logger(diag);
    spdlog::set_level(to_diag_level(config->global.log_level));

    auto audit = std::make_shared<StructuredLogger>(
        StructuredLogger::parse_level(config->global.log_level), config->global.log_path);

    spdlog::info("Starting rowguard");
    spdlog::info("Config: {}", config_path);
    spdlog::info("Store: {} (table {})", config->store.path, config->store.table);
    spdlog::info("Oracle: {}:{}{}", config->oracle.host, config->oracle.port, config->oracle.target);

    // ── 주체 선택 ───────────────────────────────────────────────────────
    auto store = std::make_shared<SqliteStore>(
        config->store.path, config->store.table, config->store.busy_timeout_ms);

    auto principal = store->get_principal(env_i64("PRINCIPAL_ID"));
    if (!principal) {
        std::cerr << "failed to load principal: " << principal.error().message << '\n';
        return EXIT_FAILURE;
    }
    if (!*principal) {
        std::cerr << "no principal found in " << config->store.path << '\n';
        return EXIT_FAILURE;
    }

    // ── 파이프라인 구성 ─────────────────────────────────────────────────
    auto oracle   = std::make_shared<HttpOracle>(config->oracle);
    auto fallback = std::make_shared<OracleFallbackResponder>(oracle);
    auto stats    = std::make_shared<StatsCollector>();

    const auto session_id = static_cast<std::uint64_t>(
        std::chrono::system_clock::now().time_since_epoch().count());

    Orchestrator orchestrator{**principal, config, oracle, store, fallback, audit, stats, session_id};

    audit->log_session(SessionLog{
        .session_id   = session_id,
        .event        = "session_start",
        .principal_id = orchestrator.principal().id,
        .identity     = orchestrator.principal().identity_string,
        .timestamp    = std::chrono::system_clock::now(),
    });

    print_banner(orchestrator.principal());

    // ── 대화 루프 ───────────────────────────────────────────────────────
    std::string line;
    while (true) {
        std::cout << "\nYou: " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }
        if (line.empty()) {
            continue;
        }
        if (line == "quit") {
            break;
        }
        if (line == "/history") {
            print_history(orchestrator.session());
            continue;
        }
        if (line == "/stats") {
            print_stats(*stats);
            continue;
        }
        print_result(orchestrator.handle(line));
    }

    audit->log_session(SessionLog{
        .session_id   = session_id,
        .event        = "session_end",
        .principal_id = orchestrator.principal().id,
        .identity     = orchestrator.principal().identity_string,
        .timestamp    = std::chrono::system_clock::now(),
    });
    audit->flush();

    std::cout << "Goodbye!\n";
    return EXIT_SUCCESS;
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int /*argc*/, char* /*argv*/[]) {
    try {
        return run();
    } catch (const std::exception& e) {
        std::cerr << "fatal: " << e.what() << '\n';
        return EXIT_FAILURE;
    }
}
