// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 감사 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "common/json_text.hpp"

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷 (UTC, 밀리초)
// ---------------------------------------------------------------------------
static std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

// ---------------------------------------------------------------------------
// Helper: 문자열 배열 → JSON 배열
// ---------------------------------------------------------------------------
static void write_string_array(std::ostringstream& json, const std::vector<std::string>& items) {
    json << '[';
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            json << ',';
        }
        json << '"' << escape_json_string(items[i]) << '"';
    }
    json << ']';
}

int StructuredLogger::to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kDebug:
            return static_cast<int>(spdlog::level::debug);
        case LogLevel::kInfo:
            return static_cast<int>(spdlog::level::info);
        case LogLevel::kWarn:
            return static_cast<int>(spdlog::level::warn);
        case LogLevel::kError:
            return static_cast<int>(spdlog::level::err);
    }
    return static_cast<int>(spdlog::level::info);
}

LogLevel StructuredLogger::parse_level(std::string_view text) noexcept {
    if (text == "debug") {
        return LogLevel::kDebug;
    }
    if (text == "warn") {
        return LogLevel::kWarn;
    }
    if (text == "error") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel                     min_level,
                                   const std::filesystem::path& log_path,
                                   bool                         echo_stderr)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;

        // Rotating file sink (100MB, 3개 파일 유지)
        const std::size_t max_file_size = 100 * 1024 * 1024;
        const std::size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_file_size, max_files));

        if (echo_stderr) {
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());
        }

        // 전역 레지스트리에 등록하지 않는다 (세션마다 독립 인스턴스 허용)
        logger_ = std::make_shared<spdlog::logger>("rowguard", sinks.begin(), sinks.end());
        logger_->set_level(static_cast<spdlog::level::level_enum>(to_spdlog_level(min_level)));

        // 타임스탬프 접두어 + JSON 본문
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::trace);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

// ---------------------------------------------------------------------------
// log_session: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_session(const SessionLog& entry) {
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(LogLevel::kInfo)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":")" << escape_json_string(entry.event) << R"(","session_id":)"
         << entry.session_id << R"(,"principal_id":)" << entry.principal_id
         << R"(,"identity":")" << escape_json_string(entry.identity) << R"(","timestamp":")"
         << format_iso8601(entry.timestamp) << R"("})";

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// log_request: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_request(const RequestLog& entry) {
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(LogLevel::kInfo)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"request","session_id":)" << entry.session_id
         << R"(,"principal_id":)" << entry.principal_id << R"(,"request":")"
         << escape_json_string(entry.request_text) << R"(","state":")"
         << escape_json_string(entry.terminal_state) << R"(","candidate_query":")"
         << escape_json_string(entry.candidate_query) << R"(","sensitive_fields":)";
    write_string_array(json, entry.sensitive_fields);
    json << R"(,"output_sanitized":)" << (entry.output_sanitized ? "true" : "false")
         << R"(,"timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << '}';

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// log_block: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_block(const BlockLog& entry) {
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(LogLevel::kWarn)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"request_blocked","session_id":)" << entry.session_id
         << R"(,"principal_id":)" << entry.principal_id << R"(,"stage":")"
         << escape_json_string(entry.stage) << R"(","reason":")"
         << escape_json_string(entry.reason) << R"(","request":")"
         << escape_json_string(entry.request_text) << R"(","candidate_query":")"
         << escape_json_string(entry.candidate_query) << R"(","timestamp":")"
         << format_iso8601(entry.timestamp) << R"("})";

    logger_->warn(json.str());
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}
