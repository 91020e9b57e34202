// ---------------------------------------------------------------------------
// http_oracle.cpp
//
// Boost.Beast 기반 chat completion 클라이언트 구현.
//
// [설계 노트]
// - 동기 인터페이스지만 내부는 async 체인 + io_context::run() 이다.
//   Beast 의 동기 API 는 타임아웃을 지원하지 않으므로, steady_timer
//   하나로 전체 기한을 강제하기 위해 async 연산을 사용한다.
// - 응답 JSON 은 yaml-cpp 로 읽는다 (JSON 은 YAML 1.2 의 부분집합).
// ---------------------------------------------------------------------------

#include "oracle/http_oracle.hpp"

#include <chrono>
#include <cstdlib>
#include <sstream>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "common/json_text.hpp"

namespace net   = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp       = net::ip::tcp;

HttpOracle::HttpOracle(OracleSettings settings)
    : settings_(std::move(settings))
{
    if (const char* key = std::getenv(settings_.api_key_env.c_str()); key != nullptr) {
        api_key_ = key;
    } else {
        spdlog::warn("http_oracle: environment variable '{}' is not set, "
                     "requests are sent without an Authorization header",
                     settings_.api_key_env);
    }
}

std::string HttpOracle::build_request_body(const OracleSettings& settings,
                                           std::string_view      system_instruction,
                                           std::string_view      user_message) {
    std::ostringstream json;
    json << R"({"model":")" << escape_json_string(settings.model)
         << R"(","temperature":)" << fmt::format("{}", settings.temperature)
         << R"(,"messages":[{"role":"system","content":")" << escape_json_string(system_instruction)
         << R"("},{"role":"user","content":")" << escape_json_string(user_message)
         << R"("}]})";
    return json.str();
}

std::expected<std::string, CollaboratorError>
HttpOracle::extract_completion(std::string_view response_body) {
    try {
        const YAML::Node root = YAML::Load(std::string(response_body));
        const YAML::Node choices = root["choices"];
        if (!choices || !choices.IsSequence() || choices.size() == 0) {
            return std::unexpected(CollaboratorError{
                CollaboratorErrorCode::kOracleMalformed,
                "response has no choices",
                std::string(response_body.substr(0, 200))
            });
        }
        const YAML::Node content = choices[0]["message"]["content"];
        if (!content || !content.IsScalar()) {
            return std::unexpected(CollaboratorError{
                CollaboratorErrorCode::kOracleMalformed,
                "response has no message content",
                std::string(response_body.substr(0, 200))
            });
        }
        return content.as<std::string>();
    } catch (const YAML::Exception& e) {
        return std::unexpected(CollaboratorError{
            CollaboratorErrorCode::kOracleMalformed,
            std::string("cannot parse response body: ") + e.what(),
            std::string(response_body.substr(0, 200))
        });
    }
}

std::expected<std::string, CollaboratorError>
HttpOracle::complete(std::string_view system_instruction, std::string_view user_message) {
    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    tcp::socket     socket(ioc);
    net::steady_timer deadline(ioc);

    http::request<http::string_body> req{http::verb::post, settings_.target, 11};
    req.set(http::field::host, settings_.host);
    req.set(http::field::user_agent, "rowguard");
    req.set(http::field::content_type, "application/json");
    if (!api_key_.empty()) {
        req.set(http::field::authorization, "Bearer " + api_key_);
    }
    req.body() = build_request_body(settings_, system_instruction, user_message);
    req.prepare_payload();

    beast::flat_buffer                buffer;
    http::response<http::string_body> res;
    beast::error_code                 failure;
    const char*                       failed_step = "";
    bool                              timed_out   = false;

    const auto fail_at = [&](const char* step, beast::error_code ec) {
        failure     = ec;
        failed_step = step;
        deadline.cancel();
    };

    deadline.expires_after(std::chrono::milliseconds(settings_.timeout_ms));
    deadline.async_wait([&](beast::error_code ec) {
        if (ec == net::error::operation_aborted) {
            return;  // 정상 완료로 취소됨
        }
        timed_out = true;
        resolver.cancel();
        beast::error_code ignored;
        socket.close(ignored);
    });

    resolver.async_resolve(
        settings_.host, std::to_string(settings_.port),
        [&](beast::error_code ec, const tcp::resolver::results_type& results) {
            if (ec) {
                fail_at("resolve", ec);
                return;
            }
            net::async_connect(socket, results,
                [&](beast::error_code cec, const tcp::endpoint&) {
                    if (cec) {
                        fail_at("connect", cec);
                        return;
                    }
                    http::async_write(socket, req,
                        [&](beast::error_code wec, std::size_t) {
                            if (wec) {
                                fail_at("write", wec);
                                return;
                            }
                            http::async_read(socket, buffer, res,
                                [&](beast::error_code rec, std::size_t) {
                                    if (rec) {
                                        fail_at("read", rec);
                                        return;
                                    }
                                    deadline.cancel();
                                });
                        });
                });
        });

    ioc.run();

    beast::error_code ignored;
    socket.shutdown(tcp::socket::shutdown_both, ignored);

    if (timed_out) {
        spdlog::warn("http_oracle: request to {}:{} timed out after {}ms",
                     settings_.host, settings_.port, settings_.timeout_ms);
        return std::unexpected(CollaboratorError{
            CollaboratorErrorCode::kOracleTimeout,
            "oracle did not answer within the deadline",
            settings_.host
        });
    }
    if (failure) {
        spdlog::warn("http_oracle: {} failed: {}", failed_step, failure.message());
        return std::unexpected(CollaboratorError{
            CollaboratorErrorCode::kOracleUnavailable,
            std::string(failed_step) + " failed: " + failure.message(),
            settings_.host
        });
    }

    const unsigned status = res.result_int();
    if (status < 200 || status >= 300) {
        spdlog::warn("http_oracle: unexpected HTTP status {}", status);
        return std::unexpected(CollaboratorError{
            CollaboratorErrorCode::kOracleUnavailable,
            "oracle returned HTTP " + std::to_string(status),
            res.body().substr(0, 200)
        });
    }

    return extract_completion(res.body());
}
