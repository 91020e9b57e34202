#pragma once

// ---------------------------------------------------------------------------
// http_oracle.hpp
//
// OpenAI 호환 POST /v1/chat/completions 엔드포인트를 호출하는 TextOracle.
// Boost.Beast (HTTP/1.1, 평문) + Boost.Asio.
//
// [타임아웃]
// - 이름 해석, 연결, 쓰기, 읽기 전체를 하나의 deadline 타이머가 덮는다.
//   만료 시 진행 중인 작업을 취소하고 kOracleTimeout 을 반환한다.
//
// [오류 분류]
// - 연결/전송 실패, 2xx 외 상태 → kOracleUnavailable
// - 본문에서 choices[0].message.content 를 꺼낼 수 없음 → kOracleMalformed
//
// [스레드 안전성]
// - complete() 는 호출마다 자체 io_context 를 만든다. 인스턴스 상태는
//   읽기 전용이므로 세션 간 공유해도 된다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string>
#include <string_view>

#include "oracle/text_oracle.hpp"
#include "policy/rule.hpp"  // OracleSettings

class HttpOracle final : public TextOracle {
public:
    explicit HttpOracle(OracleSettings settings);

    ~HttpOracle() override = default;

    HttpOracle(const HttpOracle&)            = delete;
    HttpOracle& operator=(const HttpOracle&) = delete;
    HttpOracle(HttpOracle&&)                 = default;
    HttpOracle& operator=(HttpOracle&&)      = default;

    [[nodiscard]] std::expected<std::string, CollaboratorError>
    complete(std::string_view system_instruction, std::string_view user_message) override;

    // 요청 본문(JSON) 생성: model, temperature, messages[system, user]
    [[nodiscard]] static std::string build_request_body(
        const OracleSettings& settings,
        std::string_view      system_instruction,
        std::string_view      user_message);

    // 응답 본문에서 choices[0].message.content 추출
    [[nodiscard]] static std::expected<std::string, CollaboratorError>
    extract_completion(std::string_view response_body);

private:
    OracleSettings settings_;
    std::string    api_key_;  // 생성 시 api_key_env 에서 읽는다. 비어 있으면 헤더 생략.
};
