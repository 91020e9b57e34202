#pragma once

// ---------------------------------------------------------------------------
// policy_loader.hpp
//
// YAML 가드 설정 파일(config/guard.yaml)을 GuardConfig 로 로드한다.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 부분적으로 파싱된
//   설정은 절대 반환하지 않는다 (all-or-nothing).
// - 누락된 필드는 GuardConfig 기본값을 유지한다.
//
// [보안 고려사항]
// - YAML 파일 전체를 로그에 출력하지 말 것 (민감 정보 노출 방지).
// - API 키는 파일이 아니라 oracle.api_key_env 가 가리키는 환경 변수에 둔다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "policy/rule.hpp"  // GuardConfig

class PolicyLoader {
public:
    PolicyLoader()  = default;
    ~PolicyLoader() = default;

    PolicyLoader(const PolicyLoader&)            = default;
    PolicyLoader& operator=(const PolicyLoader&) = default;
    PolicyLoader(PolicyLoader&&)                 = default;
    PolicyLoader& operator=(PolicyLoader&&)      = default;

    // load
    //   파일 없음, YAML 문법 오류, 스키마 불일치, 빈 block_patterns,
    //   빈 redaction.rules 는 모두 실패로 처리한다.
    [[nodiscard]] static std::expected<GuardConfig, std::string>
    load(const std::filesystem::path& config_path);

    // load_from_string
    //   파일 대신 YAML 문자열에서 로드한다 (테스트/내장 설정용).
    [[nodiscard]] static std::expected<GuardConfig, std::string>
    load_from_string(std::string_view yaml_text);

    // parse_duration_ms
    //   "30s" → 30000, "500ms" → 500, "5" → 5000 (단위 없으면 초).
    //   해석 불가 시 std::nullopt.
    [[nodiscard]] static std::optional<std::uint32_t>
    parse_duration_ms(std::string_view raw);
};
