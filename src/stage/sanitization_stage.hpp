#pragma once

// ---------------------------------------------------------------------------
// sanitization_stage.hpp
//
// 실행 결과 텍스트 + 현재 주체 → SanitizationVerdict.
//
// [판정 순서]
// 1. 다른 주체 데이터 검사: 주체 식별자와 다른 이메일이 보이면 응답 전체 보류.
// 2. oracle 검토 (pipeline.oracle_output_review 가 켜져 있을 때)
// 3. 결정적 정제 (Redactor): oracle 판정과 무관하게 항상 적용
//
// [불변식]
// - safe == false 이면 sanitized_response 는 항상 채워지고,
//   원본 텍스트 전체와 같지 않다. 정제 결과가 원본과 같으면 보류 문구로 바꾼다.
// - safe == true 이면 원본 텍스트를 그대로 사용할 수 있다.
// - original_response 는 항상 실제 원본 텍스트다 (oracle 의 주장이 아님).
// ---------------------------------------------------------------------------

#include <expected>
#include <memory>
#include <string_view>

#include "common/types.hpp"
#include "oracle/text_oracle.hpp"
#include "sanitize/redactor.hpp"
#include "verdict/verdict.hpp"

// 응답 전체를 내보낼 수 없을 때 사용자에게 보여 주는 문구
inline constexpr std::string_view kWithheldResponse =
    "I can't share that information.";

class SanitizationStage {
public:
    // oracle 이 nullptr 이면 oracle_review 와 무관하게 결정적 정제만 수행한다.
    SanitizationStage(std::shared_ptr<TextOracle>     oracle,
                      std::shared_ptr<const Redactor> redactor,
                      bool                            oracle_review);

    ~SanitizationStage() = default;

    SanitizationStage(const SanitizationStage&)            = delete;
    SanitizationStage& operator=(const SanitizationStage&) = delete;
    SanitizationStage(SanitizationStage&&)                 = default;
    SanitizationStage& operator=(SanitizationStage&&)      = default;

    [[nodiscard]] std::expected<SanitizationVerdict, CollaboratorError>
    sanitize(std::string_view raw_response, const Principal& principal) const;

private:
    std::shared_ptr<TextOracle>     oracle_;
    std::shared_ptr<const Redactor> redactor_;
    bool                            oracle_review_{true};
};
