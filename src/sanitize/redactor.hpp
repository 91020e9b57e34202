#pragma once

// ---------------------------------------------------------------------------
// redactor.hpp
//
// 결정적(deterministic) 출력 정제기.
// 설정된 규칙을 순서대로 적용하여 민감 값을 축약/대체한다.
//
// [기본 규칙 (config 의 redaction.rules)]
// - 주소        → "도시, 주"
// - SSN         → "REDACTED"
// - 생년월일    → 연도
// - 전화번호    → "***-" + 끝 4자리
// - 이메일      → 로컬 파트
//
// [보안 원칙]
// - oracle 의 판정이 관대하더라도 이 규칙이 지우는 값은 절대 노출되지 않는다.
// - 유효한 규칙이 하나도 없으면 fail-close: apply() 는 withheld=true 를 반환하고
//   호출자는 응답 전체를 보류해야 한다.
// ---------------------------------------------------------------------------

#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "policy/rule.hpp"  // RedactionRule

// ---------------------------------------------------------------------------
// RedactionResult
//   text         : 정제된 텍스트
//   applied_rules: 실제로 값을 바꾼 규칙 이름 (적용 순서)
//   withheld     : fail-close 상태. text 를 사용하지 말 것.
// ---------------------------------------------------------------------------
struct RedactionResult {
    std::string              text{};
    std::vector<std::string> applied_rules{};
    bool                     withheld{false};

    [[nodiscard]] bool changed() const noexcept { return !applied_rules.empty(); }
};

class Redactor {
public:
    explicit Redactor(std::vector<RedactionRule> rules);

    ~Redactor() = default;

    Redactor(const Redactor&)            = delete;
    Redactor& operator=(const Redactor&) = delete;
    Redactor(Redactor&&)                 = default;
    Redactor& operator=(Redactor&&)      = default;

    [[nodiscard]] RedactionResult apply(std::string_view text) const;

    // 텍스트에서 이메일 형태의 값을 모두 추출한다 (소문자).
    // 출력 단계의 "다른 주체 데이터" 검사에 사용한다.
    [[nodiscard]] static std::vector<std::string> find_emails(std::string_view text);

private:
    struct CompiledRule {
        std::string                       name;
        std::shared_ptr<const std::regex> compiled;
        std::string                       replacement;
    };

    std::vector<CompiledRule> rules_;
    bool                      fail_close_active_{false};
};
