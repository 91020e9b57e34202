// ---------------------------------------------------------------------------
// sanitization_stage.cpp
//
// [설계 한계]
// - 다른 주체 데이터 검사는 이메일만 본다. 이름/주소만 섞여 나온 경우는
//   scope gate 가 이미 주체 행으로 한정했다는 사실에 의존한다.
// - oracle 이 준 sanitized_response 도 Redactor 를 다시 거친다.
//   oracle 의 정제가 불완전해도 규칙 대상 값은 남지 않는다.
// ---------------------------------------------------------------------------

#include "stage/sanitization_stage.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "oracle/instructions.hpp"
#include "verdict/verdict_parser.hpp"

namespace {

std::string to_lower_copy(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string join(const std::vector<std::string>& items, std::string_view sep) {
    std::string out;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i != 0) {
            out += sep;
        }
        out += items[i];
    }
    return out;
}

SanitizationVerdict withheld(std::string reason, std::string_view raw) {
    return SanitizationVerdict{
        .safe               = false,
        .reason             = std::move(reason),
        .sanitized_response = std::string(kWithheldResponse),
        .original_response  = std::string(raw),
    };
}

}  // namespace

SanitizationStage::SanitizationStage(std::shared_ptr<TextOracle>     oracle,
                                     std::shared_ptr<const Redactor> redactor,
                                     bool                            oracle_review)
    : oracle_(std::move(oracle))
    , redactor_(std::move(redactor))
    , oracle_review_(oracle_review)
{}

std::expected<SanitizationVerdict, CollaboratorError>
SanitizationStage::sanitize(std::string_view raw_response, const Principal& principal) const {
    // 1. 다른 주체 데이터
    const std::string identity = to_lower_copy(principal.identity_string);
    for (const auto& email : Redactor::find_emails(raw_response)) {
        if (email != identity) {
            spdlog::warn("sanitization_stage: response contains foreign identity, principal={}",
                         principal.id);
            return withheld("response contains another user's data", raw_response);
        }
    }

    // 2. oracle 검토
    std::optional<SanitizationVerdict> oracle_verdict;
    if (oracle_review_ && oracle_) {
        auto text = oracle_->complete(sanitization_instruction(principal),
                                      response_message(raw_response));
        if (!text) {
            return std::unexpected(text.error());
        }
        oracle_verdict = parse_sanitization(*text);
    }

    // 3. 결정적 정제
    const bool oracle_unsafe = oracle_verdict && !oracle_verdict->safe;
    const std::string_view base =
        (oracle_unsafe && oracle_verdict->sanitized_response)
            ? std::string_view(*oracle_verdict->sanitized_response)
            : raw_response;

    RedactionResult redacted = redactor_->apply(base);
    if (redacted.withheld) {
        return withheld("no redaction rules available", raw_response);
    }

    SanitizationVerdict verdict;
    verdict.original_response = std::string(raw_response);

    if (oracle_unsafe) {
        verdict.safe   = false;
        verdict.reason = oracle_verdict->reason;
        if (redacted.text == raw_response) {
            // oracle 이 unsafe 라고 했지만 지울 것을 찾지 못함
            verdict.sanitized_response = std::string(kWithheldResponse);
        } else {
            verdict.sanitized_response = std::move(redacted.text);
        }
    } else if (redacted.changed()) {
        verdict.safe               = false;
        verdict.reason             = "redacted: " + join(redacted.applied_rules, ", ");
        verdict.sanitized_response = std::move(redacted.text);
    } else {
        verdict.safe               = true;
        verdict.reason             = oracle_verdict ? oracle_verdict->reason
                                                    : std::string("no sensitive values found");
        verdict.sanitized_response = std::string(raw_response);
    }

    if (!verdict.safe) {
        spdlog::info("sanitization_stage: response sanitized, principal={}, reason={}",
                     principal.id, verdict.reason);
    }
    return verdict;
}
