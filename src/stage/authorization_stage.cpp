#include "stage/authorization_stage.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "oracle/instructions.hpp"
#include "verdict/verdict_parser.hpp"

AuthorizationStage::AuthorizationStage(std::shared_ptr<TextOracle>         oracle,
                                       std::shared_ptr<const PolicyEngine> policy,
                                       std::vector<std::string>            sensitive_taxonomy)
    : oracle_(std::move(oracle))
    , policy_(std::move(policy))
    , sensitive_taxonomy_(std::move(sensitive_taxonomy))
{}

std::expected<AuthorizationVerdict, CollaboratorError>
AuthorizationStage::authorize(std::string_view request, const Principal& principal) const {
    auto text = oracle_->complete(authorization_instruction(principal), request_message(request));
    if (!text) {
        return std::unexpected(text.error());
    }
    return enforce(parse_authorization(*text), principal);
}

std::expected<CombinedVerdict, CollaboratorError>
AuthorizationStage::authorize_combined(std::string_view request, const Principal& principal) const {
    auto text = oracle_->complete(combined_instruction(principal), request_message(request));
    if (!text) {
        return std::unexpected(text.error());
    }
    CombinedVerdict verdict = parse_combined(*text);
    verdict.authorization = enforce(std::move(verdict.authorization), principal);
    return verdict;
}

AuthorizationVerdict AuthorizationStage::enforce(AuthorizationVerdict verdict,
                                                 const Principal&     principal) const {
    const auto in_taxonomy = [this](const std::string& field) {
        return std::find(sensitive_taxonomy_.begin(), sensitive_taxonomy_.end(), field)
               != sensitive_taxonomy_.end();
    };

    // 소문자로 맞춘 뒤 분류 체계 밖의 항목은 버린다.
    std::set<std::string> flagged;
    for (const auto& field : verdict.sensitive_fields) {
        std::string lower = field;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (in_taxonomy(lower)) {
            flagged.insert(std::move(lower));
        }
    }
    verdict.sensitive_fields = std::move(flagged);

    if (!verdict.authorized) {
        verdict.candidate_query.reset();
        return verdict;
    }
    if (!verdict.candidate_query) {
        return verdict;
    }

    const std::string& candidate = *verdict.candidate_query;
    switch (policy_->check_scope(candidate, principal)) {
        case ScopeCheck::kScoped:
            break;
        case ScopeCheck::kForeign:
            spdlog::warn("authorization_stage: candidate targets another principal, principal={}",
                         principal.id);
            verdict.authorized = false;
            verdict.reason     = "candidate query targets another user's record";
            verdict.candidate_query.reset();
            return verdict;
        case ScopeCheck::kMissing:
            spdlog::warn("authorization_stage: candidate lacks principal scope, principal={}",
                         principal.id);
            verdict.authorized = false;
            verdict.reason     = "candidate query is not scoped to the current user";
            verdict.candidate_query.reset();
            return verdict;
    }

    // 후보 쿼리가 읽는 민감 컬럼을 표시한다.
    if (auto parsed = parser_.parse(candidate)) {
        for (const auto& column : parsed->columns) {
            const auto dot = column.rfind('.');
            const std::string bare = (dot == std::string::npos) ? column : column.substr(dot + 1);
            if (bare == "*") {
                verdict.sensitive_fields.insert(sensitive_taxonomy_.begin(), sensitive_taxonomy_.end());
            } else if (in_taxonomy(bare)) {
                verdict.sensitive_fields.insert(bare);
            }
        }
    }

    return verdict;
}
