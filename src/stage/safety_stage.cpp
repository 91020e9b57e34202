#include "stage/safety_stage.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "oracle/instructions.hpp"
#include "verdict/verdict_parser.hpp"

SafetyStage::SafetyStage(std::shared_ptr<TextOracle>         oracle,
                         std::shared_ptr<const PolicyEngine> policy,
                         bool                                oracle_review)
    : oracle_(std::move(oracle))
    , policy_(std::move(policy))
    , oracle_review_(oracle_review)
{}

std::expected<SafetyVerdict, CollaboratorError>
SafetyStage::verify(std::string_view                    candidate_query,
                    const Principal&                    principal,
                    const std::optional<SafetyVerdict>& precomputed) const {
    // 1. scope gate
    const PolicyResult gate = policy_->evaluate_sql(candidate_query, principal);
    if (gate.action == PolicyAction::kBlock) {
        spdlog::info("safety_stage: scope gate blocked query, rule={}, principal={}",
                     gate.matched_rule, principal.id);
        return SafetyVerdict{
            .safe            = false,
            .reason          = gate.reason,
            .suggested_query = policy_->suggest(candidate_query, principal),
        };
    }

    // 2. oracle 검토
    if (precomputed) {
        return finish_oracle_verdict(*precomputed, candidate_query, principal);
    }
    if (!oracle_review_ || !oracle_) {
        return SafetyVerdict{.safe = true, .reason = gate.reason, .suggested_query = std::nullopt};
    }

    auto text = oracle_->complete(safety_instruction(principal), query_message(candidate_query));
    if (!text) {
        return std::unexpected(text.error());
    }
    return finish_oracle_verdict(parse_safety(*text), candidate_query, principal);
}

SafetyVerdict SafetyStage::finish_oracle_verdict(SafetyVerdict    verdict,
                                                 std::string_view candidate_query,
                                                 const Principal& principal) const {
    if (verdict.safe) {
        verdict.suggested_query.reset();
        return verdict;
    }

    spdlog::info("safety_stage: oracle rejected query, principal={}, reason={}",
                 principal.id, verdict.reason);

    if (verdict.suggested_query &&
        policy_->evaluate_sql(*verdict.suggested_query, principal).action == PolicyAction::kAllow) {
        return verdict;
    }
    verdict.suggested_query = policy_->suggest(candidate_query, principal);
    return verdict;
}
