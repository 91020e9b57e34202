#pragma once

// ---------------------------------------------------------------------------
// fallback_responder.hpp
//
// 후보 쿼리 없이 허가된 요청(인사, 일반 질문 등)에 답하는 외부 협력자.
// 응답은 Orchestrator 가 출력 정제 단계를 거친 뒤에만 내보낸다.
// ---------------------------------------------------------------------------

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"
#include "oracle/text_oracle.hpp"
#include "pipeline/session_state.hpp"

class FallbackResponder {
public:
    virtual ~FallbackResponder() = default;

    [[nodiscard]] virtual std::expected<std::string, CollaboratorError>
    answer(std::string_view                     request,
           const Principal&                     principal,
           const std::vector<ConversationTurn>& history) = 0;
};

// ---------------------------------------------------------------------------
// OracleFallbackResponder
//   fallback 지시문 + 대화 기록을 user 메시지로 포장해 oracle 에 넘긴다.
//   지시문은 데이터 조회 권한이 없음을 명시한다.
// ---------------------------------------------------------------------------
class OracleFallbackResponder final : public FallbackResponder {
public:
    explicit OracleFallbackResponder(std::shared_ptr<TextOracle> oracle);

    [[nodiscard]] std::expected<std::string, CollaboratorError>
    answer(std::string_view                     request,
           const Principal&                     principal,
           const std::vector<ConversationTurn>& history) override;

    // 대화 기록 + 현재 요청 → user 메시지
    [[nodiscard]] static std::string build_transcript(
        std::string_view                     request,
        const std::vector<ConversationTurn>& history);

private:
    std::shared_ptr<TextOracle> oracle_;
};
