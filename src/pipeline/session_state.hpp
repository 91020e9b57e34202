#pragma once

// ---------------------------------------------------------------------------
// session_state.hpp
//
// 세션 대화 기록. (요청, 응답) 쌍의 추가 전용 목록.
// Orchestrator 가 단독 소유하며 어떤 stage 도 읽지 않는다.
// RESPONDED 로 끝난 요청만 추가된다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

struct ConversationTurn {
    std::string request{};
    std::string response{};  // 사용자에게 실제로 보여 준 (정제된) 응답
};

class SessionState {
public:
    void append(std::string request, std::string response) {
        turns_.push_back(ConversationTurn{std::move(request), std::move(response)});
    }

    [[nodiscard]] const std::vector<ConversationTurn>& turns() const noexcept { return turns_; }
    [[nodiscard]] std::size_t size() const noexcept { return turns_.size(); }
    [[nodiscard]] bool empty() const noexcept { return turns_.empty(); }

private:
    std::vector<ConversationTurn> turns_;
};
