#include "stage/fallback_responder.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "oracle/instructions.hpp"

OracleFallbackResponder::OracleFallbackResponder(std::shared_ptr<TextOracle> oracle)
    : oracle_(std::move(oracle))
{}

std::string OracleFallbackResponder::build_transcript(
    std::string_view                     request,
    const std::vector<ConversationTurn>& history) {
    std::string transcript;
    if (!history.empty()) {
        transcript += "Conversation so far:\n";
        for (const auto& turn : history) {
            transcript += "User: ";
            transcript += turn.request;
            transcript += "\nAssistant: ";
            transcript += turn.response;
            transcript += '\n';
        }
        transcript += '\n';
    }
    transcript += "Current message: ";
    transcript += request;
    return transcript;
}

std::expected<std::string, CollaboratorError>
OracleFallbackResponder::answer(std::string_view                     request,
                                const Principal&                     principal,
                                const std::vector<ConversationTurn>& history) {
    spdlog::debug("fallback_responder: answering without data access, history={}", history.size());
    return oracle_->complete(fallback_instruction(principal), build_transcript(request, history));
}
