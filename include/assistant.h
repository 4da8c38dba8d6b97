#pragma once

#include "collaborators.h"
#include "llm_client.h"
#include "tool_registry.h"
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace optidex {

/**
 * @brief LLM-backed Assistant with tool calling and short memory
 *
 * Each respond() runs up to MAX_TOOL_ROUNDS chat rounds with tools offered;
 * if the model still asks for tools after that, one final round without
 * tools forces a text reply. Only user/assistant text is remembered across
 * turns, capped at MAX_HISTORY_MESSAGES.
 */
class LlmAssistant : public Assistant {
public:
    using ChatFunction = std::function<Result<LLMResponse>(const std::vector<std::string>& messages,
                                                           const std::string& tool_definitions_json)>;

    LlmAssistant(ChatFunction chat, const ToolRegistry& tools);

    Result<std::string> respond(const std::string& user_text, TurnId turn) override;

    /// Remembered messages, oldest first (JSON strings)
    std::vector<std::string> history() const;

    void clear_history();

private:
    void remember(const std::string& user_text, const std::string& reply);

    ChatFunction chat_;
    const ToolRegistry& tools_;
    mutable std::mutex mutex_;
    std::deque<std::string> history_;
};

} // namespace optidex
