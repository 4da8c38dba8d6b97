#include "assistant.h"
#include "core/constants.h"
#include "logger.h"

namespace optidex {

LlmAssistant::LlmAssistant(ChatFunction chat, const ToolRegistry& tools)
    : chat_(std::move(chat)), tools_(tools) {}

Result<std::string> LlmAssistant::respond(const std::string& user_text, TurnId turn) {
    std::vector<std::string> messages = history();
    messages.push_back(LLMClient::format_message("user", user_text));

    const std::string tool_defs = tools_.size() > 0 ? tools_.get_tool_definitions_json() : "";
    const int max_rounds = constants::tools::MAX_TOOL_ROUNDS;

    for (int round = 0; round <= max_rounds; ++round) {
        bool offer_tools = round < max_rounds && !tool_defs.empty();
        auto response = chat_(messages, offer_tools ? tool_defs : "");
        if (response.is_error()) {
            return response.error();
        }

        const LLMResponse& r = response.value();
        if (!r.has_tool_calls() || !offer_tools) {
            LOG_LLM("Reply: \"" + r.content + "\"");
            remember(user_text, r.content);
            return r.content;
        }

        messages.push_back(r.raw_message.empty() ? LLMClient::format_message("assistant", r.content)
                                                 : r.raw_message);
        for (const auto& call : r.tool_calls) {
            ToolResult result = tools_.execute(call.name, call.arguments, turn);
            messages.push_back(LLMClient::format_tool_result(call.id, call.name, result.to_message()));
        }
    }

    // Unreachable: the last round never offers tools
    return make_error(ErrorType::InvalidState, "Tool loop did not produce a reply");
}

std::vector<std::string> LlmAssistant::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<std::string>(history_.begin(), history_.end());
}

void LlmAssistant::clear_history() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
}

void LlmAssistant::remember(const std::string& user_text, const std::string& reply) {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.push_back(LLMClient::format_message("user", user_text));
    history_.push_back(LLMClient::format_message("assistant", reply));
    while (history_.size() > constants::memory::MAX_HISTORY_MESSAGES) {
        history_.pop_front();
    }
}

} // namespace optidex
