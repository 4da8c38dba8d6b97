#pragma once

#include "collaborators.h"
#include "config.h"
#include "errors.h"
#include <memory>
#include <string>
#include <vector>

namespace optidex {

/**
 * @brief Tool call structure from LLM response
 */
struct ToolCall {
    std::string id;           // Tool call ID (generated when the server omits it)
    std::string name;
    std::string arguments;    // JSON object string
};

/**
 * @brief LLM response that may contain text or tool calls
 */
struct LLMResponse {
    std::string content;
    std::vector<ToolCall> tool_calls;
    std::string raw_message;  // Assistant message JSON, echoed back in the next request

    bool has_tool_calls() const { return !tool_calls.empty(); }
};

/**
 * @brief Ollama /api/chat client
 *
 * Messages are passed as JSON object strings ({"role": ..., "content": ...}).
 * The configured system prompt is always sent first. Blocking; call from a
 * background thread.
 */
class LLMClient : public ImageAnalyzer {
public:
    explicit LLMClient(const LLMConfig& config);
    ~LLMClient() override;

    // Non-copyable
    LLMClient(const LLMClient&) = delete;
    LLMClient& operator=(const LLMClient&) = delete;

    /**
     * @brief One chat completion
     * @param messages Conversation so far, oldest first, without the system prompt
     * @param tool_definitions_json JSON array of tool definitions (empty = no tools)
     */
    Result<LLMResponse> chat(const std::vector<std::string>& messages,
                             const std::string& tool_definitions_json = "");

    /**
     * @brief Ask the vision model about an image file
     *
     * One /api/chat round with the image attached base64-encoded; no system
     * prompt and no history.
     */
    Result<std::string> analyze(const std::string& image_path, const std::string& prompt) override;

    static std::string format_message(const std::string& role, const std::string& content);

    /// User message carrying images (base64) for vision models
    static std::string format_image_message(const std::string& content,
                                            const std::vector<std::string>& base64_images);

    static std::string format_tool_result(const std::string& tool_call_id,
                                          const std::string& tool_name,
                                          const std::string& result_content);

    /// Parse an /api/chat response body
    static Result<LLMResponse> parse_response(const std::string& body);

    /// Trim and collapse whitespace so the reply reads well when spoken
    static std::string clean_response(const std::string& response);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace optidex
