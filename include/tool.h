#pragma once

#include "core/types.h"
#include <string>

namespace optidex {

/**
 * @brief Result of one tool invocation, returned to the LLM as the tool message
 */
struct ToolResult {
    bool success = false;
    std::string content;  // Acknowledgement text for the LLM
    std::string error;    // Error message if failed

    static ToolResult success_result(const std::string& content) {
        ToolResult result;
        result.success = true;
        result.content = content;
        return result;
    }

    static ToolResult error_result(const std::string& error_msg) {
        ToolResult result;
        result.success = false;
        result.error = error_msg;
        return result;
    }

    /// Text handed back to the model
    std::string to_message() const {
        return success ? content : "Error: " + error;
    }
};

/**
 * @brief Abstract base class for LLM-callable tools
 *
 * Tools run on the assistant's thread (the background executor), never on
 * the controller's thread. Visual tools only queue work: they place a
 * request in the handoff slot and return at once.
 */
class Tool {
public:
    virtual ~Tool() = default;

    /// Unique name (e.g. "start_live_detection")
    virtual std::string name() const = 0;

    /// Description shown to the LLM
    virtual std::string description() const = 0;

    /// JSON schema of the parameters object
    virtual std::string parameter_schema() const = 0;

    /**
     * @brief Execute with the LLM-supplied arguments
     * @param params_json JSON object string
     * @param turn Turn whose answer asked for the call; stamps anything the
     *        tool leaves for the controller
     */
    virtual ToolResult execute(const std::string& params_json, TurnId turn) = 0;
};

} // namespace optidex
