#pragma once

#include "tool.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace optidex {

/**
 * @brief Central registry for all available tools
 *
 * Registration happens once at startup; lookups afterwards are read-only.
 */
class ToolRegistry {
public:
    /**
     * @brief Register a tool with the registry
     * @return false if a tool with the same name already exists
     */
    bool register_tool(std::shared_ptr<Tool> tool);

    /**
     * @brief Get a tool by name
     * @return nullptr if not found
     */
    std::shared_ptr<Tool> get_tool(const std::string& name) const;

    std::vector<std::string> get_tool_names() const;

    /**
     * @brief Tool definitions in Ollama/OpenAI format
     * @return JSON array string
     */
    std::string get_tool_definitions_json() const;

    /**
     * @brief Run a tool by name
     *
     * Unknown tools and exceptions thrown by the tool become error results,
     * so one bad tool call cannot end the turn.
     */
    ToolResult execute(const std::string& name, const std::string& params_json, TurnId turn = 0) const;

    bool has_tool(const std::string& name) const;

    size_t size() const { return tools_.size(); }

private:
    std::map<std::string, std::shared_ptr<Tool>> tools_;
};

} // namespace optidex
