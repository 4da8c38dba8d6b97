#include "tool_registry.h"
#include "logger.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace optidex {

bool ToolRegistry::register_tool(std::shared_ptr<Tool> tool) {
    if (!tool) {
        Logger::error("Attempted to register null tool");
        return false;
    }

    std::string name = tool->name();
    if (tools_.find(name) != tools_.end()) {
        Logger::warn("Tool '" + name + "' is already registered. Skipping.");
        return false;
    }

    tools_[name] = std::move(tool);
    LOG_TOOL("Registered " + name);
    return true;
}

std::shared_ptr<Tool> ToolRegistry::get_tool(const std::string& name) const {
    auto it = tools_.find(name);
    return it != tools_.end() ? it->second : nullptr;
}

std::vector<std::string> ToolRegistry::get_tool_names() const {
    std::vector<std::string> names;
    names.reserve(tools_.size());
    for (const auto& [name, tool] : tools_) {
        names.push_back(name);
    }
    return names;
}

std::string ToolRegistry::get_tool_definitions_json() const {
    json tools_array = json::array();

    for (const auto& [name, tool] : tools_) {
        json function_def;
        function_def["name"] = tool->name();
        function_def["description"] = tool->description();

        json params_schema = json::parse(tool->parameter_schema(), nullptr, false);
        if (params_schema.is_discarded()) {
            Logger::error("Invalid parameter schema for tool '" + name + "'");
            params_schema = json{{"type", "object"}, {"properties", json::object()}};
        }
        function_def["parameters"] = params_schema;

        tools_array.push_back(json{{"type", "function"}, {"function", function_def}});
    }

    return tools_array.dump();
}

ToolResult ToolRegistry::execute(const std::string& name, const std::string& params_json, TurnId turn) const {
    auto tool = get_tool(name);
    if (!tool) {
        Logger::warn("[Tool] Unknown tool requested: " + name);
        return ToolResult::error_result("Unknown tool: " + name);
    }

    LOG_TOOL(name + " " + params_json);
    try {
        ToolResult result = tool->execute(params_json.empty() ? "{}" : params_json, turn);
        LOG_TOOL(name + " -> " + result.to_message());
        return result;
    } catch (const std::exception& e) {
        Logger::error("[Tool] " + name + " threw: " + e.what());
        return ToolResult::error_result(std::string("Tool failed: ") + e.what());
    }
}

bool ToolRegistry::has_tool(const std::string& name) const {
    return tools_.find(name) != tools_.end();
}

} // namespace optidex
