#pragma once

#include "config.h"
#include "process.h"
#include "tool.h"
#include "tool_registry.h"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace optidex {

/**
 * @brief What mesh radio tools need from the rest of the system
 *
 * The radio's serial port admits one client, so each command pauses the
 * monitor worker first and resumes it afterwards. Both hooks are optional
 * and must be callable from the assistant thread.
 */
struct MeshToolContext {
    const MeshConfig& mesh;
    ProcessLauncher& launcher;
    std::function<bool()> pause_monitor;   ///< Returns whether the monitor was running
    std::function<void()> resume_monitor;
};

/**
 * @brief Base for tools that run one mesh client command to completion
 */
class MeshCommandTool : public Tool {
public:
    explicit MeshCommandTool(const MeshToolContext& ctx) : ctx_(ctx) {}

protected:
    /**
     * @brief Run "<command> <script> args..." with the monitor paused
     * @param stdout_lines Receives the command's output
     */
    VoidResult run(const std::vector<std::string>& args, std::vector<std::string>* stdout_lines);

    MeshToolContext ctx_;
};

class ListMeshNodesTool : public MeshCommandTool {
public:
    using MeshCommandTool::MeshCommandTool;

    std::string name() const override { return "list_mesh_nodes"; }
    std::string description() const override {
        return "List the nodes currently visible on the mesh radio network, with battery level "
               "and signal strength.";
    }
    std::string parameter_schema() const override;
    ToolResult execute(const std::string& params_json, TurnId turn) override;
};

class SendMeshMessageTool : public MeshCommandTool {
public:
    using MeshCommandTool::MeshCommandTool;

    std::string name() const override { return "send_mesh_message"; }
    std::string description() const override {
        return "Send a text message over the mesh radio network, to everyone or to one node.";
    }
    std::string parameter_schema() const override;
    ToolResult execute(const std::string& params_json, TurnId turn) override;
};

/**
 * @brief One line per node from the client's JSON node list
 *
 * Nodes are objects with longName, shortName, snr, batteryLevel and
 * lastHeard (epoch seconds). An empty list gets a sentence saying so.
 * @param now_s Current epoch seconds, for "last heard" ages
 */
Result<std::string> format_mesh_nodes(const std::string& nodes_json, int64_t now_s);

/**
 * @brief Register the mesh tools
 */
void register_mesh_tools(ToolRegistry& registry, const MeshToolContext& ctx);

} // namespace optidex
