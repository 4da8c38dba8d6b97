#include "tools/mesh_tools.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <nlohmann/json.hpp>
#include <thread>

using json = nlohmann::json;

namespace optidex {

namespace {

json parse_params(const std::string& params_json) {
    json params = json::parse(params_json.empty() ? "{}" : params_json);
    if (!params.is_object()) params = json::object();
    return params;
}

std::string field_text(const json& node, const char* key) {
    if (!node.contains(key) || node[key].is_null()) return "?";
    const json& v = node[key];
    return v.is_string() ? v.get<std::string>() : v.dump();
}

/// Resumes the monitor on scope exit when it was running before
class MonitorPause {
public:
    explicit MonitorPause(const MeshToolContext& ctx) : ctx_(ctx) {
        was_running_ = ctx_.pause_monitor ? ctx_.pause_monitor() : false;
        if (was_running_) {
            LOG_TOOL("Mesh monitor paused");
            std::this_thread::sleep_for(std::chrono::milliseconds(ctx_.mesh.port_release_ms));
        }
    }

    ~MonitorPause() {
        if (was_running_ && ctx_.resume_monitor) {
            ctx_.resume_monitor();
            LOG_TOOL("Mesh monitor resumed");
        }
    }

    MonitorPause(const MonitorPause&) = delete;
    MonitorPause& operator=(const MonitorPause&) = delete;

private:
    const MeshToolContext& ctx_;
    bool was_running_ = false;
};

} // namespace

VoidResult MeshCommandTool::run(const std::vector<std::string>& args, std::vector<std::string>* stdout_lines) {
    LaunchSpec spec{ctx_.mesh.command, ctx_.mesh.script, args};
    auto launchable = check_launchable(spec);
    if (launchable.is_error()) {
        return launchable.error();
    }

    MonitorPause pause(ctx_);
    auto status = run_blocking(ctx_.launcher, spec, std::chrono::milliseconds(ctx_.mesh.timeout_ms), stdout_lines);
    if (status.is_error()) {
        return status.error();
    }
    if (!status.value().clean()) {
        return make_error(ErrorType::IOError, spec.describe() + " failed (" + status.value().describe() + ")");
    }
    return VoidResult();
}

Result<std::string> format_mesh_nodes(const std::string& nodes_json, int64_t now_s) {
    json nodes = json::parse(nodes_json, nullptr, false);
    if (nodes.is_discarded() || !nodes.is_array()) {
        return make_parse_error("Node list is not a JSON array");
    }
    if (nodes.empty()) {
        return std::string("No nodes found in the mesh (or the radio is still initializing).");
    }

    std::string out;
    for (const auto& node : nodes) {
        if (!node.is_object()) continue;
        std::string heard = "Never";
        if (node.contains("lastHeard") && node["lastHeard"].is_number()) {
            double minutes = (static_cast<double>(now_s) - node["lastHeard"].get<double>()) / 60.0;
            heard = std::to_string(static_cast<long long>(std::llround(std::max(0.0, minutes)))) + "m ago";
        }
        if (!out.empty()) out += "\n";
        out += "- " + field_text(node, "longName") + " (" + field_text(node, "shortName") + "): SNR " +
               field_text(node, "snr") + ", Bat " + field_text(node, "batteryLevel") + "%, Last Heard " + heard;
    }
    return out;
}

// =============================================================================
// list_mesh_nodes
// =============================================================================

std::string ListMeshNodesTool::parameter_schema() const {
    json schema;
    schema["type"] = "object";
    schema["properties"] = json::object();
    return schema.dump();
}

ToolResult ListMeshNodesTool::execute(const std::string&, TurnId) {
    std::vector<std::string> lines;
    auto ran = run({"nodes"}, &lines);
    if (ran.is_error()) {
        Logger::error("[Tool] list_mesh_nodes: " + ran.error().to_string());
        return ToolResult::error_result("Could not reach the mesh radio: " + ran.error().message);
    }

    // The client may log before printing the list; the list is its last JSON line
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        std::string line = utils::trim_copy(*it);
        if (line.empty() || line[0] != '[') continue;
        auto now_s = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        auto formatted = format_mesh_nodes(line, static_cast<int64_t>(now_s));
        if (formatted.is_ok()) {
            return ToolResult::success_result(formatted.value());
        }
    }
    return ToolResult::error_result("The mesh radio returned no node list");
}

// =============================================================================
// send_mesh_message
// =============================================================================

std::string SendMeshMessageTool::parameter_schema() const {
    json schema;
    schema["type"] = "object";
    schema["properties"]["message"] = {
        {"type", "string"},
        {"description", "The text message to send"}
    };
    schema["properties"]["destination"] = {
        {"type", "string"},
        {"description", "Optional: short or long name of the destination node. Default: broadcast to all"}
    };
    schema["required"] = json::array({"message"});
    return schema.dump();
}

ToolResult SendMeshMessageTool::execute(const std::string& params_json, TurnId) {
    try {
        json params = parse_params(params_json);
        std::string message = params.contains("message") && params["message"].is_string()
            ? utils::trim_copy(params["message"].get<std::string>()) : std::string();
        if (message.empty()) {
            return ToolResult::error_result("Please give the message text");
        }
        std::string destination = params.contains("destination") && params["destination"].is_string()
            ? utils::trim_copy(params["destination"].get<std::string>()) : std::string();

        std::vector<std::string> args = {"send", message};
        if (!destination.empty()) {
            args.push_back("--dest");
            args.push_back(destination);
        }

        auto ran = run(args, nullptr);
        if (ran.is_error()) {
            Logger::error("[Tool] send_mesh_message: " + ran.error().to_string());
            return ToolResult::error_result("Could not send the message: " + ran.error().message);
        }
        return ToolResult::success_result("Message sent to " + (destination.empty() ? "everyone" : destination) +
                                          ": \"" + message + "\"");
    } catch (const json::exception& e) {
        return ToolResult::error_result("Invalid JSON parameters: " + std::string(e.what()));
    }
}

void register_mesh_tools(ToolRegistry& registry, const MeshToolContext& ctx) {
    registry.register_tool(std::make_shared<ListMeshNodesTool>(ctx));
    registry.register_tool(std::make_shared<SendMeshMessageTool>(ctx));
}

} // namespace optidex
