#include "tools/visual_tools.h"
#include "core/constants.h"
#include "logger.h"
#include "utils.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace optidex {

namespace {

json parse_params(const std::string& params_json) {
    json params = json::parse(params_json.empty() ? "{}" : params_json);
    // Some models send null or [] for "no arguments"
    if (!params.is_object()) params = json::object();
    return params;
}

/// Optional duration in seconds; models sometimes send numbers as strings
Result<std::optional<int>> parse_duration(const json& params) {
    if (!params.contains("duration") || params["duration"].is_null()) {
        return std::optional<int>();
    }
    const json& d = params["duration"];
    double seconds = 0;
    if (d.is_number()) {
        seconds = d.get<double>();
    } else if (d.is_string()) {
        try {
            seconds = std::stod(d.get<std::string>());
        } catch (const std::exception&) {
            return make_parse_error("duration must be a number of seconds");
        }
    } else {
        return make_parse_error("duration must be a number of seconds");
    }

    // Range-check before narrowing: the cast is undefined for NaN and huge values
    if (!std::isfinite(seconds) || seconds < constants::tools::MIN_DURATION_S ||
        seconds >= constants::tools::MAX_DURATION_S + 1) {
        return make_parse_error("duration must be between " +
                                std::to_string(constants::tools::MIN_DURATION_S) + " and " +
                                std::to_string(constants::tools::MAX_DURATION_S) + " seconds");
    }
    return std::optional<int>(static_cast<int>(seconds));
}

/// Accepts an array of strings or a single comma-separated string
std::vector<std::string> string_list(const json& params, const char* key) {
    std::vector<std::string> out;
    if (!params.contains(key)) return out;
    const json& v = params[key];
    if (v.is_array()) {
        for (const auto& item : v) {
            if (item.is_string()) {
                std::string s = utils::trim_copy(item.get<std::string>());
                if (!s.empty()) out.push_back(s);
            }
        }
    } else if (v.is_string()) {
        std::string all = v.get<std::string>();
        size_t start = 0;
        while (start <= all.size()) {
            size_t comma = all.find(',', start);
            if (comma == std::string::npos) comma = all.size();
            std::string s = utils::trim_copy(all.substr(start, comma - start));
            if (!s.empty()) out.push_back(s);
            start = comma + 1;
        }
    }
    return out;
}

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

std::string duration_text(const std::optional<int>& duration_s) {
    return duration_s ? " for " + std::to_string(*duration_s) + " seconds" : " until you say stop";
}

bool is_video_file(const fs::path& p) {
    std::string ext = utils::normalize_copy(p.extension().string());
    return ext == ".mp4" || ext == ".avi" || ext == ".mkv" || ext == ".mov";
}

} // namespace

// =============================================================================
// Shared helpers
// =============================================================================

std::optional<std::string> latest_video(const std::string& dir) {
    std::error_code ec;
    fs::directory_iterator it(utils::expand_path(dir), ec);
    if (ec) return std::nullopt;

    std::optional<fs::path> best;
    fs::file_time_type best_time;
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec) || !is_video_file(entry.path())) continue;
        auto t = entry.last_write_time(ec);
        if (ec) continue;
        if (!best || t > best_time) {
            best = entry.path();
            best_time = t;
        }
    }
    if (!best) return std::nullopt;
    return best->string();
}

std::vector<std::string> all_pairs(const std::vector<std::string>& objects) {
    std::vector<std::string> pairs;
    for (size_t i = 0; i < objects.size(); ++i) {
        for (size_t j = i + 1; j < objects.size(); ++j) {
            if (objects[i] != objects[j]) {
                pairs.push_back(objects[i] + ":" + objects[j]);
            }
        }
    }
    return pairs;
}

ToolResult VisualModeTool::queue(VisualModeRequest request, TurnId turn, const std::string& ack) {
    auto launchable = check_launchable(launch_of(request));
    if (launchable.is_error()) {
        Logger::error("[Tool] " + launchable.error().to_string());
        return ToolResult::error_result("The " + std::string(visual_kind_name(kind_of(request))) +
                                        " program is not available on this device");
    }
    ctx_.handoff.set(std::move(request), turn);
    return ToolResult::success_result(ack);
}

std::string VisualModeTool::new_video_path(const std::string& prefix) const {
    std::string dir = utils::expand_path(ctx_.visual.video_dir);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        Logger::warn("[Tool] Cannot create " + dir + ": " + ec.message());
    }
    return (fs::path(dir) / (prefix + "-" + std::to_string(now_ms()) + ".mp4")).string();
}

// =============================================================================
// start_live_detection
// =============================================================================

std::string StartLiveDetectionTool::parameter_schema() const {
    json schema;
    schema["type"] = "object";
    schema["properties"]["objects"] = {
        {"type", "array"},
        {"items", {{"type", "string"}}},
        {"description", "Objects to detect, e.g. ['person', 'cup', 'phone']"}
    };
    schema["properties"]["duration"] = {
        {"type", "number"},
        {"description", "Optional: seconds to run (1-300). Default: until stopped"}
    };
    schema["properties"]["segmentation"] = {
        {"type", "boolean"},
        {"description", "Optional: overlay segmentation masks"}
    };
    schema["required"] = json::array({"objects"});
    return schema.dump();
}

ToolResult StartLiveDetectionTool::execute(const std::string& params_json, TurnId turn) {
    try {
        json params = parse_params(params_json);

        std::vector<std::string> objects = string_list(params, "objects");
        if (objects.empty()) {
            return ToolResult::error_result("Please specify at least one object to detect");
        }
        auto duration = parse_duration(params);
        if (duration.is_error()) {
            return ToolResult::error_result(duration.error().message);
        }
        bool segmentation = params.value("segmentation", false);

        auto request = make_detection_request(ctx_.visual, objects, duration.value(),
                                              new_video_path("detection"), segmentation);
        return queue(std::move(request), turn, "Starting detection" + duration_text(duration.value()) +
                                         " for: " + join(objects, ", ") + ".");
    } catch (const json::exception& e) {
        return ToolResult::error_result("Invalid JSON parameters: " + std::string(e.what()));
    }
}

// =============================================================================
// start_video_recording
// =============================================================================

std::string StartVideoRecordingTool::parameter_schema() const {
    json schema;
    schema["type"] = "object";
    schema["properties"]["duration"] = {
        {"type", "number"},
        {"description", "Optional: seconds to record (1-300). Default: until stopped"}
    };
    return schema.dump();
}

ToolResult StartVideoRecordingTool::execute(const std::string& params_json, TurnId turn) {
    try {
        json params = parse_params(params_json);
        auto duration = parse_duration(params);
        if (duration.is_error()) {
            return ToolResult::error_result(duration.error().message);
        }

        auto request = make_recording_request(ctx_.visual, new_video_path("recording"), duration.value());
        return queue(std::move(request), turn, "Recording video" + duration_text(duration.value()) + ".");
    } catch (const json::exception& e) {
        return ToolResult::error_result("Invalid JSON parameters: " + std::string(e.what()));
    }
}

// =============================================================================
// play_video
// =============================================================================

std::string PlayVideoTool::parameter_schema() const {
    json schema;
    schema["type"] = "object";
    schema["properties"]["file"] = {
        {"type", "string"},
        {"description", "Optional: video file name in the recordings folder. Default: most recent"}
    };
    return schema.dump();
}

ToolResult PlayVideoTool::execute(const std::string& params_json, TurnId turn) {
    try {
        json params = parse_params(params_json);
        std::string file = params.value("file", "");

        std::string path;
        if (!file.empty()) {
            // Only names inside the recordings folder
            fs::path candidate = fs::path(utils::expand_path(ctx_.visual.video_dir)) / fs::path(file).filename();
            std::error_code ec;
            if (!fs::exists(candidate, ec)) {
                return ToolResult::error_result("Video not found: " + file);
            }
            path = candidate.string();
        } else {
            auto latest = latest_video(ctx_.visual.video_dir);
            if (!latest) {
                return ToolResult::error_result("No recorded videos found");
            }
            path = *latest;
        }

        std::string title = fs::path(path).filename().string();
        return queue(make_playback_request(ctx_.visual, path), turn, "Playing " + title + ".");
    } catch (const json::exception& e) {
        return ToolResult::error_result("Invalid JSON parameters: " + std::string(e.what()));
    }
}

// =============================================================================
// start_pose_detection
// =============================================================================

std::string StartPoseDetectionTool::parameter_schema() const {
    json schema;
    schema["type"] = "object";
    schema["properties"]["action"] = {
        {"type", "string"},
        {"description", "waving, hands_up, sitting, standing, detect (any), or an exercise to count: "
                        "pushup, squat, pullup, crunch"}
    };
    schema["properties"]["goal"] = {
        {"type", "integer"},
        {"description", "Optional: target reps when counting an exercise"}
    };
    schema["properties"]["record"] = {
        {"type", "boolean"},
        {"description", "Optional: record the session to video"}
    };
    return schema.dump();
}

ToolResult StartPoseDetectionTool::execute(const std::string& params_json, TurnId turn) {
    static const std::vector<std::string> exercises = {"pushup", "squat", "pullup", "crunch"};
    static const std::vector<std::string> actions = {"waving", "hands_up", "sitting", "standing", "detect"};

    try {
        json params = parse_params(params_json);
        std::string action = utils::normalize_copy(utils::trim_copy(params.value("action", "detect")));
        if (action.empty()) action = "detect";

        bool count = std::find(exercises.begin(), exercises.end(), action) != exercises.end();
        if (!count && std::find(actions.begin(), actions.end(), action) == actions.end()) {
            return ToolResult::error_result("Unknown action '" + action + "'");
        }

        std::optional<int> goal;
        if (params.contains("goal") && params["goal"].is_number()) {
            double g = params["goal"].get<double>();
            if (!std::isfinite(g) || g < 1 || g > constants::tools::MAX_REP_GOAL) {
                return ToolResult::error_result("goal must be between 1 and " +
                                                std::to_string(constants::tools::MAX_REP_GOAL));
            }
            if (!count) {
                return ToolResult::error_result("goal only applies to exercise counting");
            }
            goal = static_cast<int>(g);
        }
        bool record = params.value("record", false);

        std::string ack = count
            ? "Counting " + action + "s" + (goal ? " to " + std::to_string(*goal) : std::string()) + "."
            : "Watching for " + action + ".";
        return queue(make_pose_request(ctx_.visual, action, count, goal, record), turn, ack);
    } catch (const json::exception& e) {
        return ToolResult::error_result("Invalid JSON parameters: " + std::string(e.what()));
    }
}

// =============================================================================
// start_smart_observer
// =============================================================================

std::string StartSmartObserverTool::parameter_schema() const {
    json schema;
    schema["type"] = "object";
    schema["properties"]["objects"] = {
        {"type", "array"},
        {"items", {{"type", "string"}}},
        {"description", "Objects to watch for, e.g. ['person', 'cat']"}
    };
    schema["properties"]["prompt"] = {
        {"type", "string"},
        {"description", "Optional: question to ask about the object when found"}
    };
    schema["properties"]["record"] = {
        {"type", "boolean"},
        {"description", "Optional: record clips when triggered (default true)"}
    };
    schema["required"] = json::array({"objects"});
    return schema.dump();
}

ToolResult StartSmartObserverTool::execute(const std::string& params_json, TurnId turn) {
    try {
        json params = parse_params(params_json);
        std::vector<std::string> objects = string_list(params, "objects");
        if (objects.empty()) {
            return ToolResult::error_result("Please specify at least one object to watch for");
        }
        std::string prompt = params.value("prompt", "");
        bool record = params.value("record", true);

        return queue(make_observer_request(ctx_.visual, objects, record, true, prompt), turn,
                     "Watching for " + join(objects, ", ") + ". I will notify you when I see it.");
    } catch (const json::exception& e) {
        return ToolResult::error_result("Invalid JSON parameters: " + std::string(e.what()));
    }
}

// =============================================================================
// start_semantic_sentry
// =============================================================================

std::string StartSemanticSentryTool::parameter_schema() const {
    json schema;
    schema["type"] = "object";
    schema["properties"]["objects"] = {
        {"type", "array"},
        {"items", {{"type", "string"}}},
        {"description", "Objects to monitor; with all_combinations every pair is checked"}
    };
    schema["properties"]["all_combinations"] = {
        {"type", "boolean"},
        {"description", "Check all pairwise interactions between objects"}
    };
    schema["properties"]["pairs"] = {
        {"type", "array"},
        {"items", {
            {"type", "object"},
            {"properties", {
                {"object1", {{"type", "string"}}},
                {"object2", {{"type", "string"}}}
            }}
        }},
        {"description", "Explicit pairs to watch (use this OR objects with all_combinations)"}
    };
    return schema.dump();
}

ToolResult StartSemanticSentryTool::execute(const std::string& params_json, TurnId turn) {
    try {
        json params = parse_params(params_json);

        std::vector<std::string> pairs;
        if (params.contains("pairs") && params["pairs"].is_array()) {
            for (const auto& p : params["pairs"]) {
                if (!p.is_object()) continue;
                std::string a = utils::trim_copy(p.value("object1", ""));
                std::string b = utils::trim_copy(p.value("object2", ""));
                if (!a.empty() && !b.empty()) pairs.push_back(a + ":" + b);
            }
        }

        std::vector<std::string> objects = string_list(params, "objects");
        if (pairs.empty() && !objects.empty()) {
            if (params.value("all_combinations", false) || objects.size() != 2) {
                pairs = all_pairs(objects);
            } else {
                pairs.push_back(objects[0] + ":" + objects[1]);
            }
        }
        if (pairs.empty()) {
            return ToolResult::error_result("Please give at least two objects or one object pair");
        }

        std::vector<std::string> readable;
        for (const auto& p : pairs) {
            std::string r = p;
            r.replace(r.find(':'), 1, " and ");
            readable.push_back(r);
        }
        return queue(make_sentry_request(ctx_.visual, pairs, true), turn,
                     "Sentry started. Watching for interactions between " + join(readable, ", ") + ".");
    } catch (const json::exception& e) {
        return ToolResult::error_result("Invalid JSON parameters: " + std::string(e.what()));
    }
}

// =============================================================================
// take_picture
// =============================================================================

std::string TakePictureTool::parameter_schema() const {
    json schema;
    schema["type"] = "object";
    schema["properties"] = json::object();
    return schema.dump();
}

ToolResult TakePictureTool::execute(const std::string&, TurnId turn) {
    if (ctx_.camera_arbiter.busy()) {
        return ToolResult::error_result("The camera is in use. Stop the current camera mode first.");
    }

    std::string dir = utils::expand_path(ctx_.camera.image_dir);
    std::error_code ec;
    fs::create_directories(dir, ec);
    std::string path = (fs::path(dir) / ("picture-" + std::to_string(now_ms()) + ".jpg")).string();

    LaunchSpec spec;
    spec.command = ctx_.camera.command;
    for (std::string arg : ctx_.camera.args) {
        size_t pos = arg.find("{output}");
        if (pos != std::string::npos) arg.replace(pos, 8, path);
        spec.args.push_back(arg);
    }

    auto launchable = check_launchable(spec);
    if (launchable.is_error()) {
        Logger::error("[Tool] " + launchable.error().to_string());
        return ToolResult::error_result("The camera program is not available on this device");
    }

    std::chrono::milliseconds timeout(ctx_.camera.timeout_ms);
    ProcessLauncher& launcher = ctx_.launcher;
    auto pending = ctx_.camera_arbiter.run_exclusive([&launcher, spec, timeout]() {
        return run_blocking(launcher, spec, timeout);
    });

    // The capture itself is bounded by its own timeout; the extra second covers queueing
    if (pending.wait_for(timeout + std::chrono::seconds(1)) != std::future_status::ready) {
        return ToolResult::error_result("Camera did not respond in time");
    }

    Result<ExitStatus> status = pending.get();
    if (status.is_error()) {
        Logger::error("[Tool] take_picture: " + status.error().to_string());
        return ToolResult::error_result("Failed to take picture: " + status.error().message);
    }
    if (!status.value().clean() || !fs::exists(path, ec)) {
        return ToolResult::error_result("Failed to take picture (" + status.value().describe() + ")");
    }

    LOG_CAMERA("Picture saved: " + path);
    ctx_.images.set(path, turn);
    return ToolResult::success_result("Picture taken. It will be shown on the display.");
}

// =============================================================================
// stop_visual_mode
// =============================================================================

std::string StopVisualModeTool::parameter_schema() const {
    json schema;
    schema["type"] = "object";
    schema["properties"] = json::object();
    return schema.dump();
}

ToolResult StopVisualModeTool::execute(const std::string&, TurnId) {
    if (ctx_.stop_visual_mode) ctx_.stop_visual_mode();
    return ToolResult::success_result("Stopped.");
}

void register_visual_tools(ToolRegistry& registry, const VisualToolContext& ctx) {
    registry.register_tool(std::make_shared<StartLiveDetectionTool>(ctx));
    registry.register_tool(std::make_shared<StartVideoRecordingTool>(ctx));
    registry.register_tool(std::make_shared<PlayVideoTool>(ctx));
    registry.register_tool(std::make_shared<StartPoseDetectionTool>(ctx));
    registry.register_tool(std::make_shared<StartSmartObserverTool>(ctx));
    registry.register_tool(std::make_shared<StartSemanticSentryTool>(ctx));
    registry.register_tool(std::make_shared<TakePictureTool>(ctx));
    registry.register_tool(std::make_shared<StopVisualModeTool>(ctx));
}

} // namespace optidex
