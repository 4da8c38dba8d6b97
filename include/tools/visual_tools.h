#pragma once

#include "camera_arbiter.h"
#include "config.h"
#include "core/types.h"
#include "handoff_slot.h"
#include "process.h"
#include "tool.h"
#include "tool_registry.h"
#include <optional>
#include <string>
#include <vector>

namespace optidex {

/**
 * @brief What visual tools need from the rest of the system
 *
 * Copied into each tool; everything referenced must outlive the tools.
 */
struct VisualToolContext {
    const VisualConfig& visual;
    const CameraConfig& camera;
    HandoffSlot& handoff;
    ImageSlot& images;
    CameraArbiter& camera_arbiter;
    ProcessLauncher& launcher;
    Handler stop_visual_mode;   ///< Thread-safe; ends the active or pending mode
};

/**
 * @brief Base for tools that queue a visual mode
 *
 * Subclasses build a typed request from the arguments; queue() checks the
 * worker is launchable and places the request in the handoff slot. The mode
 * starts only after the reply has been spoken.
 */
class VisualModeTool : public Tool {
public:
    explicit VisualModeTool(const VisualToolContext& ctx) : ctx_(ctx) {}

protected:
    ToolResult queue(VisualModeRequest request, TurnId turn, const std::string& ack);

    /// New timestamped path under video_dir (directory created on demand)
    std::string new_video_path(const std::string& prefix) const;

    VisualToolContext ctx_;
};

class StartLiveDetectionTool : public VisualModeTool {
public:
    using VisualModeTool::VisualModeTool;

    std::string name() const override { return "start_live_detection"; }
    std::string description() const override {
        return "Start live object detection with the camera, showing bounding boxes on the display "
               "and announcing when the objects appear. Records the session to video.";
    }
    std::string parameter_schema() const override;
    ToolResult execute(const std::string& params_json, TurnId turn) override;
};

class StartVideoRecordingTool : public VisualModeTool {
public:
    using VisualModeTool::VisualModeTool;

    std::string name() const override { return "start_video_recording"; }
    std::string description() const override {
        return "Record a video with the camera, for a number of seconds or until the user says stop.";
    }
    std::string parameter_schema() const override;
    ToolResult execute(const std::string& params_json, TurnId turn) override;
};

class PlayVideoTool : public VisualModeTool {
public:
    using VisualModeTool::VisualModeTool;

    std::string name() const override { return "play_video"; }
    std::string description() const override {
        return "Play a recorded video on the display. Plays the most recent recording unless a file name is given.";
    }
    std::string parameter_schema() const override;
    ToolResult execute(const std::string& params_json, TurnId turn) override;
};

class StartPoseDetectionTool : public VisualModeTool {
public:
    using VisualModeTool::VisualModeTool;

    std::string name() const override { return "start_pose_detection"; }
    std::string description() const override {
        return "Watch body pose. Detects actions like waving, hands_up, sitting or standing, "
               "or counts exercise reps (pushup, squat, pullup, crunch) toward an optional goal.";
    }
    std::string parameter_schema() const override;
    ToolResult execute(const std::string& params_json, TurnId turn) override;
};

class StartSmartObserverTool : public VisualModeTool {
public:
    using VisualModeTool::VisualModeTool;

    std::string name() const override { return "start_smart_observer"; }
    std::string description() const override {
        return "Watch for specific objects. When one appears, take a photo and send a notification. "
               "Useful for 'tell me who comes to my desk' or 'let me know when the package arrives'.";
    }
    std::string parameter_schema() const override;
    ToolResult execute(const std::string& params_json, TurnId turn) override;
};

class StartSemanticSentryTool : public VisualModeTool {
public:
    using VisualModeTool::VisualModeTool;

    std::string name() const override { return "start_semantic_sentry"; }
    std::string description() const override {
        return "Watch for interactions between pairs of objects (e.g. dog on couch). Either give "
               "explicit pairs, or a list of objects with all_combinations to check every pair.";
    }
    std::string parameter_schema() const override;
    ToolResult execute(const std::string& params_json, TurnId turn) override;
};

/**
 * @brief Takes a still photo through the camera arbiter
 *
 * Blocks the calling thread until the capture command finishes. The image
 * is shown after the reply has been spoken.
 */
class TakePictureTool : public Tool {
public:
    explicit TakePictureTool(const VisualToolContext& ctx) : ctx_(ctx) {}

    std::string name() const override { return "take_picture"; }
    std::string description() const override {
        return "Take a picture with the camera and show it on the display.";
    }
    std::string parameter_schema() const override;
    ToolResult execute(const std::string& params_json, TurnId turn) override;

private:
    VisualToolContext ctx_;
};

class StopVisualModeTool : public Tool {
public:
    explicit StopVisualModeTool(const VisualToolContext& ctx) : ctx_(ctx) {}

    std::string name() const override { return "stop_visual_mode"; }
    std::string description() const override {
        return "Stop whatever the camera is doing: detection, recording, video playback, pose "
               "counting, observer or sentry. Use when the user says stop, done or enough.";
    }
    std::string parameter_schema() const override;
    ToolResult execute(const std::string& params_json, TurnId turn) override;

private:
    VisualToolContext ctx_;
};

/**
 * @brief Register every visual tool
 */
void register_visual_tools(ToolRegistry& registry, const VisualToolContext& ctx);

/**
 * @brief Most recently modified video in dir, or nullopt
 */
std::optional<std::string> latest_video(const std::string& dir);

/**
 * @brief Every unordered pair "a:b" of distinct objects, in list order
 */
std::vector<std::string> all_pairs(const std::vector<std::string>& objects);

} // namespace optidex
