#pragma once

#include "config.h"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace optidex {

/**
 * @brief Camera-driven display takeovers
 */
enum class VisualKind {
    Detection,
    Recording,
    Playback,
    Pose,
    Observer,
    Sentry
};

constexpr VisualKind ALL_VISUAL_KINDS[] = {
    VisualKind::Detection, VisualKind::Recording, VisualKind::Playback,
    VisualKind::Pose, VisualKind::Observer, VisualKind::Sentry
};

const char* visual_kind_name(VisualKind kind);

/// Every kind except playback opens the camera device
inline bool uses_camera(VisualKind kind) {
    return kind != VisualKind::Playback;
}

/**
 * @brief How to start a worker process
 *
 * argv is built as [command, script (if set), args...].
 */
struct LaunchSpec {
    std::string command;
    std::string script;
    std::vector<std::string> args;

    std::vector<std::string> argv() const;

    /// Single-line rendering for logs
    std::string describe() const;
};

// =============================================================================
// Requests (one struct per kind; immutable once placed in the handoff slot)
// =============================================================================

struct DetectionRequest {
    std::string frame_path;
    LaunchSpec launch;
    std::vector<std::string> targets;
    std::optional<int> duration_s;
    std::string video_path;           ///< Empty = no video output
    bool segmentation = false;
};

struct RecordingRequest {
    std::string frame_path;
    LaunchSpec launch;
    std::string video_path;
    std::optional<int> duration_s;    ///< Empty = record until stopped
};

struct PlaybackRequest {
    std::string frame_path;
    LaunchSpec launch;
    std::string video_path;
};

struct PoseRequest {
    std::string frame_path;
    LaunchSpec launch;
    std::string action = "detect";
    bool count = false;
    std::optional<int> goal;
    bool record = false;
};

struct ObserverRequest {
    std::string frame_path;
    LaunchSpec launch;
    std::vector<std::string> targets;
    bool record = true;
    bool continuous = true;
    std::string prompt;               ///< Optional analysis prompt for triggered snapshots
};

struct SentryRequest {
    std::string frame_path;
    LaunchSpec launch;
    std::vector<std::string> interaction_pairs;  ///< "subject:object" pairs
    bool record = true;
};

using VisualModeRequest = std::variant<
    DetectionRequest,
    RecordingRequest,
    PlaybackRequest,
    PoseRequest,
    ObserverRequest,
    SentryRequest>;

VisualKind kind_of(const VisualModeRequest& request);
const std::string& frame_path_of(const VisualModeRequest& request);
const LaunchSpec& launch_of(const VisualModeRequest& request);

/// Per-kind settings (script, frame path, cadence, grace, color)
const VisualModeConfig& mode_config(const VisualConfig& config, VisualKind kind);

// =============================================================================
// Request builders: fill frame path and launch spec from config
// =============================================================================

DetectionRequest make_detection_request(const VisualConfig& config,
                                        std::vector<std::string> targets,
                                        std::optional<int> duration_s,
                                        std::string video_path,
                                        bool segmentation);

RecordingRequest make_recording_request(const VisualConfig& config,
                                        std::string video_path,
                                        std::optional<int> duration_s);

PlaybackRequest make_playback_request(const VisualConfig& config, std::string video_path);

PoseRequest make_pose_request(const VisualConfig& config,
                              std::string action,
                              bool count,
                              std::optional<int> goal,
                              bool record);

ObserverRequest make_observer_request(const VisualConfig& config,
                                      std::vector<std::string> targets,
                                      bool record,
                                      bool continuous,
                                      std::string prompt);

SentryRequest make_sentry_request(const VisualConfig& config,
                                  std::vector<std::string> interaction_pairs,
                                  bool record);

} // namespace optidex
