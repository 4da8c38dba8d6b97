#pragma once

#include "errors.h"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace optidex {

// =============================================================================
// Worker events (decoded from tag-prefixed stdout lines)
// =============================================================================

/// Watched object(s) appeared
struct ObjectTriggered {
    std::vector<std::string> objects;
    int count = 0;                 ///< Detections so far this session
    std::string image_path;        ///< Snapshot of the triggering frame, may be empty
};

/// Two watched objects interacted ("dog" on "couch")
struct InteractionTriggered {
    std::string object1;
    std::string object2;
    int count = 0;
    std::string image_path;
};

struct PoseDetected {
    std::string action;
    std::string image_path;
};

struct GoalReached {
    int reps = 0;
};

struct VideoSaved {
    std::string video_path;
    std::string action;            ///< Set by the pose worker
    std::optional<int> reps;
};

struct RepProgress {
    int reps = 0;
    std::optional<int> goal;
};

/// Line the worker wants spoken
struct AudioCue {
    std::string text;
};

/// Text received over the mesh network
struct MeshMessage {
    std::string from;
    std::string text;
};

using WorkerEvent = std::variant<
    ObjectTriggered,
    InteractionTriggered,
    PoseDetected,
    GoalReached,
    VideoSaved,
    RepProgress,
    AudioCue,
    MeshMessage>;

const char* worker_event_name(const WorkerEvent& event);

/**
 * @brief Decode one worker output line
 *
 * Recognized tags: EVENT_TRIGGER, EVENT_VIDEO, EVENT_PROGRESS, EVENT_AUDIO,
 * EVENT_MESSAGE (and the JSON_ spellings, with JSON_MSG for messages). The
 * tag may be preceded by other text on the line.
 *
 * @return nullopt for ordinary output; an event; or a MalformedEvent error
 *         for a tagged line whose payload cannot be decoded
 */
std::optional<Result<WorkerEvent>> parse_event_line(const std::string& line);

} // namespace optidex
