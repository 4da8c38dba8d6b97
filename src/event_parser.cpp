#include "event_parser.h"
#include "utils.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace optidex {

namespace {

enum class Tag { Trigger, Video, Progress, Audio, Message };

struct TagSpelling {
    const char* text;
    Tag tag;
};

// Checked in order; the first spelling found anywhere in the line wins
constexpr TagSpelling TAGS[] = {
    {"EVENT_TRIGGER:", Tag::Trigger},
    {"EVENT_VIDEO:", Tag::Video},
    {"EVENT_PROGRESS:", Tag::Progress},
    {"EVENT_AUDIO:", Tag::Audio},
    {"EVENT_MESSAGE:", Tag::Message},
    {"JSON_TRIGGER:", Tag::Trigger},
    {"JSON_VIDEO:", Tag::Video},
    {"JSON_PROGRESS:", Tag::Progress},
    {"JSON_AUDIO:", Tag::Audio},
    {"JSON_MSG:", Tag::Message},
    {"JSON_MESSAGE:", Tag::Message},
};

Error malformed(const std::string& what) {
    return make_malformed_event_error(what);
}

std::string string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

std::optional<int> int_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) return std::nullopt;
    return it->get<int>();
}

Result<WorkerEvent> decode_trigger(const json& j) {
    std::string event = string_field(j, "event");

    if (event == "goal_reached") {
        GoalReached goal;
        goal.reps = int_field(j, "reps").value_or(0);
        return WorkerEvent(goal);
    }

    if (event == "pose_detected") {
        PoseDetected pose;
        pose.action = string_field(j, "action");
        pose.image_path = string_field(j, "image_path");
        return WorkerEvent(pose);
    }

    if (j.contains("object1") && j.contains("object2")) {
        InteractionTriggered hit;
        hit.object1 = string_field(j, "object1");
        hit.object2 = string_field(j, "object2");
        hit.count = int_field(j, "count").value_or(0);
        hit.image_path = string_field(j, "image_path");
        if (hit.object1.empty() || hit.object2.empty()) {
            return malformed("interaction trigger without object names");
        }
        return WorkerEvent(hit);
    }

    if (event == "object_detected" || j.contains("objects")) {
        ObjectTriggered hit;
        auto objects = j.find("objects");
        if (objects != j.end() && objects->is_array()) {
            for (const auto& o : *objects) {
                if (o.is_string()) hit.objects.push_back(o.get<std::string>());
            }
        }
        hit.count = int_field(j, "count").value_or(0);
        hit.image_path = string_field(j, "image_path");
        return WorkerEvent(hit);
    }

    return malformed("unrecognized trigger '" + (event.empty() ? j.dump() : event) + "'");
}

Result<WorkerEvent> decode_json_payload(Tag tag, const std::string& payload) {
    json j = json::parse(payload, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return malformed("payload is not a JSON object: " + payload);
    }

    switch (tag) {
        case Tag::Trigger:
            return decode_trigger(j);

        case Tag::Video: {
            VideoSaved saved;
            saved.video_path = string_field(j, "video_path");
            saved.action = string_field(j, "action");
            saved.reps = int_field(j, "reps");
            if (saved.video_path.empty()) {
                return malformed("video event without video_path");
            }
            return WorkerEvent(saved);
        }

        case Tag::Progress: {
            auto reps = int_field(j, "reps");
            if (!reps) {
                return malformed("progress event without reps");
            }
            RepProgress progress;
            progress.reps = *reps;
            progress.goal = int_field(j, "goal");
            return WorkerEvent(progress);
        }

        case Tag::Message: {
            MeshMessage msg;
            msg.from = string_field(j, "from");
            msg.text = string_field(j, "text");
            if (msg.from.empty()) msg.from = "Unknown";
            return WorkerEvent(msg);
        }

        case Tag::Audio:
            break;
    }
    return malformed("unexpected payload");
}

} // namespace

const char* worker_event_name(const WorkerEvent& event) {
    switch (event.index()) {
        case 0: return "ObjectTriggered";
        case 1: return "InteractionTriggered";
        case 2: return "PoseDetected";
        case 3: return "GoalReached";
        case 4: return "VideoSaved";
        case 5: return "RepProgress";
        case 6: return "AudioCue";
        case 7: return "MeshMessage";
    }
    return "Unknown";
}

std::optional<Result<WorkerEvent>> parse_event_line(const std::string& line) {
    for (const auto& spelling : TAGS) {
        size_t pos = line.find(spelling.text);
        if (pos == std::string::npos) continue;

        std::string payload = utils::trim_copy(line.substr(pos + std::char_traits<char>::length(spelling.text)));

        if (spelling.tag == Tag::Audio) {
            if (payload.empty()) {
                return Result<WorkerEvent>(malformed("empty audio cue"));
            }
            return Result<WorkerEvent>(WorkerEvent(AudioCue{payload}));
        }

        try {
            return decode_json_payload(spelling.tag, payload);
        } catch (const json::exception& e) {
            // Type mismatches inside an otherwise valid object
            return Result<WorkerEvent>(malformed(std::string(e.what()) + ": " + payload));
        }
    }
    return std::nullopt;
}

} // namespace optidex
