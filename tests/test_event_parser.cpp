/**
 * Tests for worker output line decoding.
 * Asserts:
 * - Ordinary output is not an event.
 * - Each tag (EVENT_ and JSON_ spellings) decodes to its typed event.
 * - Tagged lines with bad payloads are MalformedEvent errors, not crashes.
 *
 * Run from build dir: ./test_event_parser
 */

#include "event_parser.h"
#include <iostream>
#include <string>

using namespace optidex;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

template<typename T>
const T* decode(const std::string& line) {
    static std::optional<Result<WorkerEvent>> held;
    held = parse_event_line(line);
    if (!held || held->is_error()) return nullptr;
    return std::get_if<T>(&held->value());
}

bool malformed(const std::string& line) {
    auto parsed = parse_event_line(line);
    return parsed && parsed->is_error() && parsed->error().type == ErrorType::MalformedEvent;
}

} // namespace

int main() {
    // --- plain output ---
    ASSERT(!parse_event_line(""));
    ASSERT(!parse_event_line("Loading YOLO model..."));
    ASSERT(!parse_event_line("frame 120 fps=14.8"));

    // --- object trigger ---
    auto object = decode<ObjectTriggered>(
        "EVENT_TRIGGER: {\"event\": \"object_detected\", \"objects\": [\"cup\", \"phone\"], "
        "\"count\": 3, \"image_path\": \"/tmp/snap.jpg\"}");
    ASSERT(object != nullptr);
    if (object) {
        ASSERT(object->objects.size() == 2);
        ASSERT(object->objects[1] == "phone");
        ASSERT(object->count == 3);
        ASSERT(object->image_path == "/tmp/snap.jpg");
    }

    // Prefix text before the tag is allowed
    ASSERT(decode<ObjectTriggered>("[observer] JSON_TRIGGER: {\"objects\": [\"person\"]}") != nullptr);

    // --- interaction trigger ---
    auto hit = decode<InteractionTriggered>(
        "EVENT_TRIGGER: {\"object1\": \"dog\", \"object2\": \"couch\", \"count\": 1}");
    ASSERT(hit != nullptr);
    if (hit) {
        ASSERT(hit->object1 == "dog");
        ASSERT(hit->object2 == "couch");
        ASSERT(hit->count == 1);
    }
    ASSERT(malformed("EVENT_TRIGGER: {\"object1\": \"dog\", \"object2\": \"\"}"));

    // --- pose and goal ---
    auto pose = decode<PoseDetected>("EVENT_TRIGGER: {\"event\": \"pose_detected\", \"action\": \"waving\"}");
    ASSERT(pose != nullptr && pose->action == "waving");

    auto goal = decode<GoalReached>("EVENT_TRIGGER: {\"event\": \"goal_reached\", \"reps\": 10}");
    ASSERT(goal != nullptr && goal->reps == 10);

    ASSERT(malformed("EVENT_TRIGGER: {\"event\": \"sneezed\"}"));

    // --- video ---
    auto video = decode<VideoSaved>(
        "EVENT_VIDEO: {\"video_path\": \"/tmp/v.mp4\", \"action\": \"squat\", \"reps\": 12}");
    ASSERT(video != nullptr);
    if (video) {
        ASSERT(video->video_path == "/tmp/v.mp4");
        ASSERT(video->action == "squat");
        ASSERT(video->reps == 12);
    }
    auto plain_video = decode<VideoSaved>("JSON_VIDEO: {\"video_path\": \"/tmp/w.mp4\"}");
    ASSERT(plain_video != nullptr && !plain_video->reps);
    ASSERT(malformed("EVENT_VIDEO: {}"));

    // --- progress ---
    auto progress = decode<RepProgress>("EVENT_PROGRESS: {\"reps\": 4, \"goal\": 10}");
    ASSERT(progress != nullptr && progress->reps == 4 && progress->goal == 10);
    ASSERT(malformed("EVENT_PROGRESS: {\"goal\": 10}"));

    // --- audio cue is raw text ---
    auto cue = decode<AudioCue>("EVENT_AUDIO:   Five more to go  ");
    ASSERT(cue != nullptr && cue->text == "Five more to go");
    ASSERT(malformed("EVENT_AUDIO:   "));

    // --- mesh messages ---
    auto msg = decode<MeshMessage>("JSON_MSG: {\"from\": \"node2\", \"text\": \"door open\"}");
    ASSERT(msg != nullptr && msg->from == "node2" && msg->text == "door open");
    auto anonymous = decode<MeshMessage>("EVENT_MESSAGE: {\"text\": \"hello\"}");
    ASSERT(anonymous != nullptr && anonymous->from == "Unknown");

    // --- bad payloads ---
    ASSERT(malformed("EVENT_TRIGGER: not json"));
    ASSERT(malformed("EVENT_TRIGGER: [1, 2]"));
    ASSERT(malformed("EVENT_PROGRESS: {\"reps\": \"four\"}"));

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All event parser tests passed.\n";
    return 0;
}
