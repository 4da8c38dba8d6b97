/**
 * Tests for the handoff slot and the image mailbox.
 * Asserts:
 * - The slot holds at most one request and take_and_clear() empties it.
 * - A second set() before consumption replaces the first (last write wins).
 * - Concurrent writers never leave more than one value behind.
 * - A value written under one turn is never handed to another turn.
 *
 * Run from build dir: ./test_handoff_slot
 */

#include "config.h"
#include "handoff_slot.h"
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace optidex;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    VisualConfig visual;

    // --- empty slot ---
    HandoffSlot slot;
    ASSERT(!slot.has_pending());
    ASSERT(!slot.pending_kind());
    ASSERT(!slot.take_and_clear());

    // --- set then take ---
    slot.set(make_recording_request(visual, "/tmp/a.mp4", 10), 1);
    ASSERT(slot.has_pending());
    ASSERT(slot.pending_kind() == VisualKind::Recording);

    auto taken = slot.take_and_clear();
    ASSERT(taken.has_value());
    ASSERT(kind_of(*taken) == VisualKind::Recording);
    ASSERT(std::get<RecordingRequest>(*taken).video_path == "/tmp/a.mp4");
    ASSERT(std::get<RecordingRequest>(*taken).duration_s == 10);
    ASSERT(!slot.has_pending());
    ASSERT(!slot.take_and_clear());

    // --- last write wins ---
    slot.set(make_detection_request(visual, {"cup"}, std::nullopt, "", false), 1);
    slot.set(make_pose_request(visual, "pushup", true, 10, false), 1);
    ASSERT(slot.pending_kind() == VisualKind::Pose);
    taken = slot.take_and_clear();
    ASSERT(taken && kind_of(*taken) == VisualKind::Pose);
    ASSERT(std::get<PoseRequest>(*taken).goal == 10);
    ASSERT(!slot.has_pending());

    // --- request carries its frame path and launch spec ---
    slot.set(make_playback_request(visual, "/tmp/clip.mp4"), 1);
    taken = slot.take_and_clear();
    ASSERT(taken.has_value());
    ASSERT(frame_path_of(*taken) == visual.playback.frame_path);
    ASSERT(launch_of(*taken).command == visual.interpreter);
    ASSERT(launch_of(*taken).script == visual.playback.script);

    // --- image mailbox ---
    ImageSlot images;
    ASSERT(!images.has_value());
    ASSERT(!images.set("/tmp/one.jpg", 1));
    auto displaced = images.set("/tmp/two.jpg", 1);
    ASSERT(displaced && *displaced == "/tmp/one.jpg");
    ASSERT(images.peek() == std::optional<std::string>("/tmp/two.jpg"));
    ASSERT(images.take_and_clear() == std::optional<std::string>("/tmp/two.jpg"));
    ASSERT(!images.has_value());

    // --- values belong to the turn that wrote them ---
    slot.set(make_detection_request(visual, {"cat"}, std::nullopt, "", false), 4);
    ASSERT(slot.has_pending_for(4));
    ASSERT(!slot.has_pending_for(5));
    ASSERT(!slot.take_for_turn(5));
    ASSERT(!slot.has_pending());           // dropped, not kept for later
    slot.set(make_detection_request(visual, {"cat"}, std::nullopt, "", false), 5);
    taken = slot.take_for_turn(5);
    ASSERT(taken && kind_of(*taken) == VisualKind::Detection);

    images.set("/tmp/old.jpg", 2);
    ASSERT(!images.take_for_turn(3, "image"));
    ASSERT(!images.has_value());
    images.set("/tmp/new.jpg", 3);
    ASSERT(images.take_for_turn(3, "image") == std::optional<std::string>("/tmp/new.jpg"));

    // --- concurrent writers ---
    HandoffSlot shared;
    std::vector<std::thread> writers;
    for (int i = 0; i < 8; ++i) {
        writers.emplace_back([&shared, &visual, i]() {
            for (int n = 0; n < 50; ++n) {
                shared.set(make_recording_request(visual, "/tmp/v" + std::to_string(i) + ".mp4", std::nullopt), 1);
            }
        });
    }
    for (auto& t : writers) t.join();
    ASSERT(shared.take_and_clear().has_value());
    ASSERT(!shared.take_and_clear().has_value());

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All handoff slot tests passed.\n";
    return 0;
}
