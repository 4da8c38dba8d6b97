/**
 * Tests for display state merging and the display wire format.
 * Asserts:
 * - merge() returns only fields that changed since the last send.
 * - Forced images are resent even when the path is unchanged.
 * - Updates serialize as one JSON object with the UI's key names.
 *
 * Run from build dir: ./test_display_state
 */

#include "display.h"
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>

using namespace optidex;
using json = nlohmann::json;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

int main() {
    // --- deltas ---
    DisplayState state;

    DisplayUpdate listening;
    listening.status = "listening";
    listening.color = "#00ff00";
    DisplayUpdate delta = state.merge(listening);
    ASSERT(delta.status == std::optional<std::string>("listening"));
    ASSERT(delta.color == std::optional<std::string>("#00ff00"));
    ASSERT(!delta.text);
    ASSERT(!delta.image);

    // Same values again: nothing to send
    ASSERT(state.merge(listening).empty());

    DisplayUpdate partial;
    partial.text = "hello";
    partial.status = "listening";
    delta = state.merge(partial);
    ASSERT(delta.text == std::optional<std::string>("hello"));
    ASSERT(!delta.status);

    // --- forced image ---
    DisplayUpdate frame;
    frame.image = "/tmp/frame.jpg";
    frame.force_image = true;
    ASSERT(state.merge(frame).image == std::optional<std::string>("/tmp/frame.jpg"));
    ASSERT(state.merge(frame).image == std::optional<std::string>("/tmp/frame.jpg"));
    frame.force_image = false;
    ASSERT(state.merge(frame).empty());
    ASSERT(state.image() == "/tmp/frame.jpg");

    // Clearing the image is a change
    DisplayUpdate clear;
    clear.image = "";
    ASSERT(state.merge(clear).image == std::optional<std::string>(""));

    // --- full state for a fresh connection ---
    DisplayUpdate all = state.full();
    ASSERT(all.status == std::optional<std::string>("listening"));
    ASSERT(all.text == std::optional<std::string>("hello"));
    ASSERT(all.color == std::optional<std::string>("#00ff00"));
    ASSERT(all.emoji.has_value());

    // --- JSON line ---
    DisplayUpdate update;
    update.status = "answering";
    update.color = "#00c8a3";
    update.text = "Hi \"there\"";
    json j = json::parse(display_update_to_json(update));
    ASSERT(j["status"] == "answering");
    ASSERT(j["RGB"] == "#00c8a3");
    ASSERT(j["text"] == "Hi \"there\"");
    ASSERT(!j.contains("image"));
    ASSERT(!j.contains("emoji"));
    ASSERT(j["brightness"] == 100);

    std::string line = display_update_to_json(update);
    ASSERT(line.find('\n') == std::string::npos);

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All display state tests passed.\n";
    return 0;
}
