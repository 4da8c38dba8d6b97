/**
 * Tests for the frame relay.
 * Asserts:
 * - Nothing is forwarded until the worker writes its first frame.
 * - Every tick forwards the frame, changed or not, with the image forced.
 * - stop() cancels the timer and deletes every temporary file.
 * - Frame generations come from the ".gen" sidecar, else the file size.
 *
 * Run from build dir: ./test_frame_relay
 */

#include "fakes.h"
#include "frame_relay.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace optidex;
using namespace optidex::testing;
namespace fs = std::filesystem;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

void write_file(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

size_t image_updates(const FakeDisplay& display) {
    return static_cast<size_t>(std::count_if(display.updates.begin(), display.updates.end(),
        [](const DisplayUpdate& u) { return u.image.has_value(); }));
}

} // namespace

int main() {
    fs::path dir = fs::temp_directory_path() / ("optidex_relay_test_" + std::to_string(getpid()));
    fs::create_directories(dir);
    const std::string frame = (dir / "frame.jpg").string();
    const std::string state = (dir / "state.json").string();

    // --- read_frame_generation ---
    ASSERT(!read_frame_generation(frame));
    write_file(frame, "12345");
    ASSERT(read_frame_generation(frame) == std::optional<uint64_t>(5));
    write_file(frame + ".gen", "42\n");
    ASSERT(read_frame_generation(frame) == std::optional<uint64_t>(42));
    fs::remove(frame);
    fs::remove(frame + ".gen");

    // --- visual_temp_files ---
    VisualConfig visual;
    visual.cleanup_files = {state};
    auto temp_files = visual_temp_files(visual);
    auto contains = [&temp_files](const std::string& p) {
        return std::find(temp_files.begin(), temp_files.end(), p) != temp_files.end();
    };
    ASSERT(contains(visual.detection.frame_path));
    ASSERT(contains(visual.playback.frame_path + ".gen"));
    ASSERT(contains(state));

    // --- relay ticks ---
    FakeScheduler scheduler;
    FakeDisplay display;
    FrameRelay relay(scheduler, display, {frame, frame + ".gen", state});
    ASSERT(!relay.active());

    relay.start(frame, Duration(100), "#FF0000");
    ASSERT(relay.active());
    scheduler.advance(Duration(300));
    ASSERT(image_updates(display) == 0);   // no frame yet

    write_file(frame, "jpeg-bytes");
    scheduler.advance(Duration(100));
    ASSERT(image_updates(display) == 1);
    ASSERT(!display.updates.empty() && display.updates.back().force_image);
    ASSERT(display.image == frame);
    ASSERT(display.color == "#FF0000");

    // Unchanged frames are forwarded too
    scheduler.advance(Duration(300));
    ASSERT(image_updates(display) == 4);
    ASSERT(relay.frames_forwarded() == 4);

    // --- retarget without cleanup ---
    relay.start(frame, Duration(30), "#0000FF");
    ASSERT(fs::exists(frame));
    ASSERT(relay.frames_forwarded() == 0);
    scheduler.advance(Duration(90));
    ASSERT(relay.frames_forwarded() == 3);
    ASSERT(display.color == "#0000FF");

    // --- stop cleans up ---
    write_file(frame + ".gen", "7");
    write_file(state, "{}");
    relay.stop();
    ASSERT(!relay.active());
    ASSERT(scheduler.pending_timers() == 0);
    ASSERT(!fs::exists(frame));
    ASSERT(!fs::exists(frame + ".gen"));
    ASSERT(!fs::exists(state));

    size_t before = display.updates.size();
    scheduler.advance(Duration(500));
    ASSERT(display.updates.size() == before);

    // Stopping twice is harmless
    relay.stop();

    std::error_code ec;
    fs::remove_all(dir, ec);

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All frame relay tests passed.\n";
    return 0;
}
