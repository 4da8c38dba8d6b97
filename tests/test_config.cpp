/**
 * Tests for configuration loading.
 * Asserts:
 * - Missing or unparsable files fall back to defaults.
 * - Present keys override defaults, absent keys keep them.
 * - Invalid entries (persistent workers without a command, non-positive cadence) are corrected.
 * - A directory path loads config.json inside it.
 *
 * Run from build dir: ./test_config
 */

#include "config.h"
#include "logger.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <unistd.h>

using namespace optidex;
namespace fs = std::filesystem;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

} // namespace

int main() {
    Logger::initialize(LogLevel::ERROR);

    fs::path dir = fs::temp_directory_path() / ("optidex_config_test_" + std::to_string(getpid()));
    fs::create_directories(dir);

    // --- missing file ---
    Config missing = Config::load_from_file((dir / "nope.json").string());
    ASSERT(missing.display.port == 12345);
    ASSERT(missing.visual.stop_grace_ms == 1000);
    ASSERT(missing.llm.endpoint == "http://localhost:11434/api/chat");

    // --- malformed file ---
    write_file(dir / "bad.json", "{ \"audio\": ");
    Config bad = Config::load_from_file((dir / "bad.json").string());
    ASSERT(bad.audio.sample_rate == 16000);

    // --- overrides ---
    write_file(dir / "config.json", R"({
        "display": {"port": 23456, "command": "/opt/optidex/display_ui"},
        "audio": {"input_device": "USB Mic", "max_capture_ms": 15000},
        "llm": {"model_name": "llama3.2:1b", "temperature": 0.2},
        "telegram": {"enabled": true, "token": "abc", "chat_id": "42"},
        "visual": {
            "stop_grace_ms": 2500,
            "video_dir": "/data/videos",
            "playback": {"cadence_ms": 40, "color": "#123456"},
            "pose": {"cadence_ms": 0}
        },
        "camera": {"args": ["cap.py", "{output}"], "timeout_ms": 5000},
        "mesh": {"enabled": true, "script": "/opt/mesh/client.py"},
        "persistent_workers": [
            {"name": "mesh", "command": "python3", "args": ["mesh.py"]},
            {"name": "broken"}
        ],
        "restart_backoff_ms": 2000,
        "log_level": "debug"
    })");

    Config cfg = Config::load_from_file((dir / "config.json").string());
    ASSERT(cfg.display.port == 23456);
    ASSERT(cfg.display.command == "/opt/optidex/display_ui");
    ASSERT(cfg.display.host == "127.0.0.1");
    ASSERT(cfg.audio.input_device == "USB Mic");
    ASSERT(cfg.audio.output_device == "default");
    ASSERT(cfg.audio.max_capture_ms == 15000);
    ASSERT(cfg.llm.model_name == "llama3.2:1b");
    ASSERT(cfg.llm.temperature > 0.19f && cfg.llm.temperature < 0.21f);
    ASSERT(cfg.telegram.enabled);
    ASSERT(cfg.telegram.chat_id == "42");
    ASSERT(cfg.visual.stop_grace_ms == 2500);
    ASSERT(cfg.visual.video_dir == "/data/videos");
    ASSERT(cfg.visual.playback.cadence_ms == 40);
    ASSERT(cfg.visual.playback.color == "#123456");
    ASSERT(cfg.visual.playback.exit_grace_ms == 3000);
    ASSERT(cfg.visual.pose.cadence_ms == 100);
    ASSERT(cfg.visual.detection.script == "python/live_detection.py");
    ASSERT(cfg.camera.args.size() == 2);
    ASSERT(cfg.camera.timeout_ms == 5000);
    ASSERT(cfg.mesh.enabled);
    ASSERT(cfg.mesh.script == "/opt/mesh/client.py");
    ASSERT(cfg.mesh.monitor_worker == "mesh");
    ASSERT(cfg.llm.vision_model == "moondream");
    ASSERT(cfg.persistent_workers.size() == 1);
    ASSERT(!cfg.persistent_workers.empty() && cfg.persistent_workers[0].name == "mesh");
    ASSERT(cfg.restart_backoff_ms == 2000);
    ASSERT(cfg.log_level == "debug");

    // --- directory path ---
    Config from_dir = Config::load_from_file(dir.string());
    ASSERT(from_dir.display.port == 23456);

    // --- wrong value types fall back to defaults ---
    write_file(dir / "typed.json", R"({"display": {"port": "not a number"}})");
    Config typed = Config::load_from_file((dir / "typed.json").string());
    ASSERT(typed.display.port == 12345);

    // --- save and reload ---
    cfg.visual.sentry.frame_path = "/tmp/sentry_custom.jpg";
    cfg.save_to_file((dir / "saved.json").string());
    Config saved = Config::load_from_file((dir / "saved.json").string());
    ASSERT(saved.visual.sentry.frame_path == "/tmp/sentry_custom.jpg");
    ASSERT(saved.persistent_workers.size() == 1);
    ASSERT(saved.display.port == 23456);
    ASSERT(saved.mesh.enabled);

    // --- log levels ---
    ASSERT(parse_log_level("debug") == LogLevel::DEBUG);
    ASSERT(parse_log_level("WARN") == LogLevel::WARN);
    ASSERT(parse_log_level("nonsense") == LogLevel::INFO);

    std::error_code ec;
    fs::remove_all(dir, ec);

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All config tests passed.\n";
    return 0;
}
