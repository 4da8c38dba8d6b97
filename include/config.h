#pragma once

#include <string>
#include <vector>

namespace optidex {

/// Connection to the display UI process (JSON lines over TCP)
struct DisplayConfig {
    bool enabled = true;
    std::string host = "127.0.0.1";
    int port = 12345;
    /// When set, the UI process is started as a persistent worker before connecting
    std::string command;
    std::vector<std::string> args;
};

struct AudioConfig {
    std::string input_device = "default";
    std::string output_device = "default";
    int sample_rate = 16000;
    std::string recordings_dir = "/tmp/optidex_recordings";
    /// Capture ends on its own after this long even if the button is still held (ms)
    int max_capture_ms = 30000;
};

struct STTConfig {
    std::string model_path;
    std::string language = "en";
    bool use_gpu = false;
    int threads = 4;
};

struct TTSConfig {
    std::string piper_path;         ///< Piper binary path (empty = auto-detect)
    std::string voice_path;
    std::string espeak_data_path;   ///< espeak-ng data dir (empty = platform default)
    float output_gain = 1.0f;
};

struct LLMConfig {
    std::string endpoint = "http://localhost:11434/api/chat";
    std::string model_name = "qwen2.5:3b";
    int timeout_ms = 30000;
    float temperature = 0.7f;
    std::string system_prompt = "You are Optidex, a small camera-equipped assistant. "
                                "Answer briefly in one or two sentences. "
                                "Use the camera tools when the user asks to watch, record, play or count something.";
    /// Model used to describe observer snapshots (must accept images)
    std::string vision_model = "moondream";
    int vision_timeout_ms = 60000;
};

struct TelegramConfig {
    bool enabled = false;
    std::string token;
    std::string chat_id;            ///< Empty = learn from the first incoming message
    bool poll_updates = true;       ///< Deliver incoming messages to the controller
};

/// Per-kind visual mode settings
struct VisualModeConfig {
    std::string script;
    std::string frame_path;
    int cadence_ms = 100;
    int exit_grace_ms = 1000;
    std::string color = "#00FFFF";
};

struct VisualConfig {
    std::string interpreter = "python3";
    std::string video_dir = "/tmp/optidex_videos";
    /// Time a worker gets between SIGTERM and SIGKILL (ms)
    int stop_grace_ms = 1000;
    /// Retries while the camera is leased by another operation at activation time
    int camera_busy_retries = 20;
    int camera_busy_retry_ms = 250;

    VisualModeConfig detection{"python/live_detection.py", "/tmp/optidex_detection_frame.jpg", 100, 1000, "#00FFFF"};
    VisualModeConfig recording{"python/video_capture.py", "/tmp/optidex_video_preview.jpg", 100, 1000, "#FF0000"};
    VisualModeConfig playback{"python/video_player.py", "/tmp/optidex_video_frame.jpg", 30, 3000, "#0000FF"};
    VisualModeConfig pose{"python/pose_estimation.py", "/tmp/optidex_pose_frame.jpg", 100, 1000, "#FF00FF"};
    VisualModeConfig observer{"python/smart_observer.py", "/tmp/optidex_observer_frame.jpg", 100, 1000, "#00FFFF"};
    VisualModeConfig sentry{"python/semantic_sentry.py", "/tmp/optidex_sentry_frame.jpg", 100, 1000, "#00FFFF"};

    /// Files removed on every teardown in addition to the frame paths (worker state files)
    std::vector<std::string> cleanup_files = {
        "/tmp/pose_state.json",
        "/tmp/observer_state.json",
        "/tmp/sentry_state.json"
    };
};

/// Still-photo capture command; "{output}" in args is replaced with the image path
struct CameraConfig {
    std::string command = "python3";
    std::vector<std::string> args = {"python/camera_capture.py", "{output}", "1024", "1024"};
    std::string image_dir = "/tmp/optidex_images";
    int timeout_ms = 20000;
};

/// Mesh radio client; its monitor runs as the persistent worker named monitor_worker
struct MeshConfig {
    bool enabled = false;
    std::string command = "python3";
    std::string script = "python/meshtastic_client.py";
    std::string monitor_worker = "mesh";
    int timeout_ms = 30000;
    /// Pause between stopping the monitor and using the radio, so the serial port is released
    int port_release_ms = 2000;
};

/// A long-running non-visual worker restarted after a crash
struct PersistentWorkerConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;
};

struct Config {
    DisplayConfig display;
    AudioConfig audio;
    STTConfig stt;
    TTSConfig tts;
    LLMConfig llm;
    TelegramConfig telegram;
    VisualConfig visual;
    CameraConfig camera;
    MeshConfig mesh;
    std::vector<PersistentWorkerConfig> persistent_workers;
    int restart_backoff_ms = 5000;

    std::string log_level = "info";
    std::string log_file;

    static Config load_from_file(const std::string& path);
    void save_to_file(const std::string& path) const;
};

} // namespace optidex
