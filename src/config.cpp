#include "config.h"
#include "logger.h"
#include "utils.h"
#include <fstream>
#include <filesystem>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace optidex {

namespace {

template<typename T>
T get_or_default(const json& j, const std::string& key, const T& default_val) {
    if (j.contains(key) && !j[key].is_null()) {
        return j[key].get<T>();
    }
    return default_val;
}

template<typename T>
std::vector<T> get_array_or_default(const json& j, const std::string& key,
                                    const std::vector<T>& default_val) {
    if (j.contains(key) && j[key].is_array()) {
        return j[key].get<std::vector<T>>();
    }
    return default_val;
}

DisplayConfig parse_display_config(const json& j) {
    DisplayConfig config;
    if (!j.contains("display")) return config;

    const auto& d = j["display"];
    config.enabled = get_or_default(d, "enabled", config.enabled);
    config.host = get_or_default(d, "host", config.host);
    config.port = get_or_default(d, "port", config.port);
    config.command = get_or_default(d, "command", config.command);
    config.args = get_array_or_default(d, "args", config.args);
    return config;
}

AudioConfig parse_audio_config(const json& j) {
    AudioConfig config;
    if (!j.contains("audio")) return config;

    const auto& audio = j["audio"];
    config.input_device = get_or_default(audio, "input_device", config.input_device);
    config.output_device = get_or_default(audio, "output_device", config.output_device);
    config.sample_rate = get_or_default(audio, "sample_rate", config.sample_rate);
    config.recordings_dir = utils::expand_path(get_or_default(audio, "recordings_dir", config.recordings_dir));
    config.max_capture_ms = get_or_default(audio, "max_capture_ms", config.max_capture_ms);
    return config;
}

STTConfig parse_stt_config(const json& j) {
    STTConfig config;
    if (!j.contains("stt")) return config;

    const auto& stt = j["stt"];
    config.model_path = utils::expand_path(get_or_default(stt, "model_path", config.model_path));
    config.language = get_or_default(stt, "language", config.language);
    config.use_gpu = get_or_default(stt, "use_gpu", config.use_gpu);
    config.threads = get_or_default(stt, "threads", config.threads);
    return config;
}

TTSConfig parse_tts_config(const json& j) {
    TTSConfig config;
    if (!j.contains("tts")) return config;

    const auto& tts = j["tts"];
    config.piper_path = utils::expand_path(get_or_default(tts, "piper_path", config.piper_path));
    config.voice_path = utils::expand_path(get_or_default(tts, "voice_path", config.voice_path));
    config.espeak_data_path = utils::expand_path(get_or_default(tts, "espeak_data_path", config.espeak_data_path));
    config.output_gain = get_or_default(tts, "output_gain", config.output_gain);
    return config;
}

LLMConfig parse_llm_config(const json& j) {
    LLMConfig config;
    if (!j.contains("llm")) return config;

    const auto& llm = j["llm"];
    config.endpoint = get_or_default(llm, "endpoint", config.endpoint);
    config.model_name = get_or_default(llm, "model_name", config.model_name);
    config.timeout_ms = get_or_default(llm, "timeout_ms", config.timeout_ms);
    config.temperature = get_or_default(llm, "temperature", config.temperature);
    config.system_prompt = get_or_default(llm, "system_prompt", config.system_prompt);
    config.vision_model = get_or_default(llm, "vision_model", config.vision_model);
    config.vision_timeout_ms = get_or_default(llm, "vision_timeout_ms", config.vision_timeout_ms);
    return config;
}

TelegramConfig parse_telegram_config(const json& j) {
    TelegramConfig config;
    if (!j.contains("telegram")) return config;

    const auto& t = j["telegram"];
    config.enabled = get_or_default(t, "enabled", config.enabled);
    config.token = get_or_default(t, "token", config.token);
    config.chat_id = get_or_default(t, "chat_id", config.chat_id);
    config.poll_updates = get_or_default(t, "poll_updates", config.poll_updates);
    return config;
}

void parse_mode_config(const json& visual, const std::string& key, VisualModeConfig& mode) {
    if (!visual.contains(key) || !visual[key].is_object()) return;

    const auto& m = visual[key];
    mode.script = utils::expand_path(get_or_default(m, "script", mode.script));
    mode.frame_path = get_or_default(m, "frame_path", mode.frame_path);
    mode.cadence_ms = get_or_default(m, "cadence_ms", mode.cadence_ms);
    mode.exit_grace_ms = get_or_default(m, "exit_grace_ms", mode.exit_grace_ms);
    mode.color = get_or_default(m, "color", mode.color);
    if (mode.cadence_ms <= 0) {
        Logger::warn("visual." + key + ".cadence_ms must be positive; using 100");
        mode.cadence_ms = 100;
    }
}

VisualConfig parse_visual_config(const json& j) {
    VisualConfig config;
    if (!j.contains("visual")) return config;

    const auto& v = j["visual"];
    config.interpreter = get_or_default(v, "interpreter", config.interpreter);
    config.video_dir = utils::expand_path(get_or_default(v, "video_dir", config.video_dir));
    config.stop_grace_ms = get_or_default(v, "stop_grace_ms", config.stop_grace_ms);
    config.camera_busy_retries = get_or_default(v, "camera_busy_retries", config.camera_busy_retries);
    config.camera_busy_retry_ms = get_or_default(v, "camera_busy_retry_ms", config.camera_busy_retry_ms);
    config.cleanup_files = get_array_or_default(v, "cleanup_files", config.cleanup_files);
    parse_mode_config(v, "detection", config.detection);
    parse_mode_config(v, "recording", config.recording);
    parse_mode_config(v, "playback", config.playback);
    parse_mode_config(v, "pose", config.pose);
    parse_mode_config(v, "observer", config.observer);
    parse_mode_config(v, "sentry", config.sentry);
    return config;
}

CameraConfig parse_camera_config(const json& j) {
    CameraConfig config;
    if (!j.contains("camera")) return config;

    const auto& c = j["camera"];
    config.command = get_or_default(c, "command", config.command);
    config.args = get_array_or_default(c, "args", config.args);
    config.image_dir = utils::expand_path(get_or_default(c, "image_dir", config.image_dir));
    config.timeout_ms = get_or_default(c, "timeout_ms", config.timeout_ms);
    return config;
}

MeshConfig parse_mesh_config(const json& j) {
    MeshConfig config;
    if (!j.contains("mesh")) return config;

    const auto& m = j["mesh"];
    config.enabled = get_or_default(m, "enabled", config.enabled);
    config.command = get_or_default(m, "command", config.command);
    config.script = utils::expand_path(get_or_default(m, "script", config.script));
    config.monitor_worker = get_or_default(m, "monitor_worker", config.monitor_worker);
    config.timeout_ms = get_or_default(m, "timeout_ms", config.timeout_ms);
    config.port_release_ms = get_or_default(m, "port_release_ms", config.port_release_ms);
    return config;
}

std::vector<PersistentWorkerConfig> parse_persistent_workers(const json& j) {
    std::vector<PersistentWorkerConfig> workers;
    if (!j.contains("persistent_workers") || !j["persistent_workers"].is_array()) return workers;

    for (const auto& w : j["persistent_workers"]) {
        PersistentWorkerConfig worker;
        worker.name = get_or_default(w, "name", std::string());
        worker.command = get_or_default(w, "command", std::string());
        worker.args = get_array_or_default(w, "args", std::vector<std::string>());
        if (worker.name.empty() || worker.command.empty()) {
            Logger::warn("Skipping persistent worker without name or command");
            continue;
        }
        workers.push_back(worker);
    }
    return workers;
}

json mode_to_json(const VisualModeConfig& mode) {
    json m;
    m["script"] = mode.script;
    m["frame_path"] = mode.frame_path;
    m["cadence_ms"] = mode.cadence_ms;
    m["exit_grace_ms"] = mode.exit_grace_ms;
    m["color"] = mode.color;
    return m;
}

} // namespace

Config Config::load_from_file(const std::string& path) {
    Config cfg;

    std::string file_path = path;
    std::error_code ec;
    if (fs::is_directory(path, ec) && !ec) {
        file_path = (fs::path(path) / "config.json").string();
    }

    std::ifstream file(file_path);
    if (!file.is_open()) {
        Logger::warn("Could not open config file: " + file_path + ". Using defaults.");
        return cfg;
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        Logger::error("Error parsing config file " + file_path + ": " + std::string(e.what()) + ". Using defaults.");
        return cfg;
    }

    try {
        cfg.display = parse_display_config(j);
        cfg.audio = parse_audio_config(j);
        cfg.stt = parse_stt_config(j);
        cfg.tts = parse_tts_config(j);
        cfg.llm = parse_llm_config(j);
        cfg.telegram = parse_telegram_config(j);
        cfg.visual = parse_visual_config(j);
        cfg.camera = parse_camera_config(j);
        cfg.mesh = parse_mesh_config(j);
        cfg.persistent_workers = parse_persistent_workers(j);
        cfg.restart_backoff_ms = get_or_default(j, "restart_backoff_ms", cfg.restart_backoff_ms);
        cfg.log_level = get_or_default(j, "log_level", cfg.log_level);
        cfg.log_file = utils::expand_path(get_or_default(j, "log_file", cfg.log_file));
    } catch (const json::exception& e) {
        Logger::error("Invalid value in config file " + file_path + ": " + std::string(e.what()) + ". Using defaults.");
        return Config();
    }

    Logger::info("Loaded config from " + file_path);
    return cfg;
}

void Config::save_to_file(const std::string& path) const {
    json j;

    j["display"]["enabled"] = display.enabled;
    j["display"]["host"] = display.host;
    j["display"]["port"] = display.port;
    j["display"]["command"] = display.command;
    j["display"]["args"] = display.args;

    j["audio"]["input_device"] = audio.input_device;
    j["audio"]["output_device"] = audio.output_device;
    j["audio"]["sample_rate"] = audio.sample_rate;
    j["audio"]["recordings_dir"] = audio.recordings_dir;
    j["audio"]["max_capture_ms"] = audio.max_capture_ms;

    j["stt"]["model_path"] = stt.model_path;
    j["stt"]["language"] = stt.language;
    j["stt"]["use_gpu"] = stt.use_gpu;
    j["stt"]["threads"] = stt.threads;

    j["tts"]["piper_path"] = tts.piper_path;
    j["tts"]["voice_path"] = tts.voice_path;
    j["tts"]["espeak_data_path"] = tts.espeak_data_path;
    j["tts"]["output_gain"] = tts.output_gain;

    j["llm"]["endpoint"] = llm.endpoint;
    j["llm"]["model_name"] = llm.model_name;
    j["llm"]["timeout_ms"] = llm.timeout_ms;
    j["llm"]["temperature"] = llm.temperature;
    j["llm"]["system_prompt"] = llm.system_prompt;
    j["llm"]["vision_model"] = llm.vision_model;
    j["llm"]["vision_timeout_ms"] = llm.vision_timeout_ms;

    j["telegram"]["enabled"] = telegram.enabled;
    j["telegram"]["token"] = telegram.token;
    j["telegram"]["chat_id"] = telegram.chat_id;
    j["telegram"]["poll_updates"] = telegram.poll_updates;

    j["visual"]["interpreter"] = visual.interpreter;
    j["visual"]["video_dir"] = visual.video_dir;
    j["visual"]["stop_grace_ms"] = visual.stop_grace_ms;
    j["visual"]["camera_busy_retries"] = visual.camera_busy_retries;
    j["visual"]["camera_busy_retry_ms"] = visual.camera_busy_retry_ms;
    j["visual"]["cleanup_files"] = visual.cleanup_files;
    j["visual"]["detection"] = mode_to_json(visual.detection);
    j["visual"]["recording"] = mode_to_json(visual.recording);
    j["visual"]["playback"] = mode_to_json(visual.playback);
    j["visual"]["pose"] = mode_to_json(visual.pose);
    j["visual"]["observer"] = mode_to_json(visual.observer);
    j["visual"]["sentry"] = mode_to_json(visual.sentry);

    j["camera"]["command"] = camera.command;
    j["camera"]["args"] = camera.args;
    j["camera"]["image_dir"] = camera.image_dir;
    j["camera"]["timeout_ms"] = camera.timeout_ms;

    j["mesh"]["enabled"] = mesh.enabled;
    j["mesh"]["command"] = mesh.command;
    j["mesh"]["script"] = mesh.script;
    j["mesh"]["monitor_worker"] = mesh.monitor_worker;
    j["mesh"]["timeout_ms"] = mesh.timeout_ms;
    j["mesh"]["port_release_ms"] = mesh.port_release_ms;

    j["persistent_workers"] = json::array();
    for (const auto& w : persistent_workers) {
        j["persistent_workers"].push_back({{"name", w.name}, {"command", w.command}, {"args", w.args}});
    }
    j["restart_backoff_ms"] = restart_backoff_ms;
    j["log_level"] = log_level;
    j["log_file"] = log_file;

    std::ofstream file(path);
    if (!file.is_open()) {
        Logger::error("Failed to open config file for writing: " + path);
        return;
    }
    file << j.dump(4) << std::endl;
}

} // namespace optidex
