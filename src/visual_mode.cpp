#include "visual_mode.h"
#include "utils.h"
#include <sstream>

namespace optidex {

namespace {

LaunchSpec base_launch(const VisualConfig& config, VisualKind kind) {
    LaunchSpec spec;
    spec.command = config.interpreter;
    spec.script = mode_config(config, kind).script;
    return spec;
}

} // namespace

const char* visual_kind_name(VisualKind kind) {
    switch (kind) {
        case VisualKind::Detection: return "detection";
        case VisualKind::Recording: return "recording";
        case VisualKind::Playback: return "playback";
        case VisualKind::Pose: return "pose";
        case VisualKind::Observer: return "observer";
        case VisualKind::Sentry: return "sentry";
    }
    return "unknown";
}

std::vector<std::string> LaunchSpec::argv() const {
    std::vector<std::string> out;
    out.reserve(args.size() + 2);
    out.push_back(command);
    if (!script.empty()) out.push_back(script);
    out.insert(out.end(), args.begin(), args.end());
    return out;
}

std::string LaunchSpec::describe() const {
    std::ostringstream oss;
    bool first = true;
    for (const auto& a : argv()) {
        if (!first) oss << ' ';
        oss << a;
        first = false;
    }
    return oss.str();
}

VisualKind kind_of(const VisualModeRequest& request) {
    return std::visit(utils::overloaded{
        [](const DetectionRequest&) { return VisualKind::Detection; },
        [](const RecordingRequest&) { return VisualKind::Recording; },
        [](const PlaybackRequest&) { return VisualKind::Playback; },
        [](const PoseRequest&) { return VisualKind::Pose; },
        [](const ObserverRequest&) { return VisualKind::Observer; },
        [](const SentryRequest&) { return VisualKind::Sentry; },
    }, request);
}

const std::string& frame_path_of(const VisualModeRequest& request) {
    return std::visit([](const auto& r) -> const std::string& { return r.frame_path; }, request);
}

const LaunchSpec& launch_of(const VisualModeRequest& request) {
    return std::visit([](const auto& r) -> const LaunchSpec& { return r.launch; }, request);
}

const VisualModeConfig& mode_config(const VisualConfig& config, VisualKind kind) {
    switch (kind) {
        case VisualKind::Detection: return config.detection;
        case VisualKind::Recording: return config.recording;
        case VisualKind::Playback: return config.playback;
        case VisualKind::Pose: return config.pose;
        case VisualKind::Observer: return config.observer;
        case VisualKind::Sentry: return config.sentry;
    }
    return config.detection;
}

DetectionRequest make_detection_request(const VisualConfig& config,
                                        std::vector<std::string> targets,
                                        std::optional<int> duration_s,
                                        std::string video_path,
                                        bool segmentation) {
    DetectionRequest r;
    r.frame_path = config.detection.frame_path;
    r.targets = std::move(targets);
    r.duration_s = duration_s;
    r.video_path = std::move(video_path);
    r.segmentation = segmentation;

    r.launch = base_launch(config, VisualKind::Detection);
    r.launch.args.push_back("start");
    r.launch.args.insert(r.launch.args.end(), r.targets.begin(), r.targets.end());
    if (r.duration_s) {
        r.launch.args.push_back("--duration");
        r.launch.args.push_back(std::to_string(*r.duration_s));
    }
    if (!r.video_path.empty()) {
        r.launch.args.push_back("--video_out");
        r.launch.args.push_back(r.video_path);
    }
    if (r.segmentation) r.launch.args.push_back("--segmentation");
    r.launch.args.push_back("--frame");
    r.launch.args.push_back(r.frame_path);
    return r;
}

RecordingRequest make_recording_request(const VisualConfig& config,
                                        std::string video_path,
                                        std::optional<int> duration_s) {
    RecordingRequest r;
    r.frame_path = config.recording.frame_path;
    r.video_path = std::move(video_path);
    r.duration_s = duration_s;

    r.launch = base_launch(config, VisualKind::Recording);
    r.launch.args.push_back(r.video_path);
    if (r.duration_s) {
        r.launch.args.push_back("--duration");
        r.launch.args.push_back(std::to_string(*r.duration_s));
    }
    r.launch.args.push_back("--frame");
    r.launch.args.push_back(r.frame_path);
    return r;
}

PlaybackRequest make_playback_request(const VisualConfig& config, std::string video_path) {
    PlaybackRequest r;
    r.frame_path = config.playback.frame_path;
    r.video_path = std::move(video_path);

    r.launch = base_launch(config, VisualKind::Playback);
    r.launch.args = {"play", r.video_path, "--frame", r.frame_path};
    return r;
}

PoseRequest make_pose_request(const VisualConfig& config,
                              std::string action,
                              bool count,
                              std::optional<int> goal,
                              bool record) {
    PoseRequest r;
    r.frame_path = config.pose.frame_path;
    r.action = action.empty() ? "detect" : std::move(action);
    r.count = count;
    r.goal = goal;
    r.record = record;

    r.launch = base_launch(config, VisualKind::Pose);
    r.launch.args = {"--action", r.action, "--visualize"};
    if (r.count) r.launch.args.push_back("--count");
    if (r.goal) {
        r.launch.args.push_back("--goal");
        r.launch.args.push_back(std::to_string(*r.goal));
    }
    if (r.record) r.launch.args.push_back("--record");
    r.launch.args.push_back("--frame");
    r.launch.args.push_back(r.frame_path);
    return r;
}

ObserverRequest make_observer_request(const VisualConfig& config,
                                      std::vector<std::string> targets,
                                      bool record,
                                      bool continuous,
                                      std::string prompt) {
    ObserverRequest r;
    r.frame_path = config.observer.frame_path;
    r.targets = std::move(targets);
    r.record = record;
    r.continuous = continuous;
    r.prompt = std::move(prompt);

    r.launch = base_launch(config, VisualKind::Observer);
    r.launch.args = r.targets;
    r.launch.args.push_back("--visualize");
    if (r.record) r.launch.args.push_back("--record");
    if (r.continuous) r.launch.args.push_back("--continuous");
    r.launch.args.push_back("--frame");
    r.launch.args.push_back(r.frame_path);
    return r;
}

SentryRequest make_sentry_request(const VisualConfig& config,
                                  std::vector<std::string> interaction_pairs,
                                  bool record) {
    SentryRequest r;
    r.frame_path = config.sentry.frame_path;
    r.interaction_pairs = std::move(interaction_pairs);
    r.record = record;

    r.launch = base_launch(config, VisualKind::Sentry);
    r.launch.args = r.interaction_pairs;
    r.launch.args.push_back("--visualize");
    if (r.record) r.launch.args.push_back("--record");
    r.launch.args.push_back("--continuous");
    r.launch.args.push_back("--frame");
    r.launch.args.push_back(r.frame_path);
    return r;
}

} // namespace optidex
