#include "frame_relay.h"
#include "core/constants.h"
#include "logger.h"
#include "visual_mode.h"
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace optidex {

std::optional<uint64_t> read_frame_generation(const std::string& frame_path) {
    std::error_code ec;
    auto size = fs::file_size(frame_path, ec);
    if (ec) return std::nullopt;

    std::ifstream gen_file(frame_path + constants::relay::GENERATION_SUFFIX);
    uint64_t generation = 0;
    if (gen_file && (gen_file >> generation)) {
        return generation;
    }
    return static_cast<uint64_t>(size);
}

std::vector<std::string> visual_temp_files(const VisualConfig& config) {
    std::vector<std::string> files;
    for (VisualKind kind : ALL_VISUAL_KINDS) {
        const std::string& frame = mode_config(config, kind).frame_path;
        if (frame.empty() || std::find(files.begin(), files.end(), frame) != files.end()) continue;
        files.push_back(frame);
        files.push_back(frame + constants::relay::GENERATION_SUFFIX);
    }
    for (const auto& extra : config.cleanup_files) {
        files.push_back(extra);
    }
    return files;
}

FrameRelay::FrameRelay(Scheduler& scheduler, DisplaySink& display, std::vector<std::string> temp_files)
    : scheduler_(scheduler), display_(display), temp_files_(std::move(temp_files)) {}

FrameRelay::~FrameRelay() {
    if (timer_) scheduler_.cancel(*timer_);
}

void FrameRelay::start(const std::string& frame_path, Duration cadence, const std::string& color) {
    if (timer_) {
        scheduler_.cancel(*timer_);
        timer_.reset();
    }

    record_ = FrameRecord{frame_path, std::nullopt};
    color_ = color;
    reported_missing_ = false;
    forwarded_ = 0;

    timer_ = scheduler_.schedule_every(cadence, [this]() { tick(); });
    LOG_RELAY("Relaying " + frame_path + " every " + std::to_string(cadence.count()) + "ms");
}

void FrameRelay::stop() {
    if (timer_) {
        scheduler_.cancel(*timer_);
        timer_.reset();
        LOG_RELAY("Stopped after " + std::to_string(forwarded_) + " frames");
    }

    for (const auto& path : temp_files_) {
        std::error_code ec;
        if (fs::remove(path, ec)) {
            LOG_RELAY("Removed " + path);
        } else if (ec) {
            Logger::warn("Failed to remove " + path + ": " + ec.message());
        }
    }
}

void FrameRelay::tick() {
    auto generation = read_frame_generation(record_.path);
    if (!generation) {
        // The worker has not written its first frame yet
        if (!reported_missing_) {
            LOG_RELAY("Waiting for first frame at " + record_.path);
            reported_missing_ = true;
        }
        return;
    }

    if (generation != record_.generation) {
        LOG_RELAY("Frame changed: " + record_.path + " (generation " + std::to_string(*generation) + ")");
        record_.generation = generation;
    }

    // Forward every tick; an unchanged fingerprint does not mean unchanged pixels
    DisplayUpdate update;
    update.image = record_.path;
    update.color = color_;
    update.force_image = true;
    display_.update(update);
    ++forwarded_;
}

} // namespace optidex
