#pragma once

#include "config.h"
#include "display.h"
#include "scheduler.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace optidex {

/**
 * @brief Last observed state of a frame file
 *
 * Only gates the "frame changed" log; forwarding never depends on it.
 */
struct FrameRecord {
    std::string path;
    std::optional<uint64_t> generation;
};

/**
 * @brief Read a frame's generation: "<frame>.gen" when present, else the file size
 * @return nullopt when the frame does not exist
 */
std::optional<uint64_t> read_frame_generation(const std::string& frame_path);

/**
 * @brief Every temporary file a visual mode may leave behind
 *
 * Frame paths of all kinds, their generation sidecars and the worker state files.
 */
std::vector<std::string> visual_temp_files(const VisualConfig& config);

/**
 * @brief Forwards a worker's frame file to the display at a fixed cadence
 *
 * Runs on the scheduler's thread.
 */
class FrameRelay {
public:
    FrameRelay(Scheduler& scheduler, DisplaySink& display, std::vector<std::string> temp_files);
    ~FrameRelay();

    FrameRelay(const FrameRelay&) = delete;
    FrameRelay& operator=(const FrameRelay&) = delete;

    /**
     * @brief Start ticking; a running relay is retargeted without cleanup
     */
    void start(const std::string& frame_path, Duration cadence, const std::string& color);

    /**
     * @brief Cancel the timer and delete all temporary frame and state files
     */
    void stop();

    bool active() const { return timer_.has_value(); }

    /// Updates sent since start()
    uint64_t frames_forwarded() const { return forwarded_; }

private:
    void tick();

    Scheduler& scheduler_;
    DisplaySink& display_;
    std::vector<std::string> temp_files_;

    std::optional<TimerId> timer_;
    FrameRecord record_;
    std::string color_;
    bool reported_missing_ = false;
    uint64_t forwarded_ = 0;
};

} // namespace optidex
