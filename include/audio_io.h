#pragma once

#include "collaborators.h"
#include "config.h"
#include "core/types.h"
#include <memory>
#include <string>

namespace optidex {

/**
 * @brief Audio I/O manager using PortAudio
 *
 * Records push-to-talk captures into WAV files and plays synthesized
 * speech through a frame queue drained by the output callback.
 *
 * Thread Safety:
 * - PortAudio callbacks run on PortAudio's thread
 * - Each capture is finalized on its own thread, which also runs on_complete
 * - All public methods are safe to call from any thread
 */
class AudioIO : public AudioCapture {
public:
    AudioIO();
    ~AudioIO() override;

    // Non-copyable
    AudioIO(const AudioIO&) = delete;
    AudioIO& operator=(const AudioIO&) = delete;

    /**
     * @brief Open devices and start streams
     * @return True if both streams are running
     */
    bool start(const AudioConfig& config);

    /**
     * @brief Stop all audio I/O and close streams
     */
    void stop();

    VoidResult start_capture(const std::string& path, Handler on_complete) override;
    VoidResult stop_capture() override;

    /**
     * @brief Append audio to the playback queue
     * @param buffer Samples at the stream sample rate
     */
    bool play(const AudioBuffer& buffer);

    /**
     * @brief True when nothing is queued or playing
     */
    bool is_playback_complete() const;

    /**
     * @brief Stop playback immediately and clear queue
     */
    void stop_playback();

    int sample_rate() const;

    /**
     * @brief List all available audio devices
     */
    static void list_devices();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace optidex
