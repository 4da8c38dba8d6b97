#pragma once

/**
 * @file piper_tts.h
 * @brief Piper text-to-speech with sentence-by-sentence playback
 *
 * Features:
 * - Path caching (find piper once)
 * - Phrase caching (LRU) for short repeated phrases such as rep counts
 * - Sentence callback fired as each sentence starts playing
 * - Immediate interruption via stop_playback()
 */

#include "audio_io.h"
#include "collaborators.h"
#include "config.h"
#include <memory>
#include <string>

namespace optidex {
namespace tts {

class PiperTTS : public SpeechSynthesizer {
public:
    PiperTTS(const TTSConfig& config, AudioIO& audio);
    ~PiperTTS() override;

    // Non-copyable
    PiperTTS(const PiperTTS&) = delete;
    PiperTTS& operator=(const PiperTTS&) = delete;

    /**
     * @brief Locate the piper binary and check the voice model
     */
    VoidResult warmup();

    std::shared_future<bool> speak(const std::string& text) override;
    void stop_playback() override;
    void set_sentence_callback(SentenceCallback callback) override;

    /**
     * @brief Synthesize without playing (cached for short phrases)
     * @return Samples at the audio device's sample rate
     */
    Result<AudioBuffer> synth(const std::string& text);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tts
} // namespace optidex
