#pragma once

#include "core/types.h"
#include "errors.h"
#include <functional>
#include <future>
#include <optional>
#include <string>

namespace optidex {

/**
 * @brief Text-to-speech with playback
 *
 * Implementations synthesize and play on their own threads.
 */
class SpeechSynthesizer {
public:
    using SentenceCallback = std::function<void(const std::string&)>;

    virtual ~SpeechSynthesizer() = default;

    /**
     * @brief Speak text
     * @return Future that becomes ready when playback finishes; false on
     *         failure or when interrupted by stop_playback()
     */
    virtual std::shared_future<bool> speak(const std::string& text) = 0;

    /// Cut off current and queued speech
    virtual void stop_playback() = 0;

    /// Called (on the speech thread) just before each sentence plays
    virtual void set_sentence_callback(SentenceCallback callback) = 0;
};

/**
 * @brief Speech-to-text
 */
class Recognizer {
public:
    virtual ~Recognizer() = default;

    /// Blocking. nullopt when nothing intelligible was heard or on failure.
    virtual std::optional<std::string> recognize(const std::string& audio_path) = 0;
};

/**
 * @brief Conversational reply generation (LLM plus tools)
 *
 * Tools may populate the handoff slot or the image slot as a side effect
 * before respond() returns.
 */
class Assistant {
public:
    virtual ~Assistant() = default;

    /// Blocking. Tool side effects are stamped with turn.
    virtual Result<std::string> respond(const std::string& user_text, TurnId turn) = 0;
};

/**
 * @brief Answers a question about a still image with a vision model
 */
class ImageAnalyzer {
public:
    virtual ~ImageAnalyzer() = default;

    /// Blocking
    virtual Result<std::string> analyze(const std::string& image_path, const std::string& prompt) = 0;
};

/**
 * @brief Microphone capture into a WAV file
 */
class AudioCapture {
public:
    virtual ~AudioCapture() = default;

    /**
     * @brief Begin recording to path
     * @param on_complete Called (on the capture thread) once the file is
     *        finalized, whether stopped explicitly or by the length limit
     */
    virtual VoidResult start_capture(const std::string& path, Handler on_complete) = 0;

    /// Finish recording; the WAV file is complete when this returns
    virtual VoidResult stop_capture() = 0;
};

} // namespace optidex
