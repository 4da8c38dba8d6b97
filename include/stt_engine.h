#pragma once

#include "collaborators.h"
#include "config.h"
#include "core/types.h"
#include <memory>
#include <optional>
#include <string>

namespace optidex {

/**
 * @brief Whisper speech-to-text over recorded WAV files
 *
 * The model is loaded once at construction. recognize() serializes on an
 * internal mutex since a whisper context is not reentrant.
 */
class STTEngine : public Recognizer {
public:
    explicit STTEngine(const STTConfig& config);
    ~STTEngine() override;

    // Non-copyable
    STTEngine(const STTEngine&) = delete;
    STTEngine& operator=(const STTEngine&) = delete;

    std::optional<std::string> recognize(const std::string& audio_path) override;

    /// Transcribe 16 kHz mono samples; empty string when nothing was heard
    std::string transcribe(const AudioBuffer& segment);

    bool is_ready() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace optidex
