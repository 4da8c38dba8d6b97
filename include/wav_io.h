#pragma once

#include "core/types.h"
#include "errors.h"
#include <string>

namespace optidex {

/**
 * @brief Decoded PCM WAV contents, always mono
 */
struct WavData {
    AudioBuffer samples;
    int sample_rate = audio::SAMPLE_RATE;
};

/**
 * @brief Write 16-bit mono PCM WAV
 */
VoidResult write_wav(const std::string& path, const AudioBuffer& samples, int sample_rate);

/**
 * @brief Read a 16-bit PCM WAV file
 *
 * Walks the chunk list instead of assuming a 44-byte header, so files with
 * LIST or fact chunks (as written by piper and sox) decode. Stereo is
 * downmixed by taking the left channel.
 */
Result<WavData> read_wav(const std::string& path);

/**
 * @brief Linear-interpolation resample
 */
AudioBuffer resample(const AudioBuffer& input, int from_rate, int to_rate);

} // namespace optidex
