#pragma once

/**
 * @file types.h
 * @brief Core type definitions for the Optidex device controller
 *
 * Fundamental types shared by the turn controller, the worker supervisor
 * and the audio collaborators.
 */

#include <cstdint>
#include <vector>
#include <string>
#include <chrono>
#include <functional>

namespace optidex {

// =============================================================================
// Audio Types
// =============================================================================

/// Raw audio sample (16-bit signed PCM)
using Sample = int16_t;

/// Variable-length audio buffer (a capture, a synthesized sentence)
using AudioBuffer = std::vector<Sample>;

// =============================================================================
// Timing Types
// =============================================================================

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = std::chrono::milliseconds;

inline int64_t ms_since(TimePoint start) {
    return std::chrono::duration_cast<Duration>(Clock::now() - start).count();
}

/// Get current timestamp in milliseconds (for logging and file names)
inline int64_t now_ms() {
    return std::chrono::duration_cast<Duration>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// =============================================================================
// Audio Format Constants
// =============================================================================

namespace audio {
    constexpr int SAMPLE_RATE = 16000;           // whisper's input rate
    constexpr int FRAME_DURATION_MS = 20;        // PortAudio callback period
}

// =============================================================================
// Turn Types
// =============================================================================

/// Monotonically increasing identifier of one listen/recognize/answer cycle
using TurnId = uint64_t;

/// Plain notification with no payload (button edges, capture complete)
using Handler = std::function<void()>;

/// Unit of work posted to the controller's event loop
using Task = std::function<void()>;

} // namespace optidex
