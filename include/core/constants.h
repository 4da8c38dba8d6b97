#pragma once

/**
 * @file constants.h
 * @brief System-wide constants and tuning parameters
 *
 * Defaults for everything the config file can override, plus the fixed
 * wire-level values shared with the display process and the workers.
 */

#include <cstddef>

namespace optidex {
namespace constants {

// =============================================================================
// Worker Lifecycle
// =============================================================================

namespace worker {
    /// Time a worker gets to exit after SIGTERM before SIGKILL (ms)
    constexpr int STOP_GRACE_MS = 1000;

    /// Delay between a visual worker's exit and mode teardown, so the last frame stays visible (ms)
    constexpr int EXIT_GRACE_MS = 1000;

    /// Longer exit grace for video playback (ms)
    constexpr int PLAYBACK_EXIT_GRACE_MS = 3000;

    /// Backoff before a persistent worker that crashed is restarted (ms)
    constexpr int RESTART_BACKOFF_MS = 5000;

    /// Longest stdout/stderr line kept by the reader; longer lines are truncated
    constexpr size_t MAX_LINE_BYTES = 64 * 1024;
}

// =============================================================================
// Frame Relay
// =============================================================================

namespace relay {
    /// Tick interval for video playback, ~33 fps (ms)
    constexpr int PLAYBACK_CADENCE_MS = 30;

    /// Tick interval for camera previews (detection, recording, pose, observer, sentry) (ms)
    constexpr int PREVIEW_CADENCE_MS = 100;

    /// Suffix of the generation-counter sidecar written next to each frame
    constexpr const char* GENERATION_SUFFIX = ".gen";
}

// =============================================================================
// Display
// =============================================================================

namespace display {
    constexpr const char* DEFAULT_HOST = "127.0.0.1";
    constexpr int DEFAULT_PORT = 12345;

    /// Connection attempts before the display client gives up
    constexpr int CONNECT_RETRIES = 15;

    /// Delay between connection attempts (ms)
    constexpr int CONNECT_RETRY_MS = 5000;

    constexpr const char* IDLE_COLOR = "#000055";
    constexpr const char* LISTENING_COLOR = "#00ff00";
    constexpr const char* RELEASED_COLOR = "#ff6800";
    constexpr const char* ANSWER_COLOR = "#00c8a3";

    constexpr const char* DETECTION_COLOR = "#00FFFF";
    constexpr const char* RECORDING_COLOR = "#FF0000";
    constexpr const char* PLAYBACK_COLOR = "#0000FF";
    constexpr const char* POSE_COLOR = "#FF00FF";
}

// =============================================================================
// Tools
// =============================================================================

namespace tools {
    /// Recording and detection duration bounds (seconds)
    constexpr int MIN_DURATION_S = 1;
    constexpr int MAX_DURATION_S = 300;

    /// Largest rep goal accepted for exercise counting
    constexpr int MAX_REP_GOAL = 1000;

    /// Maximum LLM round trips with tool calls in one turn
    constexpr int MAX_TOOL_ROUNDS = 3;
}

// =============================================================================
// Conversation Memory
// =============================================================================

namespace memory {
    /// Messages kept in the assistant's rolling history
    constexpr size_t MAX_HISTORY_MESSAGES = 12;
}

// =============================================================================
// Speech
// =============================================================================

namespace tts {
    /// Maximum synthesized phrases kept in the cache
    constexpr size_t MAX_CACHE_ENTRIES = 32;

    /// Only phrases up to this length are cached (rep counts, short acks)
    constexpr size_t MAX_CACHE_TEXT_LENGTH = 48;

    /// Poll interval while waiting for the output queue to drain (ms)
    constexpr int PLAYBACK_POLL_MS = 20;
}

// =============================================================================
// Notification
// =============================================================================

namespace notify {
    constexpr const char* TELEGRAM_API = "https://api.telegram.org/bot";

    /// Request timeout for outgoing messages (ms)
    constexpr long SEND_TIMEOUT_MS = 30000;

    /// Long-poll timeout for getUpdates (s)
    constexpr int POLL_TIMEOUT_S = 25;
}

} // namespace constants
} // namespace optidex
