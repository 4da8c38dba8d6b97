#pragma once

#include "camera_arbiter.h"
#include "collaborators.h"
#include "config.h"
#include "display.h"
#include "frame_relay.h"
#include "handoff_slot.h"
#include "notifier.h"
#include "scheduler.h"
#include "visual_mode.h"
#include "worker_supervisor.h"
#include <memory>
#include <optional>
#include <string>

namespace optidex {

/**
 * @brief Conversation and visual-mode states
 */
enum class TurnState {
    Sleep,
    Listening,
    Recognizing,
    Answering,
    VisualActive,   ///< See visual_kind()
    ImageDisplay
};

const char* turn_state_name(TurnState state);

/**
 * @brief Top-level state machine for the device
 *
 * Owns what is on screen, which visual worker runs, and when a deferred
 * visual mode may start (only after the same turn's speech has played).
 * Every method except request_stop_visual_mode() must be called on the
 * scheduler's thread; collaborator completions are posted back to it and
 * tagged with the turn id they were issued under, so completions of a
 * cancelled turn are dropped.
 *
 * All referenced collaborators must outlive the controller.
 */
class TurnController {
public:
    struct Deps {
        Scheduler& scheduler;
        BackgroundExecutor& executor;
        DisplaySink& display;
        ButtonInput& buttons;
        AudioCapture& capture;
        Recognizer& recognizer;
        Assistant& assistant;
        SpeechSynthesizer& speech;
        Notifier& notifier;
        WorkerSupervisor& supervisor;
        FrameRelay& relay;
        CameraArbiter& camera;
        HandoffSlot& handoff;
        ImageSlot& images;
        ImageAnalyzer& analyzer;
    };

    TurnController(const Config& config, Deps deps);
    ~TurnController();

    TurnController(const TurnController&) = delete;
    TurnController& operator=(const TurnController&) = delete;

    /**
     * @brief Register collaborator callbacks and enter Sleep
     */
    void start();

    /**
     * @brief Text recognized outside the microphone path (chat message)
     *
     * Interrupts whatever is running and answers the text.
     */
    void on_recognized_text(const std::string& text);

    /**
     * @brief End the active or pending visual mode (thread-safe)
     */
    void request_stop_visual_mode();

    /**
     * @brief Stop speech, workers and capture (shutdown)
     */
    void shutdown();

    TurnState state() const;

    /// Kind of the active visual mode; set only in VisualActive
    std::optional<VisualKind> visual_kind() const;

    TurnId turn_id() const;

    /// Worker backing the active visual mode
    std::optional<WorkerHandle> active_worker() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace optidex
