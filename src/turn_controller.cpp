#include "turn_controller.h"
#include "core/constants.h"
#include "logger.h"
#include "utils.h"
#include <filesystem>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

namespace optidex {

const char* turn_state_name(TurnState state) {
    switch (state) {
        case TurnState::Sleep: return "Sleep";
        case TurnState::Listening: return "Listening";
        case TurnState::Recognizing: return "Recognizing";
        case TurnState::Answering: return "Answering";
        case TurnState::VisualActive: return "VisualActive";
        case TurnState::ImageDisplay: return "ImageDisplay";
    }
    return "Unknown";
}

namespace {

bool file_exists(const std::string& path) {
    std::error_code ec;
    return !path.empty() && fs::exists(path, ec);
}

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::ostringstream oss;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) oss << separator;
        oss << items[i];
    }
    return oss.str();
}

void noop() {}

} // namespace

class TurnController::Impl {
public:
    /// The running visual mode and the worker behind it
    struct ActiveMode {
        VisualModeRequest request;
        WorkerHandle handle;
        bool worker_exited = false;
    };

    Impl(const Config& config, Deps deps)
        : config_(config), deps_(deps) {}

    // =========================================================================
    // Setup
    // =========================================================================

    void start() {
        deps_.supervisor.set_event_handler([this](const WorkerHandle& handle, const WorkerEvent& event) {
            on_worker_event(handle, event);
        });
        deps_.supervisor.set_exit_handler([this](const WorkerHandle& handle, ExitStatus status) {
            on_worker_exit(handle, status);
        });
        deps_.speech.set_sentence_callback([this](const std::string& sentence) {
            deps_.scheduler.post([this, sentence]() { on_sentence(sentence); });
        });
        enter_sleep();
    }

    void shutdown() {
        hard_cancel();
        deps_.supervisor.stop_all();
    }

    // =========================================================================
    // States
    // =========================================================================

    void set_state(TurnState next) {
        if (next != state_) {
            LOG_FSM(std::string("switch to: ") + turn_state_name(next) + " (turn " + std::to_string(turn_id_) + ")");
        }
        state_ = next;
    }

    void arm_buttons(Handler pressed, Handler released) {
        deps_.buttons.on_pressed(std::move(pressed));
        deps_.buttons.on_released(std::move(released));
    }

    void enter_sleep() {
        bool from_listening = state_ == TurnState::Listening || state_ == TurnState::Recognizing;
        set_state(TurnState::Sleep);
        arm_buttons([this]() { interrupt(); }, noop);

        if (!active_) {
            DisplayUpdate update;
            update.status = "idle";
            update.emoji = "😴";
            update.color = constants::display::IDLE_COLOR;
            if (from_listening) update.text = "Press the button to start";
            deps_.display.update(update);
        }
    }

    void enter_listening() {
        set_state(TurnState::Listening);
        TurnId turn = ++turn_id_;

        std::string path = config_.audio.recordings_dir + "/user-" + std::to_string(now_ms()) + ".wav";
        record_path_ = path;

        arm_buttons(noop, [this, turn]() {
            if (turn != turn_id_ || !capturing_) return;
            DisplayUpdate update;
            update.color = constants::display::RELEASED_COLOR;
            deps_.display.update(update);
            stop_capture();
        });

        DisplayUpdate update;
        update.status = "listening";
        update.emoji = "😐";
        update.color = constants::display::LISTENING_COLOR;
        update.text = "Listening...";
        deps_.display.update(update);

        auto started = deps_.capture.start_capture(path, [this, turn]() {
            deps_.scheduler.post([this, turn]() { on_capture_complete(turn); });
        });
        if (started.is_error()) {
            Logger::error("Audio capture failed to start: " + started.error().message);
            enter_sleep();
            return;
        }
        capturing_ = true;
        LOG_TRACE(turn, "capture", "path=" + path);
    }

    void enter_recognizing() {
        set_state(TurnState::Recognizing);
        TurnId turn = ++turn_id_;

        // Barge-in: a press abandons recognition and listens again
        arm_buttons([this]() { interrupt(); }, noop);

        DisplayUpdate update;
        update.status = "recognizing";
        deps_.display.update(update);

        std::string path = record_path_;
        deps_.executor.submit([this, turn, path]() {
            std::optional<std::string> text = deps_.recognizer.recognize(path);
            deps_.scheduler.post([this, turn, text]() { on_recognition_result(turn, text); });
        });
    }

    void enter_answering(const std::string& text) {
        set_state(TurnState::Answering);
        TurnId turn = ++turn_id_;

        user_text_ = text;
        answer_.clear();
        spoken_sentences_.clear();

        arm_buttons([this]() { interrupt(); }, noop);

        DisplayUpdate update;
        update.color = constants::display::ANSWER_COLOR;
        deps_.display.update(update);

        LOG_TRACE(turn, "answer", "text=" + text);
        deps_.executor.submit([this, turn, text]() {
            Result<std::string> reply = deps_.assistant.respond(text, turn);
            deps_.scheduler.post([this, turn, reply]() { on_reply(turn, reply); });
        });
    }

    void enter_image_display(const std::string& image_path) {
        set_state(TurnState::ImageDisplay);

        DisplayUpdate update;
        update.image = image_path;
        deps_.display.update(update);

        arm_buttons([this]() { interrupt(); }, noop);
    }

    // =========================================================================
    // Completions (each carries the turn it was issued under)
    // =========================================================================

    bool is_stale(TurnId turn, const char* what) const {
        if (turn == turn_id_) return false;
        Logger::debug(make_stale_error(what, turn, turn_id_).to_string());
        return true;
    }

    void on_capture_complete(TurnId turn) {
        if (is_stale(turn, "capture")) return;
        capturing_ = false;
        enter_recognizing();
    }

    void on_recognition_result(TurnId turn, const std::optional<std::string>& text) {
        if (is_stale(turn, "recognition")) return;

        if (!text || utils::is_empty_or_whitespace(*text)) {
            LOG_FSM("Nothing recognized");
            enter_sleep();
            return;
        }
        accept_text(utils::trim_copy(*text));
    }

    void accept_text(const std::string& text) {
        LOG_FSM("Recognized: " + text);
        if (!active_) {
            DisplayUpdate update;
            update.status = "recognizing";
            update.text = text;
            deps_.display.update(update);
        }
        enter_answering(text);
    }

    void on_reply(TurnId turn, const Result<std::string>& reply) {
        if (is_stale(turn, "reply")) return;

        if (reply.is_error()) {
            Logger::error("Assistant failed: " + reply.error().to_string());
            discard_pending();
            enter_sleep();
            return;
        }

        answer_ = reply.value();
        if (utils::is_empty_or_whitespace(answer_)) {
            // Nothing to say, but a tool may still have queued a visual mode
            on_playback_completed(turn, true);
            return;
        }

        std::shared_future<bool> playback = deps_.speech.speak(answer_);
        deps_.executor.submit([this, turn, playback]() {
            bool ok = playback.get();
            deps_.scheduler.post([this, turn, ok]() { on_playback_completed(turn, ok); });
        });
    }

    void on_sentence(const std::string& sentence) {
        if (state_ != TurnState::Answering) return;
        // Spoken text must not cover a live feed that is running or about to start
        if (visual_active_or_pending()) return;

        spoken_sentences_.push_back(sentence);
        DisplayUpdate update;
        update.status = "answering";
        update.emoji = "😊";
        update.text = join(spoken_sentences_, " ");
        deps_.display.update(update);
    }

    void on_playback_completed(TurnId turn, bool ok) {
        if (is_stale(turn, "playback")) return;

        if (!ok) {
            Logger::warn("Speech playback failed");
            discard_pending();
            enter_sleep();
            return;
        }

        if (!user_text_.empty() && !answer_.empty()) {
            deps_.notifier.send_text("User: " + user_text_ + "\n\nOptidex: " + answer_);
        }

        // Anything a cancelled turn's tools left behind is dropped here
        if (auto request = deps_.handoff.take_for_turn(turn)) {
            deps_.images.take_and_clear();
            begin_activation(std::move(*request), turn);
        } else if (auto image = deps_.images.take_for_turn(turn, "image")) {
            enter_image_display(*image);
        } else {
            enter_sleep();
        }
    }

    // =========================================================================
    // Visual modes
    // =========================================================================

    bool visual_active_or_pending() const {
        return active_.has_value() || activating_.has_value() || deps_.handoff.has_pending_for(turn_id_);
    }

    void begin_activation(VisualModeRequest request, TurnId turn) {
        LOG_FSM(std::string("Activating ") + visual_kind_name(kind_of(request)) + " after speech");
        activating_ = std::move(request);
        attempt_activation(turn, 0);
    }

    void attempt_activation(TurnId turn, int attempt) {
        if (turn != turn_id_ || !activating_) return;

        VisualKind kind = kind_of(*activating_);
        std::optional<CameraLease> lease;
        if (uses_camera(kind)) {
            auto acquired = deps_.camera.try_acquire();
            if (acquired.is_error()) {
                if (attempt < config_.visual.camera_busy_retries) {
                    LOG_CAMERA("Busy, retrying " + std::string(visual_kind_name(kind)) + " activation");
                    activation_timer_ = deps_.scheduler.schedule_after(
                        Duration(config_.visual.camera_busy_retry_ms),
                        [this, turn, attempt]() {
                            activation_timer_.reset();
                            attempt_activation(turn, attempt + 1);
                        });
                    return;
                }
                Logger::error(std::string("Cannot start ") + visual_kind_name(kind) + ": " +
                              acquired.error().to_string());
                activating_.reset();
                enter_sleep();
                return;
            }
            lease.emplace(std::move(acquired.value()));
        }

        VisualModeRequest request = std::move(*activating_);
        activating_.reset();

        auto spawned = deps_.supervisor.spawn(kind, launch_of(request));
        if (spawned.is_error()) {
            Logger::error(std::string("Visual mode ") + visual_kind_name(kind) + " failed: " +
                          spawned.error().to_string());
            enter_sleep();
            return;
        }

        const WorkerHandle& handle = spawned.value();
        // The worker keeps the camera until its exit is observed
        if (lease) camera_leases_.emplace(handle.id, std::move(*lease));

        const VisualModeConfig& mode = mode_config(config_.visual, kind);

        DisplayUpdate clear;
        clear.status = "";
        clear.emoji = "";
        clear.text = "";
        clear.image = "";
        clear.color = mode.color;
        deps_.display.update(clear);

        active_ = ActiveMode{std::move(request), handle, false};
        set_state(TurnState::VisualActive);
        deps_.relay.start(frame_path_of(active_->request), Duration(mode.cadence_ms), mode.color);

        arm_buttons([this]() { interrupt(); }, noop);
        LOG_FSM(std::string("Visual mode active: ") + visual_kind_name(kind) +
                " (worker " + std::to_string(handle.id) + ")");
    }

    void on_worker_exit(const WorkerHandle& handle, ExitStatus status) {
        camera_leases_.erase(handle.id);

        if (!active_ || active_->handle.id != handle.id) return;
        active_->worker_exited = true;

        VisualKind kind = *handle.kind;
        if (kind == VisualKind::Recording) {
            const auto& recording = std::get<RecordingRequest>(active_->request);
            if (file_exists(recording.video_path)) {
                LOG_FSM("Video recorded: " + recording.video_path);
                deps_.notifier.send_video(recording.video_path);
            } else {
                Logger::warn("Video file was not created: " + recording.video_path);
            }
        }

        // Leave the last frame up briefly before tearing down
        int grace_ms = mode_config(config_.visual, kind).exit_grace_ms;
        LOG_FSM(std::string(visual_kind_name(kind)) + " worker finished (" + status.describe() +
                "), returning to sleep in " + std::to_string(grace_ms) + "ms");
        WorkerId id = handle.id;
        teardown_timer_ = deps_.scheduler.schedule_after(Duration(grace_ms), [this, id]() {
            teardown_timer_.reset();
            if (!active_ || active_->handle.id != id) return;
            teardown_visual();
            enter_sleep();
        });
    }

    void teardown_visual() {
        if (teardown_timer_) {
            deps_.scheduler.cancel(*teardown_timer_);
            teardown_timer_.reset();
        }
        bool was_active = active_.has_value();
        if (active_) {
            deps_.supervisor.stop(active_->handle);
            active_.reset();
        }
        deps_.relay.stop();

        if (was_active) {
            DisplayUpdate update;
            update.status = "idle";
            update.emoji = "✅";
            update.text = "Visual mode stopped";
            update.image = "";
            update.color = constants::display::ANSWER_COLOR;
            deps_.display.update(update);
        }
    }

    void cancel_activation() {
        if (activation_timer_) {
            deps_.scheduler.cancel(*activation_timer_);
            activation_timer_.reset();
        }
        activating_.reset();
    }

    void request_stop_visual_mode() {
        if (!active_ && !activating_ && !deps_.handoff.has_pending()) return;
        LOG_FSM("Visual mode stop requested");
        bool was_visual = state_ == TurnState::VisualActive;
        cancel_activation();
        deps_.handoff.take_and_clear();
        teardown_visual();
        if (was_visual) enter_sleep();
    }

    // =========================================================================
    // Worker events
    // =========================================================================

    void announce(const std::string& spoken, const std::string& icon, const std::string& image_path) {
        deps_.speech.speak(spoken);
        deps_.notifier.send_text(icon + " " + spoken);
        if (file_exists(image_path)) deps_.notifier.send_photo(image_path);
    }

    /// Vision analysis runs off the loop; the result goes to the notifier only
    void analyze_snapshot(const std::string& image_path, const std::string& prompt) {
        LOG_FSM("Analyzing " + image_path);
        deps_.executor.submit([this, image_path, prompt]() {
            Result<std::string> analysis = deps_.analyzer.analyze(image_path, prompt);
            deps_.scheduler.post([this, analysis]() {
                if (analysis.is_error()) {
                    Logger::error("Image analysis failed: " + analysis.error().to_string());
                    deps_.notifier.send_text("Error analyzing image: " + analysis.error().message);
                    return;
                }
                deps_.notifier.send_text("🧠 Analysis: " + analysis.value());
            });
        });
    }

    void on_worker_event(const WorkerHandle& handle, const WorkerEvent& event) {
        if (auto mesh = std::get_if<MeshMessage>(&event)) {
            LOG_FSM("Mesh message from " + mesh->from + ": " + mesh->text);
            deps_.notifier.send_text("📡 Mesh message from " + mesh->from + ": " + mesh->text);
            return;
        }

        if (!active_ || active_->handle.id != handle.id) {
            LOG_DEBUG(std::string("Ignoring ") + worker_event_name(event) + " from inactive worker " + handle.name);
            return;
        }

        std::string pose_action = "rep";
        if (auto pose = std::get_if<PoseRequest>(&active_->request)) pose_action = pose->action;

        std::visit(utils::overloaded{
            [&](const ObjectTriggered& e) {
                announce("Detected " + join(e.objects, ", ") + "! (" + std::to_string(e.count) + " total)",
                         "👀", e.image_path);
                auto observer = std::get_if<ObserverRequest>(&active_->request);
                if (observer && !observer->prompt.empty() && file_exists(e.image_path)) {
                    analyze_snapshot(e.image_path, observer->prompt);
                }
            },
            [&](const InteractionTriggered& e) {
                announce("Alert! " + e.object1 + " interacting with " + e.object2 + "! (" +
                         std::to_string(e.count) + " total)", "⚠️", e.image_path);
            },
            [&](const PoseDetected& e) {
                announce("I detected someone " + e.action + "!", "👋", e.image_path);
            },
            [&](const GoalReached& e) {
                announce("Great job! You completed " + std::to_string(e.reps) + " " + pose_action + "s!",
                         "🎉", "");
            },
            [&](const RepProgress& e) {
                LOG_FSM("Rep " + std::to_string(e.reps) + (e.goal ? "/" + std::to_string(*e.goal) : ""));
                deps_.speech.speak(std::to_string(e.reps));
            },
            [&](const AudioCue& e) {
                deps_.speech.speak(e.text);
            },
            [&](const VideoSaved& e) {
                std::string message = e.reps
                    ? "Your " + (e.action.empty() ? pose_action : e.action) + " workout video with " +
                      std::to_string(*e.reps) + " reps has been saved!"
                    : "Monitoring video saved!";
                deps_.notifier.send_text("🎬 " + message);
                if (file_exists(e.video_path)) deps_.notifier.send_video(e.video_path);
            },
            [&](const MeshMessage&) {},
        }, event);
    }

    // =========================================================================
    // Cancellation
    // =========================================================================

    void stop_capture() {
        if (!capturing_) return;
        capturing_ = false;
        auto stopped = deps_.capture.stop_capture();
        if (stopped.is_error()) {
            Logger::error("Audio capture failed to stop: " + stopped.error().message);
        }
    }

    void discard_pending() {
        if (deps_.handoff.take_and_clear()) LOG_FSM("Dropped queued visual mode");
        deps_.images.take_and_clear();
    }

    /// Stop everything the current state started
    void hard_cancel() {
        if (state_ == TurnState::ImageDisplay) {
            DisplayUpdate clear;
            clear.image = "";
            deps_.display.update(clear);
        }
        deps_.speech.stop_playback();
        if (capturing_) {
            // The completion this triggers is stale once the turn id moves
            stop_capture();
        }
        cancel_activation();
        teardown_visual();
        discard_pending();
    }

    /// Button press: cancel and listen
    void interrupt() {
        hard_cancel();
        enter_listening();
    }

    void on_recognized_text(const std::string& text) {
        if (utils::is_empty_or_whitespace(text)) return;
        LOG_FSM("External text: " + text);
        hard_cancel();
        // Same turn bookkeeping as Listening without opening the microphone
        set_state(TurnState::Listening);
        ++turn_id_;
        accept_text(utils::trim_copy(text));
    }

    Config config_;
    Deps deps_;

    TurnState state_ = TurnState::Sleep;
    TurnId turn_id_ = 0;

    bool capturing_ = false;
    std::string record_path_;
    std::string user_text_;
    std::string answer_;
    std::vector<std::string> spoken_sentences_;

    std::optional<ActiveMode> active_;
    std::optional<VisualModeRequest> activating_;
    std::optional<TimerId> activation_timer_;
    std::optional<TimerId> teardown_timer_;
    std::map<WorkerId, CameraLease> camera_leases_;
};

TurnController::TurnController(const Config& config, Deps deps)
    : pimpl_(std::make_unique<Impl>(config, deps)) {}

TurnController::~TurnController() = default;

void TurnController::start() {
    pimpl_->start();
}

void TurnController::on_recognized_text(const std::string& text) {
    pimpl_->on_recognized_text(text);
}

void TurnController::request_stop_visual_mode() {
    Impl* impl = pimpl_.get();
    pimpl_->deps_.scheduler.post([impl]() { impl->request_stop_visual_mode(); });
}

void TurnController::shutdown() {
    pimpl_->shutdown();
}

TurnState TurnController::state() const {
    return pimpl_->state_;
}

std::optional<VisualKind> TurnController::visual_kind() const {
    if (pimpl_->state_ != TurnState::VisualActive || !pimpl_->active_) return std::nullopt;
    return kind_of(pimpl_->active_->request);
}

TurnId TurnController::turn_id() const {
    return pimpl_->turn_id_;
}

std::optional<WorkerHandle> TurnController::active_worker() const {
    if (!pimpl_->active_) return std::nullopt;
    return pimpl_->active_->handle;
}

} // namespace optidex
