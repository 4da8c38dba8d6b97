#include "agent.h"
#include "assistant.h"
#include "audio_io.h"
#include "camera_arbiter.h"
#include "display.h"
#include "event_loop.h"
#include "frame_relay.h"
#include "handoff_slot.h"
#include "llm_client.h"
#include "logger.h"
#include "notifier.h"
#include "process.h"
#include "stt_engine.h"
#include "tool_registry.h"
#include "tools/mesh_tools.h"
#include "tools/visual_tools.h"
#include "tts/piper_tts.h"
#include "turn_controller.h"
#include "utils.h"
#include "worker_supervisor.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>

namespace optidex {

namespace {

constexpr Duration STOP_POLL_INTERVAL{100};
constexpr std::chrono::seconds LOOP_REPLY_TIMEOUT{2};

void ensure_dir(const std::string& dir) {
    if (dir.empty()) return;
    std::error_code ec;
    std::filesystem::create_directories(utils::expand_path(dir), ec);
    if (ec) {
        Logger::warn("Cannot create directory " + dir + ": " + ec.message());
    }
}

} // namespace

class Application::Impl {
public:
    explicit Impl(const Config& config) : config_(config) {}

    ~Impl() {
        // Background jobs reference everything below; join them first
        if (executor_) executor_->wait_all();
        if (notifier_) notifier_->stop();
        if (display_) display_->stop();
        if (audio_) audio_->stop();
    }

    bool initialize() {
        if (initialized_) {
            return true;
        }

        ensure_dir(config_.audio.recordings_dir);
        ensure_dir(config_.visual.video_dir);
        ensure_dir(config_.camera.image_dir);

        loop_ = std::make_unique<EventLoop>();
        executor_ = std::make_unique<ThreadExecutor>();
        launcher_ = std::make_unique<PosixProcessLauncher>();
        supervisor_ = std::make_unique<WorkerSupervisor>(*loop_, *launcher_,
                                                         Duration(config_.visual.stop_grace_ms),
                                                         Duration(config_.restart_backoff_ms));

        display_ = std::make_unique<SocketDisplay>(config_.display, *loop_);
        relay_ = std::make_unique<FrameRelay>(*loop_, *display_, visual_temp_files(config_.visual));

        // Audio is the one hard requirement
        Logger::info("Initializing audio I/O...");
        Logger::info("  Input device: " + config_.audio.input_device);
        Logger::info("  Output device: " + config_.audio.output_device);
        audio_ = std::make_unique<AudioIO>();
        if (!audio_->start(config_.audio)) {
            Logger::error("Failed to start audio I/O");
            return false;
        }

        stt_ = std::make_unique<STTEngine>(config_.stt);
        if (!stt_->is_ready()) {
            Logger::warn("Speech recognition unavailable; button turns will end without a reply");
        }

        tts_ = std::make_unique<tts::PiperTTS>(config_.tts, *audio_);
        auto warm = tts_->warmup();
        if (warm.is_error()) {
            Logger::warn("TTS not ready: " + warm.error().to_string());
        }

        llm_ = std::make_unique<LLMClient>(config_.llm);

        VisualToolContext tool_ctx{
            config_.visual,
            config_.camera,
            handoff_,
            images_,
            camera_,
            *launcher_,
            [this]() { controller_->request_stop_visual_mode(); }
        };
        register_visual_tools(tools_, tool_ctx);
        if (config_.mesh.enabled) {
            MeshToolContext mesh_ctx{
                config_.mesh,
                *launcher_,
                [this]() { return pause_mesh_monitor(); },
                [this]() { resume_mesh_monitor(); }
            };
            register_mesh_tools(tools_, mesh_ctx);
        }
        std::string tool_list;
        for (const auto& name : tools_.get_tool_names()) {
            tool_list += (tool_list.empty() ? "" : ", ") + name;
        }
        Logger::info("Tools: " + tool_list);

        assistant_ = std::make_unique<LlmAssistant>(
            [this](const std::vector<std::string>& messages, const std::string& tool_defs) {
                return llm_->chat(messages, tool_defs);
            },
            tools_);

        notifier_ = std::make_unique<TelegramNotifier>(config_.telegram);
        notifier_->set_message_handler([this](const std::string& text) {
            loop_->post([this, text]() { controller_->on_recognized_text(text); });
        });

        controller_ = std::make_unique<TurnController>(config_, TurnController::Deps{
            *loop_,
            *executor_,
            *display_,
            *display_,
            *audio_,
            *stt_,
            *assistant_,
            *tts_,
            *notifier_,
            *supervisor_,
            *relay_,
            camera_,
            handoff_,
            images_,
            *llm_
        });

        initialized_ = true;
        Logger::info("Initialization complete");
        return true;
    }

    int run() {
        if (!initialize()) {
            return 1;
        }

        loop_->schedule_every(STOP_POLL_INTERVAL, [this]() {
            if (stop_requested_) {
                Logger::info("Shutting down...");
                loop_->stop();
            }
        });

        loop_->post([this]() {
            start_persistent_workers();
            display_->start();
            notifier_->start();
            controller_->start();
        });

        loop_->run();

        // The loop thread is the controller's thread, so this is still safe
        controller_->shutdown();
        return 0;
    }

    void request_stop() {
        stop_requested_ = true;
    }

private:
    /// Called from tool threads; the supervisor is only touched on the loop
    bool pause_mesh_monitor() {
        auto was_running = std::make_shared<std::promise<bool>>();
        std::future<bool> reply = was_running->get_future();
        loop_->post([this, was_running]() {
            const std::string& name = config_.mesh.monitor_worker;
            bool running = supervisor_->persistent_running(name);
            if (running) supervisor_->stop_persistent(name);
            was_running->set_value(running);
        });
        if (reply.wait_for(LOOP_REPLY_TIMEOUT) != std::future_status::ready) {
            Logger::warn("Mesh monitor state unknown; event loop is not running");
            return false;
        }
        return reply.get();
    }

    void resume_mesh_monitor() {
        loop_->post([this]() {
            for (const auto& worker : config_.persistent_workers) {
                if (worker.name != config_.mesh.monitor_worker) continue;
                auto started = supervisor_->start_persistent(worker.name, LaunchSpec{worker.command, "", worker.args});
                if (started.is_error()) {
                    Logger::error("Mesh monitor not restarted: " + started.error().to_string());
                }
            }
        });
    }

    void start_persistent_workers() {
        if (!config_.display.command.empty()) {
            LaunchSpec spec{config_.display.command, "", config_.display.args};
            auto started = supervisor_->start_persistent("display", spec);
            if (started.is_error()) {
                Logger::error("Display UI not started: " + started.error().to_string());
            }
        }

        for (const auto& worker : config_.persistent_workers) {
            LaunchSpec spec{worker.command, "", worker.args};
            auto started = supervisor_->start_persistent(worker.name, spec);
            if (started.is_error()) {
                Logger::error("Worker " + worker.name + " not started: " + started.error().to_string());
            }
        }
    }

    Config config_;
    bool initialized_ = false;
    std::atomic<bool> stop_requested_{false};

    // Declaration order is teardown order in reverse: the controller goes
    // before its collaborators, the loop last
    CameraArbiter camera_;
    HandoffSlot handoff_;
    ImageSlot images_;
    ToolRegistry tools_;

    std::unique_ptr<EventLoop> loop_;
    std::unique_ptr<PosixProcessLauncher> launcher_;
    std::unique_ptr<WorkerSupervisor> supervisor_;
    std::unique_ptr<SocketDisplay> display_;
    std::unique_ptr<FrameRelay> relay_;
    std::unique_ptr<AudioIO> audio_;
    std::unique_ptr<STTEngine> stt_;
    std::unique_ptr<tts::PiperTTS> tts_;
    std::unique_ptr<LLMClient> llm_;
    std::unique_ptr<LlmAssistant> assistant_;
    std::unique_ptr<TelegramNotifier> notifier_;
    std::unique_ptr<TurnController> controller_;
    std::unique_ptr<ThreadExecutor> executor_;
};

Application::Application(const Config& config)
    : pimpl_(std::make_unique<Impl>(config)) {}

Application::~Application() = default;

bool Application::initialize() {
    return pimpl_->initialize();
}

int Application::run() {
    return pimpl_->run();
}

void Application::request_stop() {
    pimpl_->request_stop();
}

} // namespace optidex
