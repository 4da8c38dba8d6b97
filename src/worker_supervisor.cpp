#include "worker_supervisor.h"
#include "logger.h"
#include <map>

namespace optidex {

const char* worker_status_name(WorkerStatus status) {
    switch (status) {
        case WorkerStatus::Starting: return "Starting";
        case WorkerStatus::Running: return "Running";
        case WorkerStatus::StopRequested: return "StopRequested";
        case WorkerStatus::Stopping: return "Stopping";
        case WorkerStatus::Stopped: return "Stopped";
    }
    return "Unknown";
}

class WorkerSupervisor::Impl : public std::enable_shared_from_this<WorkerSupervisor::Impl> {
public:
    struct WorkerRecord {
        WorkerHandle handle;
        WorkerStatus status = WorkerStatus::Starting;
        std::shared_ptr<Process> process;
        std::optional<TimerId> deadline;
        std::string persistent_name;   ///< Empty for visual workers
    };

    struct PersistentEntry {
        LaunchSpec spec;
        std::optional<WorkerId> worker;
        std::optional<TimerId> restart_timer;
        bool deliberate_stop = false;
    };

    Impl(Scheduler& scheduler, ProcessLauncher& launcher, Duration stop_grace, Duration restart_backoff)
        : scheduler_(scheduler)
        , launcher_(launcher)
        , stop_grace_(stop_grace)
        , restart_backoff_(restart_backoff) {}

    ~Impl() {
        shutdown();
    }

    // =========================================================================
    // Launch
    // =========================================================================

    Result<WorkerHandle> launch(const std::string& name,
                                std::optional<VisualKind> kind,
                                const std::string& persistent_name,
                                const LaunchSpec& spec) {
        WorkerId id = next_id_++;

        WorkerRecord record;
        record.handle.id = id;
        record.handle.name = name;
        record.handle.kind = kind;
        record.handle.started_at = scheduler_.now();
        record.status = WorkerStatus::Starting;
        record.persistent_name = persistent_name;

        auto launched = launcher_.launch(spec, make_callbacks(id));
        if (launched.is_error()) {
            Logger::error("Failed to start worker " + name + ": " + launched.error().message);
            return launched.error();
        }

        // exec succeeded, so the process is alive
        record.process = launched.value();
        record.handle.pid = record.process->pid();
        record.status = WorkerStatus::Running;

        WorkerHandle handle = record.handle;
        records_[id] = std::move(record);
        LOG_WORKER(name + " worker running (id " + std::to_string(id) + ", PID " +
                   std::to_string(handle.pid) + ")");
        return handle;
    }

    ProcessCallbacks make_callbacks(WorkerId id) {
        std::weak_ptr<Impl> weak = shared_from_this();
        Scheduler* scheduler = &scheduler_;

        ProcessCallbacks callbacks;
        callbacks.on_stdout_line = [weak, scheduler, id](const std::string& line) {
            scheduler->post([weak, id, line]() {
                if (auto self = weak.lock()) self->handle_line(id, line, false);
            });
        };
        callbacks.on_stderr_line = [weak, scheduler, id](const std::string& line) {
            scheduler->post([weak, id, line]() {
                if (auto self = weak.lock()) self->handle_line(id, line, true);
            });
        };
        callbacks.on_exit = [weak, scheduler, id](ExitStatus status) {
            scheduler->post([weak, id, status]() {
                if (auto self = weak.lock()) self->handle_exit(id, status);
            });
        };
        return callbacks;
    }

    // =========================================================================
    // Stop and escalation
    // =========================================================================

    void stop(WorkerId id) {
        auto it = records_.find(id);
        if (it == records_.end()) return;

        WorkerRecord& record = it->second;
        if (record.status != WorkerStatus::Starting && record.status != WorkerStatus::Running) {
            return;
        }

        LOG_WORKER("Stopping " + record.handle.name + " worker (PID " + std::to_string(record.handle.pid) + ")");
        record.process->terminate();
        record.status = WorkerStatus::StopRequested;

        std::weak_ptr<Impl> weak = shared_from_this();
        record.deadline = scheduler_.schedule_after(stop_grace_, [weak, id]() {
            if (auto self = weak.lock()) self->escalate(id);
        });

        if (active_visual_ == id) active_visual_.reset();
    }

    void escalate(WorkerId id) {
        auto it = records_.find(id);
        if (it == records_.end()) return;

        WorkerRecord& record = it->second;
        record.deadline.reset();
        if (record.status != WorkerStatus::StopRequested) return;

        const Error timeout(ErrorType::WorkerTimeout,
                            record.handle.name + " worker ignored SIGTERM for " +
                            std::to_string(stop_grace_.count()) + "ms, sending SIGKILL");
        Logger::warn(timeout.to_string());
        record.process->kill();
        record.status = WorkerStatus::Stopping;
    }

    // =========================================================================
    // Notifications (run on the scheduler thread)
    // =========================================================================

    void handle_line(WorkerId id, const std::string& line, bool from_stderr) {
        auto it = records_.find(id);
        std::string name = it != records_.end() ? it->second.handle.name : "worker";

        auto parsed = parse_event_line(line);
        if (!parsed) {
            LOG_DEBUG("[" + name + (from_stderr ? ":err] " : "] ") + line);
            return;
        }
        if (parsed->is_error()) {
            Logger::warn("[" + name + "] " + parsed->error().to_string());
            return;
        }
        if (it == records_.end()) return;

        const WorkerEvent& event = parsed->value();
        LOG_WORKER(name + " event: " + worker_event_name(event));
        if (event_handler_) {
            WorkerHandle handle = it->second.handle;
            try {
                event_handler_(handle, event);
            } catch (const std::exception& e) {
                Logger::error("Worker event handler failed: " + std::string(e.what()));
            }
        }
    }

    void handle_exit(WorkerId id, ExitStatus status) {
        auto it = records_.find(id);
        if (it == records_.end()) return;

        WorkerRecord record = std::move(it->second);
        records_.erase(it);

        if (record.deadline) scheduler_.cancel(*record.deadline);
        if (active_visual_ == id) active_visual_.reset();

        LOG_WORKER(record.handle.name + " worker exited (" + status.describe() + ", was " +
                   worker_status_name(record.status) + ")");

        if (!record.persistent_name.empty()) {
            handle_persistent_exit(record.persistent_name, id, status);
            return;
        }

        if (exit_handler_) {
            try {
                exit_handler_(record.handle, status);
            } catch (const std::exception& e) {
                Logger::error("Worker exit handler failed: " + std::string(e.what()));
            }
        }
    }

    // =========================================================================
    // Persistent workers
    // =========================================================================

    VoidResult start_persistent(const std::string& name, const LaunchSpec& spec) {
        PersistentEntry& entry = persistent_[name];
        entry.spec = spec;
        entry.deliberate_stop = false;
        if (entry.restart_timer) {
            scheduler_.cancel(*entry.restart_timer);
            entry.restart_timer.reset();
        }
        if (entry.worker && records_.count(*entry.worker)) {
            return VoidResult();
        }

        auto launched = launch(name, std::nullopt, name, spec);
        if (launched.is_error()) {
            entry.worker.reset();
            return launched.error();
        }
        entry.worker = launched.value().id;
        return VoidResult();
    }

    void stop_persistent(const std::string& name) {
        auto it = persistent_.find(name);
        if (it == persistent_.end()) return;

        PersistentEntry& entry = it->second;
        // Set before stopping so the exit notification cannot schedule a restart
        entry.deliberate_stop = true;
        if (entry.restart_timer) {
            scheduler_.cancel(*entry.restart_timer);
            entry.restart_timer.reset();
        }
        if (entry.worker) stop(*entry.worker);
    }

    void handle_persistent_exit(const std::string& name, WorkerId id, ExitStatus status) {
        auto it = persistent_.find(name);
        if (it == persistent_.end()) return;

        PersistentEntry& entry = it->second;
        if (entry.worker == id) entry.worker.reset();

        if (entry.deliberate_stop) {
            LOG_WORKER(name + " stopped");
            return;
        }
        if (status.clean()) {
            LOG_WORKER(name + " finished cleanly, not restarting");
            return;
        }

        Logger::warn(name + " exited unexpectedly (" + status.describe() + "), restarting in " +
                     std::to_string(restart_backoff_.count()) + "ms");
        schedule_restart(name);
    }

    void schedule_restart(const std::string& name) {
        std::weak_ptr<Impl> weak = shared_from_this();
        persistent_[name].restart_timer = scheduler_.schedule_after(restart_backoff_, [weak, name]() {
            if (auto self = weak.lock()) self->restart(name);
        });
    }

    void restart(const std::string& name) {
        auto it = persistent_.find(name);
        if (it == persistent_.end()) return;

        PersistentEntry& entry = it->second;
        entry.restart_timer.reset();
        if (entry.deliberate_stop || entry.worker) return;

        auto launched = launch(name, std::nullopt, name, entry.spec);
        if (launched.is_error()) {
            schedule_restart(name);
            return;
        }
        entry.worker = launched.value().id;
    }

    void shutdown() {
        for (auto& [name, entry] : persistent_) {
            entry.deliberate_stop = true;
            if (entry.restart_timer) {
                scheduler_.cancel(*entry.restart_timer);
                entry.restart_timer.reset();
            }
        }
        for (auto& [id, record] : records_) {
            if (record.deadline) scheduler_.cancel(*record.deadline);
            if (record.process && record.process->running()) {
                LOG_WORKER("Killing " + record.handle.name + " worker (PID " +
                           std::to_string(record.handle.pid) + ")");
                record.process->kill();
            }
            record.status = WorkerStatus::Stopping;
        }
        active_visual_.reset();
    }

    Scheduler& scheduler_;
    ProcessLauncher& launcher_;
    Duration stop_grace_;
    Duration restart_backoff_;

    EventHandler event_handler_;
    ExitHandler exit_handler_;

    std::map<WorkerId, WorkerRecord> records_;
    std::map<std::string, PersistentEntry> persistent_;
    std::optional<WorkerId> active_visual_;
    WorkerId next_id_ = 1;
};

WorkerSupervisor::WorkerSupervisor(Scheduler& scheduler,
                                   ProcessLauncher& launcher,
                                   Duration stop_grace,
                                   Duration restart_backoff)
    : pimpl_(std::make_shared<Impl>(scheduler, launcher, stop_grace, restart_backoff)) {}

WorkerSupervisor::~WorkerSupervisor() = default;

void WorkerSupervisor::set_event_handler(EventHandler handler) {
    pimpl_->event_handler_ = std::move(handler);
}

void WorkerSupervisor::set_exit_handler(ExitHandler handler) {
    pimpl_->exit_handler_ = std::move(handler);
}

Result<WorkerHandle> WorkerSupervisor::spawn(VisualKind kind, const LaunchSpec& spec) {
    if (pimpl_->active_visual_) {
        pimpl_->stop(*pimpl_->active_visual_);
    }

    auto launched = pimpl_->launch(visual_kind_name(kind), kind, "", spec);
    if (launched.is_ok()) {
        pimpl_->active_visual_ = launched.value().id;
    }
    return launched;
}

void WorkerSupervisor::stop(const WorkerHandle& handle) {
    pimpl_->stop(handle.id);
}

WorkerStatus WorkerSupervisor::status(const WorkerHandle& handle) const {
    auto it = pimpl_->records_.find(handle.id);
    if (it == pimpl_->records_.end()) return WorkerStatus::Stopped;
    return it->second.status;
}

std::optional<WorkerHandle> WorkerSupervisor::active_visual() const {
    if (!pimpl_->active_visual_) return std::nullopt;
    auto it = pimpl_->records_.find(*pimpl_->active_visual_);
    if (it == pimpl_->records_.end()) return std::nullopt;
    return it->second.handle;
}

VoidResult WorkerSupervisor::start_persistent(const std::string& name, const LaunchSpec& spec) {
    return pimpl_->start_persistent(name, spec);
}

void WorkerSupervisor::stop_persistent(const std::string& name) {
    pimpl_->stop_persistent(name);
}

bool WorkerSupervisor::persistent_running(const std::string& name) const {
    auto it = pimpl_->persistent_.find(name);
    return it != pimpl_->persistent_.end() && it->second.worker.has_value();
}

void WorkerSupervisor::stop_all() {
    pimpl_->shutdown();
}

} // namespace optidex
