#pragma once

#include "errors.h"
#include "event_parser.h"
#include "process.h"
#include "scheduler.h"
#include "visual_mode.h"
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace optidex {

using WorkerId = uint64_t;

/**
 * @brief Worker lifecycle
 *
 * Starting -> Running -> StopRequested (SIGTERM sent, deadline armed)
 * -> Stopping (deadline passed, SIGKILL sent) -> Stopped.
 * A process that exits on its own goes straight to Stopped.
 */
enum class WorkerStatus {
    Starting,
    Running,
    StopRequested,
    Stopping,
    Stopped
};

const char* worker_status_name(WorkerStatus status);

/**
 * @brief Identifies one spawned worker process
 */
struct WorkerHandle {
    WorkerId id = 0;
    std::string name;                  ///< Visual kind name or persistent worker name
    std::optional<VisualKind> kind;    ///< Empty for persistent workers
    pid_t pid = -1;
    TimePoint started_at;
};

/**
 * @brief Spawns, monitors and tears down worker processes
 *
 * Visual workers: at most one runs at a time; spawn() stops the previous
 * one first. Persistent workers: restarted after a backoff when they exit
 * unexpectedly, unless stop_persistent() was called for them.
 *
 * All methods must be called on the scheduler's thread. Process output
 * and exit notifications are posted to the scheduler, so handlers run
 * there too. The scheduler and launcher must outlive the supervisor.
 */
class WorkerSupervisor {
public:
    using EventHandler = std::function<void(const WorkerHandle&, const WorkerEvent&)>;
    using ExitHandler = std::function<void(const WorkerHandle&, ExitStatus)>;

    WorkerSupervisor(Scheduler& scheduler,
                     ProcessLauncher& launcher,
                     Duration stop_grace,
                     Duration restart_backoff);
    ~WorkerSupervisor();

    WorkerSupervisor(const WorkerSupervisor&) = delete;
    WorkerSupervisor& operator=(const WorkerSupervisor&) = delete;

    /// Structured events from any worker
    void set_event_handler(EventHandler handler);

    /// Exit of any visual worker, deliberate or not
    void set_exit_handler(ExitHandler handler);

    /**
     * @brief Start a visual worker, stopping the current one first
     * @return Handle, or WorkerSpawnFailure
     */
    Result<WorkerHandle> spawn(VisualKind kind, const LaunchSpec& spec);

    /**
     * @brief SIGTERM now, SIGKILL once the grace period passes
     *
     * No-op for handles already stopping or stopped.
     */
    void stop(const WorkerHandle& handle);

    /// Unknown or exited handles report Stopped
    WorkerStatus status(const WorkerHandle& handle) const;

    /// The visual worker currently Starting or Running, if any
    std::optional<WorkerHandle> active_visual() const;

    // =========================================================================
    // Persistent workers
    // =========================================================================

    /**
     * @brief Start a named long-running worker (no-op if already running)
     */
    VoidResult start_persistent(const std::string& name, const LaunchSpec& spec);

    /**
     * @brief Stop a named worker and suppress its restart
     */
    void stop_persistent(const std::string& name);

    bool persistent_running(const std::string& name) const;

    /**
     * @brief Kill every worker immediately (shutdown)
     */
    void stop_all();

private:
    class Impl;
    std::shared_ptr<Impl> pimpl_;
};

} // namespace optidex
