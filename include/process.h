#pragma once

#include "errors.h"
#include "visual_mode.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

namespace optidex {

/**
 * @brief How a child process ended
 */
struct ExitStatus {
    int code = -1;        ///< Exit code when exited normally, else -1
    int signal = 0;       ///< Terminating signal, 0 when exited normally

    bool clean() const { return signal == 0 && code == 0; }
    std::string describe() const;
};

/// Callbacks for a spawned process; they run on reader/waiter threads
struct ProcessCallbacks {
    std::function<void(const std::string&)> on_stdout_line;
    std::function<void(const std::string&)> on_stderr_line;
    /// Called once, after both output streams are drained
    std::function<void(ExitStatus)> on_exit;
};

/**
 * @brief A running child process
 */
class Process {
public:
    virtual ~Process() = default;

    virtual pid_t pid() const = 0;

    /// SIGTERM to the process group
    virtual void terminate() = 0;

    /// SIGKILL to the process group
    virtual void kill() = 0;

    virtual bool running() const = 0;
};

/**
 * @brief Starts child processes (fake in tests, fork/exec in production)
 */
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    /**
     * @brief Start a process
     * @return The process, or WorkerSpawnFailure when exec failed
     */
    virtual Result<std::shared_ptr<Process>> launch(const LaunchSpec& spec,
                                                    ProcessCallbacks callbacks) = 0;
};

/**
 * @brief fork/exec launcher with piped stdout/stderr
 *
 * Each child runs in its own process group so signals reach helpers it
 * starts. Exec errors come back synchronously through a close-on-exec
 * pipe. A waiter thread reaps the child, joins the line readers, then
 * fires on_exit.
 */
class PosixProcessLauncher : public ProcessLauncher {
public:
    Result<std::shared_ptr<Process>> launch(const LaunchSpec& spec,
                                            ProcessCallbacks callbacks) override;
};

/**
 * @brief Check that a launch spec's command resolves to an executable
 *
 * Commands containing '/' are checked directly; others are looked up on PATH.
 * A script, when set, must exist.
 */
VoidResult check_launchable(const LaunchSpec& spec);

/**
 * @brief Run a command to completion
 *
 * Output lines are logged at debug level. The process is killed when it
 * outlives the timeout.
 * @param stdout_lines When set, receives the child's stdout lines
 * @return Exit status, WorkerSpawnFailure or Timeout
 */
Result<ExitStatus> run_blocking(ProcessLauncher& launcher,
                                const LaunchSpec& spec,
                                std::chrono::milliseconds timeout,
                                std::vector<std::string>* stdout_lines = nullptr);

} // namespace optidex
