#include "process.h"
#include "core/constants.h"
#include "logger.h"
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <future>
#include <signal.h>
#include <sstream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace optidex {

std::string ExitStatus::describe() const {
    std::ostringstream oss;
    if (signal != 0) {
        oss << "signal " << signal;
    } else {
        oss << "exit " << code;
    }
    return oss.str();
}

namespace {

ExitStatus decode_wait_status(int status) {
    ExitStatus result;
    if (WIFEXITED(status)) {
        result.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }
    return result;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

/// Read lines until EOF; a line longer than the cap is delivered truncated
void read_lines(int fd, const std::function<void(const std::string&)>& on_line) {
    std::string pending;
    char buffer[4096];
    bool truncated = false;

    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;

        for (ssize_t i = 0; i < n; ++i) {
            char c = buffer[i];
            if (c == '\n') {
                if (!pending.empty() && pending.back() == '\r') pending.pop_back();
                if (on_line) on_line(pending);
                pending.clear();
                truncated = false;
            } else if (pending.size() < constants::worker::MAX_LINE_BYTES) {
                pending += c;
            } else if (!truncated) {
                truncated = true;
                LOG_WARN("Worker output line exceeds " +
                         std::to_string(constants::worker::MAX_LINE_BYTES) + " bytes; truncating");
            }
        }
    }

    if (!pending.empty() && on_line) on_line(pending);
}

// =============================================================================
// PosixProcess
// =============================================================================

class PosixProcess : public Process {
public:
    PosixProcess(pid_t pid, int out_fd, int err_fd, ProcessCallbacks callbacks)
        : pid_(pid), out_fd_(out_fd), err_fd_(err_fd), callbacks_(std::move(callbacks)) {}

    ~PosixProcess() override {
        if (running()) kill();
        if (waiter_.joinable()) {
            if (waiter_.get_id() == std::this_thread::get_id()) {
                waiter_.detach();
            } else {
                waiter_.join();
            }
        }
    }

    void start_threads() {
        stdout_reader_ = std::thread([this]() {
            Logger::set_thread_name("pid " + std::to_string(pid_) + " out");
            read_lines(out_fd_, callbacks_.on_stdout_line);
            close_fd(out_fd_);
        });
        stderr_reader_ = std::thread([this]() {
            Logger::set_thread_name("pid " + std::to_string(pid_) + " err");
            read_lines(err_fd_, callbacks_.on_stderr_line);
            close_fd(err_fd_);
        });
        waiter_ = std::thread([this]() { wait_for_exit(); });
    }

    pid_t pid() const override { return pid_; }

    void terminate() override { signal_group(SIGTERM); }

    void kill() override { signal_group(SIGKILL); }

    bool running() const override { return !exited_.load(); }

private:
    void signal_group(int sig) {
        if (exited_) return;
        // Negative pid targets the whole group the child leads
        if (::kill(-pid_, sig) != 0 && errno == ESRCH) {
            ::kill(pid_, sig);
        }
    }

    void wait_for_exit() {
        int status = 0;
        pid_t result;
        do {
            result = waitpid(pid_, &status, 0);
        } while (result < 0 && errno == EINTR);

        ExitStatus exit_status = result == pid_ ? decode_wait_status(status) : ExitStatus{};
        exited_ = true;

        // Grandchildren may still hold the pipes open; clear them out so the readers see EOF
        ::kill(-pid_, SIGKILL);

        if (stdout_reader_.joinable()) stdout_reader_.join();
        if (stderr_reader_.joinable()) stderr_reader_.join();

        if (callbacks_.on_exit) callbacks_.on_exit(exit_status);
    }

    pid_t pid_;
    int out_fd_;
    int err_fd_;
    ProcessCallbacks callbacks_;
    std::atomic<bool> exited_{false};
    std::thread stdout_reader_;
    std::thread stderr_reader_;
    std::thread waiter_;
};

} // namespace

// =============================================================================
// PosixProcessLauncher
// =============================================================================

Result<std::shared_ptr<Process>> PosixProcessLauncher::launch(const LaunchSpec& spec,
                                                              ProcessCallbacks callbacks) {
    std::vector<std::string> args = spec.argv();
    if (args.empty() || args[0].empty()) {
        return make_spawn_error("Empty command");
    }

    // Build argv before forking; the child must not allocate
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    if (pipe2(out_pipe, O_CLOEXEC) == -1 || pipe2(err_pipe, O_CLOEXEC) == -1 ||
        pipe2(status_pipe, O_CLOEXEC) == -1) {
        std::string reason = std::strerror(errno);
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        close_fd(status_pipe[0]); close_fd(status_pipe[1]);
        return make_spawn_error("Failed to create pipes: " + reason);
    }

    pid_t pid = fork();

    if (pid == -1) {
        std::string reason = std::strerror(errno);
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        close_fd(status_pipe[0]); close_fd(status_pipe[1]);
        return make_spawn_error("fork failed: " + reason);
    }

    if (pid == 0) {
        // Child: own process group, stdout/stderr to pipes, stdin from /dev/null
        setpgid(0, 0);

        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }

        execvp(argv[0], argv.data());

        // Exec failed: report errno through the status pipe
        int err = errno;
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    setpgid(pid, pid);  // Also set here so signals work before the child runs
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        return make_spawn_error("exec " + args[0] + " failed: " + std::strerror(child_errno));
    }

    auto process = std::make_shared<PosixProcess>(pid, out_pipe[0], err_pipe[0], std::move(callbacks));
    process->start_threads();
    LOG_WORKER("Started " + spec.describe() + " (PID: " + std::to_string(pid) + ")");
    return std::shared_ptr<Process>(process);
}

// =============================================================================
// Helpers
// =============================================================================

namespace {

bool is_executable(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

} // namespace

VoidResult check_launchable(const LaunchSpec& spec) {
    if (spec.command.empty()) {
        return make_spawn_error("No command configured");
    }

    bool found = false;
    if (spec.command.find('/') != std::string::npos) {
        found = is_executable(spec.command);
    } else {
        const char* path_env = std::getenv("PATH");
        std::string path_list = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
        std::istringstream dirs(path_list);
        std::string dir;
        while (!found && std::getline(dirs, dir, ':')) {
            if (dir.empty()) dir = ".";
            found = is_executable(dir + "/" + spec.command);
        }
    }
    if (!found) {
        return make_spawn_error("Executable not found: " + spec.command);
    }

    if (!spec.script.empty() && access(spec.script.c_str(), R_OK) != 0) {
        return make_spawn_error("Worker script not found: " + spec.script);
    }
    return VoidResult();
}

Result<ExitStatus> run_blocking(ProcessLauncher& launcher,
                                const LaunchSpec& spec,
                                std::chrono::milliseconds timeout,
                                std::vector<std::string>* stdout_lines) {
    auto done = std::make_shared<std::promise<ExitStatus>>();
    std::future<ExitStatus> exited = done->get_future();
    // Filled on the reader thread; complete once on_exit has fired
    auto captured = std::make_shared<std::vector<std::string>>();

    ProcessCallbacks callbacks;
    callbacks.on_stdout_line = [captured](const std::string& line) {
        LOG_DEBUG("[child] " + line);
        captured->push_back(line);
    };
    callbacks.on_stderr_line = [](const std::string& line) { LOG_DEBUG("[child:err] " + line); };
    callbacks.on_exit = [done](ExitStatus status) { done->set_value(status); };

    auto launched = launcher.launch(spec, std::move(callbacks));
    if (launched.is_error()) {
        return launched.error();
    }
    std::shared_ptr<Process> process = launched.value();

    if (exited.wait_for(timeout) != std::future_status::ready) {
        process->kill();
        exited.wait();
        return make_timeout_error(spec.describe() + " timed out after " +
                                  std::to_string(timeout.count()) + "ms");
    }
    ExitStatus status = exited.get();
    if (stdout_lines) *stdout_lines = std::move(*captured);
    return status;
}

} // namespace optidex
