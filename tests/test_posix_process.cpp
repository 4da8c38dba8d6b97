/**
 * Tests for the fork/exec launcher against real shell processes.
 * Asserts:
 * - stdout and stderr lines arrive, and on_exit fires after both are drained.
 * - Exit codes and terminating signals are reported.
 * - A missing executable fails synchronously with WorkerSpawnFailure.
 * - run_blocking() kills a child that outlives its timeout.
 *
 * Run from build dir: ./test_posix_process
 * Requires /bin/sh.
 */

#include "process.h"
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

using namespace optidex;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

/// Collects callbacks from reader and waiter threads
struct Recorder {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::string> out;
    std::vector<std::string> err;
    std::vector<std::string> order;
    bool exited = false;
    ExitStatus status;

    ProcessCallbacks callbacks() {
        ProcessCallbacks cb;
        cb.on_stdout_line = [this](const std::string& line) {
            std::lock_guard<std::mutex> lock(mutex);
            out.push_back(line);
            order.push_back("out");
        };
        cb.on_stderr_line = [this](const std::string& line) {
            std::lock_guard<std::mutex> lock(mutex);
            err.push_back(line);
            order.push_back("err");
        };
        cb.on_exit = [this](ExitStatus s) {
            std::lock_guard<std::mutex> lock(mutex);
            status = s;
            exited = true;
            order.push_back("exit");
            cv.notify_all();
        };
        return cb;
    }

    bool wait_exit(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [this] { return exited; });
    }
};

LaunchSpec shell(const std::string& script) {
    return LaunchSpec{"/bin/sh", "", {"-c", script}};
}

} // namespace

int main() {
    PosixProcessLauncher launcher;

    // --- output lines, then exit ---
    {
        Recorder rec;
        auto launched = launcher.launch(shell("echo one; echo two; echo bad 1>&2; exit 3"), rec.callbacks());
        ASSERT(launched.is_ok());
        ASSERT(rec.wait_exit(std::chrono::seconds(5)));

        std::lock_guard<std::mutex> lock(rec.mutex);
        ASSERT(rec.out.size() == 2);
        if (rec.out.size() == 2) {
            ASSERT(rec.out[0] == "one");
            ASSERT(rec.out[1] == "two");
        }
        ASSERT(rec.err.size() == 1);
        ASSERT(rec.status.code == 3);
        ASSERT(rec.status.signal == 0);
        ASSERT(!rec.status.clean());
        ASSERT(!rec.order.empty() && rec.order.back() == "exit");
    }

    // --- partial last line is still delivered ---
    {
        Recorder rec;
        auto launched = launcher.launch(shell("printf 'EVENT_AUDIO: done'"), rec.callbacks());
        ASSERT(launched.is_ok());
        ASSERT(rec.wait_exit(std::chrono::seconds(5)));
        std::lock_guard<std::mutex> lock(rec.mutex);
        ASSERT(rec.out.size() == 1 && rec.out[0] == "EVENT_AUDIO: done");
        ASSERT(rec.status.clean());
    }

    // --- terminate ---
    {
        Recorder rec;
        auto launched = launcher.launch(shell("sleep 30"), rec.callbacks());
        ASSERT(launched.is_ok());
        if (launched.is_ok()) {
            auto process = launched.value();
            ASSERT(process->pid() > 0);
            ASSERT(process->running());
            process->terminate();
            ASSERT(rec.wait_exit(std::chrono::seconds(5)));
            std::lock_guard<std::mutex> lock(rec.mutex);
            ASSERT(rec.status.signal == 15);
            ASSERT(rec.status.describe() == "signal 15");
        }
    }

    // --- exec failure ---
    {
        Recorder rec;
        auto launched = launcher.launch(LaunchSpec{"/nonexistent/optidex-worker", "", {}}, rec.callbacks());
        ASSERT(launched.is_error());
        if (launched.is_error()) {
            ASSERT(launched.error().type == ErrorType::WorkerSpawnFailure);
        }
    }

    // --- check_launchable ---
    ASSERT(check_launchable(LaunchSpec{"/bin/sh", "", {}}).is_ok());
    ASSERT(check_launchable(LaunchSpec{"sh", "", {}}).is_ok());
    ASSERT(check_launchable(LaunchSpec{"", "", {}}).is_error());
    ASSERT(check_launchable(LaunchSpec{"optidex-no-such-binary", "", {}}).is_error());
    ASSERT(check_launchable(LaunchSpec{"/bin/sh", "/nonexistent/script.py", {}}).is_error());

    // --- run_blocking ---
    {
        auto ok = run_blocking(launcher, shell("exit 0"), std::chrono::seconds(5));
        ASSERT(ok.is_ok() && ok.value().clean());

        auto start = std::chrono::steady_clock::now();
        auto slow = run_blocking(launcher, shell("sleep 30"), std::chrono::milliseconds(200));
        auto elapsed = std::chrono::steady_clock::now() - start;
        ASSERT(slow.is_error());
        if (slow.is_error()) {
            ASSERT(slow.error().type == ErrorType::Timeout);
        }
        ASSERT(elapsed < std::chrono::seconds(10));
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All process tests passed.\n";
    return 0;
}
