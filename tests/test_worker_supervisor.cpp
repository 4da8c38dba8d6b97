/**
 * Tests for worker process supervision.
 * Asserts:
 * - Only one visual worker runs; spawning another stops the first.
 * - stop() sends SIGTERM, then SIGKILL once the grace period passes.
 * - Events and exits are delivered on the scheduler, events before the exit.
 * - Persistent workers restart after a crash unless stopped deliberately.
 *
 * Run from build dir: ./test_worker_supervisor
 */

#include "fakes.h"
#include "worker_supervisor.h"
#include <iostream>
#include <string>
#include <vector>

using namespace optidex;
using namespace optidex::testing;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

namespace {

const Duration GRACE(1000);
const Duration BACKOFF(5000);

LaunchSpec spec(const std::string& script) {
    return LaunchSpec{"python3", script, {}};
}

} // namespace

int main() {
    // --- spawn, events, exit ---
    {
        FakeScheduler scheduler;
        FakeLauncher launcher;
        WorkerSupervisor supervisor(scheduler, launcher, GRACE, BACKOFF);

        std::vector<std::string> seen;
        supervisor.set_event_handler([&seen](const WorkerHandle& h, const WorkerEvent& e) {
            seen.push_back(h.name + ":" + worker_event_name(e));
        });
        supervisor.set_exit_handler([&seen](const WorkerHandle& h, ExitStatus status) {
            seen.push_back(h.name + ":exit:" + std::to_string(status.code));
        });

        auto spawned = supervisor.spawn(VisualKind::Detection, spec("live_detection.py"));
        ASSERT(spawned.is_ok());
        const WorkerHandle handle = spawned.value();
        ASSERT(handle.kind == VisualKind::Detection);
        ASSERT(handle.pid == launcher.last()->pid());
        ASSERT(supervisor.status(handle) == WorkerStatus::Running);
        ASSERT(supervisor.active_visual() && supervisor.active_visual()->id == handle.id);

        auto process = launcher.last();
        process->emit_stdout("warming up");
        process->emit_stdout("EVENT_TRIGGER: {\"objects\": [\"cup\"], \"count\": 1}");
        process->emit_stdout("EVENT_TRIGGER: garbage");
        process->exit(ExitStatus{0, 0});
        ASSERT(seen.empty());   // nothing runs until the scheduler does

        scheduler.run_pending();
        ASSERT(seen.size() == 2);
        if (seen.size() == 2) {
            ASSERT(seen[0] == "detection:ObjectTriggered");
            ASSERT(seen[1] == "detection:exit:0");
        }
        ASSERT(supervisor.status(handle) == WorkerStatus::Stopped);
        ASSERT(!supervisor.active_visual());
    }

    // --- graceful stop and escalation ---
    {
        FakeScheduler scheduler;
        FakeLauncher launcher;
        WorkerSupervisor supervisor(scheduler, launcher, GRACE, BACKOFF);

        auto handle = supervisor.spawn(VisualKind::Recording, spec("video_capture.py")).value();
        auto process = launcher.last();

        supervisor.stop(handle);
        ASSERT(process->terms == 1);
        ASSERT(supervisor.status(handle) == WorkerStatus::StopRequested);
        ASSERT(!supervisor.active_visual());

        supervisor.stop(handle);   // already stopping
        ASSERT(process->terms == 1);

        scheduler.advance(Duration(999));
        ASSERT(process->kills == 0);
        scheduler.advance(Duration(1));
        ASSERT(process->kills == 1);
        ASSERT(supervisor.status(handle) == WorkerStatus::Stopping);

        process->exit(ExitStatus{-1, 9});
        scheduler.run_pending();
        ASSERT(supervisor.status(handle) == WorkerStatus::Stopped);
    }

    // --- exit within the grace period cancels the kill ---
    {
        FakeScheduler scheduler;
        FakeLauncher launcher;
        WorkerSupervisor supervisor(scheduler, launcher, GRACE, BACKOFF);

        auto handle = supervisor.spawn(VisualKind::Pose, spec("pose_estimation.py")).value();
        auto process = launcher.last();
        supervisor.stop(handle);
        process->exit(ExitStatus{0, 15});
        scheduler.run_pending();
        scheduler.advance(GRACE * 2);
        ASSERT(process->kills == 0);
        ASSERT(scheduler.pending_timers() == 0);
    }

    // --- one visual worker at a time ---
    {
        FakeScheduler scheduler;
        FakeLauncher launcher;
        WorkerSupervisor supervisor(scheduler, launcher, GRACE, BACKOFF);

        int exits = 0;
        supervisor.set_exit_handler([&exits](const WorkerHandle&, ExitStatus) { ++exits; });

        auto first = supervisor.spawn(VisualKind::Detection, spec("live_detection.py")).value();
        auto first_process = launcher.last();
        auto second = supervisor.spawn(VisualKind::Playback, spec("video_player.py")).value();

        ASSERT(first_process->terms == 1);
        ASSERT(first.id != second.id);
        ASSERT(supervisor.active_visual() && supervisor.active_visual()->id == second.id);

        // The old worker's late exit is reported but does not disturb the new one
        first_process->exit(ExitStatus{0, 15});
        scheduler.run_pending();
        ASSERT(exits == 1);
        ASSERT(supervisor.active_visual() && supervisor.active_visual()->id == second.id);
    }

    // --- spawn failure ---
    {
        FakeScheduler scheduler;
        FakeLauncher launcher;
        WorkerSupervisor supervisor(scheduler, launcher, GRACE, BACKOFF);

        launcher.fail_next = true;
        auto spawned = supervisor.spawn(VisualKind::Sentry, spec("semantic_sentry.py"));
        ASSERT(spawned.is_error());
        ASSERT(spawned.error().type == ErrorType::WorkerSpawnFailure);
        ASSERT(!supervisor.active_visual());
    }

    // --- persistent restart ---
    {
        FakeScheduler scheduler;
        FakeLauncher launcher;
        WorkerSupervisor supervisor(scheduler, launcher, GRACE, BACKOFF);

        ASSERT(supervisor.start_persistent("mesh", LaunchSpec{"python3", "mesh.py", {}}).is_ok());
        ASSERT(supervisor.persistent_running("mesh"));
        ASSERT(launcher.processes.size() == 1);

        // Starting again is a no-op while it runs
        ASSERT(supervisor.start_persistent("mesh", LaunchSpec{"python3", "mesh.py", {}}).is_ok());
        ASSERT(launcher.processes.size() == 1);

        launcher.last()->exit(ExitStatus{1, 0});
        scheduler.run_pending();
        ASSERT(!supervisor.persistent_running("mesh"));

        scheduler.advance(BACKOFF - Duration(1));
        ASSERT(launcher.processes.size() == 1);
        scheduler.advance(Duration(1));
        ASSERT(launcher.processes.size() == 2);
        ASSERT(supervisor.persistent_running("mesh"));

        // A clean exit is not restarted
        launcher.last()->exit(ExitStatus{0, 0});
        scheduler.run_pending();
        scheduler.advance(BACKOFF * 2);
        ASSERT(launcher.processes.size() == 2);
    }

    // --- deliberate stop suppresses the restart ---
    {
        FakeScheduler scheduler;
        FakeLauncher launcher;
        WorkerSupervisor supervisor(scheduler, launcher, GRACE, BACKOFF);

        ASSERT(supervisor.start_persistent("display", LaunchSpec{"./display_ui", "", {}}).is_ok());
        auto process = launcher.last();
        supervisor.stop_persistent("display");
        ASSERT(process->terms == 1);

        process->exit(ExitStatus{-1, 15});
        scheduler.run_pending();
        scheduler.advance(BACKOFF * 2);
        ASSERT(launcher.processes.size() == 1);
        ASSERT(!supervisor.persistent_running("display"));
    }

    // --- a failed restart keeps retrying ---
    {
        FakeScheduler scheduler;
        FakeLauncher launcher;
        WorkerSupervisor supervisor(scheduler, launcher, GRACE, BACKOFF);

        ASSERT(supervisor.start_persistent("mesh", LaunchSpec{"python3", "mesh.py", {}}).is_ok());
        launcher.last()->exit(ExitStatus{-1, 11});
        scheduler.run_pending();

        launcher.fail_next = true;
        scheduler.advance(BACKOFF);
        ASSERT(launcher.specs.size() == 2);
        ASSERT(!supervisor.persistent_running("mesh"));

        scheduler.advance(BACKOFF);
        ASSERT(launcher.specs.size() == 3);
        ASSERT(supervisor.persistent_running("mesh"));
    }

    // --- stop_all kills everything ---
    {
        FakeScheduler scheduler;
        FakeLauncher launcher;
        WorkerSupervisor supervisor(scheduler, launcher, GRACE, BACKOFF);

        supervisor.spawn(VisualKind::Observer, spec("smart_observer.py"));
        auto visual = launcher.last();
        ASSERT(supervisor.start_persistent("mesh", LaunchSpec{"python3", "mesh.py", {}}).is_ok());
        auto mesh = launcher.last();

        supervisor.stop_all();
        ASSERT(visual->kills == 1);
        ASSERT(mesh->kills == 1);

        mesh->exit(ExitStatus{-1, 9});
        scheduler.run_pending();
        scheduler.advance(BACKOFF * 2);
        ASSERT(launcher.processes.size() == 2);
    }

    if (failed) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All worker supervisor tests passed.\n";
    return 0;
}
