#pragma once

/**
 * @file fakes.h
 * @brief Deterministic stand-ins for the controller's collaborators
 *
 * FakeScheduler runs everything on the test thread with a manual clock, so
 * tests decide exactly when timers fire and when posted completions land.
 */

#include "collaborators.h"
#include "display.h"
#include "notifier.h"
#include "process.h"
#include "scheduler.h"
#include <deque>
#include <functional>
#include <future>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace optidex {
namespace testing {

// =============================================================================
// Scheduling
// =============================================================================

class FakeScheduler : public Scheduler {
public:
    /// Safe from job threads; everything else is test-thread only
    void post(Task task) override {
        std::lock_guard<std::mutex> lock(mutex_);
        posted_.push_back(std::move(task));
    }

    TimerId schedule_after(Duration delay, Task task) override {
        TimerId id = next_id_++;
        timers_[id] = Timer{now_ + delay, Duration(0), std::move(task)};
        return id;
    }

    TimerId schedule_every(Duration interval, Task task) override {
        TimerId id = next_id_++;
        timers_[id] = Timer{now_ + interval, interval, std::move(task)};
        return id;
    }

    void cancel(TimerId id) override {
        timers_.erase(id);
    }

    TimePoint now() const override { return now_; }

    /// Run posted tasks (and tasks they post) until the queue is empty
    size_t run_pending() {
        size_t ran = 0;
        while (true) {
            Task task;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (posted_.empty()) break;
                task = std::move(posted_.front());
                posted_.pop_front();
            }
            task();
            ++ran;
        }
        return ran;
    }

    /// Move the clock forward, firing due timers in deadline order
    void advance(Duration amount) {
        TimePoint target = now_ + amount;
        run_pending();
        while (true) {
            auto due = timers_.end();
            for (auto it = timers_.begin(); it != timers_.end(); ++it) {
                if (it->second.deadline <= target &&
                    (due == timers_.end() || it->second.deadline < due->second.deadline)) {
                    due = it;
                }
            }
            if (due == timers_.end()) break;

            now_ = due->second.deadline;
            Task task = due->second.task;
            if (due->second.interval.count() > 0) {
                due->second.deadline += due->second.interval;
            } else {
                timers_.erase(due);
            }
            task();
            run_pending();
        }
        now_ = target;
    }

    size_t pending_timers() const { return timers_.size(); }

private:
    struct Timer {
        TimePoint deadline;
        Duration interval;
        Task task;
    };

    TimePoint now_{};
    TimerId next_id_ = 1;
    std::mutex mutex_;
    std::deque<Task> posted_;
    std::map<TimerId, Timer> timers_;
};

/**
 * @brief Holds submitted jobs until the test releases them
 *
 * Released jobs run on their own threads because some of them block on
 * speech futures that the test completes later. run_all() waits a short
 * while for them and leaves the blocked ones running.
 */
class ManualExecutor : public BackgroundExecutor {
public:
    void submit(Task task) override {
        std::lock_guard<std::mutex> lock(mutex_);
        queued_.push_back(std::move(task));
    }

    /// Start queued jobs; returns how many jobs have finished since the last call
    size_t run_all(Duration patience = Duration(100)) {
        std::deque<Task> jobs;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            jobs.swap(queued_);
        }
        for (auto& job : jobs) {
            running_.push_back(std::async(std::launch::async, std::move(job)));
        }

        auto deadline = Clock::now() + patience;
        size_t finished = 0;
        for (auto it = running_.begin(); it != running_.end();) {
            if (it->wait_until(deadline) == std::future_status::ready) {
                it = running_.erase(it);
                ++finished;
            } else {
                ++it;
            }
        }
        return finished;
    }

    size_t queued() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queued_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<Task> queued_;
    std::list<std::future<void>> running_;
};

// =============================================================================
// Processes
// =============================================================================

class FakeProcess : public Process {
public:
    FakeProcess(pid_t pid, ProcessCallbacks callbacks)
        : pid_(pid), callbacks_(std::move(callbacks)) {}

    pid_t pid() const override { return pid_; }
    void terminate() override { ++terms; }
    void kill() override { ++kills; }
    bool running() const override { return !exited_; }

    void emit_stdout(const std::string& line) {
        if (callbacks_.on_stdout_line) callbacks_.on_stdout_line(line);
    }

    void exit(ExitStatus status) {
        if (exited_) return;
        exited_ = true;
        if (callbacks_.on_exit) callbacks_.on_exit(status);
    }

    int terms = 0;
    int kills = 0;

private:
    pid_t pid_;
    ProcessCallbacks callbacks_;
    bool exited_ = false;
};

class FakeLauncher : public ProcessLauncher {
public:
    Result<std::shared_ptr<Process>> launch(const LaunchSpec& spec,
                                            ProcessCallbacks callbacks) override {
        specs.push_back(spec);
        if (fail_next) {
            fail_next = false;
            return make_spawn_error("No such file: " + spec.command);
        }
        auto process = std::make_shared<FakeProcess>(next_pid_++, std::move(callbacks));
        processes.push_back(process);
        return std::shared_ptr<Process>(process);
    }

    std::shared_ptr<FakeProcess> last() const {
        return processes.empty() ? nullptr : processes.back();
    }

    bool fail_next = false;
    std::vector<LaunchSpec> specs;
    std::vector<std::shared_ptr<FakeProcess>> processes;

private:
    pid_t next_pid_ = 1000;
};

// =============================================================================
// Display, buttons, notifications
// =============================================================================

class FakeDisplay : public DisplaySink {
public:
    void update(const DisplayUpdate& update) override {
        updates.push_back(update);
        if (update.status) status = *update.status;
        if (update.text) text = *update.text;
        if (update.color) color = *update.color;
        if (update.image) image = *update.image;
    }

    std::vector<DisplayUpdate> updates;
    std::string status;
    std::string text;
    std::string color;
    std::string image;
};

class FakeButtons : public ButtonInput {
public:
    void on_pressed(Handler handler) override { pressed_ = std::move(handler); }
    void on_released(Handler handler) override { released_ = std::move(handler); }

    void press() { if (pressed_) { Handler h = pressed_; h(); } }
    void release() { if (released_) { Handler h = released_; h(); } }

private:
    Handler pressed_;
    Handler released_;
};

class FakeNotifier : public Notifier {
public:
    void send_text(const std::string& message) override { texts.push_back(message); }
    void send_photo(const std::string& path) override { photos.push_back(path); }
    void send_video(const std::string& path) override { videos.push_back(path); }

    std::vector<std::string> texts;
    std::vector<std::string> photos;
    std::vector<std::string> videos;
};

// =============================================================================
// Audio and assistant
// =============================================================================

class FakeCapture : public AudioCapture {
public:
    VoidResult start_capture(const std::string& path, Handler on_complete) override {
        if (fail_start) return make_error(ErrorType::IOError, "no microphone");
        paths.push_back(path);
        on_complete_ = std::move(on_complete);
        active = true;
        return VoidResult();
    }

    VoidResult stop_capture() override {
        ++stops;
        if (!active) return VoidResult();
        active = false;
        Handler done = std::move(on_complete_);
        on_complete_ = nullptr;
        if (done) done();
        return VoidResult();
    }

    bool fail_start = false;
    bool active = false;
    int stops = 0;
    std::vector<std::string> paths;

private:
    Handler on_complete_;
};

class FakeRecognizer : public Recognizer {
public:
    std::optional<std::string> recognize(const std::string& audio_path) override {
        paths.push_back(audio_path);
        return next_text;
    }

    std::optional<std::string> next_text;
    std::vector<std::string> paths;
};

/// Replies with a fixed text; the hook runs first, standing in for tool side effects
class FakeAssistant : public Assistant {
public:
    Result<std::string> respond(const std::string& user_text, TurnId turn) override {
        {
            // Jobs of a cancelled and a current turn may run together
            std::lock_guard<std::mutex> lock(mutex_);
            inputs.push_back(user_text);
            turns.push_back(turn);
        }
        if (on_respond) on_respond(turn);
        if (fail) return make_network_error("endpoint unreachable");
        return reply;
    }

    std::string reply = "Sure.";
    bool fail = false;
    std::function<void(TurnId)> on_respond;
    std::vector<std::string> inputs;
    std::vector<TurnId> turns;

private:
    std::mutex mutex_;
};

/// Vision model stand-in; called on executor threads
class FakeAnalyzer : public ImageAnalyzer {
public:
    Result<std::string> analyze(const std::string& image_path, const std::string& prompt) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests.push_back(image_path + "|" + prompt);
        if (fail) return make_network_error("vision model unavailable");
        return answer;
    }

    size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests.size();
    }

    std::string answer = "A person holding a parcel.";
    bool fail = false;
    std::vector<std::string> requests;

private:
    mutable std::mutex mutex_;
};

/// Speech whose playback completes only when the test says so
class FakeSpeech : public SpeechSynthesizer {
public:
    std::shared_future<bool> speak(const std::string& text) override {
        spoken.push_back(text);
        pending_.emplace_back();
        return pending_.back().get_future().share();
    }

    void stop_playback() override {
        ++stops;
        for (auto& promise : pending_) promise.set_value(false);
        pending_.clear();
    }

    void set_sentence_callback(SentenceCallback callback) override {
        sentence_callback_ = std::move(callback);
    }

    /// Report a sentence as starting to play
    void play_sentence(const std::string& sentence) {
        if (sentence_callback_) sentence_callback_(sentence);
    }

    /// Finish the oldest outstanding utterance
    void finish(bool ok = true) {
        if (pending_.empty()) return;
        pending_.front().set_value(ok);
        pending_.pop_front();
    }

    size_t outstanding() const { return pending_.size(); }

    std::vector<std::string> spoken;
    int stops = 0;

private:
    std::deque<std::promise<bool>> pending_;
    SentenceCallback sentence_callback_;
};

} // namespace testing
} // namespace optidex
