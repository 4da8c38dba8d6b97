#include "event_loop.h"
#include "logger.h"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

namespace optidex {

// =============================================================================
// EventLoop
// =============================================================================

struct Timer {
    TimePoint deadline;
    Duration interval{0};   ///< Zero for one-shot timers
    Task task;
};

class EventLoop::Impl {
public:
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<Task> queue;
    std::map<TimerId, Timer> timers;
    TimerId next_timer_id = 1;
    bool stop_requested = false;
    std::atomic<bool> running{false};

    TimerId add_timer(Duration delay, Duration interval, Task task) {
        std::lock_guard<std::mutex> lock(mutex);
        TimerId id = next_timer_id++;
        timers[id] = Timer{Clock::now() + delay, interval, std::move(task)};
        cv.notify_one();
        return id;
    }

    /// Earliest due timer id, or 0. Caller holds the lock.
    TimerId next_due(TimePoint now, TimePoint& earliest) const {
        TimerId due = 0;
        bool have_earliest = false;
        for (const auto& [id, timer] : timers) {
            if (!have_earliest || timer.deadline < earliest) {
                earliest = timer.deadline;
                have_earliest = true;
                due = timer.deadline <= now ? id : 0;
            }
        }
        if (!have_earliest) earliest = TimePoint::max();
        return due;
    }

    static void run_task(const Task& task) {
        try {
            task();
        } catch (const std::exception& e) {
            Logger::error(std::string("Event loop task failed: ") + e.what());
        }
    }
};

EventLoop::EventLoop() : pimpl_(std::make_unique<Impl>()) {}

EventLoop::~EventLoop() = default;

void EventLoop::post(Task task) {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    pimpl_->queue.push_back(std::move(task));
    pimpl_->cv.notify_one();
}

TimerId EventLoop::schedule_after(Duration delay, Task task) {
    return pimpl_->add_timer(delay, Duration(0), std::move(task));
}

TimerId EventLoop::schedule_every(Duration interval, Task task) {
    return pimpl_->add_timer(interval, interval, std::move(task));
}

void EventLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    pimpl_->timers.erase(id);
}

TimePoint EventLoop::now() const {
    return Clock::now();
}

void EventLoop::run() {
    Logger::set_thread_name("loop");
    pimpl_->running = true;
    std::unique_lock<std::mutex> lock(pimpl_->mutex);
    pimpl_->stop_requested = false;

    while (!pimpl_->stop_requested) {
        if (!pimpl_->queue.empty()) {
            Task task = std::move(pimpl_->queue.front());
            pimpl_->queue.pop_front();
            lock.unlock();
            Impl::run_task(task);
            lock.lock();
            continue;
        }

        TimePoint earliest;
        TimerId due = pimpl_->next_due(Clock::now(), earliest);
        if (due != 0) {
            auto it = pimpl_->timers.find(due);
            Task task = it->second.task;
            if (it->second.interval.count() > 0) {
                // Rearm from the previous deadline so cadence does not drift
                it->second.deadline += it->second.interval;
                if (it->second.deadline < Clock::now()) {
                    it->second.deadline = Clock::now() + it->second.interval;
                }
            } else {
                pimpl_->timers.erase(it);
            }
            lock.unlock();
            Impl::run_task(task);
            lock.lock();
            continue;
        }

        if (earliest == TimePoint::max()) {
            pimpl_->cv.wait(lock);
        } else {
            pimpl_->cv.wait_until(lock, earliest);
        }
    }

    pimpl_->running = false;
}

void EventLoop::stop() {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);
    pimpl_->stop_requested = true;
    pimpl_->cv.notify_all();
}

bool EventLoop::running() const {
    return pimpl_->running;
}

// =============================================================================
// ThreadExecutor
// =============================================================================

class ThreadExecutor::Impl {
public:
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::thread> threads;
    size_t active = 0;
};

ThreadExecutor::ThreadExecutor() : pimpl_(std::make_unique<Impl>()) {}

ThreadExecutor::~ThreadExecutor() {
    std::vector<std::thread> threads;
    {
        std::lock_guard<std::mutex> lock(pimpl_->mutex);
        threads.swap(pimpl_->threads);
    }
    for (auto& t : threads) {
        if (t.joinable()) t.join();
    }
}

void ThreadExecutor::submit(Task task) {
    std::lock_guard<std::mutex> lock(pimpl_->mutex);

    // Reap finished threads so the list does not grow without bound
    if (pimpl_->active == 0) {
        for (auto& t : pimpl_->threads) {
            if (t.joinable()) t.join();
        }
        pimpl_->threads.clear();
    }

    ++pimpl_->active;
    Impl* impl = pimpl_.get();
    pimpl_->threads.emplace_back([impl, task = std::move(task)]() {
        Logger::set_thread_name("job");
        try {
            task();
        } catch (const std::exception& e) {
            Logger::error(std::string("Background job failed: ") + e.what());
        }
        std::lock_guard<std::mutex> lock(impl->mutex);
        --impl->active;
        impl->cv.notify_all();
    });
}

void ThreadExecutor::wait_all() {
    std::unique_lock<std::mutex> lock(pimpl_->mutex);
    pimpl_->cv.wait(lock, [this] { return pimpl_->active == 0; });
}

} // namespace optidex
