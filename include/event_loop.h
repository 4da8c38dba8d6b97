#pragma once

#include "scheduler.h"
#include <memory>

namespace optidex {

/**
 * @brief Real-time Scheduler driven by run() on the calling thread
 *
 * Posted tasks run in FIFO order; due timers run in deadline order.
 * An exception escaping a task is logged and the loop continues.
 */
class EventLoop : public Scheduler {
public:
    EventLoop();
    ~EventLoop() override;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void post(Task task) override;
    TimerId schedule_after(Duration delay, Task task) override;
    TimerId schedule_every(Duration interval, Task task) override;
    void cancel(TimerId id) override;
    TimePoint now() const override;

    /**
     * @brief Process tasks until stop() is called
     */
    void run();

    /**
     * @brief Request run() to return (thread-safe, callable from signal-driven threads)
     */
    void stop();

    bool running() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

/**
 * @brief BackgroundExecutor with one thread per job, joined on destruction
 */
class ThreadExecutor : public BackgroundExecutor {
public:
    ThreadExecutor();
    ~ThreadExecutor() override;

    ThreadExecutor(const ThreadExecutor&) = delete;
    ThreadExecutor& operator=(const ThreadExecutor&) = delete;

    void submit(Task task) override;

    /// Wait for every submitted job to finish
    void wait_all();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace optidex
