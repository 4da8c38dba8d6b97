#pragma once

#include "core/types.h"
#include <cstdint>

namespace optidex {

using TimerId = uint64_t;

/**
 * @brief Event queue plus timers for a single actor
 *
 * Everything posted or scheduled runs on one thread, one task at a time.
 * post(), schedule_*() and cancel() are safe from any thread; that is how
 * collaborator threads hand completions back to the turn controller.
 */
class Scheduler {
public:
    virtual ~Scheduler() = default;

    /// Run a task on the actor thread, after already-queued tasks
    virtual void post(Task task) = 0;

    /// Run a task once after a delay
    virtual TimerId schedule_after(Duration delay, Task task) = 0;

    /// Run a task repeatedly, first after one interval
    virtual TimerId schedule_every(Duration interval, Task task) = 0;

    /// Cancel a timer; unknown or already-fired ids are ignored
    virtual void cancel(TimerId id) = 0;

    virtual TimePoint now() const = 0;
};

/**
 * @brief Runs blocking collaborator calls off the actor thread
 */
class BackgroundExecutor {
public:
    virtual ~BackgroundExecutor() = default;
    virtual void submit(Task task) = 0;
};

} // namespace optidex
