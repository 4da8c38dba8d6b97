#pragma once

#include "errors.h"
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>

namespace optidex {

class CameraArbiter;

/**
 * @brief Exclusive camera ownership for the duration of one operation
 *
 * Move-only. Destroying (or release()-ing) a valid lease hands the camera
 * to the next ticket in line.
 */
class CameraLease {
public:
    CameraLease(CameraLease&& other) noexcept;
    CameraLease& operator=(CameraLease&& other) noexcept;
    ~CameraLease();

    CameraLease(const CameraLease&) = delete;
    CameraLease& operator=(const CameraLease&) = delete;

    bool valid() const { return owner_ != nullptr; }
    uint64_t ticket() const { return ticket_; }

    void release();

private:
    friend class CameraArbiter;
    CameraLease(CameraArbiter* owner, uint64_t ticket) : owner_(owner), ticket_(ticket) {}

    CameraArbiter* owner_;
    uint64_t ticket_;
};

/**
 * @brief FIFO ticket queue guarding the single camera device
 *
 * Tickets are drawn in call order and served one at a time, so at most
 * one operation touches the camera and queued operations run in
 * submission order. The camera driver does not tolerate concurrent opens.
 *
 * Thread Safety: all methods may be called from any thread.
 */
class CameraArbiter {
public:
    CameraArbiter() = default;
    ~CameraArbiter();

    CameraArbiter(const CameraArbiter&) = delete;
    CameraArbiter& operator=(const CameraArbiter&) = delete;

    /**
     * @brief Block until this caller's ticket is served
     */
    CameraLease acquire();

    /**
     * @brief Take the camera only if nobody holds or waits for it
     * @return Lease, or ResourceBusy
     */
    Result<CameraLease> try_acquire();

    /**
     * @brief Queue an operation to run while holding the camera
     *
     * The ticket is drawn before this returns, so submission order is
     * execution order. The operation runs on its own thread. Whatever it
     * returns or throws is delivered through the returned future only;
     * the lease is released either way and later operations still run.
     */
    template<typename F>
    auto run_exclusive(F operation) -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        uint64_t ticket = draw_ticket();
        auto task = std::make_shared<std::packaged_task<R()>>(
            [this, ticket, op = std::move(operation)]() mutable -> R {
                wait_for_turn(ticket);
                CameraLease lease(this, ticket);
                return op();
            });
        std::future<R> result = task->get_future();
        begin_operation();
        std::thread([this, task]() {
            (*task)();
            end_operation();
        }).detach();
        return result;
    }

    /// True while a lease is held
    bool busy() const;

    /// Tickets drawn but not yet served (excludes the holder)
    size_t queued() const;

private:
    friend class CameraLease;

    uint64_t draw_ticket();
    void wait_for_turn(uint64_t ticket);
    void release(uint64_t ticket);
    void begin_operation();
    void end_operation();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint64_t next_ticket_ = 0;   ///< Next ticket to hand out
    uint64_t serving_ = 0;       ///< Ticket currently allowed to hold the camera
    bool held_ = false;
    size_t detached_ops_ = 0;
};

} // namespace optidex
