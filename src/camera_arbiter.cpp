#include "camera_arbiter.h"
#include "logger.h"

namespace optidex {

// =============================================================================
// CameraLease
// =============================================================================

CameraLease::CameraLease(CameraLease&& other) noexcept
    : owner_(other.owner_), ticket_(other.ticket_) {
    other.owner_ = nullptr;
}

CameraLease& CameraLease::operator=(CameraLease&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        ticket_ = other.ticket_;
        other.owner_ = nullptr;
    }
    return *this;
}

CameraLease::~CameraLease() {
    release();
}

void CameraLease::release() {
    if (owner_) {
        owner_->release(ticket_);
        owner_ = nullptr;
    }
}

// =============================================================================
// CameraArbiter
// =============================================================================

CameraArbiter::~CameraArbiter() {
    // Detached operations reference this arbiter; wait for them to drain
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return detached_ops_ == 0; });
}

CameraLease CameraArbiter::acquire() {
    uint64_t ticket = draw_ticket();
    wait_for_turn(ticket);
    return CameraLease(this, ticket);
}

Result<CameraLease> CameraArbiter::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (held_ || next_ticket_ != serving_) {
        return make_busy_error("Camera is in use by another operation");
    }
    uint64_t ticket = next_ticket_++;
    held_ = true;
    LOG_CAMERA("Lease " + std::to_string(ticket) + " acquired");
    return CameraLease(this, ticket);
}

bool CameraArbiter::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return held_;
}

size_t CameraArbiter::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t outstanding = next_ticket_ - serving_;
    return static_cast<size_t>(held_ ? outstanding - 1 : outstanding);
}

uint64_t CameraArbiter::draw_ticket() {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_ticket_++;
}

void CameraArbiter::wait_for_turn(uint64_t ticket) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this, ticket] { return serving_ == ticket && !held_; });
    held_ = true;
    LOG_CAMERA("Lease " + std::to_string(ticket) + " acquired");
}

void CameraArbiter::release(uint64_t ticket) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!held_ || ticket != serving_) {
            Logger::error("Camera lease " + std::to_string(ticket) + " released out of turn (serving " +
                          std::to_string(serving_) + ")");
            return;
        }
        held_ = false;
        ++serving_;
    }
    LOG_CAMERA("Lease " + std::to_string(ticket) + " released");
    cv_.notify_all();
}

void CameraArbiter::begin_operation() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++detached_ops_;
}

void CameraArbiter::end_operation() {
    // Notify under the lock: the destructor may be waiting to tear down cv_
    std::lock_guard<std::mutex> lock(mutex_);
    --detached_ops_;
    cv_.notify_all();
}

} // namespace optidex
