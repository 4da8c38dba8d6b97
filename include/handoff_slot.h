#pragma once

#include "core/types.h"
#include "errors.h"
#include "logger.h"
#include "visual_mode.h"
#include <mutex>
#include <optional>
#include <string>

namespace optidex {

/**
 * @brief Single-value mailbox stamped with the turn that filled it
 *
 * Holds zero or one value. set() replaces any unconsumed value and hands
 * the displaced one back; take_and_clear() empties the box atomically.
 * Never blocks. Tools write from the assistant thread while the turn
 * controller drains from the event loop, hence the lock.
 *
 * A value written by a turn that has since been cancelled must never be
 * consumed by a later turn: take_for_turn() discards it instead.
 */
template<typename T>
class Mailbox {
public:
    /// Store a value for turn; returns the value it displaced, if any
    std::optional<T> set(T value, TurnId turn) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<T> previous;
        if (entry_) previous = std::move(entry_->value);
        entry_ = Entry{std::move(value), turn};
        return previous;
    }

    std::optional<T> take_and_clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<T> taken;
        if (entry_) taken = std::move(entry_->value);
        entry_.reset();
        return taken;
    }

    /**
     * @brief Empty the box, returning the value only if turn wrote it
     * @param what Names the value in the StaleCompletion log line
     */
    std::optional<T> take_for_turn(TurnId turn, const char* what) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<Entry> taken = std::move(entry_);
        entry_.reset();
        if (!taken) return std::nullopt;
        if (taken->turn != turn) {
            Logger::debug(make_stale_error(what, taken->turn, turn).to_string());
            return std::nullopt;
        }
        return std::move(taken->value);
    }

    bool has_value() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entry_.has_value();
    }

    bool has_value_for(TurnId turn) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entry_.has_value() && entry_->turn == turn;
    }

    std::optional<T> peek() const {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!entry_) return std::nullopt;
        return entry_->value;
    }

private:
    struct Entry {
        T value;
        TurnId turn;
    };

    mutable std::mutex mutex_;
    std::optional<Entry> entry_;
};

/// Path of a generated or captured image waiting to be shown after speech
using ImageSlot = Mailbox<std::string>;

/**
 * @brief Deferred visual-mode activation
 *
 * A tool places a request here during the answer; the turn controller
 * drains it only after the same turn's speech has finished playing.
 * Last write wins: a second set() before consumption replaces the first
 * and logs a warning naming both kinds.
 */
class HandoffSlot {
public:
    void set(VisualModeRequest request, TurnId turn);

    /// Returns the pending request and empties the slot, or nullopt
    std::optional<VisualModeRequest> take_and_clear();

    /// Empties the slot; nullopt unless the pending request came from turn
    std::optional<VisualModeRequest> take_for_turn(TurnId turn);

    bool has_pending() const;

    bool has_pending_for(TurnId turn) const;

    std::optional<VisualKind> pending_kind() const;

private:
    Mailbox<VisualModeRequest> box_;
};

} // namespace optidex
